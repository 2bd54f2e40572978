#include <QCoreApplication>

#include "cli/PruneCli.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>

#include <vector>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("keepsake"));

    bool trace = qEnvironmentVariableIntValue("KEEPSAKE_TRACE") == 1;
    QStringList filteredArgs;
    filteredArgs.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == QStringLiteral("--trace")) {
            trace = true;
            continue;
        }
        filteredArgs.push_back(arg);
    }
    keepsake::logging::initLogging(QStringLiteral("keepsake"), trace);
    KSLOG_DEBUG(QStringLiteral("main"),
                QStringLiteral("main"),
                QStringLiteral("keepsake_start"),
                (nlohmann::json{{"args", filteredArgs.size()}}));

    // Options and I/O are handled by PruneCli.
    keepsake::PruneCli cli;
    std::vector<QByteArray> localArgs;
    std::vector<char *> rawArgs;
    for (const QString &arg : filteredArgs) {
        localArgs.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : localArgs) {
        rawArgs.push_back(arg.data());
    }
    return cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());
}
