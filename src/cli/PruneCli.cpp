#include "cli/PruneCli.hpp"

#include <algorithm>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QLocale>
#include <QRegularExpression>

#include <nlohmann/json.hpp>

#include "cli/snapshot_scanner.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "retention/policy.hpp"
#include "retention/prune.hpp"

namespace keepsake {

namespace {

constexpr int kExitFatal = 2;

int digits(long long n)
{
    int count = 1;
    while (n >= 10) {
        n /= 10;
        ++count;
    }
    return count;
}

std::optional<QStringList> readInputLines(std::istream &in)
{
    QStringList lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(QString::fromStdString(line));
    }
    if (in.bad()) {
        return std::nullopt;
    }
    return lines;
}

// e.g. "Sun 2013 Sep  8 23:33:14"
QString formatWhyTime(const QDateTime &timestamp)
{
    const QLocale c = QLocale::c();
    return c.toString(timestamp, QStringLiteral("ddd yyyy MMM "))
        + QStringLiteral("%1").arg(timestamp.date().day(), 2)
        + c.toString(timestamp, QStringLiteral(" HH:mm:ss"));
}

QString joinReasons(const std::vector<Period> &reasons)
{
    QStringList parts;
    for (const auto &period : reasons) {
        parts.push_back(QString::fromStdString(period.toString()));
    }
    return parts.join(QStringLiteral(", "));
}

void printWhy(const PruneResult &result, const std::vector<QDateTime> &snapshots)
{
    const int width = digits(static_cast<long long>(result.keep.size()));
    const int total = static_cast<int>(result.keep.size());
    for (std::size_t at = 0; at < result.keep.size(); ++at) {
        const auto &reasons = result.keep[at];
        if (reasons.empty()) {
            continue;
        }
        std::cerr << "keepsake: why: keep ["
                  << QStringLiteral("%1").arg(static_cast<int>(at) + 1, width).toStdString()
                  << "/"
                  << QStringLiteral("%1").arg(total, width).toStdString()
                  << "] " << formatWhyTime(snapshots[at]).toStdString()
                  << " :: " << joinReasons(reasons).toStdString() << "\n";
    }
}

void printSummary(const Policy &policy, const PruneResult &result, std::size_t pruned)
{
    int widest = 0;
    policy.forEach([&widest](const Period &, int count) {
        widest = std::max(widest, count);
    });
    const int width = digits(widest);

    result.need.forEach([&](const Period &period, int count) {
        const std::string label = period.toString();
        if (count < 0) {
            std::cerr << "keepsake: summary: (" << std::string(static_cast<std::size_t>(width), '*')
                      << ") " << label << "\n";
            return;
        }
        std::cerr << "keepsake: summary: ("
                  << QStringLiteral("%1").arg(policy.get(period), width).toStdString()
                  << ") " << label;
        if (count > 0) {
            std::cerr << " (missing " << count << ")";
        }
        std::cerr << "\n";
    });
    std::cerr << "keepsake: summary: pruning " << pruned << "/" << result.keep.size()
              << " snapshots\n";
}

nlohmann::json buildReport(const Policy &policy, const PruneResult &result,
                           const std::vector<QDateTime> &snapshots,
                           const std::vector<QString> &snapshotLines,
                           std::size_t pruned)
{
    nlohmann::json kept = nlohmann::json::array();
    for (std::size_t at = 0; at < result.keep.size(); ++at) {
        const auto &reasons = result.keep[at];
        if (reasons.empty()) {
            continue;
        }
        nlohmann::json labels = nlohmann::json::array();
        for (const auto &period : reasons) {
            labels.push_back(period.toString());
        }
        kept.push_back(nlohmann::json{
            {"index", at + 1},
            {"line", snapshotLines[at].toStdString()},
            {"timestamp", toIso8601(snapshots[at])},
            {"reasons", labels}
        });
    }

    nlohmann::json need = nlohmann::json::array();
    result.need.forEach([&](const Period &period, int count) {
        const int wanted = policy.get(period);
        need.push_back(nlohmann::json{
            {"period", period},
            {"wanted", wanted < 0 ? nlohmann::json(nullptr) : nlohmann::json(wanted)},
            {"missing", count < 0 ? nlohmann::json(nullptr) : nlohmann::json(count)}
        });
    });

    nlohmann::json report;
    report["policy"] = policy;
    report["snapshots"] = result.keep.size();
    report["pruned"] = pruned;
    report["kept"] = kept;
    report["need"] = need;
    return report;
}

} // namespace

QString PruneCli::usageText()
{
    return QStringLiteral(
        "usage: keepsake [options] policy...\n"
        "\n"
        "options:\n"
        "  -q, --quiet             do not show warnings about invalid or unmatched input lines\n"
        "  -e, --extract REGEXP    extract the timestamp from each input line using the provided\n"
        "                          regexp, which must contain up to one capture group\n"
        "  -E, --extended-regexp   use Perl-compatible regexp syntax rather than POSIX extended\n"
        "  -o, --only              only print the part of the line matching the regexp\n"
        "  -p, --parse FORMAT      parse the timestamp using a Qt date-time format (or ISO for\n"
        "                          ISO 8601) rather than as a unix timestamp\n"
        "  -L, --local-time        use the system timezone rather than UTC if no timezone is\n"
        "                          parsed from the timestamp\n"
        "  -v, --invert            output the snapshots to keep instead of the ones to prune\n"
        "  -w, --why               explain why each snapshot is being kept to stderr\n"
        "  -s, --summarize         summarize retention policy results to stderr\n"
        "  -j, --json              write the explanation and summary to stderr as JSON\n"
        "  -c, --canonical         print the canonical form of the policy and exit\n"
        "      --trace             enable trace logging\n"
        "  -h, --help              show this help text\n"
        "\n"
        "time format examples:\n"
        "  - ddd MMM dd HH:mm:ss yyyy\n"
        "  - dd MMM yy HH:mm t\n"
        "  - yyyy-MM-dd'T'HH:mm:ss\n"
        "  - ISO\n"
        "\n"
        "policy: N@unit:X\n"
        "  - keep the last N snapshots every X units\n"
        "  - omit the N@ to keep an infinite number of snapshots\n"
        "  - if :X is omitted, it defaults to :1\n"
        "  - there may only be one N specified for each unit:X pair\n"
        "  - if no policy is given, KEEPSAKE_POLICY is used\n"
        "  - put -- before rules starting with a minus sign\n"
        "\n"
        "unit:\n"
        "  last       snapshot count (X must be 1)\n"
        "  secondly   clock seconds (can also use the format #h#m#s, omitting any zeroed units)\n"
        "  daily      calendar days\n"
        "  monthly    calendar months\n"
        "  yearly     calendar years\n"
        "\n"
        "notes:\n"
        "  - output lines consist of filtered input lines\n"
        "  - input is read from stdin, and should consist of unix timestamps (or more if\n"
        "    --extract and/or --parse are set)\n"
        "  - invalid/unmatched input lines are ignored, or passed through if --invert is set\n"
        "    (and a warning is printed unless --quiet is set)\n"
        "  - snapshots are ordered by their UTC time\n"
        "  - timezones only affect the exact point at which calendar days/months/years are split\n");
}

int PruneCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    QCommandLineParser parser;
    parser.setSingleDashWordOptionMode(QCommandLineParser::ParseAsCompactedShortOptions);
    const QCommandLineOption quietOption({QStringLiteral("q"), QStringLiteral("quiet")},
                                         QStringLiteral("Hide warnings."));
    const QCommandLineOption extractOption({QStringLiteral("e"), QStringLiteral("extract")},
                                           QStringLiteral("Timestamp regexp."),
                                           QStringLiteral("regexp"));
    const QCommandLineOption extendedOption({QStringLiteral("E"), QStringLiteral("extended-regexp")},
                                            QStringLiteral("Perl-compatible regexp."));
    const QCommandLineOption onlyOption({QStringLiteral("o"), QStringLiteral("only")},
                                        QStringLiteral("Print only the match."));
    const QCommandLineOption parseOption({QStringLiteral("p"), QStringLiteral("parse")},
                                         QStringLiteral("Timestamp format."),
                                         QStringLiteral("format"));
    const QCommandLineOption localOption({QStringLiteral("L"), QStringLiteral("local-time")},
                                         QStringLiteral("Use the system timezone."));
    const QCommandLineOption invertOption({QStringLiteral("v"), QStringLiteral("invert")},
                                          QStringLiteral("Print the snapshots to keep."));
    const QCommandLineOption whyOption({QStringLiteral("w"), QStringLiteral("why")},
                                       QStringLiteral("Explain kept snapshots."));
    const QCommandLineOption summarizeOption({QStringLiteral("s"), QStringLiteral("summarize")},
                                             QStringLiteral("Summarize the policy."));
    const QCommandLineOption jsonOption({QStringLiteral("j"), QStringLiteral("json")},
                                        QStringLiteral("JSON diagnostics."));
    const QCommandLineOption canonicalOption({QStringLiteral("c"), QStringLiteral("canonical")},
                                             QStringLiteral("Print the canonical policy."));
    const QCommandLineOption helpOption({QStringLiteral("h"), QStringLiteral("help")},
                                        QStringLiteral("Show help."));
    parser.addOptions({quietOption, extractOption, extendedOption, onlyOption, parseOption,
                       localOption, invertOption, whyOption, summarizeOption, jsonOption,
                       canonicalOption, helpOption});
    parser.addPositionalArgument(QStringLiteral("policy"), QStringLiteral("Retention rules."),
                                 QStringLiteral("policy..."));

    if (!parser.parse(args)) {
        std::cerr << "keepsake: fatal: " << parser.errorText().toStdString() << "\n"
                  << usageText().toStdString();
        return kExitFatal;
    }

    if (parser.isSet(helpOption)) {
        std::cout << usageText().toStdString();
        return 0;
    }

    KSLOG_INFO(QStringLiteral("PruneCli"),
               QStringLiteral("run"),
               QStringLiteral("prune_cli_start"),
               (nlohmann::json{{"args", args.size()}}));

    QStringList rules = parser.positionalArguments();
    QString policySource = QStringLiteral("args");
    if (rules.isEmpty()) {
        rules = qEnvironmentVariable("KEEPSAKE_POLICY").split(
            QRegularExpression(QStringLiteral("\\s+")), Qt::SkipEmptyParts);
        policySource = QStringLiteral("env");
    }
    if (rules.isEmpty()) {
        std::cerr << usageText().toStdString();
        return kExitFatal;
    }

    Policy policy;
    try {
        std::vector<std::string> ruleStrings;
        for (const QString &rule : rules) {
            ruleStrings.push_back(rule.toStdString());
        }
        policy = parsePolicy(ruleStrings);
    } catch (const PolicyParseError &ex) {
        KSLOG_ERROR(QStringLiteral("PruneCli"),
                    QStringLiteral("run"),
                    QStringLiteral("policy_invalid"),
                    (nlohmann::json{{"rule", ex.rule()},
                                    {"field", ex.field()},
                                    {"error", ex.what()}}));
        std::cerr << "keepsake: fatal: invalid policy: " << ex.what() << std::endl;
        return kExitFatal;
    }

    if (parser.isSet(canonicalOption)) {
        std::cout << policy.toText() << std::endl;
        return 0;
    }

    std::unique_ptr<LineMatcher> extractor;
    const QString pattern = parser.value(extractOption);
    if (!pattern.isEmpty()) {
        try {
            extractor = parser.isSet(extendedOption)
                ? makePerlMatcher(pattern)
                : makePosixMatcher(pattern);
        } catch (const std::invalid_argument &ex) {
            std::cerr << "keepsake: fatal: --extract regexp is invalid: " << ex.what()
                      << std::endl;
            return kExitFatal;
        }
    }

    const auto input = readInputLines(std::cin);
    if (!input.has_value()) {
        std::cerr << "keepsake: fatal: failed to read stdin" << std::endl;
        return kExitFatal;
    }

    ScanOptions options;
    options.extractor = extractor.get();
    options.format = parser.value(parseOption);
    options.localTime = parser.isSet(localOption);
    options.onlyMatch = parser.isSet(onlyOption);
    const ScanResult scan = scanSnapshotLines(*input, options);

    if (!scan.warnings.isEmpty()) {
        KSLOG_WARN(QStringLiteral("PruneCli"),
                   QStringLiteral("run"),
                   QStringLiteral("input_warnings"),
                   (nlohmann::json{{"count", scan.warnings.size()},
                                   {"first", scan.warnings.first().toStdString()}}));
    }
    if (!parser.isSet(quietOption)) {
        for (const QString &warning : scan.warnings) {
            std::cerr << "keepsake: warning: " << warning.toStdString() << "\n";
        }
    }

    std::vector<QDateTime> snapshots;
    std::vector<QString> snapshotLines;
    std::vector<std::size_t> snapshotMap;
    snapshots.reserve(scan.lines.size());
    for (std::size_t i = 0; i < scan.lines.size(); ++i) {
        if (scan.lines[i].timestamp.has_value()) {
            snapshots.push_back(*scan.lines[i].timestamp);
            snapshotLines.push_back(scan.lines[i].text);
            snapshotMap.push_back(i);
        }
    }

    KSLOG_DEBUG(QStringLiteral("PruneCli"),
                QStringLiteral("run"),
                QStringLiteral("input_scanned"),
                (nlohmann::json{{"lines", scan.lines.size()},
                                {"snapshots", snapshots.size()},
                                {"warnings", scan.warnings.size()}}));

    const PruneResult result = prune(snapshots, policy);

    std::vector<bool> discard(scan.lines.size(), false);
    std::size_t pruned = 0;
    for (std::size_t at = 0; at < result.keep.size(); ++at) {
        if (result.keep[at].empty()) {
            discard[snapshotMap[at]] = true;
            ++pruned;
        }
    }

    const bool invert = parser.isSet(invertOption);
    for (std::size_t i = 0; i < scan.lines.size(); ++i) {
        if (discard[i] != invert) {
            std::cout << scan.lines[i].text.toStdString() << "\n";
        }
    }
    std::cout.flush();

    if (parser.isSet(jsonOption)) {
        std::cerr << buildReport(policy, result, snapshots, snapshotLines, pruned).dump(2)
                  << std::endl;
    } else {
        if (parser.isSet(whyOption)) {
            printWhy(result, snapshots);
        }
        if (parser.isSet(summarizeOption)) {
            printSummary(policy, result, pruned);
        }
    }

    KSLOG_INFO(QStringLiteral("PruneCli"),
               QStringLiteral("run"),
               QStringLiteral("prune_complete"),
               (nlohmann::json{{"policy", policy.toText()},
                               {"policySource", policySource.toStdString()},
                               {"snapshots", snapshots.size()},
                               {"pruned", pruned},
                               {"invalid", scan.lines.size() - snapshots.size()}}));
    return 0;
}

} // namespace keepsake
