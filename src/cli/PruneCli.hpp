#pragma once

#include <QString>
#include <QStringList>

namespace keepsake {

class PruneCli
{
public:
    // Reads snapshot lines from std::cin, writes the lines to prune (or keep)
    // to std::cout and diagnostics to std::cerr.
    // returns exit code
    int run(int argc, char *argv[]);

    static QString usageText();
};

} // namespace keepsake
