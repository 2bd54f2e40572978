#pragma once

#include <memory>
#include <optional>
#include <vector>

#include <QDateTime>
#include <QString>
#include <QStringList>

namespace keepsake {

struct LineMatch {
    QString whole;
    // Text of the capture group, or the whole match without a group.
    QString timestamp;
};

// Extracts the timestamp text from an input line.
class LineMatcher
{
public:
    virtual ~LineMatcher() = default;

    virtual std::optional<LineMatch> match(const QString &line) const = 0;
};

// Both factories throw std::invalid_argument if the pattern does not compile
// or has more than one capture group.
std::unique_ptr<LineMatcher> makePosixMatcher(const QString &pattern);
std::unique_ptr<LineMatcher> makePerlMatcher(const QString &pattern);

struct ScanOptions {
    // No extractor: the trimmed line is the timestamp.
    const LineMatcher *extractor = nullptr;
    // Empty: Unix seconds. "ISO": ISO 8601. Anything else: a QDateTime format.
    QString format;
    // Place zone-less timestamps (and the result) in the system zone, not UTC.
    bool localTime = false;
    // Echo only the matched part of the line.
    bool onlyMatch = false;
};

struct ScannedLine {
    QString text;
    // nullopt when the line did not match or did not parse.
    std::optional<QDateTime> timestamp;
};

struct ScanResult {
    std::vector<ScannedLine> lines;
    QStringList warnings;
};

// Empty lines are skipped; every other line yields one ScannedLine.
ScanResult scanSnapshotLines(const QStringList &lines, const ScanOptions &options);

std::optional<QDateTime> parseSnapshotTime(const QString &text, const QString &format,
                                           bool localTime);

} // namespace keepsake
