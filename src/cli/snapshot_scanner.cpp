#include "cli/snapshot_scanner.hpp"

#include <QByteArray>
#include <QRegularExpression>
#include <QTimeZone>

#include <regex.h>

#include <stdexcept>
#include <string>

namespace keepsake {

namespace {

QString quoted(const QString &value)
{
    return QStringLiteral("\"") + value + QStringLiteral("\"");
}

// POSIX extended syntax (leftmost-longest), matched against UTF-8 bytes.
class PosixMatcher : public LineMatcher
{
public:
    explicit PosixMatcher(const QString &pattern)
    {
        const QByteArray utf8 = pattern.toUtf8();
        const int rc = regcomp(&m_regex, utf8.constData(), REG_EXTENDED);
        if (rc != 0) {
            char message[256] = {};
            regerror(rc, &m_regex, message, sizeof(message));
            throw std::invalid_argument(message);
        }
        if (m_regex.re_nsub > 1) {
            regfree(&m_regex);
            throw std::invalid_argument("must contain up to one capture group");
        }
    }

    ~PosixMatcher() override
    {
        regfree(&m_regex);
    }

    PosixMatcher(const PosixMatcher &) = delete;
    PosixMatcher &operator=(const PosixMatcher &) = delete;

    std::optional<LineMatch> match(const QString &line) const override
    {
        const QByteArray utf8 = line.toUtf8();
        regmatch_t groups[2] = {};
        if (regexec(&m_regex, utf8.constData(), 2, groups, 0) != 0) {
            return std::nullopt;
        }

        LineMatch result;
        result.whole = slice(utf8, groups[0]);
        result.timestamp = m_regex.re_nsub == 1 ? slice(utf8, groups[1]) : result.whole;
        return result;
    }

private:
    static QString slice(const QByteArray &utf8, const regmatch_t &group)
    {
        if (group.rm_so < 0 || group.rm_eo < group.rm_so) {
            return {};
        }
        return QString::fromUtf8(utf8.mid(group.rm_so, group.rm_eo - group.rm_so));
    }

    regex_t m_regex{};
};

class PerlMatcher : public LineMatcher
{
public:
    explicit PerlMatcher(const QString &pattern)
        : m_regex(pattern)
    {
        if (!m_regex.isValid()) {
            throw std::invalid_argument(m_regex.errorString().toStdString());
        }
        if (m_regex.captureCount() > 1) {
            throw std::invalid_argument("must contain up to one capture group");
        }
        m_regex.optimize();
    }

    std::optional<LineMatch> match(const QString &line) const override
    {
        const QRegularExpressionMatch found = m_regex.match(line);
        if (!found.hasMatch()) {
            return std::nullopt;
        }

        LineMatch result;
        result.whole = found.captured(0);
        result.timestamp = found.captured(m_regex.captureCount());
        return result;
    }

private:
    QRegularExpression m_regex;
};

} // namespace

std::unique_ptr<LineMatcher> makePosixMatcher(const QString &pattern)
{
    return std::make_unique<PosixMatcher>(pattern);
}

std::unique_ptr<LineMatcher> makePerlMatcher(const QString &pattern)
{
    return std::make_unique<PerlMatcher>(pattern);
}

std::optional<QDateTime> parseSnapshotTime(const QString &text, const QString &format,
                                           bool localTime)
{
    QDateTime parsed;
    if (format.isEmpty()) {
        bool ok = false;
        const qint64 seconds = text.toLongLong(&ok, 10);
        if (!ok) {
            return std::nullopt;
        }
        parsed = QDateTime::fromSecsSinceEpoch(seconds, QTimeZone::utc());
    } else if (format.compare(QStringLiteral("ISO"), Qt::CaseInsensitive) == 0) {
        parsed = QDateTime::fromString(text, Qt::ISODate);
    } else {
        parsed = QDateTime::fromString(text, format);
    }
    if (!parsed.isValid()) {
        return std::nullopt;
    }

    // Zone-less text comes back as local time; re-anchor it unless asked not to.
    if (parsed.timeSpec() == Qt::LocalTime && !localTime) {
        parsed = QDateTime(parsed.date(), parsed.time(), QTimeZone::utc());
    }

    return localTime ? parsed.toLocalTime() : parsed.toUTC();
}

ScanResult scanSnapshotLines(const QStringList &lines, const ScanOptions &options)
{
    ScanResult result;
    result.lines.reserve(static_cast<std::size_t>(lines.size()));

    for (const QString &raw : lines) {
        if (raw.isEmpty()) {
            continue;
        }

        ScannedLine scanned;
        scanned.text = raw;

        QString timestampText;
        bool matched = true;
        if (options.extractor == nullptr) {
            timestampText = raw.trimmed();
        } else if (const auto found = options.extractor->match(raw); found.has_value()) {
            if (options.onlyMatch) {
                scanned.text = found->whole;
            }
            timestampText = found->timestamp;
        } else {
            result.warnings.push_back(
                QStringLiteral("failed to match extract regexp against line %1")
                    .arg(quoted(raw)));
            matched = false;
        }

        if (matched) {
            scanned.timestamp =
                parseSnapshotTime(timestampText, options.format, options.localTime);
            if (!scanned.timestamp.has_value()) {
                if (options.format.isEmpty()) {
                    result.warnings.push_back(
                        QStringLiteral("failed to parse unix timestamp %1")
                            .arg(quoted(timestampText)));
                } else {
                    result.warnings.push_back(
                        QStringLiteral("failed to parse timestamp %1 using format %2")
                            .arg(quoted(timestampText), quoted(options.format)));
                }
            }
        }

        result.lines.push_back(scanned);
    }

    return result;
}

} // namespace keepsake
