#include "retention/period.hpp"

#include <cctype>

#include "retention/duration.hpp"

namespace keepsake {

namespace {

// Floor division so that pre-epoch instants land in the right second.
qint64 utcSecond(const QDateTime &value)
{
    const qint64 msecs = value.toMSecsSinceEpoch();
    qint64 seconds = msecs / 1000;
    if (msecs % 1000 < 0) {
        --seconds;
    }
    return seconds;
}

QDateTime inZoneOf(const QDateTime &reference, const QDateTime &value)
{
    switch (reference.timeSpec()) {
    case Qt::UTC:
        return value.toUTC();
    case Qt::LocalTime:
        return value.toLocalTime();
    case Qt::OffsetFromUTC:
        return value.toOffsetFromUtc(reference.offsetFromUtc());
    case Qt::TimeZone:
        return value.toTimeZone(reference.timeZone());
    }
    return value;
}

std::string countedNoun(int count, const char *singular)
{
    if (count == 1) {
        return std::string("every ") + singular;
    }
    return "every " + std::to_string(count) + " " + singular + "s";
}

} // namespace

bool isValidUnit(Unit unit)
{
    switch (unit) {
    case Unit::Last:
    case Unit::Secondly:
    case Unit::Daily:
    case Unit::Monthly:
    case Unit::Yearly:
        return true;
    }
    return false;
}

std::string unitName(Unit unit)
{
    switch (unit) {
    case Unit::Last:
        return "last";
    case Unit::Secondly:
        return "secondly";
    case Unit::Daily:
        return "daily";
    case Unit::Monthly:
        return "monthly";
    case Unit::Yearly:
        return "yearly";
    }
    return {};
}

std::optional<Unit> parseUnitName(const std::string &name)
{
    std::string lowered = name;
    for (auto &ch : lowered) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    if (lowered == "last") {
        return Unit::Last;
    }
    if (lowered == "secondly") {
        return Unit::Secondly;
    }
    if (lowered == "daily") {
        return Unit::Daily;
    }
    if (lowered == "monthly") {
        return Unit::Monthly;
    }
    if (lowered == "yearly") {
        return Unit::Yearly;
    }
    return std::nullopt;
}

std::optional<Period> Period::normalize() const
{
    if (!isValidUnit(unit)) {
        return std::nullopt;
    }
    Period normalized = *this;
    if (unit == Unit::Last) {
        normalized.interval = 1;
    } else if (interval <= 0) {
        return std::nullopt;
    }
    return normalized;
}

int Period::compare(const Period &other) const
{
    if (unit != other.unit) {
        return static_cast<int>(unit) < static_cast<int>(other.unit) ? -1 : 1;
    }
    if (interval != other.interval) {
        return interval < other.interval ? -1 : 1;
    }
    return 0;
}

std::string Period::toString() const
{
    const auto normalized = normalize();
    if (!normalized.has_value()) {
        return {};
    }
    switch (normalized->unit) {
    case Unit::Last:
        return unitName(Unit::Last);
    case Unit::Secondly:
        return "every " + formatDuration(normalized->interval);
    case Unit::Daily:
        return countedNoun(normalized->interval, "day");
    case Unit::Monthly:
        return countedNoun(normalized->interval, "month");
    case Unit::Yearly:
        return countedNoun(normalized->interval, "year");
    }
    return {};
}

bool operator==(const Period &a, const Period &b)
{
    return a.unit == b.unit && a.interval == b.interval;
}

bool operator!=(const Period &a, const Period &b)
{
    return !(a == b);
}

bool operator<(const Period &a, const Period &b)
{
    return a.compare(b) < 0;
}

QDateTime prevTime(const Period &period, const QDateTime &at)
{
    switch (period.unit) {
    case Unit::Last:
        return at.addMSecs(-1);
    case Unit::Secondly:
        return at.addSecs(-static_cast<qint64>(period.interval));
    case Unit::Daily:
        return at.addDays(-static_cast<qint64>(period.interval));
    case Unit::Monthly:
        return at.addMonths(-period.interval);
    case Unit::Yearly:
        return at.addYears(-period.interval);
    }
    return at;
}

bool timeEquals(Unit unit, const QDateTime &a, const QDateTime &b)
{
    switch (unit) {
    case Unit::Last:
        return a == b;
    case Unit::Secondly:
        return utcSecond(a) == utcSecond(b);
    case Unit::Daily:
        return a.date() == inZoneOf(a, b).date();
    case Unit::Monthly: {
        const QDate left = a.date();
        const QDate right = inZoneOf(a, b).date();
        return left.year() == right.year() && left.month() == right.month();
    }
    case Unit::Yearly:
        return a.date().year() == inZoneOf(a, b).date().year();
    }
    return false;
}

} // namespace keepsake
