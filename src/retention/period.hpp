#pragma once

#include <optional>
#include <string>

#include <QDateTime>

#include "common/enums.hpp"

namespace keepsake {

bool isValidUnit(Unit unit);

// Lowercase rule name ("last", "secondly", ...), empty for an invalid unit.
std::string unitName(Unit unit);

// Case-insensitive inverse of unitName.
std::optional<Unit> parseUnitName(const std::string &name);

/**
 * One retained snapshot every Interval units.
 *
 * Interval is ignored for Unit::Last (normalized to 1) and must be > 0 for
 * every other unit.
 */
struct Period {
    Unit unit = Unit::Last;
    int interval = 1;

    // Validated, canonical copy of this period; nullopt if it is invalid.
    std::optional<Period> normalize() const;

    // Total order: unit first, then interval.
    int compare(const Period &other) const;

    // Human-readable form, e.g. "last", "every 1h30m", "every 2 months".
    // Empty for an invalid period.
    std::string toString() const;
};

bool operator==(const Period &a, const Period &b);
bool operator!=(const Period &a, const Period &b);
bool operator<(const Period &a, const Period &b);

/**
 * The instant one interval before `at`.
 *
 * Secondly subtracts wallclock seconds. Daily, Monthly and Yearly use calendar
 * arithmetic in the time zone carried by `at`; a day of month that does not
 * exist in the target month is clamped to that month's last day. Last has no
 * calendar meaning and steps back by the smallest representable amount.
 */
QDateTime prevTime(const Period &period, const QDateTime &at);

/**
 * Whether `a` and `b` fall into the same bucket of `unit`: the same UTC second
 * for Secondly, the same calendar day, month or year for the others (evaluated
 * in the time zone of `a`), plain equality for Last.
 */
bool timeEquals(Unit unit, const QDateTime &a, const QDateTime &b);

} // namespace keepsake
