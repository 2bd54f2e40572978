#pragma once

#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "retention/period.hpp"

namespace keepsake {

struct PruneResult;
class Policy;

PruneResult prune(const std::vector<QDateTime> &snapshots, const Policy &policy);

/**
 * Retention counts keyed by period.
 *
 * Every stored period is valid and normalized. Counts are positive, or
 * kInfinite for an unbounded rule; setting a count of zero removes the rule.
 * Iteration always follows Period order, so output built from a policy does
 * not depend on insertion order.
 */
class Policy
{
public:
    static constexpr int kInfinite = -1;

    Policy() = default;

    // Replace, insert or (count == 0) remove the rule for `period`. Negative
    // counts become kInfinite. Returns false without changes if the period is
    // invalid.
    bool set(const Period &period, int count);

    // Like set, but throws std::logic_error if the period is invalid or
    // already has a rule. Intended for policies built in code.
    void mustSet(Unit unit, int interval, int count);

    // The stored count, or 0 if unset or invalid.
    int get(const Period &period) const;

    void forEach(const std::function<void(const Period &, int)> &visit) const;

    Policy clone() const;

    std::size_t size() const;
    bool isEmpty() const;

    // e.g. "last (3), every day (7), every 5 years (inf)"
    std::string toString() const;

    // Canonical rule text accepted by fromText; equivalent policies render
    // identically.
    std::string toText() const;

    // Split on whitespace and parse as rules. Throws PolicyParseError.
    static Policy fromText(const std::string &text);

    bool operator==(const Policy &other) const;
    bool operator!=(const Policy &other) const;

private:
    friend PruneResult prune(const std::vector<QDateTime> &snapshots,
                             const Policy &policy);

    // Prune reports satisfied rules with an explicit count of 0.
    explicit Policy(std::map<Period, int> counts);

    std::map<Period, int> m_counts;
};

class PolicyParseError : public std::runtime_error
{
public:
    enum class Kind {
        UnknownUnit,
        BadInteger,
        DuplicatePeriod,
        InvalidPeriod
    };

    PolicyParseError(Kind kind, std::string rule, std::string field,
                     const std::string &message);

    Kind kind() const;
    const std::string &rule() const;
    // "unit", "count", "interval" or "period"
    const std::string &field() const;

private:
    Kind m_kind;
    std::string m_rule;
    std::string m_field;
};

/**
 * Parse rules of the form N@unit:X.
 *
 * N is the snapshot count (negative for unbounded, never zero) and defaults to
 * unbounded. unit is one of last, secondly, daily, monthly, yearly in any
 * case. X is the interval, defaults to 1 and must be 1 for last; for secondly
 * it may also be a duration such as 1h30m, truncated to whole seconds. Each
 * unit:X may appear once. Throws PolicyParseError on the first bad rule.
 */
Policy parsePolicy(const std::vector<std::string> &rules);

} // namespace keepsake
