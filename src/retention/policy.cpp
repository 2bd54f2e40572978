#include "retention/policy.hpp"

#include <charconv>
#include <limits>
#include <sstream>
#include <utility>

#include "retention/duration.hpp"

namespace keepsake {

namespace {

std::string quoted(const std::string &value)
{
    return "\"" + value + "\"";
}

// Base-10 integer with an optional sign, nothing else. Must fit in an int.
bool parseInteger(const std::string &text, int &out)
{
    std::string digits = text;
    if (!digits.empty() && digits.front() == '+') {
        digits.erase(digits.begin());
        if (!digits.empty() && digits.front() == '-') {
            return false;
        }
    }
    if (digits.empty()) {
        return false;
    }

    long long value = 0;
    const char *first = digits.data();
    const char *last = digits.data() + digits.size();
    const auto result = std::from_chars(first, last, value, 10);
    if (result.ec != std::errc() || result.ptr != last) {
        return false;
    }
    if (value < std::numeric_limits<int>::min()
        || value > std::numeric_limits<int>::max()) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

std::string renderInterval(const Period &period)
{
    if (period.unit == Unit::Secondly && period.interval >= 60) {
        return formatDuration(period.interval);
    }
    return std::to_string(period.interval);
}

} // namespace

Policy::Policy(std::map<Period, int> counts)
    : m_counts(std::move(counts))
{
}

bool Policy::set(const Period &period, int count)
{
    const auto normalized = period.normalize();
    if (!normalized.has_value()) {
        return false;
    }
    if (count < 0) {
        count = kInfinite;
    }
    if (count == 0) {
        m_counts.erase(*normalized);
    } else {
        m_counts[*normalized] = count;
    }
    return true;
}

void Policy::mustSet(Unit unit, int interval, int count)
{
    const Period period{unit, interval};
    if (get(period) != 0) {
        throw std::logic_error("duplicate period " + period.toString());
    }
    if (!set(period, count)) {
        throw std::logic_error("invalid period");
    }
}

int Policy::get(const Period &period) const
{
    const auto normalized = period.normalize();
    if (!normalized.has_value()) {
        return 0;
    }
    const auto it = m_counts.find(*normalized);
    return it == m_counts.end() ? 0 : it->second;
}

void Policy::forEach(const std::function<void(const Period &, int)> &visit) const
{
    for (const auto &[period, count] : m_counts) {
        visit(period, count);
    }
}

Policy Policy::clone() const
{
    return Policy(m_counts);
}

std::size_t Policy::size() const
{
    return m_counts.size();
}

bool Policy::isEmpty() const
{
    return m_counts.empty();
}

std::string Policy::toString() const
{
    std::string out;
    for (const auto &[period, count] : m_counts) {
        if (!out.empty()) {
            out += ", ";
        }
        out += period.toString();
        out += " (";
        out += count < 0 ? std::string("inf") : std::to_string(count);
        out += ")";
    }
    return out;
}

std::string Policy::toText() const
{
    std::string out;
    for (const auto &[period, count] : m_counts) {
        if (!out.empty()) {
            out += " ";
        }
        // Unbounded is the default and is written without a count.
        if (count >= 0) {
            out += std::to_string(count) + "@";
        }
        out += unitName(period.unit);
        if (period.interval != 1) {
            out += ":" + renderInterval(period);
        }
    }
    return out;
}

Policy Policy::fromText(const std::string &text)
{
    std::vector<std::string> rules;
    std::istringstream in(text);
    std::string rule;
    while (in >> rule) {
        rules.push_back(rule);
    }
    return parsePolicy(rules);
}

bool Policy::operator==(const Policy &other) const
{
    return m_counts == other.m_counts;
}

bool Policy::operator!=(const Policy &other) const
{
    return !(*this == other);
}

PolicyParseError::PolicyParseError(Kind kind, std::string rule, std::string field,
                                   const std::string &message)
    : std::runtime_error("rule " + quoted(rule) + ": " + message)
    , m_kind(kind)
    , m_rule(std::move(rule))
    , m_field(std::move(field))
{
}

PolicyParseError::Kind PolicyParseError::kind() const
{
    return m_kind;
}

const std::string &PolicyParseError::rule() const
{
    return m_rule;
}

const std::string &PolicyParseError::field() const
{
    return m_field;
}

Policy parsePolicy(const std::vector<std::string> &rules)
{
    using Kind = PolicyParseError::Kind;

    Policy policy;
    for (const auto &rule : rules) {
        std::string countText = "-1";
        std::string rest = rule;
        if (const auto at = rule.find('@'); at != std::string::npos) {
            countText = rule.substr(0, at);
            rest = rule.substr(at + 1);
        }

        std::string unitText = rest;
        std::string intervalText = "1";
        if (const auto colon = rest.find(':'); colon != std::string::npos) {
            unitText = rest.substr(0, colon);
            intervalText = rest.substr(colon + 1);
        }

        const auto unit = parseUnitName(unitText);
        if (!unit.has_value()) {
            throw PolicyParseError(Kind::UnknownUnit, rule, "unit",
                                   "unknown unit " + quoted(unitText));
        }

        int count = 0;
        if (!parseInteger(countText, count)) {
            throw PolicyParseError(Kind::BadInteger, rule, "count",
                                   "parse count " + quoted(countText)
                                       + ": invalid integer");
        }
        if (count == 0) {
            throw PolicyParseError(Kind::InvalidPeriod, rule, "count",
                                   "count must not be zero");
        }

        int interval = 0;
        bool intervalOk = parseInteger(intervalText, interval);
        if (!intervalOk && *unit == Unit::Secondly) {
            if (const auto duration = parseDuration(intervalText); duration.has_value()) {
                const auto seconds =
                    std::chrono::duration_cast<std::chrono::seconds>(*duration).count();
                if (seconds <= std::numeric_limits<int>::max()) {
                    // Negative or sub-second durations are rejected below.
                    interval = seconds < 0 ? 0 : static_cast<int>(seconds);
                    intervalOk = true;
                }
            }
        }
        if (!intervalOk) {
            throw PolicyParseError(Kind::BadInteger, rule, "interval",
                                   "parse interval " + quoted(intervalText)
                                       + ": invalid integer");
        }
        if (interval < 1) {
            throw PolicyParseError(Kind::InvalidPeriod, rule, "interval",
                                   "interval must be > 0");
        }
        if (*unit == Unit::Last && interval != 1) {
            throw PolicyParseError(Kind::InvalidPeriod, rule, "interval",
                                   "interval must be 1 for unit last");
        }

        const Period period{*unit, interval};
        if (policy.get(period) != 0) {
            throw PolicyParseError(Kind::DuplicatePeriod, rule, "period",
                                   "duplicate " + unitName(*unit) + ":"
                                       + std::to_string(interval));
        }
        if (!policy.set(period, count)) {
            throw PolicyParseError(Kind::InvalidPeriod, rule, "period",
                                   "invalid period " + unitName(*unit) + ":"
                                       + std::to_string(interval));
        }
    }
    return policy;
}

} // namespace keepsake
