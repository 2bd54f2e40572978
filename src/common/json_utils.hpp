#pragma once

#include <stdexcept>
#include <string>

#include <QDateTime>

#include <nlohmann/json.hpp>

#include "retention/period.hpp"
#include "retention/policy.hpp"

namespace keepsake {

inline std::string toIso8601(const QDateTime &timestamp)
{
    return timestamp.toString(Qt::ISODateWithMs).toStdString();
}

inline void to_json(nlohmann::json &j, const Unit &unit)
{
    j = unitName(unit);
}

inline void from_json(const nlohmann::json &j, Unit &unit)
{
    const auto parsed = j.is_string()
        ? parseUnitName(j.get<std::string>())
        : std::nullopt;
    if (!parsed.has_value()) {
        throw std::invalid_argument("unknown unit " + j.dump());
    }
    unit = *parsed;
}

inline void to_json(nlohmann::json &j, const Period &period)
{
    j = nlohmann::json{
        {"unit", period.unit},
        {"interval", period.interval},
        {"label", period.toString()}
    };
}

// Throws std::invalid_argument for a period that does not normalize.
inline void from_json(const nlohmann::json &j, Period &period)
{
    const Period parsed{j.at("unit").get<Unit>(), j.value("interval", 1)};
    const auto normalized = parsed.normalize();
    if (!normalized.has_value()) {
        throw std::invalid_argument("invalid period " + j.dump());
    }
    period = *normalized;
}

// Counts are numbers, or null for an unbounded rule.
inline void to_json(nlohmann::json &j, const Policy &policy)
{
    nlohmann::json rules = nlohmann::json::array();
    policy.forEach([&rules](const Period &period, int count) {
        rules.push_back(nlohmann::json{
            {"period", period},
            {"count", count < 0 ? nlohmann::json(nullptr) : nlohmann::json(count)}
        });
    });
    j = nlohmann::json{
        {"text", policy.toText()},
        {"rules", rules}
    };
}

// Reads the canonical "text" field. Throws PolicyParseError for bad rules.
inline void from_json(const nlohmann::json &j, Policy &policy)
{
    policy = Policy::fromText(j.value("text", ""));
}

} // namespace keepsake
