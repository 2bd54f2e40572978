#include "retention/prune.hpp"

#include <algorithm>
#include <array>
#include <map>
#include <numeric>
#include <optional>
#include <utility>

namespace keepsake {

namespace {

// Working state for one rule; the input policy is never modified.
struct RuleState {
    Period period;
    int remaining = 0;
    // One interval before the snapshot this rule claimed last.
    std::optional<QDateTime> boundary;
};

// The snapshot most recently retained by any rule of a unit.
struct UnitClaim {
    QDateTime at;
    std::size_t index = 0;
};

bool isDue(const RuleState &rule, const QDateTime &at)
{
    if (!rule.boundary.has_value()) {
        return true;
    }
    if (!(*rule.boundary < at)) {
        return true;
    }
    return timeEquals(rule.period.unit, *rule.boundary, at);
}

} // namespace

PruneResult prune(const std::vector<QDateTime> &snapshots, const Policy &policy)
{
    PruneResult result;
    result.keep.resize(snapshots.size());

    std::vector<RuleState> rules;
    rules.reserve(policy.size());
    policy.forEach([&rules](const Period &period, int count) {
        rules.push_back(RuleState{period, count, std::nullopt});
    });

    std::vector<qint64> instants;
    instants.reserve(snapshots.size());
    for (const auto &snapshot : snapshots) {
        instants.push_back(snapshot.toMSecsSinceEpoch());
    }

    std::vector<std::size_t> order(snapshots.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(),
                     [&instants](std::size_t a, std::size_t b) {
                         return instants[a] > instants[b];
                     });

    std::array<std::optional<UnitClaim>, kUnitCount> claims;

    for (const std::size_t index : order) {
        const QDateTime &at = snapshots[index];
        for (auto &rule : rules) {
            if (rule.remaining == 0) {
                continue;
            }

            if (rule.period.unit != Unit::Last) {
                if (!isDue(rule, at)) {
                    continue;
                }
                auto &claim = claims[static_cast<std::size_t>(rule.period.unit)];
                if (claim.has_value() && claim->index != index
                    && timeEquals(rule.period.unit, claim->at, at)) {
                    continue;
                }
                claim = UnitClaim{at, index};
                rule.boundary = prevTime(rule.period, at);
            }

            result.keep[index].push_back(rule.period);
            if (rule.remaining > 0) {
                --rule.remaining;
            }
        }
    }

    std::map<Period, int> need;
    for (const auto &rule : rules) {
        need.emplace(rule.period, rule.remaining);
    }
    result.need = Policy(std::move(need));
    return result;
}

} // namespace keepsake
