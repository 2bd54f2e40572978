#pragma once

#include <vector>

#include <QDateTime>

#include "retention/period.hpp"
#include "retention/policy.hpp"

namespace keepsake {

struct PruneResult {
    // Index-aligned with the input snapshots. Each list holds the periods
    // retaining that snapshot, in Period order; empty means it can be pruned.
    std::vector<std::vector<Period>> keep;

    // Per rule of the input policy, how many more snapshots would be needed to
    // satisfy it: 0 once satisfied, Policy::kInfinite for unbounded rules.
    Policy need;
};

/**
 * Decide which snapshots a policy retains.
 *
 * Snapshots are walked from newest to oldest (ties keep input order). A Last
 * rule claims each snapshot until its count runs out. Any other rule claims the
 * newest snapshot, then the first snapshot at or before one interval earlier
 * than the previous claim (or inside the same bucket as that boundary), so it
 * keeps the most recent snapshot of each bucket it is due for. Rules sharing a
 * unit never retain two different snapshots from the same bucket.
 *
 * Calendar buckets use the time zone carried by each snapshot. The result only
 * depends on the input; pruning the retained subset again gives the same
 * answer.
 *
 * Known limitation: with several intervals for one unit, pruning incrementally
 * (deleting discarded snapshots between runs) can drop a snapshot that a longer
 * interval would have claimed later.
 */
PruneResult prune(const std::vector<QDateTime> &snapshots, const Policy &policy);

} // namespace keepsake
