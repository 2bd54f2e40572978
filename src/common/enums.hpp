#pragma once

#include <cstddef>

namespace keepsake {

// Declaration order is the canonical sort order for periods.
enum class Unit {
    Last,     // snapshot count
    Secondly, // wallclock seconds
    Daily,    // calendar days
    Monthly,  // calendar months
    Yearly    // calendar years
};

constexpr std::size_t kUnitCount = 5;

} // namespace keepsake
