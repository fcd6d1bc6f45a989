#pragma once

#include "localelo/core/store/Entrant.h"

#include <random>
#include <vector>

namespace localelo::core::knockout {

// Exponent of the top-skew phase. Not configurable.
constexpr double kTopSkewPower = 3.0;

struct PoolSelection {
    std::vector<int> weighted_ids;
    std::vector<int> top_skew_ids;

    std::vector<int> all_ids() const;
};

// Draws total_size - top_skew_size entrants weighted with the caller's power,
// then top_skew_size more from what is left using kTopSkewPower. Both phases
// sample without replacement. Requires
// 0 <= top_skew_size <= total_size <= available.size().
PoolSelection CuratePool(const std::vector<store::Entrant>& available,
                         int total_size,
                         int top_skew_size,
                         double power,
                         std::mt19937& rng);

}  // namespace localelo::core::knockout
