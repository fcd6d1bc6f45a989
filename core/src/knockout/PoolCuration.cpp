#include "localelo/core/knockout/PoolCuration.h"

#include "localelo/core/match/MatchSelector.h"
#include "localelo/core/match/WeightedSampler.h"

#include <algorithm>
#include <cstddef>

namespace localelo::core::knockout {

namespace {

std::vector<int> DrawPhase(std::vector<store::Entrant>& candidates, int count, double power, std::mt19937& rng) {
    std::vector<double> weights;
    weights.reserve(candidates.size());
    for (const auto& entrant : candidates) {
        weights.push_back(match::FirstPickWeight(entrant, power));
    }
    auto picks = match::SampleWithoutReplacement(std::move(weights), static_cast<size_t>(std::max(0, count)), rng);

    std::vector<int> ids;
    ids.reserve(picks.size());
    for (size_t index : picks) {
        ids.push_back(candidates[index].id);
    }
    // Drop this phase's picks so the next phase cannot draw them again.
    std::sort(picks.begin(), picks.end());
    for (auto it = picks.rbegin(); it != picks.rend(); ++it) {
        candidates.erase(candidates.begin() + static_cast<std::ptrdiff_t>(*it));
    }
    return ids;
}

}  // namespace

std::vector<int> PoolSelection::all_ids() const {
    std::vector<int> ids = weighted_ids;
    ids.insert(ids.end(), top_skew_ids.begin(), top_skew_ids.end());
    return ids;
}

PoolSelection CuratePool(const std::vector<store::Entrant>& available,
                         int total_size,
                         int top_skew_size,
                         double power,
                         std::mt19937& rng) {
    PoolSelection selection;
    const int total = std::clamp(total_size, 0, static_cast<int>(available.size()));
    const int skew = std::clamp(top_skew_size, 0, total);

    std::vector<store::Entrant> candidates = available;
    selection.weighted_ids = DrawPhase(candidates, total - skew, power, rng);
    selection.top_skew_ids = DrawPhase(candidates, skew, kTopSkewPower, rng);
    return selection;
}

}  // namespace localelo::core::knockout
