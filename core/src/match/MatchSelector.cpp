#include "localelo/core/match/MatchSelector.h"

#include "localelo/core/match/WeightedSampler.h"
#include "localelo/core/rating/RatingEngine.h"

#include <algorithm>
#include <cmath>

namespace localelo::core::match {

double FirstPickWeight(const store::Entrant& entrant, double power) {
    const double elo_weight = rating::WinProbability(entrant.elo, store::kDefaultElo);
    const double games_weight = 1.0 / std::pow(static_cast<double>(entrant.games_played() + 1), power);
    return elo_weight * games_weight;
}

double ClosenessWeight(const store::Entrant& first, const store::Entrant& candidate) {
    const double low = std::min(first.elo, candidate.elo);
    const double high = std::max(first.elo, candidate.elo);
    return rating::WinProbability(low, high);
}

MatchSelector::MatchSelector(std::mt19937::result_type seed) : rng_(seed) {}

std::optional<store::Entrant> MatchSelector::PickFirst(const std::vector<store::Entrant>& entrants,
                                                       double power,
                                                       Error* error) {
    if (entrants.empty()) {
        SetError(error, ErrorCode::InsufficientEntrants, "No entrants to pick from");
        return std::nullopt;
    }
    std::vector<double> weights;
    weights.reserve(entrants.size());
    for (const auto& entrant : entrants) {
        weights.push_back(FirstPickWeight(entrant, power));
    }
    return entrants[SampleIndex(weights, rng_)];
}

std::optional<store::Entrant> MatchSelector::PickSecond(const std::vector<store::Entrant>& entrants,
                                                        const store::Entrant& first) {
    std::vector<const store::Entrant*> candidates;
    std::vector<double> weights;
    for (const auto& entrant : entrants) {
        if (entrant.id == first.id) {
            continue;
        }
        candidates.push_back(&entrant);
        weights.push_back(ClosenessWeight(first, entrant));
    }
    if (candidates.empty()) {
        return std::nullopt;
    }
    return *candidates[SampleIndex(weights, rng_)];
}

std::optional<Bout> MatchSelector::PickBout(const std::vector<store::Entrant>& entrants,
                                            double power,
                                            Error* error) {
    if (entrants.size() < 2) {
        SetError(error,
                 ErrorCode::InsufficientEntrants,
                 "Need at least two entrants for a bout, have " + std::to_string(entrants.size()));
        return std::nullopt;
    }
    auto first = PickFirst(entrants, power, error);
    if (!first) {
        return std::nullopt;
    }
    auto second = PickSecond(entrants, *first);
    if (!second) {
        SetError(error, ErrorCode::EmptyCandidateSet, "No second entrant available for " + first->identifier);
        return std::nullopt;
    }
    return Bout{*first, *second};
}

}  // namespace localelo::core::match
