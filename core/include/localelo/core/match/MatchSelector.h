#pragma once

#include "localelo/core/store/Entrant.h"
#include "localelo/core/util/Error.h"

#include <optional>
#include <random>
#include <vector>

namespace localelo::core::match {

struct Bout {
    store::Entrant a;
    store::Entrant b;
};

// Strength against a default-rated opponent, damped by 1/(games+1)^power.
double FirstPickWeight(const store::Entrant& entrant, double power);

// Chance of the lower-rated side of the pair upsetting the higher-rated one.
double ClosenessWeight(const store::Entrant& first, const store::Entrant& candidate);

// Weighted random pairing over a list of entrants the caller has already
// filtered for eligibility.
class MatchSelector {
public:
    explicit MatchSelector(std::mt19937::result_type seed);

    std::optional<store::Entrant> PickFirst(const std::vector<store::Entrant>& entrants,
                                            double power,
                                            Error* error);
    // Empty when no entrant other than first is available.
    std::optional<store::Entrant> PickSecond(const std::vector<store::Entrant>& entrants,
                                             const store::Entrant& first);
    std::optional<Bout> PickBout(const std::vector<store::Entrant>& entrants, double power, Error* error);

    std::mt19937& rng() { return rng_; }

private:
    std::mt19937 rng_;
};

}  // namespace localelo::core::match
