#include "localelo/core/match/WeightedSampler.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <utility>

namespace localelo::core::match {

namespace {

double Usable(double weight) {
    return std::isfinite(weight) && weight > 0.0 ? weight : 0.0;
}

}  // namespace

size_t SampleIndex(const std::vector<double>& weights, std::mt19937& rng) {
    double total = 0.0;
    for (double weight : weights) {
        total += Usable(weight);
    }
    if (!(total > 0.0) || !std::isfinite(total)) {
        std::uniform_int_distribution<size_t> uniform(0, weights.size() - 1);
        return uniform(rng);
    }

    std::uniform_real_distribution<double> dist(0.0, total);
    const double target = dist(rng);
    double cumulative = 0.0;
    size_t last_positive = 0;
    for (size_t i = 0; i < weights.size(); ++i) {
        const double weight = Usable(weights[i]);
        if (weight <= 0.0) {
            continue;
        }
        cumulative += weight;
        last_positive = i;
        if (target < cumulative) {
            return i;
        }
    }
    // Rounding can leave target == total.
    return last_positive;
}

std::vector<size_t> SampleWithoutReplacement(std::vector<double> weights, size_t count, std::mt19937& rng) {
    std::vector<size_t> slots(weights.size());
    std::iota(slots.begin(), slots.end(), size_t{0});

    std::vector<size_t> chosen;
    chosen.reserve(std::min(count, weights.size()));
    while (chosen.size() < count && !slots.empty()) {
        const size_t pick = SampleIndex(weights, rng);
        chosen.push_back(slots[pick]);
        std::swap(slots[pick], slots.back());
        std::swap(weights[pick], weights.back());
        slots.pop_back();
        weights.pop_back();
    }
    return chosen;
}

}  // namespace localelo::core::match
