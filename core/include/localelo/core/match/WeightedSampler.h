#pragma once

#include <cstddef>
#include <random>
#include <vector>

namespace localelo::core::match {

// Picks an index with probability proportional to its weight. Negative or
// non-finite weights count as zero; when nothing positive remains the draw
// is uniform. weights must not be empty.
size_t SampleIndex(const std::vector<double>& weights, std::mt19937& rng);

// Draws count distinct indices without replacement. Each draw swap-removes the
// chosen slot and its weight, so duplicate weights cannot be confused.
std::vector<size_t> SampleWithoutReplacement(std::vector<double> weights, size_t count, std::mt19937& rng);

}  // namespace localelo::core::match
