#pragma once

#include "localelo/core/store/EntrantStore.h"
#include "localelo/core/util/Error.h"

#include <functional>
#include <string>
#include <utility>

namespace localelo::core::rating {

constexpr double kKFactor = 32.0;
// Redistribution deltas below this are not worth a write.
constexpr double kNegligibleDelta = 0.01;

// Probability that a player rated elo_a beats one rated elo_b.
double WinProbability(double elo_a, double elo_b);

// Returns (new_elo_a, new_elo_b). The two deltas always sum to zero.
std::pair<double, double> ApplyResult(double elo_a, double elo_b, store::BoutResult result);

class RatingEngine {
public:
    using LogFn = std::function<void(const std::string&)>;
    using ClockFn = std::function<std::string()>;

    explicit RatingEngine(store::EntrantStore& store, LogFn log = {}, ClockFn clock = {});

    // Updates both ratings and record counters and appends the game as one
    // transaction. Fails with UnknownEntrant without touching the store.
    bool RecordResult(int id_a, int id_b, store::BoutResult result, Error* error);

    // Adds delta / N to every entrant except excluded_id.
    bool Redistribute(double delta, int excluded_id, Error* error);

    // Removes the entrant with its games and mark and spreads its deviation
    // from the default rating over the survivors, in one transaction.
    bool RemoveEntrant(int id, Error* error);

private:
    void Log(const std::string& line) const;

    store::EntrantStore& store_;
    LogFn log_;
    ClockFn clock_;
};

}  // namespace localelo::core::rating
