#include "localelo/core/rating/RatingEngine.h"

#include "localelo/core/util/Timestamp.h"

#include <cmath>
#include <sstream>

namespace localelo::core::rating {

double WinProbability(double elo_a, double elo_b) {
    return 1.0 / (1.0 + std::pow(10.0, (elo_b - elo_a) / 400.0));
}

std::pair<double, double> ApplyResult(double elo_a, double elo_b, store::BoutResult result) {
    const double expected_a = WinProbability(elo_a, elo_b);
    double actual_a = 0.5;
    if (result == store::BoutResult::A) {
        actual_a = 1.0;
    } else if (result == store::BoutResult::B) {
        actual_a = 0.0;
    }
    // B's change is the exact negation of A's, so the pair is zero-sum.
    const double delta = kKFactor * (actual_a - expected_a);
    return {elo_a + delta, elo_b - delta};
}

namespace {

std::string RedistributionLine(double delta, size_t survivors, double amount) {
    std::ostringstream line;
    line << "Redistributing " << delta << " Elo over " << survivors << " entrants (" << amount << " each)";
    return line.str();
}

}  // namespace

RatingEngine::RatingEngine(store::EntrantStore& store, LogFn log, ClockFn clock)
    : store_(store), log_(std::move(log)), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return util::NowUtcTimestamp(); };
    }
}

void RatingEngine::Log(const std::string& line) const {
    if (log_) {
        log_("[rating] " + line);
    }
}

bool RatingEngine::RecordResult(int id_a, int id_b, store::BoutResult result, Error* error) {
    const auto a = store_.GetEntrant(id_a);
    const auto b = store_.GetEntrant(id_b);
    if (!a || !b) {
        SetError(error,
                 ErrorCode::UnknownEntrant,
                 "Cannot record bout: unknown entrant " + std::to_string(a ? id_b : id_a));
        return false;
    }
    if (id_a == id_b) {
        SetError(error, ErrorCode::UnknownEntrant, "Cannot record a bout of an entrant against itself");
        return false;
    }

    const auto ratings = ApplyResult(a->elo, b->elo, result);
    store::BoutUpdate update;
    update.entrant_a = id_a;
    update.entrant_b = id_b;
    update.new_elo_a = ratings.first;
    update.new_elo_b = ratings.second;
    update.result = result;
    update.timestamp = clock_();
    return store_.ApplyBout(update, error);
}

bool RatingEngine::Redistribute(double delta, int excluded_id, Error* error) {
    if (std::abs(delta) < kNegligibleDelta) {
        Log("Redistribution skipped: negligible delta");
        return true;
    }
    const auto survivors = store_.ListEntrants([excluded_id](const store::Entrant& e) { return e.id != excluded_id; });
    if (survivors.empty()) {
        Log("Warning: no remaining entrants to redistribute Elo to");
        return true;
    }
    const double amount = delta / static_cast<double>(survivors.size());
    Log(RedistributionLine(delta, survivors.size(), amount));
    return store_.AdjustRatings(amount, excluded_id, error);
}

bool RatingEngine::RemoveEntrant(int id, Error* error) {
    const auto removed = store_.GetEntrant(id);
    if (!removed) {
        SetError(error, ErrorCode::UnknownEntrant, "Cannot remove unknown entrant " + std::to_string(id));
        return false;
    }
    const double delta = removed->elo - store::kDefaultElo;

    // Removal and redistribution commit together or not at all.
    std::string outcome;
    const bool ok = store_.Transact(
        [id, delta, &outcome](store::StoreState& state, Error* err) {
            if (!state.EraseEntrant(id)) {
                SetError(err, ErrorCode::UnknownEntrant, "Cannot remove unknown entrant " + std::to_string(id));
                return false;
            }
            if (std::abs(delta) < kNegligibleDelta) {
                outcome = "Redistribution skipped: negligible delta";
                return true;
            }
            if (state.entrants.empty()) {
                outcome = "Warning: no remaining entrants to redistribute Elo to";
                return true;
            }
            const double amount = delta / static_cast<double>(state.entrants.size());
            for (auto& entrant : state.entrants) {
                entrant.elo += amount;
            }
            outcome = RedistributionLine(delta, state.entrants.size(), amount);
            return true;
        },
        error);
    if (!ok) {
        return false;
    }
    Log("Removed " + removed->identifier);
    Log(outcome);
    return true;
}

}  // namespace localelo::core::rating
