#include "localelo/core/knockout/TournamentController.h"

#include "localelo/core/knockout/PoolCuration.h"
#include "localelo/core/util/Timestamp.h"

#include <algorithm>
#include <sstream>

namespace localelo::core::knockout {

std::vector<KnockoutStanding> OrderForWinnerScreen(const std::vector<store::Entrant>& entrants,
                                                   const std::vector<store::EliminationMark>& marks) {
    std::unordered_map<int, std::string> eliminated_at;
    for (const auto& mark : marks) {
        eliminated_at.emplace(mark.entrant_id, mark.eliminated_at);
    }

    std::vector<KnockoutStanding> standings;
    standings.reserve(entrants.size());
    for (const auto& entrant : entrants) {
        KnockoutStanding row;
        row.entrant = entrant;
        auto it = eliminated_at.find(entrant.id);
        if (it != eliminated_at.end()) {
            row.eliminated_at = it->second;
        }
        standings.push_back(std::move(row));
    }

    std::sort(standings.begin(), standings.end(), [](const KnockoutStanding& a, const KnockoutStanding& b) {
        if (a.eliminated_at.has_value() != b.eliminated_at.has_value()) {
            return !a.eliminated_at.has_value();
        }
        if (a.eliminated_at && b.eliminated_at && *a.eliminated_at != *b.eliminated_at) {
            return *a.eliminated_at > *b.eliminated_at;
        }
        if (a.entrant.elo != b.entrant.elo) {
            return a.entrant.elo > b.entrant.elo;
        }
        return a.entrant.id < b.entrant.id;
    });
    return standings;
}

TournamentController::TournamentController(store::EntrantStore& store,
                                           rating::RatingEngine& ratings,
                                           match::MatchSelector& selector,
                                           LogFn log,
                                           ClockFn clock)
    : store_(store), ratings_(ratings), selector_(selector), log_(std::move(log)), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return util::NowUtcTimestamp(); };
    }
    Sync();
}

void TournamentController::Log(const std::string& line) const {
    if (log_) {
        log_("[knockout] " + line);
    }
}

void TournamentController::Sync() {
    eliminated_.clear();
    for (const auto& mark : store_.Eliminations()) {
        eliminated_.emplace(mark.entrant_id, mark.eliminated_at);
    }
    const auto pool = store_.LoadPool();
    pool_ = std::unordered_set<int>(pool.begin(), pool.end());
}

bool TournamentController::Start(const KnockoutOptions& options,
                                 const std::vector<store::Entrant>& available,
                                 Error* error) {
    Sync();
    if (!eliminated_.empty() || !pool_.empty()) {
        if (options.pool_size > 0 && !pool_.empty() && static_cast<int>(pool_.size()) != options.pool_size) {
            std::ostringstream message;
            message << "Existing knockout tournament has pool size " << pool_.size() << ", but pool size "
                    << options.pool_size << " was requested. Resume without a pool size, or reset first.";
            SetError(error, ErrorCode::ConfigurationConflict, message.str());
            return false;
        }
        std::ostringstream line;
        line << "Resuming knockout tournament";
        if (!pool_.empty()) {
            line << " (pool size " << pool_.size() << ")";
        }
        line << ": " << eliminated_.size() << " eliminated, " << RemainingCount(available) << " still competing";
        Log(line.str());
        return true;
    }

    if (options.pool_size <= 0) {
        Log("Starting knockout tournament with all " + std::to_string(available.size()) + " entrants");
        return true;
    }
    if (options.top_skew_size < 0 || options.top_skew_size > options.pool_size) {
        SetError(error,
                 ErrorCode::InvalidConfig,
                 "Top-skew size " + std::to_string(options.top_skew_size) + " must lie between 0 and pool size " +
                     std::to_string(options.pool_size));
        return false;
    }
    if (static_cast<int>(available.size()) < options.pool_size) {
        SetError(error,
                 ErrorCode::InsufficientEntrants,
                 "Only " + std::to_string(available.size()) + " entrants available, but pool size is " +
                     std::to_string(options.pool_size));
        return false;
    }

    const auto selection =
        CuratePool(available, options.pool_size, options.top_skew_size, options.power, selector_.rng());
    if (!store_.SavePool(selection.all_ids(), error)) {
        return false;
    }
    Sync();
    Log("Selected " + std::to_string(selection.weighted_ids.size()) + " weighted and " +
        std::to_string(selection.top_skew_ids.size()) + " top-skew competitors");
    return true;
}

bool TournamentController::InScope(int id) const {
    return pool_.empty() || pool_.count(id) > 0;
}

EntrantState TournamentController::StateOf(int id) const {
    return eliminated_.count(id) > 0 ? EntrantState::Eliminated : EntrantState::Active;
}

std::vector<store::Entrant> TournamentController::Eligible(const std::vector<store::Entrant>& available) const {
    std::vector<store::Entrant> eligible;
    for (const auto& entrant : available) {
        if (InScope(entrant.id) && StateOf(entrant.id) == EntrantState::Active) {
            eligible.push_back(entrant);
        }
    }
    return eligible;
}

int TournamentController::RemainingCount(const std::vector<store::Entrant>& available) const {
    return static_cast<int>(Eligible(available).size());
}

std::optional<store::Entrant> TournamentController::Winner(const std::vector<store::Entrant>& available) const {
    const auto eligible = Eligible(available);
    if (eligible.size() != 1) {
        return std::nullopt;
    }
    return eligible.front();
}

std::optional<match::Bout> TournamentController::NextBout(const std::vector<store::Entrant>& available,
                                                          double power,
                                                          Error* error) {
    return selector_.PickBout(Eligible(available), power, error);
}

bool TournamentController::ApplyCommand(KnockoutCommand command,
                                        int id_a,
                                        int id_b,
                                        KnockoutTransition* transition,
                                        Error* error) {
    const CommandOutcome outcome = OutcomeFor(command);
    if (!ratings_.RecordResult(id_a, id_b, outcome.rating_result, error)) {
        return false;
    }

    std::vector<int> eliminated_ids;
    if (outcome.eliminate_a) {
        eliminated_ids.push_back(id_a);
    }
    if (outcome.eliminate_b) {
        eliminated_ids.push_back(id_b);
    }
    if (!eliminated_ids.empty() && !store_.MarkEliminated(eliminated_ids, clock_(), error)) {
        return false;
    }
    Sync();

    if (transition) {
        transition->command = command;
        transition->outcome = outcome;
        transition->eliminated_ids = std::move(eliminated_ids);
    }
    return true;
}

bool TournamentController::Reset(Error* error) {
    if (!store_.ResetKnockout(error)) {
        return false;
    }
    Sync();
    Log("Knockout tournament reset; every entrant is back in");
    return true;
}

std::vector<KnockoutStanding> TournamentController::WinnerOrdering() const {
    const auto entrants = store_.ListEntrants([this](const store::Entrant& e) { return InScope(e.id); });
    return OrderForWinnerScreen(entrants, store_.Eliminations());
}

}  // namespace localelo::core::knockout
