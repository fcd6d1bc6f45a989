#pragma once

#include "localelo/core/knockout/KnockoutCommand.h"
#include "localelo/core/match/MatchSelector.h"
#include "localelo/core/rating/RatingEngine.h"
#include "localelo/core/store/EntrantStore.h"
#include "localelo/core/util/Error.h"

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace localelo::core::knockout {

enum class EntrantState {
    Active,
    Eliminated,
};

struct KnockoutOptions {
    int pool_size = 0;  // 0 means every entrant takes part
    int top_skew_size = 0;
    double power = 1.0;
};

struct KnockoutStanding {
    store::Entrant entrant;
    std::optional<std::string> eliminated_at;
};

struct KnockoutTransition {
    KnockoutCommand command = KnockoutCommand::Tie;
    CommandOutcome outcome;
    std::vector<int> eliminated_ids;
};

// Winner first, then most recently eliminated, ties by Elo descending.
std::vector<KnockoutStanding> OrderForWinnerScreen(const std::vector<store::Entrant>& entrants,
                                                   const std::vector<store::EliminationMark>& marks);

// Knockout state machine. The store is the only source of truth; the
// eliminated/pool sets held here are rebuilt by Sync() on every loop pass.
class TournamentController {
public:
    using LogFn = std::function<void(const std::string&)>;
    using ClockFn = std::function<std::string()>;

    TournamentController(store::EntrantStore& store,
                         rating::RatingEngine& ratings,
                         match::MatchSelector& selector,
                         LogFn log = {},
                         ClockFn clock = {});

    // Resumes persisted state or curates a fresh pool. A persisted pool whose
    // size differs from options.pool_size is a ConfigurationConflict.
    bool Start(const KnockoutOptions& options, const std::vector<store::Entrant>& available, Error* error);
    void Sync();

    bool has_pool() const { return !pool_.empty(); }
    const std::unordered_set<int>& pool() const { return pool_; }
    bool InScope(int id) const;
    EntrantState StateOf(int id) const;

    std::vector<store::Entrant> Eligible(const std::vector<store::Entrant>& available) const;
    int RemainingCount(const std::vector<store::Entrant>& available) const;
    // Set once exactly one in-scope entrant is still active.
    std::optional<store::Entrant> Winner(const std::vector<store::Entrant>& available) const;

    std::optional<match::Bout> NextBout(const std::vector<store::Entrant>& available, double power, Error* error);

    // Records the bout using the command's base result, then applies its
    // eliminations in a single store transaction.
    bool ApplyCommand(KnockoutCommand command, int id_a, int id_b, KnockoutTransition* transition, Error* error);

    bool Reset(Error* error);

    std::vector<KnockoutStanding> WinnerOrdering() const;

private:
    void Log(const std::string& line) const;

    store::EntrantStore& store_;
    rating::RatingEngine& ratings_;
    match::MatchSelector& selector_;
    LogFn log_;
    ClockFn clock_;
    std::unordered_map<int, std::string> eliminated_;
    std::unordered_set<int> pool_;
};

}  // namespace localelo::core::knockout
