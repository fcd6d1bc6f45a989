#pragma once

#include "localelo/core/store/StoreState.h"
#include "localelo/core/util/Error.h"

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace localelo::core::store {

struct BoutUpdate {
    int entrant_a = -1;
    int entrant_b = -1;
    double new_elo_a = kDefaultElo;
    double new_elo_b = kDefaultElo;
    BoutResult result = BoutResult::Tie;
    std::string timestamp;
};

// JSON-file store for entrants, games, elimination marks and the knockout pool.
// Each mutation runs as a transaction: it edits a copy of the state, writes it
// atomically, and only then replaces the in-memory state. An empty path keeps
// the store in memory.
class EntrantStore {
public:
    using EntrantFilter = std::function<bool(const Entrant&)>;
    using Mutation = std::function<bool(StoreState&, Error*)>;

    EntrantStore() = default;
    explicit EntrantStore(std::string path);

    // Loads the file if it exists, otherwise starts empty.
    bool Open(Error* error);
    bool Reload(Error* error);
    const std::string& path() const { return path_; }

    std::vector<Entrant> ListEntrants(const EntrantFilter& filter = {}) const;
    std::optional<Entrant> GetEntrant(int id) const;
    std::optional<Entrant> FindByIdentifier(const std::string& identifier) const;
    size_t entrant_count() const { return state_.entrants.size(); }

    // Idempotent; an existing identifier keeps its record.
    bool UpsertEntrant(const std::string& identifier, Error* error);
    // Inserts every unknown identifier in one transaction; returns how many were new.
    int MergeDiscovered(const std::vector<std::string>& identifiers, Error* error);

    bool ApplyBout(const BoutUpdate& update, Error* error);
    bool AdjustRatings(double amount, int excluded_id, Error* error);
    // Cascades to games and the elimination mark. The pool is left as is.
    bool RemoveEntrant(int id, Error* error);

    std::vector<EliminationMark> Eliminations() const { return state_.eliminations; }
    bool MarkEliminated(const std::vector<int>& ids, const std::string& eliminated_at, Error* error);
    bool ClearEliminations(Error* error);

    std::vector<int> LoadPool() const { return state_.pool; }
    bool SavePool(const std::vector<int>& ids, Error* error);
    bool ClearPool(Error* error);
    bool ResetKnockout(Error* error);

    const std::vector<GameRecord>& games() const { return state_.games; }
    const StoreState& state() const { return state_; }

    // Elo descending, ties by id ascending.
    std::vector<Entrant> Rankings() const;
    std::unordered_map<int, int> RankMap() const;

    bool Transact(const Mutation& mutation, Error* error);

private:
    std::string path_;
    StoreState state_;
};

}  // namespace localelo::core::store
