#include "localelo/core/store/EntrantStore.h"

#include <algorithm>
#include <filesystem>
#include <unordered_set>

namespace localelo::core::store {

EntrantStore::EntrantStore(std::string path) : path_(std::move(path)) {}

bool EntrantStore::Open(Error* error) {
    if (path_.empty() || !std::filesystem::exists(path_)) {
        state_ = StoreState{};
        return true;
    }
    return Reload(error);
}

bool EntrantStore::Reload(Error* error) {
    if (path_.empty()) {
        return true;
    }
    if (!std::filesystem::exists(path_)) {
        state_ = StoreState{};
        return true;
    }
    StoreState loaded;
    std::string message;
    if (!LoadStoreState(path_, loaded, &message)) {
        SetError(error, ErrorCode::Storage, message);
        return false;
    }
    state_ = std::move(loaded);
    return true;
}

bool EntrantStore::Transact(const Mutation& mutation, Error* error) {
    StoreState next = state_;
    if (!mutation(next, error)) {
        return false;
    }
    if (!path_.empty()) {
        std::string message;
        if (!SaveStoreState(path_, next, &message)) {
            SetError(error, ErrorCode::Storage, message);
            return false;
        }
    }
    state_ = std::move(next);
    return true;
}

std::vector<Entrant> EntrantStore::ListEntrants(const EntrantFilter& filter) const {
    std::vector<Entrant> result;
    result.reserve(state_.entrants.size());
    for (const auto& entrant : state_.entrants) {
        if (!filter || filter(entrant)) {
            result.push_back(entrant);
        }
    }
    return result;
}

std::optional<Entrant> EntrantStore::GetEntrant(int id) const {
    const Entrant* entrant = state_.FindEntrant(id);
    if (!entrant) {
        return std::nullopt;
    }
    return *entrant;
}

std::optional<Entrant> EntrantStore::FindByIdentifier(const std::string& identifier) const {
    for (const auto& entrant : state_.entrants) {
        if (entrant.identifier == identifier) {
            return entrant;
        }
    }
    return std::nullopt;
}

bool EntrantStore::UpsertEntrant(const std::string& identifier, Error* error) {
    return MergeDiscovered({identifier}, error) >= 0;
}

int EntrantStore::MergeDiscovered(const std::vector<std::string>& identifiers, Error* error) {
    std::unordered_set<std::string> known;
    for (const auto& entrant : state_.entrants) {
        known.insert(entrant.identifier);
    }
    std::vector<std::string> fresh;
    for (const auto& identifier : identifiers) {
        if (!identifier.empty() && known.insert(identifier).second) {
            fresh.push_back(identifier);
        }
    }
    if (fresh.empty()) {
        return 0;
    }

    const bool ok = Transact(
        [&fresh](StoreState& state, Error*) {
            for (const auto& identifier : fresh) {
                Entrant entrant;
                entrant.id = state.next_entrant_id++;
                entrant.identifier = identifier;
                state.entrants.push_back(std::move(entrant));
            }
            return true;
        },
        error);
    return ok ? static_cast<int>(fresh.size()) : -1;
}

bool EntrantStore::ApplyBout(const BoutUpdate& update, Error* error) {
    return Transact(
        [&update](StoreState& state, Error* err) {
            Entrant* a = state.FindEntrant(update.entrant_a);
            Entrant* b = state.FindEntrant(update.entrant_b);
            if (!a || !b) {
                SetError(err,
                         ErrorCode::UnknownEntrant,
                         "Bout references unknown entrant " +
                             std::to_string(a ? update.entrant_b : update.entrant_a));
                return false;
            }
            a->elo = update.new_elo_a;
            b->elo = update.new_elo_b;
            switch (update.result) {
                case BoutResult::A:
                    a->wins += 1;
                    b->losses += 1;
                    break;
                case BoutResult::B:
                    a->losses += 1;
                    b->wins += 1;
                    break;
                case BoutResult::Tie:
                    a->ties += 1;
                    b->ties += 1;
                    break;
            }
            state.games.push_back({update.entrant_a, update.entrant_b, update.result, update.timestamp});
            return true;
        },
        error);
}

bool EntrantStore::AdjustRatings(double amount, int excluded_id, Error* error) {
    return Transact(
        [amount, excluded_id](StoreState& state, Error*) {
            for (auto& entrant : state.entrants) {
                if (entrant.id != excluded_id) {
                    entrant.elo += amount;
                }
            }
            return true;
        },
        error);
}

bool EntrantStore::RemoveEntrant(int id, Error* error) {
    return Transact(
        [id](StoreState& state, Error* err) {
            if (!state.EraseEntrant(id)) {
                SetError(err, ErrorCode::UnknownEntrant, "Cannot remove unknown entrant " + std::to_string(id));
                return false;
            }
            return true;
        },
        error);
}

bool EntrantStore::MarkEliminated(const std::vector<int>& ids, const std::string& eliminated_at, Error* error) {
    return Transact(
        [&ids, &eliminated_at](StoreState& state, Error* err) {
            for (int id : ids) {
                if (!state.FindEntrant(id)) {
                    SetError(err, ErrorCode::UnknownEntrant, "Cannot eliminate unknown entrant " + std::to_string(id));
                    return false;
                }
                const bool already = std::any_of(state.eliminations.begin(),
                                                 state.eliminations.end(),
                                                 [id](const EliminationMark& mark) { return mark.entrant_id == id; });
                if (!already) {
                    state.eliminations.push_back({id, eliminated_at});
                }
            }
            return true;
        },
        error);
}

bool EntrantStore::ClearEliminations(Error* error) {
    return Transact(
        [](StoreState& state, Error*) {
            state.eliminations.clear();
            return true;
        },
        error);
}

bool EntrantStore::SavePool(const std::vector<int>& ids, Error* error) {
    return Transact(
        [&ids](StoreState& state, Error* err) {
            for (int id : ids) {
                if (!state.FindEntrant(id)) {
                    SetError(err, ErrorCode::UnknownEntrant, "Pool references unknown entrant " + std::to_string(id));
                    return false;
                }
            }
            state.pool = ids;
            std::sort(state.pool.begin(), state.pool.end());
            state.pool.erase(std::unique(state.pool.begin(), state.pool.end()), state.pool.end());
            return true;
        },
        error);
}

bool EntrantStore::ClearPool(Error* error) {
    return Transact(
        [](StoreState& state, Error*) {
            state.pool.clear();
            return true;
        },
        error);
}

bool EntrantStore::ResetKnockout(Error* error) {
    return Transact(
        [](StoreState& state, Error*) {
            state.eliminations.clear();
            state.pool.clear();
            return true;
        },
        error);
}

std::vector<Entrant> EntrantStore::Rankings() const {
    auto sorted = state_.entrants;
    std::sort(sorted.begin(), sorted.end(), [](const Entrant& a, const Entrant& b) {
        if (a.elo != b.elo) {
            return a.elo > b.elo;
        }
        return a.id < b.id;
    });
    return sorted;
}

std::unordered_map<int, int> EntrantStore::RankMap() const {
    std::unordered_map<int, int> ranks;
    int rank = 1;
    for (const auto& entrant : Rankings()) {
        ranks.emplace(entrant.id, rank++);
    }
    return ranks;
}

}  // namespace localelo::core::store
