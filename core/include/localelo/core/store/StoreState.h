#pragma once

#include "localelo/core/store/Entrant.h"

#include <string>
#include <vector>

namespace localelo::core::store {

struct StoreState {
    int version = 1;
    int next_entrant_id = 1;
    std::vector<Entrant> entrants;
    std::vector<GameRecord> games;
    std::vector<EliminationMark> eliminations;
    std::vector<int> pool;

    Entrant* FindEntrant(int id);
    const Entrant* FindEntrant(int id) const;
    // Drops the entrant with its games and elimination mark. The pool keeps
    // the id: a pool is fixed until the knockout is reset.
    bool EraseEntrant(int id);
};

std::string SerializeStoreState(const StoreState& state);
bool ParseStoreState(const std::string& payload, StoreState& state, std::string* error);

bool SaveStoreState(const std::string& path, const StoreState& state, std::string* error);
bool LoadStoreState(const std::string& path, StoreState& state, std::string* error);

}  // namespace localelo::core::store
