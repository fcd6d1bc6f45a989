#include "localelo/core/store/StoreState.h"

#include "localelo/core/util/AtomicFileWriter.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace localelo::core::store {

std::string BoutResultToString(BoutResult result) {
    switch (result) {
        case BoutResult::A:
            return "A";
        case BoutResult::B:
            return "B";
        case BoutResult::Tie:
            return "tie";
    }
    return "tie";
}

bool ParseBoutResult(const std::string& text, BoutResult& result) {
    if (text == "A") {
        result = BoutResult::A;
    } else if (text == "B") {
        result = BoutResult::B;
    } else if (text == "tie") {
        result = BoutResult::Tie;
    } else {
        return false;
    }
    return true;
}

Entrant* StoreState::FindEntrant(int id) {
    auto it = std::find_if(entrants.begin(), entrants.end(), [id](const Entrant& e) { return e.id == id; });
    return it == entrants.end() ? nullptr : &*it;
}

const Entrant* StoreState::FindEntrant(int id) const {
    auto it = std::find_if(entrants.begin(), entrants.end(), [id](const Entrant& e) { return e.id == id; });
    return it == entrants.end() ? nullptr : &*it;
}

bool StoreState::EraseEntrant(int id) {
    auto it = std::find_if(entrants.begin(), entrants.end(), [id](const Entrant& e) { return e.id == id; });
    if (it == entrants.end()) {
        return false;
    }
    entrants.erase(it);
    games.erase(std::remove_if(games.begin(),
                               games.end(),
                               [id](const GameRecord& game) { return game.entrant_a == id || game.entrant_b == id; }),
                games.end());
    eliminations.erase(std::remove_if(eliminations.begin(),
                                      eliminations.end(),
                                      [id](const EliminationMark& mark) { return mark.entrant_id == id; }),
                       eliminations.end());
    return true;
}

std::string SerializeStoreState(const StoreState& state) {
    nlohmann::json root;
    root["version"] = state.version;
    root["next_entrant_id"] = state.next_entrant_id;

    root["entrants"] = nlohmann::json::array();
    for (const auto& entrant : state.entrants) {
        root["entrants"].push_back({
            {"id", entrant.id},
            {"identifier", entrant.identifier},
            {"elo", entrant.elo},
            {"wins", entrant.wins},
            {"losses", entrant.losses},
            {"ties", entrant.ties},
        });
    }

    root["games"] = nlohmann::json::array();
    for (const auto& game : state.games) {
        root["games"].push_back({
            {"entrant_a", game.entrant_a},
            {"entrant_b", game.entrant_b},
            {"result", BoutResultToString(game.result)},
            {"timestamp", game.timestamp},
        });
    }

    root["eliminations"] = nlohmann::json::array();
    for (const auto& mark : state.eliminations) {
        root["eliminations"].push_back({
            {"entrant_id", mark.entrant_id},
            {"eliminated_at", mark.eliminated_at},
        });
    }

    root["pool"] = state.pool;
    return root.dump(2);
}

bool ParseStoreState(const std::string& payload, StoreState& state, std::string* error) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(payload);
    } catch (const std::exception& ex) {
        if (error) {
            *error = std::string("Failed to parse store: ") + ex.what();
        }
        return false;
    }

    StoreState parsed;
    try {
        parsed.version = root.value("version", parsed.version);
        parsed.next_entrant_id = root.value("next_entrant_id", parsed.next_entrant_id);

        if (root.contains("entrants")) {
            for (const auto& node : root.at("entrants")) {
                Entrant entrant;
                entrant.id = node.value("id", -1);
                entrant.identifier = node.value("identifier", "");
                entrant.elo = node.value("elo", kDefaultElo);
                entrant.wins = node.value("wins", 0);
                entrant.losses = node.value("losses", 0);
                entrant.ties = node.value("ties", 0);
                if (entrant.id < 0 || entrant.identifier.empty()) {
                    if (error) {
                        *error = "Store contains an entrant without id or identifier";
                    }
                    return false;
                }
                parsed.next_entrant_id = std::max(parsed.next_entrant_id, entrant.id + 1);
                parsed.entrants.push_back(std::move(entrant));
            }
        }

        if (root.contains("games")) {
            for (const auto& node : root.at("games")) {
                GameRecord game;
                game.entrant_a = node.value("entrant_a", -1);
                game.entrant_b = node.value("entrant_b", -1);
                game.timestamp = node.value("timestamp", "");
                if (!ParseBoutResult(node.value("result", ""), game.result)) {
                    if (error) {
                        *error = "Store contains a game with an invalid result";
                    }
                    return false;
                }
                parsed.games.push_back(std::move(game));
            }
        }

        if (root.contains("eliminations")) {
            for (const auto& node : root.at("eliminations")) {
                EliminationMark mark;
                mark.entrant_id = node.value("entrant_id", -1);
                mark.eliminated_at = node.value("eliminated_at", "");
                parsed.eliminations.push_back(std::move(mark));
            }
        }

        if (root.contains("pool")) {
            parsed.pool = root.at("pool").get<std::vector<int>>();
        }
    } catch (const std::exception& ex) {
        if (error) {
            *error = std::string("Malformed store: ") + ex.what();
        }
        return false;
    }

    state = std::move(parsed);
    return true;
}

bool SaveStoreState(const std::string& path, const StoreState& state, std::string* error) {
    return util::AtomicFileWriter::Write(path, SerializeStoreState(state), error);
}

bool LoadStoreState(const std::string& path, StoreState& state, std::string* error) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        if (error) {
            *error = "Failed to open store: " + path;
        }
        return false;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return ParseStoreState(buffer.str(), state, error);
}

}  // namespace localelo::core::store
