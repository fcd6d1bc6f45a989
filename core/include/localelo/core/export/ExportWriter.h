#pragma once

#include "localelo/core/knockout/TournamentController.h"

#include <chrono>
#include <string>
#include <vector>

namespace localelo::core::exporter {

struct ExportRow {
    int position = 0;
    std::string identifier;
    int elo = 0;
    std::string record;
    std::string eliminated_at;  // "Winner" for the entrant without a mark
};

std::vector<ExportRow> BuildKnockoutRows(const std::vector<knockout::KnockoutStanding>& ordering);
std::string RenderKnockoutCsv(const std::vector<ExportRow>& rows);
bool WriteKnockoutCsv(const std::string& path,
                      const std::vector<knockout::KnockoutStanding>& ordering,
                      std::string* error);

// "knockout_results_20261019_133902.csv"
std::string KnockoutCsvName(std::chrono::system_clock::time_point when);

}  // namespace localelo::core::exporter
