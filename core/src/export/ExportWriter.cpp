#include "localelo/core/export/ExportWriter.h"

#include "localelo/core/present/Presenter.h"
#include "localelo/core/util/AtomicFileWriter.h"
#include "localelo/core/util/Timestamp.h"

#include <sstream>

namespace localelo::core::exporter {

namespace {

std::string CsvField(const std::string& value) {
    if (value.find_first_of(",\"\n\r") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char ch : value) {
        if (ch == '"') {
            quoted += '"';
        }
        quoted += ch;
    }
    quoted += '"';
    return quoted;
}

}  // namespace

std::vector<ExportRow> BuildKnockoutRows(const std::vector<knockout::KnockoutStanding>& ordering) {
    std::vector<ExportRow> rows;
    rows.reserve(ordering.size());
    int position = 1;
    for (const auto& standing : ordering) {
        ExportRow row;
        row.position = position++;
        row.identifier = standing.entrant.identifier;
        row.elo = static_cast<int>(standing.entrant.elo);
        row.record = present::FormatRecord(standing.entrant);
        row.eliminated_at = standing.eliminated_at ? *standing.eliminated_at : "Winner";
        rows.push_back(std::move(row));
    }
    return rows;
}

std::string RenderKnockoutCsv(const std::vector<ExportRow>& rows) {
    std::ostringstream output;
    output << "Position,Identifier,Elo,Record,Eliminated At\n";
    for (const auto& row : rows) {
        output << row.position << ',' << CsvField(row.identifier) << ',' << row.elo << ',' << row.record << ','
               << CsvField(row.eliminated_at) << "\n";
    }
    return output.str();
}

bool WriteKnockoutCsv(const std::string& path,
                      const std::vector<knockout::KnockoutStanding>& ordering,
                      std::string* error) {
    return util::AtomicFileWriter::Write(path, RenderKnockoutCsv(BuildKnockoutRows(ordering)), error);
}

std::string KnockoutCsvName(std::chrono::system_clock::time_point when) {
    return "knockout_results_" + util::FormatFileStamp(when) + ".csv";
}

}  // namespace localelo::core::exporter
