#include "TestSupport.h"

#include <atomic>
#include <chrono>
#include <fstream>
#include <stdexcept>

namespace localelo::test {

TempDir::TempDir() {
    static std::atomic<int> counter{0};
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = std::filesystem::temp_directory_path() /
            ("localelo_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
    std::filesystem::create_directories(path_);
}

TempDir::~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
}

void TempDir::Touch(const std::string& name) const {
    std::ofstream output(path_ / name);
    output << name << '\n';
}

std::vector<int> Seed(core::store::EntrantStore& store,
                      const std::vector<std::string>& identifiers,
                      const std::vector<double>& elos) {
    core::Error error;
    if (store.MergeDiscovered(identifiers, &error) < 0) {
        throw std::runtime_error(error.message);
    }
    std::vector<int> ids;
    for (const auto& identifier : identifiers) {
        ids.push_back(store.FindByIdentifier(identifier)->id);
    }
    if (!elos.empty()) {
        const bool ok = store.Transact(
            [&](core::store::StoreState& state, core::Error*) {
                for (size_t i = 0; i < ids.size() && i < elos.size(); ++i) {
                    state.FindEntrant(ids[i])->elo = elos[i];
                }
                return true;
            },
            &error);
        if (!ok) {
            throw std::runtime_error(error.message);
        }
    }
    return ids;
}

}  // namespace localelo::test
