#include "localelo/core/discovery/EntrantFiles.h"

#include "localelo/core/util/Timestamp.h"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <regex>
#include <sstream>
#include <system_error>

namespace localelo::core::discovery {

namespace {

std::string Trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t");
    return value.substr(begin, end - begin + 1);
}

std::string EscapeRegex(const std::string& value) {
    static const std::string kSpecial = R"(\^$.|?*+()[]{})";
    std::string escaped;
    for (char ch : value) {
        if (kSpecial.find(ch) != std::string::npos) {
            escaped.push_back('\\');
        }
        escaped.push_back(ch);
    }
    return escaped;
}

}  // namespace

std::vector<std::string> DiscoverEntrants(const std::string& dir,
                                          const DiscoveryOptions& options,
                                          std::string* error) {
    std::vector<std::string> found;
    std::regex regex;
    try {
        regex = std::regex(options.pattern);
    } catch (const std::regex_error& ex) {
        if (error) {
            *error = "Invalid pattern '" + options.pattern + "': " + ex.what();
        }
        return found;
    }

    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        if (error) {
            *error = "Failed to scan " + dir + ": " + ec.message();
        }
        return found;
    }
    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        const std::string name = entry.path().filename().string();
        if (name.empty() || name.front() == '.') {
            continue;
        }
        if (std::find(options.excluded_names.begin(), options.excluded_names.end(), name) !=
            options.excluded_names.end()) {
            continue;
        }
        if (std::regex_search(name, regex)) {
            found.push_back(name);
        }
    }
    std::sort(found.begin(), found.end());
    found.erase(std::unique(found.begin(), found.end()), found.end());
    return found;
}

bool MatchesPattern(const std::string& identifier, const std::string& pattern) {
    try {
        return std::regex_search(identifier, std::regex(pattern));
    } catch (const std::regex_error&) {
        return false;
    }
}

bool EntrantExists(const std::string& dir, const std::string& identifier) {
    std::error_code ec;
    return std::filesystem::is_regular_file(std::filesystem::path(dir) / identifier, ec);
}

std::string ExtensionsToPattern(const std::string& extensions) {
    std::vector<std::string> parts;
    std::stringstream stream(extensions);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = Trim(item);
        while (!item.empty() && item.front() == '.') {
            item.erase(item.begin());
        }
        if (!item.empty()) {
            parts.push_back(EscapeRegex(item));
        }
    }
    if (parts.empty()) {
        return ".*";
    }
    if (parts.size() == 1) {
        return ".*\\." + parts.front() + "$";
    }
    std::string joined;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            joined += '|';
        }
        joined += parts[i];
    }
    return ".*\\.(" + joined + ")$";
}

std::string DisplayName(const std::string& identifier) {
    const std::filesystem::path path(identifier);
    const std::string stem = path.stem().string();
    return stem.empty() ? path.filename().string() : stem;
}

bool TrashEntrantFile(const std::string& dir,
                      const std::string& identifier,
                      std::string* trash_path,
                      std::string* error) {
    const std::filesystem::path source = std::filesystem::path(dir) / identifier;
    std::error_code ec;
    if (!std::filesystem::exists(source, ec)) {
        if (error) {
            *error = "File " + source.string() + " does not exist on disk";
        }
        return false;
    }
    const std::filesystem::path trash_dir = std::filesystem::path(dir) / ".trash";
    std::filesystem::create_directories(trash_dir, ec);
    if (ec) {
        if (error) {
            *error = "Could not create " + trash_dir.string() + ": " + ec.message();
        }
        return false;
    }

    const std::string stamp = util::FormatFileStamp(std::chrono::system_clock::now());
    const std::filesystem::path target =
        trash_dir / (source.stem().string() + "_" + stamp + source.extension().string());
    std::filesystem::rename(source, target, ec);
    if (ec) {
        if (error) {
            *error = "Could not trash file: " + ec.message();
        }
        return false;
    }
    if (trash_path) {
        *trash_path = target.string();
    }
    return true;
}

}  // namespace localelo::core::discovery
