#pragma once

#include <string>
#include <vector>

namespace localelo::core::discovery {

struct DiscoveryOptions {
    std::string pattern = ".*";
    std::vector<std::string> excluded_names;
};

// Regular, non-hidden files directly under dir whose name matches the
// pattern; sorted and unique.
std::vector<std::string> DiscoverEntrants(const std::string& dir,
                                          const DiscoveryOptions& options,
                                          std::string* error);

bool MatchesPattern(const std::string& identifier, const std::string& pattern);
bool EntrantExists(const std::string& dir, const std::string& identifier);

// "py,.js" -> ".*\.(py|js)$"
std::string ExtensionsToPattern(const std::string& extensions);

// "dir/file.tar.gz" -> "file.tar"
std::string DisplayName(const std::string& identifier);

// Moves dir/identifier into dir/.trash with a timestamp suffix.
bool TrashEntrantFile(const std::string& dir, const std::string& identifier, std::string* trash_path, std::string* error);

}  // namespace localelo::core::discovery
