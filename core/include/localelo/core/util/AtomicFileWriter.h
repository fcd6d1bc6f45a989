#pragma once

#include <string>

namespace localelo::core::util {

// Writes to "<path>.tmp" and renames over <path>; readers never see a partial file.
class AtomicFileWriter {
public:
    static bool Write(const std::string& path, const std::string& contents, std::string* error = nullptr);
};

}  // namespace localelo::core::util
