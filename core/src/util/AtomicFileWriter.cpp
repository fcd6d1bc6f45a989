#include "localelo/core/util/AtomicFileWriter.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

namespace localelo::core::util {

namespace {

bool Fail(const std::string& message, std::string* error) {
    std::cerr << "[atomic] " << message << '\n';
    if (error) {
        *error = message;
    }
    return false;
}

}  // namespace

bool AtomicFileWriter::Write(const std::string& path, const std::string& contents, std::string* error) {
    const std::filesystem::path fs_path(path);
    std::error_code ec;
    if (!fs_path.parent_path().empty()) {
        std::filesystem::create_directories(fs_path.parent_path(), ec);
        if (ec) {
            return Fail("Failed to create directory for " + path + ": " + ec.message(), error);
        }
    }

    const std::string temp_path = path + ".tmp";
    {
        std::ofstream output(temp_path, std::ios::binary | std::ios::trunc);
        if (!output) {
            return Fail("Failed to open temp file: " + temp_path, error);
        }
        output.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        output.flush();
        if (!output) {
            std::remove(temp_path.c_str());
            return Fail("Failed to write temp file: " + temp_path, error);
        }
    }

    // rename() replaces the target atomically on POSIX.
    std::filesystem::rename(temp_path, fs_path, ec);
    if (ec) {
        std::remove(temp_path.c_str());
        return Fail("rename failed for " + path + ": " + ec.message(), error);
    }
    return true;
}

}  // namespace localelo::core::util
