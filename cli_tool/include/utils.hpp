#pragma once

#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

#include "error.hpp"

namespace fs = std::filesystem;

namespace Utils {
inline bool check_file_exists(const std::string_view& filepath) {
    fs::path file{filepath};
    return fs::exists(file);
}

// The peer-supplied name must be a bare file name. Anything that could walk
// out of the storage directory is refused rather than rewritten.
inline std::string sanitize_file_name(const std::string& name) {
    if (name.empty()) {
        throw ProtocolError("empty file name");
    }
    if (name == "." || name == "..") {
        throw ProtocolError("refusing file name '" + name + "'");
    }
    for (char c : name) {
        if (c == '/' || c == '\\' || c == '\0') {
            throw ProtocolError("refusing file name with path separator: '" + name + "'");
        }
    }
    return name;
}

inline fs::path normalized_dir(const fs::path& dir) {
    fs::path p = fs::weakly_canonical(fs::absolute(dir)).lexically_normal();
    if (!p.has_filename() && p.has_parent_path() && p != p.root_path()) p = p.parent_path();
    return p;
}

// Joins a sanitized name onto the storage directory and checks that the
// result is a direct child of it.
inline fs::path resolve_destination(const fs::path& storage_dir, const std::string& name) {
    const std::string safe = sanitize_file_name(name);
    const fs::path dir = normalized_dir(storage_dir);
    const fs::path target = (dir / safe).lexically_normal();
    if (target.parent_path() != dir) {
        throw ProtocolError("destination escapes storage directory: '" + name + "'");
    }
    return target;
}

inline std::string human_size(std::uint64_t bytes) {
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    if (unit == 0) {
        oss << bytes << " " << units[0];
    } else {
        oss << std::fixed << std::setprecision(1) << value << " " << units[unit];
    }
    return oss.str();
}
}  // namespace Utils
