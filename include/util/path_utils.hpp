#pragma once

#include "util/result.hpp"

#include <string>
#include <string_view>

namespace fwunpack {

// Normalize a path recorded in an image header to a clean relative form:
// - strip leading "./"
// - strip leading "/" (avoid absolute)
// - collapse duplicate slashes
inline std::string NormalizeRelativePath(std::string s) {
    while (s.rfind("./", 0) == 0) s.erase(0, 2);
    while (!s.empty() && s.front() == '/') s.erase(0, 1);

    std::string out;
    out.reserve(s.size());
    bool prev_slash = false;
    for (char c : s) {
        const bool slash = (c == '/');
        if (slash && prev_slash) continue;
        out.push_back(c);
        prev_slash = slash;
    }
    return out;
}

inline std::string JoinPath(std::string_view dir, std::string_view name) {
    std::string out(dir);
    if (!out.empty() && out.back() != '/') out.push_back('/');
    out.append(name);
    return out;
}

// mkdir -p
Result CreateDirectories(const std::string& dir);
Result CreateParentDirectories(const std::string& file_path);

} // namespace fwunpack
