#include "util/config_json_utils.hpp"

#include <fstream>

namespace fwunpack::config::detail {

namespace {

// Present but of the wrong type is an error; absent is not.
bool GetStringIfPresent(const nlohmann::json& j, const char* key, std::optional<std::string>& out,
                        std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

bool GetU64IfPresent(const nlohmann::json& j, const char* key, std::optional<std::uint64_t>& out,
                     std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (it->is_number_unsigned()) {
        out = it->get<std::uint64_t>();
        return true;
    }
    if (it->is_number_integer() && it->get<long long>() >= 0) {
        out = static_cast<std::uint64_t>(it->get<long long>());
        return true;
    }
    err = std::string(key) + " must be a non-negative integer";
    return false;
}

bool GetBoolIfPresent(const nlohmann::json& j, const char* key, std::optional<bool>& out,
                      std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_boolean()) {
        err = std::string(key) + " must be a boolean";
        return false;
    }
    out = it->get<bool>();
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, UnpackerConfigFromFile& cfg, std::string& err) {
    if (!GetU64IfPresent(j, "ChunkSize", cfg.chunk_size, err))
        return false;
    if (cfg.chunk_size && (*cfg.chunk_size < kMinChunkSize || *cfg.chunk_size > kMaxChunkSize)) {
        err = "ChunkSize out of range [" + std::to_string(kMinChunkSize) + ", " +
              std::to_string(kMaxChunkSize) + "]";
        return false;
    }

    std::optional<std::string> level;
    if (!GetStringIfPresent(j, "LogLevel", level, err))
        return false;
    if (level) {
        LogLevel lvl{};
        if (!ParseLogLevel(*level, lvl)) {
            err = "unknown LogLevel '" + *level + "'";
            return false;
        }
        cfg.log_level = lvl;
    }

    if (!GetBoolIfPresent(j, "ComputeDigests", cfg.compute_digests, err))
        return false;
    if (!GetBoolIfPresent(j, "Progress", cfg.progress, err))
        return false;
    if (!GetBoolIfPresent(j, "SafePathsOnly", cfg.safe_paths_only, err))
        return false;

    return true;
}

} // namespace fwunpack::config::detail
