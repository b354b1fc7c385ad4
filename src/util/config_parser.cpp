#include "util/config_parser.hpp"

#include "util/config_json_utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <system_error>

namespace fwunpack::config {

void UnpackerConfigFromFile::Reset() {
    chunk_size.reset();
    log_level.reset();
    compute_digests.reset();
    progress.reset();
    safe_paths_only.reset();
}

Result UnpackerConfigFromFile::LoadFile(const std::string& path) {
    Reset();

    nlohmann::json json;
    std::string err;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return Result::Fail(ErrorCode::InvalidConfig, "Config: " + err);
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        Reset();
        return Result::Fail(ErrorCode::InvalidConfig, "Config: " + err + " in " + path);
    }

    return Result::Ok();
}

std::string ResolveConfigPath(const char* cli_path, bool& explicit_path) {
    if (cli_path && *cli_path) {
        explicit_path = true;
        return cli_path;
    }
    if (const char* env = std::getenv(kConfigPathEnv); env && *env) {
        explicit_path = true;
        return env;
    }
    explicit_path = false;
    return kDefaultConfigPath;
}

Result LoadResolvedConfig(const std::string& path, bool explicit_path,
                          UnpackerConfigFromFile& cfg, std::string& warning) {
    warning.clear();
    cfg.Reset();
    if (!explicit_path) {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) return Result::Ok();
    }

    auto r = cfg.LoadFile(path);
    if (r.ok || explicit_path) return r;

    warning = r.msg + ", using built-in defaults";
    return Result::Ok();
}

} // namespace fwunpack::config
