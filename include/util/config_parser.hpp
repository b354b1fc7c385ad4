#pragma once
#include "util/logger.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace fwunpack::config {

inline constexpr const char* kDefaultConfigPath = "/etc/fwunpack/fwunpack.conf";
inline constexpr const char* kConfigPathEnv = "FWUNPACK_CONFIG_PATH";

inline constexpr std::uint64_t kMinChunkSize = 512;
inline constexpr std::uint64_t kMaxChunkSize = 64 * 1024 * 1024ULL;

// Optional settings; unset fields keep the built-in defaults.
class UnpackerConfigFromFile {
public:
    std::optional<std::uint64_t> chunk_size;
    std::optional<LogLevel> log_level;
    std::optional<bool> compute_digests;
    std::optional<bool> progress;
    std::optional<bool> safe_paths_only;

    Result LoadFile(const std::string &path);

    void Reset();
};

// --config value, else $FWUNPACK_CONFIG_PATH, else the default path.
std::string ResolveConfigPath(const char *cli_path, bool &explicit_path);

// An explicit path must load. The default path may be missing; when it exists
// but fails to load, the built-in defaults apply and the error lands in warning.
Result LoadResolvedConfig(const std::string &path, bool explicit_path,
                          UnpackerConfigFromFile &cfg, std::string &warning);

} // namespace fwunpack::config
