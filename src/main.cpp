#include "fwunpack/image_unpacker.hpp"
#include "fwunpack/progress_sinks.hpp"
#include "fwunpack/summary_json.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <cstdlib>
#include <getopt.h>
#include <optional>
#include <string>

namespace {

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s -i <image> -o <dir> [-j <file|->] [-c <config>] [-s] [-p] [-v|-q]\n"
        "   %s -i <image> -l [-j <file|->]\n"
        "\n"
        "Options:\n"
        "  -i, --input      Firmware image (RKFW wrapper or RKAF update package)\n"
        "  -o, --output     Destination directory (created if missing)\n"
        "  -l, --list       Decode and validate headers only, write nothing\n"
        "  -j, --json       Write unpack metadata as JSON to a file, '-' for stdout\n"
        "  -c, --config     JSON config file (default $FWUNPACK_CONFIG_PATH or %s)\n"
        "  -s, --sha256     Report SHA-256 of every extracted region\n"
        "  -p, --progress   Show per-region progress\n"
        "  -v, --verbose    Debug logging\n"
        "  -q, --quiet      Errors only\n"
        "  -h, --help       Show this help\n",
        argv, argv, fwunpack::config::kDefaultConfigPath);
}

} // namespace

int main(int argc, char **argv) {
    const char *in = nullptr;
    const char *out = nullptr;
    const char *json_out = nullptr;
    const char *config_cli = nullptr;
    bool list_only = false;
    bool sha256_cli = false;
    bool progress_cli = false;
    std::optional<fwunpack::LogLevel> level_cli;

    static option long_opts[] = {
        {"input", required_argument, nullptr, 'i'},
        {"output", required_argument, nullptr, 'o'},
        {"list", no_argument, nullptr, 'l'},
        {"json", required_argument, nullptr, 'j'},
        {"config", required_argument, nullptr, 'c'},
        {"sha256", no_argument, nullptr, 's'},
        {"progress", no_argument, nullptr, 'p'},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hi:o:lj:c:spvq", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;
            case 'i':
                in = optarg;
                break;
            case 'o':
                out = optarg;
                break;
            case 'l':
                list_only = true;
                break;
            case 'j':
                json_out = optarg;
                break;
            case 'c':
                config_cli = optarg;
                break;
            case 's':
                sha256_cli = true;
                break;
            case 'p':
                progress_cli = true;
                break;
            case 'v':
                level_cli = fwunpack::LogLevel::Debug;
                break;
            case 'q':
                level_cli = fwunpack::LogLevel::Error;
                break;
            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (!in || (!out && !list_only) || optind != argc) {
        PrintUsage(argv[0]);
        return 2;
    }

    bool explicit_config = false;
    const std::string config_path = fwunpack::config::ResolveConfigPath(config_cli, explicit_config);

    fwunpack::config::UnpackerConfigFromFile cfg;
    std::string config_warning;
    if (auto r = fwunpack::config::LoadResolvedConfig(config_path, explicit_config, cfg,
                                                      config_warning);
        !r.ok) {
        std::fprintf(stderr, "ERROR: %s\n", r.msg.c_str());
        return 1;
    }

    auto& logger = fwunpack::Logger::Instance();
    if (level_cli) {
        logger.SetLevel(*level_cli);
    } else if (cfg.log_level) {
        logger.SetLevel(*cfg.log_level);
    }
    if (!config_warning.empty()) {
        LogWarn("%s", config_warning.c_str());
    }

    fwunpack::ConsoleProgressSink progress_sink;

    fwunpack::UnpackOptions opt{};
    opt.dry_run = list_only;
    opt.safe_paths_only = cfg.safe_paths_only.value_or(true);
    opt.extract.chunk_size = static_cast<size_t>(
        cfg.chunk_size.value_or(fwunpack::RegionExtractor::kDefaultChunkSize));
    opt.extract.compute_digest = sha256_cli || cfg.compute_digests.value_or(false);
    if (progress_cli || cfg.progress.value_or(false)) {
        opt.extract.progress_sink = &progress_sink;
    }

    const std::string dst = out ? out : "";
    fwunpack::UnpackResult result;
    fwunpack::ImageUnpacker unpacker(opt);
    if (auto r = unpacker.UnpackFile(in, dst, result); !r.ok) {
        LogError("%s: %s", fwunpack::ToString(r.code), r.msg.c_str());
        return 1;
    }

    if (json_out) {
        if (auto r = fwunpack::WriteSummaryJson(result, json_out); !r.ok) {
            LogError("%s", r.msg.c_str());
            return 1;
        }
    }

    LogInfo("%s %s", list_only ? "Listed" : "Unpacked", in);
    return 0;
}
