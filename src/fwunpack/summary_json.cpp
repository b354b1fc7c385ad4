#include "fwunpack/summary_json.hpp"

#include <cerrno>
#include <cstdio>
#include <fstream>

namespace fwunpack {

using json = nlohmann::json;

namespace {

void PutDigest(json& j, const char* key, const std::string& hex) {
    if (!hex.empty()) j[key] = hex;
}

} // namespace

json ToJson(const WrapperInfo& info) {
    json j;
    j["format"] = "wrapper";
    j["version"] = info.version;
    j["code"] = info.code;
    j["timestamp"] = info.timestamp;
    j["chip_family"] = info.chip_family;
    j["chip_code"] = info.chip_code;
    j["chip_recognized"] = info.chip_recognized;
    j["boot"] = {{"offset", info.boot_offset}, {"size", info.boot_size}};
    PutDigest(j["boot"], "sha256", info.boot_sha256);
    j["embedded_update"] = {{"offset", info.update_offset}, {"size", info.update_size}};
    PutDigest(j["embedded_update"], "sha256", info.update_sha256);
    return j;
}

json ToJson(const PartitionInfo& part) {
    json j = {
        {"name", part.name},
        {"path", part.path},
        {"flash_size", part.flash_size},
        {"flash_offset", part.flash_offset},
        {"part_offset", part.part_offset},
        {"padded_size", part.padded_size},
        {"part_byte_count", part.part_byte_count},
    };
    PutDigest(j, "sha256", part.sha256);
    return j;
}

json ToJson(const PackageInfo& info) {
    json j;
    j["format"] = "package";
    j["manufacturer"] = info.manufacturer;
    j["model"] = info.model;
    j["version"] = info.version;
    j["filesize"] = info.filesize;
    j["declared_length"] = info.declared_length;
    j["length_consistent"] = info.length_consistent;
    j["partitions"] = json::array();
    for (const auto& part : info.partitions) {
        j["partitions"].push_back(ToJson(part));
    }
    return j;
}

json ToJson(const UnpackResult& result) {
    return std::visit([](const auto& info) { return ToJson(info); }, result);
}

Result WriteSummaryJson(const UnpackResult& result, const std::string& path) {
    std::string text;
    try {
        text = ToJson(result).dump(2);
    } catch (const json::exception& e) {
        // dump() throws on invalid UTF-8 in string values
        return Result::Fail(ErrorCode::Io, std::string("Cannot serialize summary: ") + e.what());
    }
    text.push_back('\n');

    if (path == "-") {
        if (std::fwrite(text.data(), 1, text.size(), stdout) != text.size()) {
            return Result::FailErrno(errno, "Failed to write summary to stdout");
        }
        std::fflush(stdout);
        return Result::Ok();
    }

    std::ofstream os(path, std::ios::trunc);
    if (!os.good()) {
        return Result::FailErrno(errno, "cannot open summary file: " + path);
    }
    os << text;
    os.close();
    if (!os.good()) {
        return Result::FailErrno(errno, "Failed to write summary: " + path);
    }
    return Result::Ok();
}

} // namespace fwunpack
