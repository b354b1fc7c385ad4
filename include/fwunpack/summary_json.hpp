#pragma once

#include "fwunpack/image_types.hpp"
#include "util/result.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace fwunpack {

nlohmann::json ToJson(const WrapperInfo& info);
nlohmann::json ToJson(const PartitionInfo& part);
nlohmann::json ToJson(const PackageInfo& info);
nlohmann::json ToJson(const UnpackResult& result);

// Writes the metadata of one unpack run as pretty-printed JSON; "-" means stdout.
Result WriteSummaryJson(const UnpackResult& result, const std::string& path);

} // namespace fwunpack
