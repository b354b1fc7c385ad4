#include "util/result.hpp"

namespace fwunpack {

const char* ToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:                   return "none";
        case ErrorCode::Io:                     return "io";
        case ErrorCode::UnrecognizedFormat:     return "unrecognized format";
        case ErrorCode::MalformedHeader:        return "malformed header";
        case ErrorCode::InvalidTimestamp:       return "invalid timestamp";
        case ErrorCode::MissingEmbeddedPackage: return "missing embedded package";
        case ErrorCode::TruncatedRegion:        return "truncated region";
        case ErrorCode::UnsafePath:             return "unsafe path";
        case ErrorCode::InvalidConfig:          return "invalid config";
    }
    return "unknown";
}

} // namespace fwunpack
