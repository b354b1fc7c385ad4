#pragma once
#include <string>
#include <utility>

namespace fwunpack {

enum class ErrorCode : int {
    None = 0,
    Io,
    UnrecognizedFormat,
    MalformedHeader,
    InvalidTimestamp,
    MissingEmbeddedPackage,
    TruncatedRegion,
    UnsafePath,
    InvalidConfig,
};

const char* ToString(ErrorCode code);

struct Result {
    bool ok{true};
    ErrorCode code{ErrorCode::None};
    int err{0}; // errno for ErrorCode::Io
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(ErrorCode c, std::string m) {
        return {.ok = false, .code = c, .err = 0, .msg = std::move(m)};
    }
    static Result FailErrno(int e, std::string m) {
        return {.ok = false, .code = ErrorCode::Io, .err = e, .msg = std::move(m)};
    }
};

} // namespace fwunpack
