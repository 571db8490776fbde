#pragma once
#include <string>
#include <utility>

namespace ovaup {

enum class ErrorCode : int {
    None = 0,
    Io,
    Parse,
    MissingRequiredEntry,
    ChecksumMismatch,
    Network,
    Exhausted,
    Cancelled,
    InvalidArgument,
    NotFound,
};

const char* ErrorCodeName(ErrorCode code);

struct Result {
    bool ok{true};
    ErrorCode code{ErrorCode::None};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(ErrorCode c, std::string m) {
        return {.ok = false, .code = c, .err = 0, .msg = std::move(m)};
    }
    // errno-carrying I/O failure
    static Result FailErrno(int e, std::string m) {
        return {.ok = false, .code = ErrorCode::Io, .err = e, .msg = std::move(m)};
    }
};

} // namespace ovaup
