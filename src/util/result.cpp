#include "util/result.hpp"

namespace ovaup {

const char* ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None:                 return "ok";
        case ErrorCode::Io:                   return "io error";
        case ErrorCode::Parse:                return "parse error";
        case ErrorCode::MissingRequiredEntry: return "missing required entry";
        case ErrorCode::ChecksumMismatch:     return "checksum mismatch";
        case ErrorCode::Network:              return "network error";
        case ErrorCode::Exhausted:            return "retries exhausted";
        case ErrorCode::Cancelled:            return "cancelled";
        case ErrorCode::InvalidArgument:      return "invalid argument";
        case ErrorCode::NotFound:             return "not found";
    }
    return "unknown";
}

} // namespace ovaup
