#include "errors.hpp"

namespace wfmk {

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NetworkUnreachable:   return "network unreachable";
        case ErrorKind::HttpStatus:           return "HTTP error";
        case ErrorKind::MalformedResponse:    return "malformed response";
        case ErrorKind::Timeout:              return "timeout";
        case ErrorKind::CacheIo:              return "cache I/O error";
        case ErrorKind::InvalidConfiguration: return "invalid configuration";
    }
    return "unknown error";
}

std::string Error::message() const {
    std::string msg = toString(kind);
    if (kind == ErrorKind::HttpStatus) {
        msg += " " + std::to_string(httpStatus);
    }
    if (!detail.empty()) {
        msg += ": " + detail;
    }
    return msg;
}

} // namespace wfmk
