//
// Created by Giuseppe Francione on 02/12/25.
//

#include "../../include/cover_error.hpp"

namespace coverthumb {

std::string_view to_string(const ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::UnsupportedFormat: return "unsupported-format";
        case ErrorKind::ContainerError:    return "container-error";
        case ErrorKind::NoCoverFound:      return "no-cover-found";
        case ErrorKind::DecodeError:       return "decode-error";
        case ErrorKind::IoError:           return "io-error";
        case ErrorKind::CacheWriteFailure: return "cache-write-failure";
    }
    return "unknown";
}

} // namespace coverthumb
