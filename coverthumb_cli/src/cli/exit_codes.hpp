//
// Created by Giuseppe Francione on 21/09/25.
//

#ifndef COVERTHUMB_EXIT_CODES_HPP
#define COVERTHUMB_EXIT_CODES_HPP

#include "../../../libcoverthumb/include/cover_error.hpp"

enum ExitCode : int {
    kExitOk = 0,
    kExitUsage = 1,
    kExitUnsupported = 2,
    kExitContainer = 3,
    kExitNoCover = 4,
    kExitDecode = 5,
    kExitIo = 6,
    kExitOutput = 7
};

/// Process exit status for a failed request.
inline int exit_code_for(const coverthumb::ErrorKind kind) {
    switch (kind) {
        case coverthumb::ErrorKind::UnsupportedFormat: return kExitUnsupported;
        case coverthumb::ErrorKind::ContainerError:    return kExitContainer;
        case coverthumb::ErrorKind::NoCoverFound:      return kExitNoCover;
        case coverthumb::ErrorKind::DecodeError:       return kExitDecode;
        case coverthumb::ErrorKind::IoError:
        case coverthumb::ErrorKind::CacheWriteFailure: return kExitIo;
    }
    return kExitIo;
}

#endif //COVERTHUMB_EXIT_CODES_HPP
