//
//  sync_map_status.hpp
//  SyncForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <utility>

namespace syncforge {

/// @ingroup api
/// Failure classes reported by sync map operations.
enum class SyncMapErrc {
    None = 0,
    InvalidArgument,   ///< Absent/unknown format, absent fragment
    IoPermission,      ///< Input unreadable or output unwritable
    MissingParameter,  ///< A codec requires a parameter that was not supplied
    CodecError,        ///< Failure inside a codec's parse/format
};

/**
 * @brief Result object with success flag, failure class and optional error message.
 *
 * When `ok == true`, `code` is `None` and `message` is empty. On failure, `message` contains a
 * short description of what went wrong.
 */
struct SyncMapStatus {
    bool ok{false};
    SyncMapErrc code{SyncMapErrc::None};
    std::string message;
};

inline SyncMapStatus make_ok() { return SyncMapStatus{true, SyncMapErrc::None, {}}; }

inline SyncMapStatus make_error(SyncMapErrc code, std::string msg) {
    return SyncMapStatus{false, code, std::move(msg)};
}

const char *to_string(SyncMapErrc code);

}  // namespace syncforge
