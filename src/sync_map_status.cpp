//
//  sync_map_status.cpp
//  SyncForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "sync_map_status.hpp"

namespace syncforge {

const char *to_string(SyncMapErrc code) {
    switch (code) {
        case SyncMapErrc::None:
            return "none";
        case SyncMapErrc::InvalidArgument:
            return "invalid argument";
        case SyncMapErrc::IoPermission:
            return "i/o permission";
        case SyncMapErrc::MissingParameter:
            return "missing parameter";
        case SyncMapErrc::CodecError:
            return "codec error";
    }
    return "unknown";
}

}  // namespace syncforge
