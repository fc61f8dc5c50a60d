//
//  sync_map_codec.cpp
//  SyncForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "sync_map_codec.hpp"

#include "logging.hpp"

namespace syncforge {

SyncMapStatus SyncMapCodec::parse(const std::string &input_text, SyncMap &syncmap) {
    (void)input_text;
    (void)syncmap;
    return unsupported("reading");
}

SyncMapStatus SyncMapCodec::format(const SyncMap &syncmap, std::string &out) const {
    (void)syncmap;
    (void)out;
    return unsupported("writing");
}

SyncMapStatus SyncMapCodec::unsupported(const char *direction) const {
    std::string msg = std::string("Format '") + to_string(variant_) + "' does not support " +
                      direction;
    SF_LOG("error", msg);
    return make_error(SyncMapErrc::CodecError, msg);
}

}  // namespace syncforge
