//
//  json_codec.hpp
//  SyncForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "sync_map_codec.hpp"

namespace syncforge {

// Reads and writes the canonical JSON projection (SyncMap::json_string), nesting included.
class JsonCodec : public SyncMapCodec {
   public:
    using SyncMapCodec::SyncMapCodec;

    static CodecResult create(SyncMapFormat variant, const SyncMapParameters &parameters,
                              const RunConfiguration &rconf);

    SyncMapStatus parse(const std::string &input_text, SyncMap &syncmap) override;
    SyncMapStatus format(const SyncMap &syncmap, std::string &out) const override;
};

}  // namespace syncforge
