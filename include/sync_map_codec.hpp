//
//  sync_map_codec.hpp
//  SyncForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>
#include <utility>

#include "sync_map_format.hpp"
#include "sync_map_parameters.hpp"
#include "sync_map_status.hpp"

namespace syncforge {

class SyncMap;

/**
 * @brief Reader/writer bound to one format variant.
 *
 * `parse` populates the given sync map as a side effect; `format` renders the whole tree to a
 * single text blob. A codec that does not support a direction returns CodecError; the
 * registry's format_can_parse/format_can_format say which directions exist.
 */
class SyncMapCodec {
   public:
    SyncMapCodec(SyncMapFormat variant, RunConfiguration rconf)
        : variant_(variant), rconf_(std::move(rconf)) {}
    virtual ~SyncMapCodec() = default;

    SyncMapFormat variant() const { return variant_; }

    virtual SyncMapStatus parse(const std::string &input_text, SyncMap &syncmap);
    virtual SyncMapStatus format(const SyncMap &syncmap, std::string &out) const;

   protected:
    SyncMapStatus unsupported(const char *direction) const;

    SyncMapFormat variant_;
    RunConfiguration rconf_;
};

}  // namespace syncforge
