//
//  subtitle_codec.hpp
//  SyncForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include "sync_map_codec.hpp"

namespace syncforge {

/**
 * @brief SubRip (srt) and WebVTT (vtt) cues.
 *
 * Each cue is a number, a `begin --> end` timing line and one or more text lines. srt uses
 * `HH:MM:SS,mmm`, vtt uses `HH:MM:SS.mmm` after a `WEBVTT` header. Cue numbers are not kept
 * on read; identifiers are generated as f000001, f000002, ... Blank text lines are not written.
 */
class SubtitleCodec : public SyncMapCodec {
   public:
    using SyncMapCodec::SyncMapCodec;

    static CodecResult create(SyncMapFormat variant, const SyncMapParameters &parameters,
                              const RunConfiguration &rconf);

    SyncMapStatus parse(const std::string &input_text, SyncMap &syncmap) override;
    SyncMapStatus format(const SyncMap &syncmap, std::string &out) const override;
};

// Identifier for the n-th (1-based) generated fragment, e.g. 7 -> "f000007".
std::string generated_fragment_id(size_t n);

}  // namespace syncforge
