//
//  sync_map_format.hpp
//  SyncForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "sync_map_parameters.hpp"
#include "sync_map_status.hpp"

namespace syncforge {

class SyncMapCodec;

/// @ingroup api
/// Formats known to the registry. Identifiers are the lowercase names ("csv", "json", ...).
enum class SyncMapFormat { Csv, Json, Smil, Srt, Ssv, Tsv, Txt, Vtt };

// Lookup by identifier; nullopt for unknown or empty identifiers.
std::optional<SyncMapFormat> sync_map_format_from_string(const std::string &id);

const char *to_string(SyncMapFormat format);

// All registered formats, in identifier order.
std::vector<SyncMapFormat> all_sync_map_formats();

// Capability queries: whether the codec for format can read and/or write.
bool format_can_parse(SyncMapFormat format);
bool format_can_format(SyncMapFormat format);

/// Outcome of codec construction. On failure `codec` is null and `status` says why.
struct CodecResult {
    SyncMapStatus status;
    std::unique_ptr<SyncMapCodec> codec;
};

// Construct the codec registered for format. Fails with MissingParameter when the codec
// requires a parameter that is absent.
CodecResult make_codec(SyncMapFormat format, const SyncMapParameters &parameters,
                       const RunConfiguration &rconf);

}  // namespace syncforge
