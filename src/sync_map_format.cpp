//
//  sync_map_format.cpp
//  SyncForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "sync_map_format.hpp"

#include <array>

#include "delimited_codec.hpp"
#include "json_codec.hpp"
#include "logging.hpp"
#include "smil_codec.hpp"
#include "subtitle_codec.hpp"
#include "sync_map_codec.hpp"

namespace {

using syncforge::CodecResult;
using syncforge::RunConfiguration;
using syncforge::SyncMapFormat;
using syncforge::SyncMapParameters;

using CodecFactory = CodecResult (*)(SyncMapFormat, const SyncMapParameters &,
                                     const RunConfiguration &);

struct RegistryEntry {
    SyncMapFormat format;
    const char *id;
    bool can_parse;
    bool can_format;
    CodecFactory factory;
};

// Sorted by identifier.
constexpr std::array<RegistryEntry, 8> kRegistry = {{
    {SyncMapFormat::Csv, "csv", true, true, &syncforge::DelimitedCodec::create},
    {SyncMapFormat::Json, "json", true, true, &syncforge::JsonCodec::create},
    {SyncMapFormat::Smil, "smil", false, true, &syncforge::SmilCodec::create},
    {SyncMapFormat::Srt, "srt", true, true, &syncforge::SubtitleCodec::create},
    {SyncMapFormat::Ssv, "ssv", true, true, &syncforge::DelimitedCodec::create},
    {SyncMapFormat::Tsv, "tsv", true, true, &syncforge::DelimitedCodec::create},
    {SyncMapFormat::Txt, "txt", true, true, &syncforge::DelimitedCodec::create},
    {SyncMapFormat::Vtt, "vtt", true, true, &syncforge::SubtitleCodec::create},
}};

const RegistryEntry &entry_for(SyncMapFormat format) {
    for (const auto &e : kRegistry) {
        if (e.format == format) {
            return e;
        }
    }
    // Every enumerator has an entry.
    return kRegistry.front();
}

}  // namespace

namespace syncforge {

std::optional<SyncMapFormat> sync_map_format_from_string(const std::string &id) {
    for (const auto &e : kRegistry) {
        if (id == e.id) {
            return e.format;
        }
    }
    return std::nullopt;
}

const char *to_string(SyncMapFormat format) { return entry_for(format).id; }

std::vector<SyncMapFormat> all_sync_map_formats() {
    std::vector<SyncMapFormat> out;
    out.reserve(kRegistry.size());
    for (const auto &e : kRegistry) {
        out.push_back(e.format);
    }
    return out;
}

bool format_can_parse(SyncMapFormat format) { return entry_for(format).can_parse; }

bool format_can_format(SyncMapFormat format) { return entry_for(format).can_format; }

CodecResult make_codec(SyncMapFormat format, const SyncMapParameters &parameters,
                       const RunConfiguration &rconf) {
    const auto &e = entry_for(format);
    SF_LOG("codec", "constructing codec for '" << e.id << "' with " << parameters.size()
                                               << " parameter(s)");
    auto result = e.factory(format, parameters, rconf);
    if (!result.status.ok) {
        SF_LOG("error", "codec construction for '" << e.id << "' failed: "
                                                   << result.status.message);
    }
    return result;
}

}  // namespace syncforge
