//
//  json_codec.cpp
//  SyncForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "json_codec.hpp"

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>

#include "logging.hpp"
#include "sync_map.hpp"
#include "time_format.hpp"

using json = nlohmann::json;

namespace {

using syncforge::SyncMap;
using syncforge::SyncMapErrc;
using syncforge::SyncMapStatus;

// Times are "S.mmm" strings in our own output; plain numbers are accepted too.
std::optional<uint64_t> read_time(const json &j, const char *key) {
    if (!j.contains(key)) {
        return std::nullopt;
    }
    const auto &v = j.at(key);
    if (v.is_string()) {
        return syncforge::parse_seconds(v.get<std::string>());
    }
    if (v.is_number()) {
        const double secs = v.get<double>();
        if (secs < 0.0) {
            return std::nullopt;
        }
        return syncforge::ms_from_seconds(secs);
    }
    return std::nullopt;
}

SyncMapStatus build_children(const json &list, SyncMap::FragmentTree &parent,
                             bool safety_checks, size_t &count) {
    if (!list.is_array()) {
        return syncforge::make_error(SyncMapErrc::CodecError, "'fragments' is not an array");
    }
    for (const auto &entry : list) {
        if (!entry.is_object()) {
            return syncforge::make_error(SyncMapErrc::CodecError, "fragment is not an object");
        }
        auto begin = read_time(entry, "begin");
        auto end = read_time(entry, "end");
        if (!begin || !end) {
            return syncforge::make_error(SyncMapErrc::CodecError,
                                         "fragment '" + entry.value("id", std::string()) +
                                             "' has a missing or invalid begin/end");
        }
        if (safety_checks && *begin > *end) {
            return syncforge::make_error(SyncMapErrc::CodecError,
                                         "fragment '" + entry.value("id", std::string()) +
                                             "' ends before it begins");
        }
        syncforge::TextFragment text;
        text.identifier = entry.value("id", std::string());
        if (entry.contains("language") && entry["language"].is_string()) {
            text.language = entry["language"].get<std::string>();
        }
        if (entry.contains("lines")) {
            text.lines = entry["lines"].get<std::vector<std::string>>();
        }
        auto node = SyncMap::FragmentTree::create(
            std::make_unique<syncforge::SyncMapFragment>(std::move(text), *begin, *end));
        ++count;
        if (entry.contains("children")) {
            auto status = build_children(entry["children"], *node, safety_checks, count);
            if (!status.ok) {
                return status;
            }
        }
        parent.add_child(std::move(node));
    }
    return syncforge::make_ok();
}

}  // namespace

namespace syncforge {

CodecResult JsonCodec::create(SyncMapFormat variant, const SyncMapParameters &,
                              const RunConfiguration &rconf) {
    return CodecResult{make_ok(), std::make_unique<JsonCodec>(variant, rconf)};
}

SyncMapStatus JsonCodec::parse(const std::string &input_text, SyncMap &syncmap) {
    size_t count = 0;
    SyncMapStatus status;
    try {
        json j = json::parse(input_text);
        if (!j.is_object() || !j.contains("fragments")) {
            status = make_error(SyncMapErrc::CodecError, "JSON input has no 'fragments' array");
        } else {
            status = build_children(j["fragments"], syncmap.fragments_tree(),
                                    rconf_.safety_checks, count);
        }
    } catch (const json::exception &e) {
        status = make_error(SyncMapErrc::CodecError, std::string("JSON input: ") + e.what());
    }
    if (!status.ok) {
        SF_LOG("error", "json parse failed: " << status.message);
        return status;
    }
    SF_LOG("codec", "json parsed fragments=" << count);
    return make_ok();
}

SyncMapStatus JsonCodec::format(const SyncMap &syncmap, std::string &out) const {
    out = syncmap.json_string();
    return make_ok();
}

}  // namespace syncforge
