//
//  subtitle_codec.cpp
//  SyncForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "subtitle_codec.hpp"

#include <cstdio>
#include <memory>
#include <sstream>
#include <vector>

#include "logging.hpp"
#include "sync_map.hpp"
#include "time_format.hpp"

namespace {

constexpr const char *kCueArrow = "-->";
constexpr const char *kVttHeader = "WEBVTT";

std::string trim(const std::string &s) {
    const auto first = s.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t");
    return s.substr(first, last - first + 1);
}

// Blank-line separated blocks, CR stripped.
std::vector<std::vector<std::string>> split_blocks(const std::string &text) {
    std::vector<std::vector<std::string>> blocks;
    std::vector<std::string> current;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (trim(line).empty()) {
            if (!current.empty()) {
                blocks.push_back(std::move(current));
                current.clear();
            }
            continue;
        }
        current.push_back(line);
    }
    if (!current.empty()) {
        blocks.push_back(std::move(current));
    }
    return blocks;
}

}  // namespace

namespace syncforge {

std::string generated_fragment_id(size_t n) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "f%06zu", n);
    return buf;
}

CodecResult SubtitleCodec::create(SyncMapFormat variant, const SyncMapParameters &,
                                  const RunConfiguration &rconf) {
    return CodecResult{make_ok(), std::make_unique<SubtitleCodec>(variant, rconf)};
}

SyncMapStatus SubtitleCodec::parse(const std::string &input_text, SyncMap &syncmap) {
    const bool vtt = variant_ == SyncMapFormat::Vtt;
    auto blocks = split_blocks(input_text);
    size_t count = 0;
    for (size_t b = 0; b < blocks.size(); ++b) {
        const auto &block = blocks[b];
        if (vtt && b == 0 && block.front().rfind(kVttHeader, 0) == 0) {
            continue;
        }
        if (vtt && (block.front().rfind("NOTE", 0) == 0 || block.front() == "STYLE" ||
                    block.front() == "REGION")) {
            continue;
        }
        // Optional cue number / identifier line before the timing line.
        size_t timing = 0;
        if (block.front().find(kCueArrow) == std::string::npos) {
            timing = 1;
        }
        if (timing >= block.size() || block[timing].find(kCueArrow) == std::string::npos) {
            std::string msg = std::string(to_string(variant_)) + " cue " + std::to_string(b + 1) +
                              ": missing timing line";
            SF_LOG("error", msg);
            return make_error(SyncMapErrc::CodecError, msg);
        }
        const std::string &timing_line = block[timing];
        const auto arrow = timing_line.find(kCueArrow);
        const std::string begin_s = trim(timing_line.substr(0, arrow));
        std::string end_s = trim(timing_line.substr(arrow + 3));
        // Drop vtt cue settings ("align:start ...").
        const auto space = end_s.find_first_of(" \t");
        if (space != std::string::npos) {
            end_s = end_s.substr(0, space);
        }
        auto begin = parse_clock(begin_s);
        auto end = parse_clock(end_s);
        if (!begin || !end) {
            std::string msg = std::string(to_string(variant_)) + " cue " + std::to_string(b + 1) +
                              ": invalid timing '" + timing_line + "'";
            SF_LOG("error", msg);
            return make_error(SyncMapErrc::CodecError, msg);
        }
        if (rconf_.safety_checks && *begin > *end) {
            std::string msg = std::string(to_string(variant_)) + " cue " + std::to_string(b + 1) +
                              ": ends before it begins";
            SF_LOG("error", msg);
            return make_error(SyncMapErrc::CodecError, msg);
        }
        std::vector<std::string> lines(block.begin() + static_cast<long>(timing) + 1, block.end());
        ++count;
        auto status =
            syncmap.add_fragment(make_fragment(generated_fragment_id(count), std::move(lines),
                                               *begin, *end));
        if (!status.ok) {
            return status;
        }
    }
    SF_LOG("codec", to_string(variant_) << " parsed cues=" << count);
    return make_ok();
}

SyncMapStatus SubtitleCodec::format(const SyncMap &syncmap, std::string &out) const {
    const bool vtt = variant_ == SyncMapFormat::Vtt;
    const char sep = vtt ? '.' : ',';
    std::ostringstream oss;
    if (vtt) {
        oss << kVttHeader << "\n\n";
    }
    size_t index = 1;
    for (const auto *f : syncmap.fragments()) {
        oss << index++ << "\n";
        oss << format_clock(f->begin_ms, sep) << " " << kCueArrow << " "
            << format_clock(f->end_ms, sep) << "\n";
        // A blank line would end the cue.
        for (const auto &line : f->text_fragment.lines) {
            if (line.find_first_not_of(" \t\r") != std::string::npos) {
                oss << line << "\n";
            }
        }
        oss << "\n";
    }
    out = oss.str();
    return make_ok();
}

}  // namespace syncforge
