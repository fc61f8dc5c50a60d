//
//  sync_map_fragment.cpp
//  SyncForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "sync_map_fragment.hpp"

#include <sstream>

#include "time_format.hpp"

namespace syncforge {

std::string SyncMapFragment::to_string() const {
    std::ostringstream oss;
    oss << text_fragment.identifier << " " << format_ssmmm(begin_ms) << " "
        << format_ssmmm(end_ms) << " \"" << text_fragment.text() << "\"";
    return oss.str();
}

SyncMapFragmentPtr make_fragment(std::string identifier, std::vector<std::string> lines,
                                 uint64_t begin_ms, uint64_t end_ms,
                                 std::optional<std::string> language) {
    TextFragment text;
    text.identifier = std::move(identifier);
    text.language = std::move(language);
    text.lines = std::move(lines);
    return std::make_unique<SyncMapFragment>(std::move(text), begin_ms, end_ms);
}

}  // namespace syncforge
