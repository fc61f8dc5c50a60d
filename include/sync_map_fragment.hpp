//
//  sync_map_fragment.hpp
//  SyncForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "text_fragment.hpp"

namespace syncforge {

/// @ingroup api
/// Connects a text fragment with its time interval. begin_ms <= end_ms is trusted.
struct SyncMapFragment {
    TextFragment text_fragment;
    uint64_t begin_ms = 0;  ///< Absolute begin time in ms
    uint64_t end_ms = 0;    ///< Absolute end time in ms

    SyncMapFragment() = default;
    SyncMapFragment(TextFragment text, uint64_t begin, uint64_t end)
        : text_fragment(std::move(text)), begin_ms(begin), end_ms(end) {}

    // One-line description: id begin end "text".
    std::string to_string() const;
};

using SyncMapFragmentPtr = std::unique_ptr<SyncMapFragment>;

// Convenience factory used by codecs and tests.
SyncMapFragmentPtr make_fragment(std::string identifier, std::vector<std::string> lines,
                                 uint64_t begin_ms, uint64_t end_ms,
                                 std::optional<std::string> language = std::nullopt);

}  // namespace syncforge
