//
//  text_fragment.hpp
//  SyncForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace syncforge {

/// @ingroup api
/// A unit of text (sentence, paragraph, word...) carried by a sync map fragment.
struct TextFragment {
    std::string identifier;                ///< Unique within a sync map (not enforced)
    std::optional<std::string> language;   ///< Language code, if known
    std::vector<std::string> lines;        ///< UTF-8 text, one entry per line

    /// Lines joined with a single space.
    std::string text() const {
        std::string out;
        for (size_t i = 0; i < lines.size(); ++i) {
            if (i != 0) {
                out.push_back(' ');
            }
            out += lines[i];
        }
        return out;
    }
};

}  // namespace syncforge
