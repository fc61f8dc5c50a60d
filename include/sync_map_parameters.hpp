//
//  sync_map_parameters.hpp
//  SyncForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <map>
#include <optional>
#include <string>

namespace syncforge {

// Open key/value parameter set; keys not listed below pass through to codecs untouched.
using SyncMapParameters = std::map<std::string, std::string>;

// Overwrite the language of every fragment after reading.
inline constexpr const char *kParamLanguage = "language";
// Output format advertised to the fine-tuning page.
inline constexpr const char *kParamOutputFormat = "os_task_file_format";
// SMIL audio reference (src of <audio>).
inline constexpr const char *kParamSmilAudioRef = "os_task_file_smil_audio_ref";
// SMIL page reference (src prefix of <text>).
inline constexpr const char *kParamSmilPageRef = "os_task_file_smil_page_ref";

inline std::optional<std::string> find_parameter(const SyncMapParameters &params,
                                                 const std::string &key) {
    auto it = params.find(key);
    if (it == params.end()) {
        return std::nullopt;
    }
    return it->second;
}

/// Settings for one run of the library, passed explicitly instead of living in globals.
struct RunConfiguration {
    bool safety_checks = true;           ///< Codecs reject inverted intervals on parse
    std::string finetune_template_path;  ///< Empty selects the bundled finetuneas.html
};

// Template path used when RunConfiguration::finetune_template_path is empty.
std::string default_finetune_template_path();

}  // namespace syncforge
