//
//  finetune_html.hpp
//  SyncForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <array>
#include <string>
#include <utility>

#include "sync_map_parameters.hpp"

namespace syncforge {

// Placeholders understood by res/finetuneas.html.
inline constexpr const char *kFinetuneReplaceAudioFilePath = "// SYNCFORGE_REPLACE_AUDIOFILEPATH";
inline constexpr const char *kFinetuneReplaceFragments = "// SYNCFORGE_REPLACE_FRAGMENTS";
inline constexpr const char *kFinetuneReplaceOutputFormat = "// SYNCFORGE_REPLACE_OUTPUT_FORMAT";
inline constexpr const char *kFinetuneReplaceSmilAudioRef = "// SYNCFORGE_REPLACE_SMIL_AUDIOREF";
inline constexpr const char *kFinetuneReplaceSmilPageRef = "// SYNCFORGE_REPLACE_SMIL_PAGEREF";

// Fixed (find, replace) pairs applied first and in this order. The comment/uncomment pairs
// flip HTML comment markers; each marker must be rewritten on its own.
inline constexpr std::array<std::pair<const char *, const char *>, 8> kFinetuneReplacements = {{
    {"<!-- SYNCFORGE_REPLACE_COMMENT_BEGIN -->", "<!-- SYNCFORGE_REPLACE_COMMENT_BEGIN"},
    {"<!-- SYNCFORGE_REPLACE_COMMENT_END -->", "SYNCFORGE_REPLACE_COMMENT_END -->"},
    {"<!-- SYNCFORGE_REPLACE_UNCOMMENT_BEGIN", "<!-- SYNCFORGE_REPLACE_UNCOMMENT_BEGIN -->"},
    {"SYNCFORGE_REPLACE_UNCOMMENT_END -->", "<!-- SYNCFORGE_REPLACE_UNCOMMENT_END -->"},
    {"// SYNCFORGE_REPLACE_SHOW_ID", "showID = true;"},
    {"// SYNCFORGE_REPLACE_ALIGN_TEXT", "alignText = \"left\""},
    {"// SYNCFORGE_REPLACE_CONTINUOUS_PLAY", "continuousPlay = true;"},
    {"// SYNCFORGE_REPLACE_TIME_FORMAT", "timeFormatHHMMSSmmm = true;"},
}};

// Output formats the fine-tuning page can save.
inline constexpr std::array<const char *, 10> kFinetuneAllowedFormats = {
    "csv", "json", "smil", "srt", "ssv", "ttml", "tsv", "txt", "vtt", "xml"};

bool finetune_format_allowed(const std::string &format);

// Replace every non-overlapping occurrence of find, scanning left to right.
// Returns the number of replacements.
size_t replace_all(std::string &text, const std::string &find, const std::string &replacement);

/**
 * @brief Fill the fine-tuning template.
 *
 * @param template_text Contents of finetuneas.html.
 * @param audio_path_absolute Absolute, forward-slash audio path.
 * @param sync_map_json SyncMap::json_string() of the map to tune.
 * @param parameters Optional output format and SMIL references.
 */
std::string render_finetune_html(std::string template_text, const std::string &audio_path_absolute,
                                 const std::string &sync_map_json,
                                 const SyncMapParameters &parameters);

}  // namespace syncforge
