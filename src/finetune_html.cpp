//
//  finetune_html.cpp
//  SyncForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "finetune_html.hpp"

#include <filesystem>

#include "logging.hpp"

#ifndef SYNCFORGE_RESOURCE_DIR
#define SYNCFORGE_RESOURCE_DIR "res"
#endif

namespace syncforge {

std::string default_finetune_template_path() {
    return (std::filesystem::path(SYNCFORGE_RESOURCE_DIR) / "finetuneas.html").string();
}

bool finetune_format_allowed(const std::string &format) {
    for (const char *allowed : kFinetuneAllowedFormats) {
        if (format == allowed) {
            return true;
        }
    }
    return false;
}

size_t replace_all(std::string &text, const std::string &find, const std::string &replacement) {
    if (find.empty()) {
        return 0;
    }
    size_t count = 0;
    size_t pos = 0;
    while ((pos = text.find(find, pos)) != std::string::npos) {
        text.replace(pos, find.size(), replacement);
        pos += replacement.size();
        ++count;
    }
    return count;
}

std::string render_finetune_html(std::string template_text, const std::string &audio_path_absolute,
                                 const std::string &sync_map_json,
                                 const SyncMapParameters &parameters) {
    for (const auto &repl : kFinetuneReplacements) {
        replace_all(template_text, repl.first, repl.second);
    }
    replace_all(template_text, kFinetuneReplaceAudioFilePath,
                "audioFilePath = \"file://" + audio_path_absolute + "\";");
    replace_all(template_text, kFinetuneReplaceFragments,
                "fragments = (" + sync_map_json + ").fragments;");

    auto output_format = find_parameter(parameters, kParamOutputFormat);
    if (!output_format) {
        return template_text;
    }
    if (!finetune_format_allowed(*output_format)) {
        SF_LOG("warn", "output format '" << *output_format
                                         << "' is not supported by the fine-tuning page");
        return template_text;
    }
    replace_all(template_text, kFinetuneReplaceOutputFormat,
                "outputFormat = \"" + *output_format + "\";");
    if (*output_format == "smil") {
        if (auto audio_ref = find_parameter(parameters, kParamSmilAudioRef)) {
            replace_all(template_text, kFinetuneReplaceSmilAudioRef,
                        "audioref = \"" + *audio_ref + "\";");
        }
        if (auto page_ref = find_parameter(parameters, kParamSmilPageRef)) {
            replace_all(template_text, kFinetuneReplaceSmilPageRef,
                        "pageref = \"" + *page_ref + "\";");
        }
    }
    return template_text;
}

}  // namespace syncforge
