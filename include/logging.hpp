//
//  logging.hpp
//  SyncForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <algorithm>
#include <atomic>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>

namespace syncforge {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Set/get global logging verbosity.
void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

// Parse a CLI level name; unknown names map to Error.
LogVerbosity log_verbosity_from_string(std::string_view name);

// Shorten text for single-line debug output (e.g. fragment lines, parameter values).
inline constexpr size_t kLogPreviewChars = 40;
inline std::string text_preview(const std::string &text, size_t max_len = kLogPreviewChars) {
    std::string out;
    out.reserve(std::min(text.size(), max_len) + 3);
    for (size_t i = 0; i < text.size() && i < max_len; ++i) {
        const char c = text[i];
        out.push_back(c == '\n' || c == '\r' || c == '\t' ? ' ' : c);
    }
    if (text.size() > max_len) {
        out += "...";
    }
    return out;
}

}  // namespace syncforge

inline constexpr syncforge::LogVerbosity sf_severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return syncforge::LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return syncforge::LogVerbosity::Warn;
    }
    if (tag == "info") {
        return syncforge::LogVerbosity::Info;
    }
    // Everything else (io/codec/html/etc.) treated as debug-level.
    return syncforge::LogVerbosity::Debug;
}

inline bool sf_should_log(const char *level) {
    const auto current = syncforge::get_log_verbosity();
    const auto sev = sf_severity_for_tag(level ? level : "");
    return static_cast<int>(sev) <= static_cast<int>(current);
}

inline void sf_log_impl(const char *level, const std::string &msg, const char *file, int line,
                        const char *func) {
    std::string lvl(level ? level : "");
    if (lvl == "error") {
        std::cerr << "[SyncForge][" << level << "][" << file << ":" << line << " " << func
                  << "] " << msg << std::endl;
    } else {
        std::cerr << "[SyncForge][" << level << "] " << msg << std::endl;
    }
}

#define SF_LOG(level, message)                                              \
    do {                                                                    \
        if (sf_should_log(level)) {                                         \
            std::ostringstream _sf_log_ss;                                  \
            _sf_log_ss << message;                                          \
            sf_log_impl(level, _sf_log_ss.str(), __FILE__, __LINE__,        \
                        __func__);                                          \
        }                                                                   \
    } while (0)
