//
//  time_format.cpp
//  SyncForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "time_format.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <vector>

namespace {

constexpr uint64_t kMsPerSecond = 1000;
constexpr uint64_t kMsPerMinute = 60 * kMsPerSecond;
constexpr uint64_t kMsPerHour = 60 * kMsPerMinute;
// Same bound as the 12 integer digits parse_seconds accepts.
constexpr double kMaxSeconds = 1e12;

bool all_digits(const std::string &s) {
    if (s.empty()) {
        return false;
    }
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

// Fraction digits -> milliseconds, rounding on the fourth digit.
uint64_t fraction_to_ms(const std::string &digits) {
    uint64_t ms = 0;
    for (size_t i = 0; i < 3; ++i) {
        ms = ms * 10 + (i < digits.size() ? static_cast<uint64_t>(digits[i] - '0') : 0);
    }
    if (digits.size() > 3 && digits[3] >= '5') {
        ++ms;
    }
    return ms;
}

std::vector<std::string> split(const std::string &s, char sep) {
    std::vector<std::string> parts;
    std::string cur;
    for (char c : s) {
        if (c == sep) {
            parts.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    parts.push_back(cur);
    return parts;
}

}  // namespace

namespace syncforge {

std::string format_ssmmm(uint64_t ms) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%llu.%03llu",
                  static_cast<unsigned long long>(ms / kMsPerSecond),
                  static_cast<unsigned long long>(ms % kMsPerSecond));
    return buf;
}

std::string format_clock(uint64_t ms, char ms_separator) {
    const uint64_t hours = ms / kMsPerHour;
    const uint64_t minutes = (ms % kMsPerHour) / kMsPerMinute;
    const uint64_t seconds = (ms % kMsPerMinute) / kMsPerSecond;
    const uint64_t millis = ms % kMsPerSecond;
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%02llu:%02llu:%02llu%c%03llu",
                  static_cast<unsigned long long>(hours), static_cast<unsigned long long>(minutes),
                  static_cast<unsigned long long>(seconds), ms_separator,
                  static_cast<unsigned long long>(millis));
    return buf;
}

std::optional<uint64_t> parse_seconds(const std::string &text) {
    if (text.empty()) {
        return std::nullopt;
    }
    const auto dot = text.find('.');
    const std::string whole = dot == std::string::npos ? text : text.substr(0, dot);
    const std::string frac = dot == std::string::npos ? std::string() : text.substr(dot + 1);
    if (whole.empty() && frac.empty()) {
        return std::nullopt;
    }
    if (!whole.empty() && !all_digits(whole)) {
        return std::nullopt;
    }
    if (dot != std::string::npos && !all_digits(frac)) {
        return std::nullopt;
    }
    if (whole.size() > 12) {
        return std::nullopt;
    }
    const uint64_t secs = whole.empty() ? 0 : std::stoull(whole);
    return secs * kMsPerSecond + fraction_to_ms(frac);
}

std::optional<uint64_t> parse_clock(const std::string &text) {
    auto sep = text.find_last_of(",.");
    const std::string clock = sep == std::string::npos ? text : text.substr(0, sep);
    const std::string frac = sep == std::string::npos ? std::string() : text.substr(sep + 1);
    if (sep != std::string::npos && !all_digits(frac)) {
        return std::nullopt;
    }
    auto parts = split(clock, ':');
    if (parts.size() < 2 || parts.size() > 3) {
        return std::nullopt;
    }
    for (const auto &p : parts) {
        if (!all_digits(p) || p.size() > 9) {
            return std::nullopt;
        }
    }
    uint64_t hours = 0;
    if (parts.size() == 3) {
        hours = std::stoull(parts[0]);
        parts.erase(parts.begin());
    }
    const uint64_t minutes = std::stoull(parts[0]);
    const uint64_t seconds = std::stoull(parts[1]);
    if (minutes >= 60 || seconds >= 60) {
        return std::nullopt;
    }
    return hours * kMsPerHour + minutes * kMsPerMinute + seconds * kMsPerSecond +
           fraction_to_ms(frac);
}

std::optional<uint64_t> ms_from_seconds(double seconds) {
    if (!std::isfinite(seconds) || seconds >= kMaxSeconds) {
        return std::nullopt;
    }
    if (!(seconds > 0.0)) {
        return uint64_t{0};
    }
    return static_cast<uint64_t>(std::llround(seconds * 1000.0));
}

}  // namespace syncforge
