//
//  time_format.hpp
//  SyncForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace syncforge {

// Seconds with millisecond precision, e.g. 2500 -> "2.500".
std::string format_ssmmm(uint64_t ms);

// Clock value with millisecond precision, e.g. 3723004 -> "01:02:03,004" for sep ','.
std::string format_clock(uint64_t ms, char ms_separator = ',');

// Parse "S", "S.f", ".f" seconds notation. Fractions beyond milliseconds are rounded.
std::optional<uint64_t> parse_seconds(const std::string &text);

// Parse "HH:MM:SS[,.]mmm" or "MM:SS[,.]mmm"; the fraction is optional.
std::optional<uint64_t> parse_clock(const std::string &text);

// Round a floating-point seconds value to milliseconds; negative input clamps to 0.
// nullopt for non-finite values or values of 10^12 seconds and above.
std::optional<uint64_t> ms_from_seconds(double seconds);

}  // namespace syncforge
