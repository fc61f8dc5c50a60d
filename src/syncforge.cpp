//
//  syncforge.cpp
//  SyncForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "syncforge.hpp"
#include "syncforge_version.hpp"

namespace syncforge {

std::string version_string() { return SYNCFORGE_VERSION_DISPLAY; }

}  // namespace syncforge
