//
//  syncforge.hpp
//  SyncForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>

#include "sync_map.hpp"
#include "sync_map_format.hpp"
#include "sync_map_fragment.hpp"
#include "sync_map_parameters.hpp"
#include "sync_map_status.hpp"

namespace syncforge {

/**
 * @brief Return the SyncForge library version string.
 *
 * Follows the same formatting as the CLI banner (e.g. `v0.3`).
 */
std::string version_string();  ///< @ingroup api

}  // namespace syncforge
