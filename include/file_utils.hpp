//
//  file_utils.hpp
//  SyncForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#pragma once

#include <string>

#include "sync_map_status.hpp"

namespace syncforge {

// True if path names an existing regular file the process may read.
bool file_can_be_read(const std::string &path);

// True if path could be written without touching it: an existing path must be a writable
// regular file, otherwise the nearest existing ancestor must be a writable directory.
bool file_can_be_written(const std::string &path);

// Create missing parent directories of path (no-op if they exist).
SyncMapStatus ensure_parent_directory(const std::string &path);

// Whole-file UTF-8 read/write through scoped streams.
SyncMapStatus read_text_file(const std::string &path, std::string &out);
SyncMapStatus write_text_file(const std::string &path, const std::string &text);

// Absolute path with forward slashes, e.g. for file:// URLs.
std::string absolute_slash_path(const std::string &path);

}  // namespace syncforge
