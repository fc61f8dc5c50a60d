//
//  file_utils.cpp
//  SyncForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "file_utils.hpp"

#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include "logging.hpp"

namespace fs = std::filesystem;

namespace syncforge {

bool file_can_be_read(const std::string &path) {
    if (path.empty()) {
        return false;
    }
    std::error_code ec;
    if (!fs::is_regular_file(path, ec) || ec) {
        return false;
    }
    return ::access(path.c_str(), R_OK) == 0;
}

bool file_can_be_written(const std::string &path) {
    if (path.empty()) {
        return false;
    }
    std::error_code ec;
    fs::path p(path);
    if (fs::exists(p, ec)) {
        return fs::is_regular_file(p, ec) && ::access(path.c_str(), W_OK) == 0;
    }
    // Walk up to the nearest existing ancestor; it must be a directory we can write into.
    fs::path ancestor = fs::absolute(p, ec).parent_path();
    if (ec) {
        return false;
    }
    while (!ancestor.empty() && !fs::exists(ancestor, ec)) {
        if (ancestor == ancestor.parent_path()) {
            return false;
        }
        ancestor = ancestor.parent_path();
    }
    if (ancestor.empty() || !fs::is_directory(ancestor, ec)) {
        return false;
    }
    return ::access(ancestor.c_str(), W_OK | X_OK) == 0;
}

SyncMapStatus ensure_parent_directory(const std::string &path) {
    fs::path parent = fs::path(path).parent_path();
    if (parent.empty()) {
        return make_ok();
    }
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        std::string msg = "Cannot create directory '" + parent.string() + "': " + ec.message();
        SF_LOG("error", msg);
        return make_error(SyncMapErrc::IoPermission, msg);
    }
    return make_ok();
}

SyncMapStatus read_text_file(const std::string &path, std::string &out) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        std::string msg = "open failed for " + path + " (" +
                          std::generic_category().message(errno) + ")";
        SF_LOG("error", msg);
        return make_error(SyncMapErrc::IoPermission, msg);
    }
    std::ostringstream oss;
    oss << f.rdbuf();
    if (f.bad()) {
        std::string msg = "read failed for " + path;
        SF_LOG("error", msg);
        return make_error(SyncMapErrc::IoPermission, msg);
    }
    out = oss.str();
    // Drop a UTF-8 byte order mark.
    if (out.size() >= 3 && static_cast<unsigned char>(out[0]) == 0xEF &&
        static_cast<unsigned char>(out[1]) == 0xBB && static_cast<unsigned char>(out[2]) == 0xBF) {
        out.erase(0, 3);
    }
    SF_LOG("io", "read " << out.size() << " bytes from " << path);
    return make_ok();
}

SyncMapStatus write_text_file(const std::string &path, const std::string &text) {
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) {
        std::string msg = "open failed for " + path + " (" +
                          std::generic_category().message(errno) + ")";
        SF_LOG("error", msg);
        return make_error(SyncMapErrc::IoPermission, msg);
    }
    f.write(text.data(), static_cast<std::streamsize>(text.size()));
    f.close();
    if (!f) {
        std::string msg = "write failed for " + path;
        SF_LOG("error", msg);
        return make_error(SyncMapErrc::IoPermission, msg);
    }
    SF_LOG("io", "wrote " << text.size() << " bytes to " << path);
    return make_ok();
}

std::string absolute_slash_path(const std::string &path) {
    std::error_code ec;
    fs::path abs = fs::absolute(fs::path(path), ec);
    std::string out = ec ? path : abs.lexically_normal().generic_string();
    std::replace(out.begin(), out.end(), '\\', '/');
    return out;
}

}  // namespace syncforge
