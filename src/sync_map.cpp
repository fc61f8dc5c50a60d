//
//  sync_map.cpp
//  SyncForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "sync_map.hpp"

#include <chrono>
#include <nlohmann/json.hpp>
#include <sstream>
#include <utility>

#include "file_utils.hpp"
#include "finetune_html.hpp"
#include "logging.hpp"
#include "sync_map_codec.hpp"
#include "sync_map_format.hpp"
#include "time_format.hpp"

using json = nlohmann::json;

namespace {

using syncforge::SyncMap;

json visit_children(const SyncMap::FragmentTree &node) {
    json out = json::array();
    for (const auto *child : node.children_not_empty()) {
        const auto *fragment = child->value();
        const auto &text = fragment->text_fragment;
        json entry;
        entry["id"] = text.identifier;
        entry["language"] = text.language ? json(*text.language) : json(nullptr);
        entry["lines"] = text.lines;
        entry["begin"] = syncforge::format_ssmmm(fragment->begin_ms);
        entry["end"] = syncforge::format_ssmmm(fragment->end_ms);
        entry["children"] = visit_children(*child);
        out.push_back(std::move(entry));
    }
    return out;
}

std::string describe(const syncforge::SyncMapParameters &parameters) {
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto &kv : parameters) {
        oss << (first ? "" : ", ") << kv.first << "=" << syncforge::text_preview(kv.second);
        first = false;
    }
    oss << "}";
    return oss.str();
}

// Shared front half of read/write: resolve format and check the direction is supported.
syncforge::SyncMapStatus resolve_format(const std::string &format, bool for_reading,
                                        syncforge::SyncMapFormat &out) {
    using syncforge::SyncMapErrc;
    if (format.empty()) {
        std::string msg = "Sync map format is empty";
        SF_LOG("error", msg);
        return syncforge::make_error(SyncMapErrc::InvalidArgument, msg);
    }
    auto parsed = syncforge::sync_map_format_from_string(format);
    if (!parsed) {
        std::string msg = "Sync map format '" + format + "' is not allowed";
        SF_LOG("error", msg);
        return syncforge::make_error(SyncMapErrc::InvalidArgument, msg);
    }
    const bool supported = for_reading ? syncforge::format_can_parse(*parsed)
                                       : syncforge::format_can_format(*parsed);
    if (!supported) {
        std::string msg = "Sync map format '" + format + "' cannot be " +
                          (for_reading ? "read" : "written");
        SF_LOG("error", msg);
        return syncforge::make_error(SyncMapErrc::InvalidArgument, msg);
    }
    out = *parsed;
    return syncforge::make_ok();
}

}  // namespace

namespace syncforge {

SyncMap::SyncMap(RunConfiguration rconf)
    : rconf_(std::move(rconf)), tree_(FragmentTree::create()) {}

SyncMapStatus SyncMap::add_fragment(SyncMapFragmentPtr fragment, bool as_last) {
    if (!fragment) {
        std::string msg = "fragment is not a SyncMapFragment";
        SF_LOG("error", msg);
        return make_error(SyncMapErrc::InvalidArgument, msg);
    }
    tree_->add_child(FragmentTree::create(std::move(fragment)), as_last);
    return make_ok();
}

void SyncMap::clear() {
    SF_LOG("debug", "Clearing sync map");
    tree_ = FragmentTree::create();
}

std::vector<SyncMapFragment *> SyncMap::fragments() { return tree_->vchildren_not_empty(); }

std::vector<const SyncMapFragment *> SyncMap::fragments() const {
    return static_cast<const FragmentTree &>(*tree_).vchildren_not_empty();
}

size_t SyncMap::size() const { return fragments().size(); }

bool SyncMap::empty() const { return tree_->is_empty(); }

bool SyncMap::is_single_level() const {
    const auto &root = static_cast<const FragmentTree &>(*tree_);
    for (const auto *node : root.children_not_empty()) {
        if (!node->children_not_empty().empty()) {
            return false;
        }
    }
    return true;
}

std::string SyncMap::json_string() const {
    json root;
    root["fragments"] = visit_children(*tree_);
    // Invalid UTF-8 in fragment text is replaced rather than thrown.
    return root.dump(1, ' ', false, json::error_handler_t::replace);
}

std::string SyncMap::to_string() const {
    std::string out;
    for (const auto *f : fragments()) {
        if (!out.empty()) {
            out.push_back('\n');
        }
        out += f->to_string();
    }
    return out;
}

SyncMapStatus SyncMap::read(const std::string &format, const std::string &input_path,
                            const SyncMapParameters &parameters) {
    SyncMapFormat fmt{};
    auto status = resolve_format(format, true, fmt);
    if (!status.ok) {
        return status;
    }
    if (!file_can_be_read(input_path)) {
        std::string msg = "Cannot read sync map file '" + input_path + "'. Wrong permissions?";
        SF_LOG("error", msg);
        return make_error(SyncMapErrc::IoPermission, msg);
    }

    SF_LOG("debug", "Input format:     '" << format << "'");
    SF_LOG("debug", "Input path:       '" << input_path << "'");
    SF_LOG("debug", "Input parameters: " << describe(parameters));

    auto reader = make_codec(fmt, parameters, rconf_);
    if (!reader.status.ok) {
        return reader.status;
    }

    const auto t0 = std::chrono::steady_clock::now();
    SF_LOG("debug", "Reading input file...");
    std::string input_text;
    status = read_text_file(input_path, input_text);
    if (!status.ok) {
        return status;
    }
    status = reader.codec->parse(input_text, *this);
    if (!status.ok) {
        return status;
    }
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - t0)
                        .count();
    SF_LOG("debug", "Reading input file... done, fragments=" << size() << " ms=" << ms);

    if (auto language = find_parameter(parameters, kParamLanguage)) {
        SF_LOG("debug", "Overwriting language to '" << *language << "'");
        tree_->pre_order([&](FragmentTree &node) {
            if (auto *fragment = node.value()) {
                fragment->text_fragment.language = *language;
            }
        });
    }
    return make_ok();
}

SyncMapStatus SyncMap::write(const std::string &format, const std::string &output_path,
                             const SyncMapParameters &parameters) const {
    SyncMapFormat fmt{};
    auto status = resolve_format(format, false, fmt);
    if (!status.ok) {
        return status;
    }
    if (!file_can_be_written(output_path)) {
        std::string msg = "Cannot write sync map file '" + output_path + "'. Wrong permissions?";
        SF_LOG("error", msg);
        return make_error(SyncMapErrc::IoPermission, msg);
    }

    SF_LOG("debug", "Output format:     '" << format << "'");
    SF_LOG("debug", "Output path:       '" << output_path << "'");
    SF_LOG("debug", "Output parameters: " << describe(parameters));

    // The factory checks required parameters.
    auto writer = make_codec(fmt, parameters, rconf_);
    if (!writer.status.ok) {
        return writer.status;
    }

    status = ensure_parent_directory(output_path);
    if (!status.ok) {
        return status;
    }

    SF_LOG("debug", "Writing output file...");
    std::string output_text;
    status = writer.codec->format(*this, output_text);
    if (!status.ok) {
        return status;
    }
    status = write_text_file(output_path, output_text);
    if (!status.ok) {
        return status;
    }
    SF_LOG("debug", "Writing output file... done");
    return make_ok();
}

SyncMapStatus SyncMap::output_html_for_tuning(const std::string &audio_file_path,
                                              const std::string &output_file_path,
                                              const SyncMapParameters &parameters) const {
    if (!file_can_be_written(output_file_path)) {
        std::string msg =
            "Cannot output HTML file '" + output_file_path + "'. Wrong permissions?";
        SF_LOG("error", msg);
        return make_error(SyncMapErrc::IoPermission, msg);
    }
    const std::string template_path = rconf_.finetune_template_path.empty()
                                          ? default_finetune_template_path()
                                          : rconf_.finetune_template_path;
    SF_LOG("html", "template=" << template_path << " audio=" << audio_file_path
                               << " output=" << output_file_path);
    std::string template_text;
    auto status = read_text_file(template_path, template_text);
    if (!status.ok) {
        return status;
    }
    const std::string page = render_finetune_html(template_text, absolute_slash_path(audio_file_path),
                                                  json_string(), parameters);
    status = ensure_parent_directory(output_file_path);
    if (!status.ok) {
        return status;
    }
    return write_text_file(output_file_path, page);
}

}  // namespace syncforge
