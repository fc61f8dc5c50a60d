//
//  delimited_codec.cpp
//  SyncForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "delimited_codec.hpp"

#include <memory>
#include <sstream>
#include <vector>

#include "logging.hpp"
#include "sync_map.hpp"
#include "time_format.hpp"

namespace {

// Split off at most max_splits leading fields; the remainder is the last element.
std::vector<std::string> split_fields(const std::string &line, char delimiter, size_t max_splits) {
    std::vector<std::string> fields;
    size_t start = 0;
    while (fields.size() < max_splits) {
        auto pos = line.find(delimiter, start);
        if (pos == std::string::npos) {
            break;
        }
        fields.push_back(line.substr(start, pos - start));
        start = pos + 1;
    }
    fields.push_back(line.substr(start));
    return fields;
}

std::string unquote(std::string text) {
    if (text.size() >= 2 && text.front() == '"' && text.back() == '"') {
        return text.substr(1, text.size() - 2);
    }
    return text;
}

std::string quote(const std::string &text) { return "\"" + text + "\""; }

}  // namespace

namespace syncforge {

CodecResult DelimitedCodec::create(SyncMapFormat variant, const SyncMapParameters &,
                                   const RunConfiguration &rconf) {
    return CodecResult{make_ok(), std::make_unique<DelimitedCodec>(variant, rconf)};
}

char DelimitedCodec::delimiter() const {
    switch (variant_) {
        case SyncMapFormat::Csv:
            return ',';
        case SyncMapFormat::Tsv:
            return '\t';
        default:
            return ' ';
    }
}

SyncMapStatus DelimitedCodec::parse(const std::string &input_text, SyncMap &syncmap) {
    const bool has_text = variant_ != SyncMapFormat::Tsv;
    const size_t min_fields = has_text ? 4 : 3;
    std::istringstream in(input_text);
    std::string line;
    size_t line_no = 0;
    size_t count = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }
        auto fields = split_fields(line, delimiter(), min_fields - 1);
        if (fields.size() < min_fields) {
            std::string msg = std::string(to_string(variant_)) + " line " +
                              std::to_string(line_no) + ": expected " +
                              std::to_string(min_fields) + " fields";
            SF_LOG("error", msg);
            return make_error(SyncMapErrc::CodecError, msg);
        }
        std::string id, begin_s, end_s, text;
        if (variant_ == SyncMapFormat::Csv || variant_ == SyncMapFormat::Txt) {
            id = fields[0];
            begin_s = fields[1];
            end_s = fields[2];
            text = fields[3];
        } else {
            begin_s = fields[0];
            end_s = fields[1];
            id = fields[2];
            if (has_text) {
                text = fields[3];
            }
        }
        auto begin = parse_seconds(begin_s);
        auto end = parse_seconds(end_s);
        if (!begin || !end) {
            std::string msg = std::string(to_string(variant_)) + " line " +
                              std::to_string(line_no) + ": invalid time value";
            SF_LOG("error", msg);
            return make_error(SyncMapErrc::CodecError, msg);
        }
        if (rconf_.safety_checks && *begin > *end) {
            std::string msg = std::string(to_string(variant_)) + " line " +
                              std::to_string(line_no) + ": fragment ends before it begins";
            SF_LOG("error", msg);
            return make_error(SyncMapErrc::CodecError, msg);
        }
        std::vector<std::string> lines;
        text = unquote(text);
        if (!text.empty()) {
            lines.push_back(text);
        }
        auto status = syncmap.add_fragment(make_fragment(id, std::move(lines), *begin, *end));
        if (!status.ok) {
            return status;
        }
        ++count;
    }
    SF_LOG("codec", to_string(variant_) << " parsed fragments=" << count);
    return make_ok();
}

SyncMapStatus DelimitedCodec::format(const SyncMap &syncmap, std::string &out) const {
    std::ostringstream oss;
    const char d = delimiter();
    for (const auto *f : syncmap.fragments()) {
        const std::string begin = format_ssmmm(f->begin_ms);
        const std::string end = format_ssmmm(f->end_ms);
        const std::string &id = f->text_fragment.identifier;
        switch (variant_) {
            case SyncMapFormat::Csv:
            case SyncMapFormat::Txt:
                oss << id << d << begin << d << end << d << quote(f->text_fragment.text());
                break;
            case SyncMapFormat::Tsv:
                oss << begin << d << end << d << id;
                break;
            default:
                oss << begin << d << end << d << id << d << quote(f->text_fragment.text());
                break;
        }
        oss << "\n";
    }
    out = oss.str();
    return make_ok();
}

}  // namespace syncforge
