//
//  smil_codec.cpp
//  SyncForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include "smil_codec.hpp"

#include <cstdio>
#include <memory>
#include <sstream>
#include <utility>

#include "logging.hpp"
#include "sync_map.hpp"
#include "time_format.hpp"

namespace {

using syncforge::SyncMap;

std::string xml_escape(const std::string &s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&':
                out += "&amp;";
                break;
            case '<':
                out += "&lt;";
                break;
            case '>':
                out += "&gt;";
                break;
            case '"':
                out += "&quot;";
                break;
            default:
                out.push_back(c);
        }
    }
    return out;
}

std::string numbered(const char *prefix, size_t n) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%s%06zu", prefix, n);
    return buf;
}

struct SmilWriter {
    std::ostringstream &out;
    const std::string &audio_ref;
    const std::string &page_ref;
    size_t seq_count = 0;
    size_t par_count = 0;

    void indent(size_t depth) {
        for (size_t i = 0; i < depth; ++i) {
            out << " ";
        }
    }

    void write_children(const SyncMap::FragmentTree &node, size_t depth) {
        for (const auto *child : node.children_not_empty()) {
            const auto *fragment = child->value();
            const std::string text_src =
                xml_escape(page_ref + "#" + fragment->text_fragment.identifier);
            if (child->children_not_empty().empty()) {
                indent(depth);
                out << "<par id=\"" << numbered("par", ++par_count) << "\">\n";
                indent(depth + 1);
                out << "<text src=\"" << text_src << "\"/>\n";
                indent(depth + 1);
                out << "<audio clipBegin=\"" << syncforge::format_clock(fragment->begin_ms, '.')
                    << "\" clipEnd=\"" << syncforge::format_clock(fragment->end_ms, '.')
                    << "\" src=\"" << xml_escape(audio_ref) << "\"/>\n";
                indent(depth);
                out << "</par>\n";
            } else {
                indent(depth);
                out << "<seq id=\"" << numbered("seq", ++seq_count) << "\" epub:textref=\""
                    << text_src << "\">\n";
                write_children(*child, depth + 1);
                indent(depth);
                out << "</seq>\n";
            }
        }
    }
};

}  // namespace

namespace syncforge {

SmilCodec::SmilCodec(SyncMapFormat variant, RunConfiguration rconf, std::string audio_ref,
                     std::string page_ref)
    : SyncMapCodec(variant, std::move(rconf)),
      audio_ref_(std::move(audio_ref)),
      page_ref_(std::move(page_ref)) {}

CodecResult SmilCodec::create(SyncMapFormat variant, const SyncMapParameters &parameters,
                              const RunConfiguration &rconf) {
    auto audio_ref = find_parameter(parameters, kParamSmilAudioRef);
    auto page_ref = find_parameter(parameters, kParamSmilPageRef);
    const char *missing =
        !audio_ref ? kParamSmilAudioRef : (!page_ref ? kParamSmilPageRef : nullptr);
    if (missing) {
        std::string msg = std::string("Parameter '") + missing + "' is required for smil";
        return CodecResult{make_error(SyncMapErrc::MissingParameter, msg), nullptr};
    }
    return CodecResult{make_ok(), std::make_unique<SmilCodec>(variant, rconf, *audio_ref,
                                                              *page_ref)};
}

SyncMapStatus SmilCodec::format(const SyncMap &syncmap, std::string &out) const {
    std::ostringstream oss;
    oss << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    oss << "<smil xmlns=\"http://www.w3.org/ns/SMIL\" "
           "xmlns:epub=\"http://www.idpf.org/2007/ops\" version=\"3.0\">\n";
    oss << " <body>\n";
    oss << "  <seq id=\"seq000000\" epub:textref=\"" << xml_escape(page_ref_) << "\">\n";
    SmilWriter writer{oss, audio_ref_, page_ref_};
    writer.write_children(syncmap.fragments_tree(), 3);
    oss << "  </seq>\n";
    oss << " </body>\n";
    oss << "</smil>\n";
    out = oss.str();
    SF_LOG("codec", "smil wrote pars=" << writer.par_count << " seqs=" << writer.seq_count);
    return make_ok();
}

}  // namespace syncforge
