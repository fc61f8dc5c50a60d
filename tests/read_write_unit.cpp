// Validates read/write orchestration: validation order, error classes, language override,
// parent directory creation and the no-side-effect guarantees on failure.
#include <filesystem>
#include <iostream>
#include <string>

#include "logging.hpp"
#include "sync_map.hpp"
#include "test_utils.hpp"

using namespace syncforge;
using test_utils::TempDir;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[read_write_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

const char *kNestedJson = R"({
 "fragments": [
  {
   "begin": "0.000",
   "children": [
    {"begin": "0.000", "children": [], "end": "1.000", "id": "s1", "language": "de",
     "lines": ["eins"]},
    {"begin": "1.000", "children": [], "end": "2.000", "id": "s2", "language": null,
     "lines": ["zwei"]}
   ],
   "end": "2.000",
   "id": "p1",
   "language": "de",
   "lines": ["eins zwei"]
  },
  {"begin": "2.000", "children": [], "end": "3.000", "id": "p2", "language": "fr",
   "lines": ["trois"]}
 ]
})";

SyncMap three_fragments() {
    SyncMap syncmap;
    syncmap.add_fragment(make_fragment("f1", {"one"}, 0, 1000));
    syncmap.add_fragment(make_fragment("f2", {"two"}, 1000, 2500));
    syncmap.add_fragment(make_fragment("f3", {"three"}, 2500, 4000));
    return syncmap;
}

bool test_read_rejects_format(const TempDir &dir) {
    const std::string input = dir.file("input.csv");
    test_utils::write_file(input, "f9,0.000,1.000,\"x\"\n");
    SyncMap syncmap = three_fragments();
    const std::string before = syncmap.json_string();

    auto status = syncmap.read("docx", input);
    bool ok = check(!status.ok && status.code == SyncMapErrc::InvalidArgument,
                    "unknown format is InvalidArgument");
    status = syncmap.read("", input);
    ok &= check(!status.ok && status.code == SyncMapErrc::InvalidArgument,
                "empty format is InvalidArgument");
    status = syncmap.read("smil", input);
    ok &= check(!status.ok && status.code == SyncMapErrc::InvalidArgument,
                "write-only format cannot be read");
    // Format is checked before the path.
    status = syncmap.read("docx", dir.file("missing.csv"));
    ok &= check(status.code == SyncMapErrc::InvalidArgument, "format validated before path");
    ok &= check(syncmap.json_string() == before, "tree unchanged after rejected formats");
    return ok;
}

bool test_read_missing_input(const TempDir &dir) {
    SyncMap syncmap = three_fragments();
    const std::string before = syncmap.json_string();
    auto status = syncmap.read("csv", dir.file("does_not_exist.csv"));
    bool ok = check(!status.ok && status.code == SyncMapErrc::IoPermission,
                    "missing input is IoPermission");
    status = syncmap.read("csv", dir.path().string());
    ok &= check(!status.ok && status.code == SyncMapErrc::IoPermission,
                "directory input is IoPermission");
    ok &= check(syncmap.json_string() == before, "tree unchanged after unreadable input");
    return ok;
}

bool test_read_appends(const TempDir &dir) {
    const std::string input = dir.file("append.csv");
    test_utils::write_file(input, "f4,4.000,5.000,\"four\"\n\nf5,5.000,6.000,\"five\"\n");
    SyncMap syncmap = three_fragments();
    auto status = syncmap.read("csv", input);
    bool ok = check(status.ok, "csv read succeeds: " + status.message);
    ok &= check(syncmap.size() == 5, "read adds to existing fragments");
    if (syncmap.size() == 5) {
        ok &= check(syncmap.fragments()[4]->text_fragment.identifier == "f5",
                    "read fragments appended last");
    }
    return ok;
}

bool test_language_override(const TempDir &dir) {
    const std::string input = dir.file("nested.json");
    test_utils::write_file(input, kNestedJson);

    SyncMap plain;
    auto status = plain.read("json", input);
    bool ok = check(status.ok, "nested json read succeeds: " + status.message);
    ok &= check(!plain.is_single_level(), "nested json yields a hierarchical map");
    ok &= check(plain.fragments().size() == 2, "two top-level fragments");

    SyncMap overridden;
    status = overridden.read("json", input, {{kParamLanguage, "en"}});
    ok &= check(status.ok, "read with language override succeeds");
    size_t visited = 0;
    bool all_en = true;
    overridden.fragments_tree().pre_order([&](SyncMap::FragmentTree &node) {
        if (const auto *f = node.value()) {
            ++visited;
            all_en &= f->text_fragment.language && *f->text_fragment.language == "en";
        }
    });
    ok &= check(visited == 4, "all four fragments visited");
    ok &= check(all_en, "every fragment, nested ones included, reports the override");
    return ok;
}

bool test_codec_failure_propagates(const TempDir &dir) {
    const std::string input = dir.file("broken.csv");
    test_utils::write_file(input, "f1,0.000,1.000,\"ok\"\nf2,zero,1.000,\"bad\"\n");
    SyncMap syncmap;
    auto status = syncmap.read("csv", input);
    bool ok = check(!status.ok && status.code == SyncMapErrc::CodecError,
                    "malformed input is CodecError");
    ok &= check(syncmap.size() == 1, "fragments parsed before the failure stay (no rollback)");

    const std::string inverted = dir.file("inverted.csv");
    test_utils::write_file(inverted, "f1,2.000,1.000,\"backwards\"\n");
    SyncMap checked;
    status = checked.read("csv", inverted);
    ok &= check(status.code == SyncMapErrc::CodecError, "inverted interval rejected");
    RunConfiguration relaxed;
    relaxed.safety_checks = false;
    SyncMap unchecked(relaxed);
    status = unchecked.read("csv", inverted);
    ok &= check(status.ok && unchecked.size() == 1, "inverted interval accepted without checks");
    return ok;
}

bool test_write_missing_parameter(const TempDir &dir) {
    SyncMap syncmap = three_fragments();
    const std::string fresh = dir.file("sub/dir/out.smil");
    auto status = syncmap.write("smil", fresh, {{kParamSmilAudioRef, "audio.mp3"}});
    bool ok = check(!status.ok && status.code == SyncMapErrc::MissingParameter,
                    "missing page ref is MissingParameter");
    ok &= check(!std::filesystem::exists(fresh), "no output file created");
    ok &= check(!std::filesystem::exists(dir.file("sub")), "no parent directory created");

    const std::string existing = dir.file("existing.smil");
    test_utils::write_file(existing, "keep me");
    status = syncmap.write("smil", existing);
    ok &= check(status.code == SyncMapErrc::MissingParameter, "no parameters at all");
    ok &= check(test_utils::read_file(existing) == "keep me", "existing file not modified");

    status = syncmap.write("smil", existing,
                           {{kParamSmilAudioRef, "audio.mp3"}, {kParamSmilPageRef, "p.xhtml"}});
    ok &= check(status.ok, "smil write succeeds with both references");
    const std::string smil = test_utils::read_file(existing);
    ok &= check(smil.find("src=\"p.xhtml#f2\"") != std::string::npos, "text reference written");
    ok &= check(smil.find("clipEnd=\"00:00:04.000\"") != std::string::npos,
                "clip end written");
    return ok;
}

bool test_write_paths(const TempDir &dir) {
    SyncMap syncmap = three_fragments();
    auto status = syncmap.write("xyz", dir.file("out.xyz"));
    bool ok = check(status.code == SyncMapErrc::InvalidArgument, "unknown output format");
    ok &= check(!std::filesystem::exists(dir.file("out.xyz")), "nothing written for bad format");

    status = syncmap.write("srt", dir.path().string());
    ok &= check(status.code == SyncMapErrc::IoPermission, "directory as output is IoPermission");

    const std::string nested = dir.file("a/b/c/out.srt");
    status = syncmap.write("srt", nested);
    ok &= check(status.ok, "write creates missing parent directories: " + status.message);
    ok &= check(std::filesystem::exists(nested), "nested output exists");
    status = syncmap.write("srt", nested);
    ok &= check(status.ok, "second write over existing file succeeds");
    ok &= check(test_utils::read_file(nested).rfind("1\n00:00:00,000 --> 00:00:01,000\none\n", 0) == 0,
                "srt content written");
    return ok;
}

bool test_json_round_trip(const TempDir &dir) {
    const std::string input = dir.file("nested_in.json");
    test_utils::write_file(input, kNestedJson);
    SyncMap original;
    auto status = original.read("json", input);
    const std::string out = dir.file("nested_out.json");
    status = original.write("json", out);
    bool ok = check(status.ok, "json write succeeds");
    SyncMap reread;
    status = reread.read("json", out);
    ok &= check(status.ok, "json re-read succeeds");
    ok &= check(reread.json_string() == original.json_string(),
                "re-reading the projection reconstructs an equivalent tree");
    return ok;
}

}  // namespace

int main() {
    set_log_verbosity(LogVerbosity::Error);
    TempDir dir("read_write");
    bool ok = true;
    ok &= test_read_rejects_format(dir);
    ok &= test_read_missing_input(dir);
    ok &= test_read_appends(dir);
    ok &= test_language_override(dir);
    ok &= test_codec_failure_propagates(dir);
    ok &= test_write_missing_parameter(dir);
    ok &= test_write_paths(dir);
    ok &= test_json_round_trip(dir);
    if (ok) {
        std::cout << "read_write_unit OK\n";
    }
    return ok ? 0 : 1;
}
