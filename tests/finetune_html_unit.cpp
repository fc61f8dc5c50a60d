// Validates the fine-tuning HTML export: fixed replacements, output format allow-list and
// the independent SMIL references.
#include <filesystem>
#include <iostream>
#include <string>

#include "file_utils.hpp"
#include "finetune_html.hpp"
#include "logging.hpp"
#include "sync_map.hpp"
#include "test_utils.hpp"

using namespace syncforge;
using test_utils::TempDir;

namespace {

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        std::cerr << "[finetune_html_unit] FAIL: " << msg << "\n";
    }
    return cond;
}

bool contains(const std::string &haystack, const std::string &needle) {
    return haystack.find(needle) != std::string::npos;
}

SyncMap sample_map(const std::string &template_path) {
    RunConfiguration rconf;
    rconf.finetune_template_path = template_path;
    SyncMap syncmap(rconf);
    syncmap.add_fragment(make_fragment("f1", {"one"}, 0, 1000));
    syncmap.add_fragment(make_fragment("f2", {"two"}, 1000, 2500));
    return syncmap;
}

bool test_replace_all() {
    std::string text = "aaa";
    bool ok = check(replace_all(text, "aa", "b") == 1 && text == "ba",
                    "replacement is non-overlapping, left to right");
    text = "x-x-x";
    ok &= check(replace_all(text, "x", "xx") == 3 && text == "xx-xx-xx",
                "replacement text is not rescanned");
    ok &= check(replace_all(text, "", "y") == 0, "empty pattern is a no-op");
    return ok;
}

bool test_render_markers() {
    const std::string tmpl =
        "<!-- SYNCFORGE_REPLACE_COMMENT_BEGIN -->A<!-- SYNCFORGE_REPLACE_COMMENT_END -->\n"
        "<!-- SYNCFORGE_REPLACE_UNCOMMENT_BEGIN B SYNCFORGE_REPLACE_UNCOMMENT_END -->\n"
        "// SYNCFORGE_REPLACE_SHOW_ID\n// SYNCFORGE_REPLACE_AUDIOFILEPATH\n"
        "// SYNCFORGE_REPLACE_FRAGMENTS\n";
    const std::string out = render_finetune_html(tmpl, "/tmp/a b/audio.mp3",
                                                 "{\n \"fragments\": []\n}", {});
    bool ok = check(contains(out, "<!-- SYNCFORGE_REPLACE_COMMENT_BEGINA"
                                  "SYNCFORGE_REPLACE_COMMENT_END -->"),
                    "visible block commented out");
    ok &= check(contains(out, "<!-- SYNCFORGE_REPLACE_UNCOMMENT_BEGIN --> B "
                              "<!-- SYNCFORGE_REPLACE_UNCOMMENT_END -->"),
                "hidden block uncommented");
    ok &= check(contains(out, "showID = true;"), "show id switched on");
    ok &= check(contains(out, "audioFilePath = \"file:///tmp/a b/audio.mp3\";"),
                "audio path assignment");
    ok &= check(contains(out, "fragments = ({\n \"fragments\": []\n}).fragments;"),
                "fragments assignment embeds the projection");
    return ok;
}

bool test_output_format(const std::string &template_path, const TempDir &dir) {
    SyncMap syncmap = sample_map(template_path);
    const std::string audio = dir.file("audio.mp3");
    const std::string srt_page = dir.file("srt.html");
    auto status = syncmap.output_html_for_tuning(audio, srt_page, {{kParamOutputFormat, "srt"}});
    bool ok = check(status.ok, "export with srt succeeds: " + status.message);
    const std::string srt_html = test_utils::read_file(srt_page);
    ok &= check(contains(srt_html, "outputFormat = \"srt\";"), "allowed format assigned");
    ok &= check(contains(srt_html, "audioFilePath = \"file://" + absolute_slash_path(audio) +
                                       "\";"),
                "absolute audio path embedded");
    ok &= check(contains(srt_html, "\"id\": \"f2\""), "fragments embedded");
    ok &= check(!contains(srt_html, "// SYNCFORGE_REPLACE_FRAGMENTS"),
                "fragments placeholder consumed");
    ok &= check(!contains(srt_html, "<!-- SYNCFORGE_REPLACE_COMMENT_BEGIN -->"),
                "template notice commented out");

    const std::string docx_page = dir.file("docx.html");
    status = syncmap.output_html_for_tuning(audio, docx_page, {{kParamOutputFormat, "docx"}});
    ok &= check(status.ok, "export with docx succeeds");
    const std::string docx_html = test_utils::read_file(docx_page);
    ok &= check(!contains(docx_html, "outputFormat = \""), "unlisted format not assigned");
    ok &= check(contains(docx_html, kFinetuneReplaceOutputFormat),
                "output format placeholder left untouched");

    const std::string plain_page = dir.file("plain.html");
    status = syncmap.output_html_for_tuning(audio, plain_page);
    ok &= check(status.ok && !contains(test_utils::read_file(plain_page), "outputFormat = \""),
                "no format parameter, no assignment");
    return ok;
}

bool test_smil_references(const std::string &template_path, const TempDir &dir) {
    SyncMap syncmap = sample_map(template_path);
    const std::string audio = dir.file("audio.mp3");

    const std::string audio_only = dir.file("smil_audio.html");
    auto status = syncmap.output_html_for_tuning(
        audio, audio_only, {{kParamOutputFormat, "smil"}, {kParamSmilAudioRef, "a.mp3"}});
    bool ok = check(status.ok, "smil export succeeds");
    std::string html = test_utils::read_file(audio_only);
    ok &= check(contains(html, "outputFormat = \"smil\";"), "smil assigned");
    ok &= check(contains(html, "audioref = \"a.mp3\";"), "audio reference assigned");
    ok &= check(!contains(html, "pageref = \""), "page reference not assigned");
    ok &= check(contains(html, kFinetuneReplaceSmilPageRef), "page placeholder untouched");

    const std::string page_only = dir.file("smil_page.html");
    status = syncmap.output_html_for_tuning(
        audio, page_only, {{kParamOutputFormat, "smil"}, {kParamSmilPageRef, "p.xhtml"}});
    html = test_utils::read_file(page_only);
    ok &= check(status.ok && contains(html, "pageref = \"p.xhtml\";") &&
                    !contains(html, "audioref = \""),
                "page reference alone");

    const std::string srt_refs = dir.file("srt_refs.html");
    status = syncmap.output_html_for_tuning(
        audio, srt_refs,
        {{kParamOutputFormat, "srt"}, {kParamSmilAudioRef, "a.mp3"}, {kParamSmilPageRef, "p"}});
    html = test_utils::read_file(srt_refs);
    ok &= check(status.ok && !contains(html, "audioref = \"") && !contains(html, "pageref = \""),
                "smil references ignored for other formats");
    return ok;
}

bool test_missing_parent_directories(const std::string &template_path, const TempDir &dir) {
    SyncMap syncmap = sample_map(template_path);
    const std::string page = (dir.path() / "pages" / "deeper" / "tune.html").string();
    auto status = syncmap.output_html_for_tuning(dir.file("audio.mp3"), page);
    bool ok = check(status.ok, "export creates missing directories: " + status.message);
    ok &= check(contains(test_utils::read_file(page), "\"id\": \"f1\""),
                "page written below new directories");
    return ok;
}

bool test_failures(const std::string &template_path, const TempDir &dir) {
    SyncMap syncmap = sample_map(template_path);
    auto status = syncmap.output_html_for_tuning(dir.file("audio.mp3"), dir.path().string());
    bool ok = check(status.code == SyncMapErrc::IoPermission, "directory output is IoPermission");

    RunConfiguration rconf;
    rconf.finetune_template_path = dir.file("no_such_template.html");
    SyncMap missing_template(rconf);
    const std::string out = dir.file("never.html");
    status = missing_template.output_html_for_tuning(dir.file("audio.mp3"), out);
    ok &= check(status.code == SyncMapErrc::IoPermission, "missing template is IoPermission");
    ok &= check(!std::filesystem::exists(out), "nothing written without a template");
    return ok;
}

}  // namespace

int main(int argc, char **argv) {
    if (argc != 2) {
        std::cerr << "usage: finetune_html_unit <RESOURCE_DIR>\n";
        return 2;
    }
    set_log_verbosity(LogVerbosity::Error);
    const std::string template_path = std::string(argv[1]) + "/finetuneas.html";
    TempDir dir("finetune");
    bool ok = true;
    ok &= test_replace_all();
    ok &= test_render_markers();
    ok &= test_output_format(template_path, dir);
    ok &= test_smil_references(template_path, dir);
    ok &= test_missing_parent_directories(template_path, dir);
    ok &= test_failures(template_path, dir);
    if (ok) {
        std::cout << "finetune_html_unit OK\n";
    }
    return ok ? 0 : 1;
}
