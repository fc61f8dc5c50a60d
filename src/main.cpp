//
//  main.cpp
//  SyncForge
//
//  Created by Till Toenshoff on 10/19/26.
//  Copyright © 2026 Till Toenshoff. All rights reserved.
//

#include <iostream>
#include <string>
#include <vector>

#include "logging.hpp"
#include "syncforge.hpp"

namespace {

void print_usage() {
    std::cerr << "SyncForge " << syncforge::version_string() << "\n"
              << "Copyright (c) 2026 Till Toenshoff\n\n"
              << "usage:\n"
              << "  syncforge json <format> <input>\n"
              << "  syncforge convert <in-format> <input> <out-format> <output>\n"
              << "  syncforge html <format> <input> <audio> <output.html>\n"
              << "Formats:";
    for (auto f : syncforge::all_sync_map_formats()) {
        std::cerr << " " << syncforge::to_string(f);
    }
    std::cerr << "\n"
              << "Options:\n"
              << "  --param KEY=VALUE   Pass a parameter (repeatable), e.g. language=en,\n"
              << "                      os_task_file_smil_audio_ref=audio.mp3.\n"
              << "  --template PATH     Fine-tuning HTML template (default: bundled).\n"
              << "  --no-safety-checks  Accept fragments that end before they begin.\n"
              << "  --log-level LEVEL   Set logging verbosity (default: info).\n";
}

int fail(const char *what, const syncforge::SyncMapStatus &status) {
    SF_LOG("error", "syncforge: " << what << " failed (" << syncforge::to_string(status.code)
                                  << "): " << status.message);
    return 1;
}

}  // namespace

int main(int argc, char **argv) {
    if (argc == 2 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-v")) {
        std::cout << "SyncForge " << syncforge::version_string() << "\n";
        return 0;
    }

    // Gather positional arguments (non-option).
    std::vector<std::string> positional;
    syncforge::SyncMapParameters parameters;
    syncforge::RunConfiguration rconf;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--log-level" && i + 1 < argc) {
            syncforge::set_log_verbosity(syncforge::log_verbosity_from_string(argv[++i]));
        } else if (arg == "--param" && i + 1 < argc) {
            std::string kv = argv[++i];
            auto eq = kv.find('=');
            if (eq == std::string::npos || eq == 0) {
                std::cerr << "Invalid parameter (expected KEY=VALUE): " << kv << "\n";
                return 2;
            }
            parameters[kv.substr(0, eq)] = kv.substr(eq + 1);
        } else if (arg == "--template" && i + 1 < argc) {
            rconf.finetune_template_path = argv[++i];
        } else if (arg == "--no-safety-checks") {
            rconf.safety_checks = false;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return 2;
        } else {
            positional.emplace_back(std::move(arg));
        }
    }

    if (positional.empty()) {
        print_usage();
        return 2;
    }

    const std::string command = positional[0];
    syncforge::SyncMap syncmap(rconf);

    if (command == "json" && positional.size() == 3) {
        auto status = syncmap.read(positional[1], positional[2], parameters);
        if (!status.ok) {
            return fail("read", status);
        }
        std::cout << syncmap.json_string() << "\n";
        return 0;
    }

    if (command == "convert" && positional.size() == 5) {
        auto status = syncmap.read(positional[1], positional[2], parameters);
        if (!status.ok) {
            return fail("read", status);
        }
        status = syncmap.write(positional[3], positional[4], parameters);
        if (!status.ok) {
            return fail("write", status);
        }
        std::cout << "Wrote: " << positional[4] << " (" << syncmap.size() << " fragments)\n";
        return 0;
    }

    if (command == "html" && positional.size() == 5) {
        auto status = syncmap.read(positional[1], positional[2], parameters);
        if (!status.ok) {
            return fail("read", status);
        }
        status = syncmap.output_html_for_tuning(positional[3], positional[4], parameters);
        if (!status.ok) {
            return fail("html export", status);
        }
        std::cout << "Wrote: " << positional[4] << "\n";
        return 0;
    }

    std::cerr << "Invalid arguments. See usage.\n";
    print_usage();
    return 2;
}
