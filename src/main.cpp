//
//  main.cpp
//  CytubeGen
//
//  Created by the CytubeGen authors on 10/19/26.
//  Copyright © 2026 CytubeGen authors. All rights reserved.
//

#include <iostream>
#include <string>
#include <vector>

#include "cytubegen.hpp"
#include "cytubegen_version.hpp"
#include "logging.hpp"

namespace {

void print_usage() {
    std::cerr << "CytubeGen " << CYTUBEGEN_VERSION_DISPLAY << "\n\n"
              << "usage:\n"
              << "  cytubegen <input> <output-dir> <url-prefix> [--lang CODE] [--config FILE]\n"
              << "            [--dry-run] [--print-plan] [--log-level error|warn|info|debug]\n"
              << "Options:\n"
              << "  --lang CODE         Prefer audio in this language (e.g. eng) for the main file.\n"
              << "  --config FILE       JSON file with url_prefix, preferred_language, probe_tool,\n"
              << "                      transcode_tool, manifest_name, log_level.\n"
              << "  --dry-run           Write the manifest but do not run the transcode tool.\n"
              << "  --print-plan        Print the transcode command line to stdout.\n"
              << "  --log-level LEVEL   Set logging verbosity (default: info).\n";
}

}  // namespace

int main(int argc, char **argv) {
    if (argc == 2 && (std::string(argv[1]) == "--version" || std::string(argv[1]) == "-v")) {
        std::cout << "CytubeGen " << CYTUBEGEN_VERSION_DISPLAY << "\n";
        return 0;
    }

    cytubegen::Options options;
    std::string config_path;
    std::string lang;
    std::string level;
    bool dry_run = false;
    bool print_plan = false;
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--dry-run") {
            dry_run = true;
        } else if (arg == "--print-plan") {
            print_plan = true;
        } else if (arg == "--lang" && i + 1 < argc) {
            lang = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            level = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            return 2;
        } else {
            positional.emplace_back(std::move(arg));
        }
    }

    // Config file first, command line overrides it.
    if (!config_path.empty()) {
        auto loaded = cytubegen::load_options_json(config_path, options);
        if (!loaded.ok) {
            return 2;
        }
    }
    if (positional.size() == 3) {
        options.url_prefix = positional[2];
    } else if (positional.size() != 2 || options.url_prefix.empty()) {
        print_usage();
        return 2;
    }
    options.output_dir = positional[1];
    if (!lang.empty()) {
        cytubegen::set_preferred_language(options, lang);
    }
    if (!level.empty()) {
        options.log_level = cytubegen::parse_log_verbosity(level);
    }
    options.dry_run = dry_run;
    options.print_plan = print_plan;
    cytubegen::set_log_verbosity(options.log_level);

    auto status = cytubegen::generate(positional[0], options);
    if (!status.ok) {
        CG_LOG("error", "cytubegen: " << cytubegen::error_code_name(status.code) << ": "
                                      << status.message);
        return 1;
    }
    std::cout << "Wrote: " << options.output_dir << "\n";
    return 0;
}
