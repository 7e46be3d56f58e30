//
//  options.hpp
//  CytubeGen
//
//  Created by the CytubeGen authors on 10/19/26.
//  Copyright © 2026 CytubeGen authors. All rights reserved.
//

#pragma once

#include <optional>
#include <string>

#include "logging.hpp"
#include "status.hpp"
#include "track.hpp"

namespace cytubegen {

struct Options {
    std::string url_prefix;
    std::optional<std::string> preferred_language;
    std::string output_dir;
    std::string probe_tool = "ffprobe";
    std::string transcode_tool = "ffmpeg";
    std::string manifest_name = "manifest.json";
    LogVerbosity log_level = LogVerbosity::Info;
    bool dry_run = false;     ///< plan and manifest only
    bool print_plan = false;  ///< echo the transcode command line to stdout
};

// Set the preferred audio language, truncated like probe language tags so the two compare.
void set_preferred_language(Options &options, const std::string &code);

/**
 * @brief Overlay values from a JSON config file onto `options`.
 *
 * Recognized keys: url_prefix, preferred_language, probe_tool, transcode_tool,
 * manifest_name, log_level. Absent keys keep their current values; a value of the wrong
 * type or a malformed file is a ConfigError.
 */
Status load_options_json(const std::string &path, Options &options);

}  // namespace cytubegen
