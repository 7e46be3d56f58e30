//
//  probe_runner.hpp
//  CytubeGen
//
//  Created by the CytubeGen authors on 10/19/26.
//  Copyright © 2026 CytubeGen authors. All rights reserved.
//

#pragma once

#include <string>
#include <vector>

#include "track.hpp"

namespace cytubegen {

// Arguments for the probe tool: compact output restricted to the fields the parser reads.
std::vector<std::string> probe_arguments(const std::string &input_path);

/**
 * @brief Run the probe tool on `input_path` and parse its output.
 *
 * Fails with ProbeUnavailable when the input cannot be read, ProbeFailed when the tool
 * exits non-zero, ParseError when its output misses mandatory stream fields.
 */
ProbeOutcome run_probe(const std::string &input_path, const std::string &tool = "ffprobe");

}  // namespace cytubegen
