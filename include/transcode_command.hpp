//
//  transcode_command.hpp
//  CytubeGen
//
//  Created by the CytubeGen authors on 10/19/26.
//  Copyright © 2026 CytubeGen authors. All rights reserved.
//

#pragma once

#include <string>
#include <vector>

#include "status.hpp"
#include "stream_operation.hpp"

namespace cytubegen {

/**
 * @brief Translate a plan into transcode-tool arguments.
 *
 * Output files are emitted in order of first appearance in the plan; each gets its
 * `-map` selectors, per-stream codec options and `<output_dir>/<destination>`.
 */
std::vector<std::string> transcode_arguments(const TranscodePlan &plan,
                                             const std::string &input_path,
                                             const std::string &output_dir);

// Quote one argument for a POSIX shell.
std::string shell_quote(const std::string &arg);

// Shell-safe command line, for logs and --print-plan.
std::string format_command_line(const std::string &tool, const std::vector<std::string> &args);

// Run the transcode tool to completion. Non-zero exit is TranscodeFailed.
Status run_transcode(const std::string &tool, const std::vector<std::string> &args);

}  // namespace cytubegen
