//
//  probe_runner.cpp
//  CytubeGen
//
//  Created by the CytubeGen authors on 10/19/26.
//  Copyright © 2026 CytubeGen authors. All rights reserved.
//

#include "probe_runner.hpp"

#include <cerrno>
#include <cstdio>
#include <fstream>
#include <system_error>
#include <sys/wait.h>

#include "logging.hpp"
#include "probe_parser.hpp"
#include "transcode_command.hpp"

namespace cytubegen {

std::vector<std::string> probe_arguments(const std::string &input_path) {
    return {input_path,
            "-of",
            "compact",
            "-hide_banner",
            "-show_streams",
            "-show_format",
            "-show_entries",
            "stream_tags=title,language:stream=index,codec_type,codec_name,coded_height,bitrate:"
            "stream_disposition=:format=duration,bit_rate:format_tags=title"};
}

ProbeOutcome run_probe(const std::string &input_path, const std::string &tool) {
    ProbeOutcome outcome{};
    // Check readability first; the probe tool's own message is discarded.
    {
        std::ifstream f(input_path, std::ios::binary);
        if (!f.is_open()) {
            std::string msg = "cannot read " + input_path + " (" +
                              std::generic_category().message(errno) + ")";
            CG_LOG("error", msg);
            outcome.status = error_status(ErrorCode::ProbeUnavailable, msg);
            return outcome;
        }
    }

    const std::string cmd = format_command_line(tool, probe_arguments(input_path)) + " 2>/dev/null";
    CG_LOG("exec", cmd);
    FILE *pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        std::string msg = "failed to start " + tool + " (" +
                          std::generic_category().message(errno) + ")";
        CG_LOG("error", msg);
        outcome.status = error_status(ErrorCode::ProbeFailed, msg);
        return outcome;
    }
    std::string output;
    char buffer[4096];
    size_t n = 0;
    while ((n = fread(buffer, 1, sizeof(buffer), pipe)) > 0) {
        output.append(buffer, n);
    }
    int ret = pclose(pipe);
    if (ret == -1 || !WIFEXITED(ret) || WEXITSTATUS(ret) != 0) {
        std::string msg = tool + " failed on " + input_path;
        if (ret != -1 && WIFEXITED(ret)) {
            msg += " (exit status " + std::to_string(WEXITSTATUS(ret)) + ")";
        }
        CG_LOG("error", msg);
        outcome.status = error_status(ErrorCode::ProbeFailed, msg);
        return outcome;
    }
    return parse_probe_output(output);
}

}  // namespace cytubegen
