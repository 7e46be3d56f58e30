//
//  status.cpp
//  CytubeGen
//
//  Created by the CytubeGen authors on 10/19/26.
//  Copyright © 2026 CytubeGen authors. All rights reserved.
//

#include "status.hpp"

namespace cytubegen {

const char *error_code_name(ErrorCode code) {
    switch (code) {
    case ErrorCode::None:
        return "none";
    case ErrorCode::ProbeUnavailable:
        return "probe-unavailable";
    case ErrorCode::ProbeFailed:
        return "probe-failed";
    case ErrorCode::ParseError:
        return "parse-error";
    case ErrorCode::MissingScanlineCount:
        return "missing-scanline-count";
    case ErrorCode::ConfigError:
        return "config-error";
    case ErrorCode::OutputError:
        return "output-error";
    case ErrorCode::TranscodeFailed:
        return "transcode-failed";
    }
    return "unknown";
}

}  // namespace cytubegen
