//
//  status.hpp
//  CytubeGen
//
//  Created by the CytubeGen authors on 10/19/26.
//  Copyright © 2026 CytubeGen authors. All rights reserved.
//

#pragma once

#include <string>
#include <utility>

namespace cytubegen {

enum class ErrorCode {
    None = 0,
    ProbeUnavailable,      ///< input could not be read before invoking the probe tool
    ProbeFailed,           ///< probe tool exited non-zero
    ParseError,            ///< mandatory stream field missing or unparsable
    MissingScanlineCount,  ///< primary video track has no coded height
    ConfigError,
    OutputError,
    TranscodeFailed,
};

/**
 * @brief Result object with success flag, error code and optional message.
 *
 * When `ok == true`, `code` is `ErrorCode::None` and `message` is empty.
 */
struct Status {
    bool ok{false};
    ErrorCode code{ErrorCode::None};
    std::string message;
};

inline Status ok_status() { return Status{true, ErrorCode::None, {}}; }

inline Status error_status(ErrorCode code, std::string msg) {
    return Status{false, code, std::move(msg)};
}

const char *error_code_name(ErrorCode code);

}  // namespace cytubegen
