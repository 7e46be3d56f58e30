//
//  logging.hpp
//  CytubeGen
//
//  Created by the CytubeGen authors on 10/19/26.
//  Copyright © 2026 CytubeGen authors. All rights reserved.
//

#pragma once

#include <atomic>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace cytubegen {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Set/get global logging verbosity.
void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

// Parse a level name ("error", "warn", "info", "debug"); unknown names map to Error.
LogVerbosity parse_log_verbosity(const std::string &name);

// Codec-list helper used in plan logs, e.g. "{opus, vorbis}".
inline std::string codec_list(const std::vector<std::string_view> &codecs) {
    std::string out = "{";
    for (size_t i = 0; i < codecs.size(); ++i) {
        if (i != 0) {
            out += ", ";
        }
        out += codecs[i];
    }
    out += '}';
    return out;
}

}  // namespace cytubegen

inline constexpr cytubegen::LogVerbosity cg_severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return cytubegen::LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return cytubegen::LogVerbosity::Warn;
    }
    if (tag == "info") {
        return cytubegen::LogVerbosity::Info;
    }
    // Everything else (probe/plan/exec/etc.) treated as debug-level.
    return cytubegen::LogVerbosity::Debug;
}

inline bool cg_should_log(const char *level) {
    const auto current = cytubegen::get_log_verbosity();
    const auto sev = cg_severity_for_tag(level ? level : "");
    return static_cast<int>(sev) <= static_cast<int>(current);
}

inline void cg_log_impl(const char *level, const std::string &msg, const char *file, int line,
                        const char *func) {
    std::string lvl(level ? level : "");
    if (lvl == "error") {
        std::cerr << "[CytubeGen][" << level << "][" << file << ":" << line << " " << func
                  << "] " << msg << std::endl;
    } else {
        std::cerr << "[CytubeGen][" << level << "] " << msg << std::endl;
    }
}

#define CG_LOG(level, message)                                              \
    do {                                                                    \
        if (cg_should_log(level)) {                                         \
            std::ostringstream _cg_log_ss;                                  \
            _cg_log_ss << message;                                          \
            cg_log_impl(level, _cg_log_ss.str(), __FILE__, __LINE__,        \
                        __func__);                                          \
        }                                                                   \
    } while (0)
