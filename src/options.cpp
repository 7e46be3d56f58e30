//
//  options.cpp
//  CytubeGen
//
//  Created by the CytubeGen authors on 10/19/26.
//  Copyright © 2026 CytubeGen authors. All rights reserved.
//

#include "options.hpp"

#include <cerrno>
#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace cytubegen {

namespace {

bool read_string(const json &j, const char *key, std::string &out, std::string &error) {
    if (!j.contains(key)) {
        return true;
    }
    if (!j[key].is_string()) {
        error = std::string("'") + key + "' must be a string";
        return false;
    }
    out = j[key].get<std::string>();
    return true;
}

}  // namespace

void set_preferred_language(Options &options, const std::string &code) {
    if (code.empty()) {
        options.preferred_language.reset();
        return;
    }
    options.preferred_language = code.substr(0, kMaxLanguageLength);
    if (code.size() > kMaxLanguageLength) {
        CG_LOG("warn", "preferred language " << code << " truncated to "
                                             << *options.preferred_language);
    }
}

Status load_options_json(const std::string &path, Options &options) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::string msg = "open failed for " + path + " (" +
                          std::generic_category().message(errno) + ")";
        CG_LOG("error", msg);
        return error_status(ErrorCode::ConfigError, msg);
    }
    json j;
    try {
        f >> j;
    } catch (const json::parse_error &e) {
        std::string msg = "invalid JSON in " + path + ": " + e.what();
        CG_LOG("error", msg);
        return error_status(ErrorCode::ConfigError, msg);
    }
    if (!j.is_object()) {
        std::string msg = path + ": top-level value must be an object";
        CG_LOG("error", msg);
        return error_status(ErrorCode::ConfigError, msg);
    }

    std::string error;
    std::string language;
    std::string level;
    bool ok = read_string(j, "url_prefix", options.url_prefix, error) &&
              read_string(j, "probe_tool", options.probe_tool, error) &&
              read_string(j, "transcode_tool", options.transcode_tool, error) &&
              read_string(j, "manifest_name", options.manifest_name, error) &&
              read_string(j, "preferred_language", language, error) &&
              read_string(j, "log_level", level, error);
    if (!ok) {
        std::string msg = path + ": " + error;
        CG_LOG("error", msg);
        return error_status(ErrorCode::ConfigError, msg);
    }
    if (!language.empty()) {
        set_preferred_language(options, language);
    }
    if (!level.empty()) {
        options.log_level = parse_log_verbosity(level);
    }
    for (const auto &item : j.items()) {
        const auto &k = item.key();
        if (k != "url_prefix" && k != "probe_tool" && k != "transcode_tool" &&
            k != "manifest_name" && k != "preferred_language" && k != "log_level") {
            CG_LOG("warn", path << ": ignoring unknown key " << k);
        }
    }
    return ok_status();
}

}  // namespace cytubegen
