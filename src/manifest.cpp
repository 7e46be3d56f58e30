//
//  manifest.cpp
//  CytubeGen
//
//  Created by the CytubeGen authors on 10/19/26.
//  Copyright © 2026 CytubeGen authors. All rights reserved.
//

#include "manifest.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <system_error>

#include "logging.hpp"

using json = nlohmann::json;

namespace cytubegen {

uint16_t snap_quality(uint16_t scanlines) {
    uint16_t best = kAcceptedQualities.front();
    int best_distance = std::abs(static_cast<int>(scanlines) - static_cast<int>(best));
    for (auto tier : kAcceptedQualities) {
        int distance = std::abs(static_cast<int>(scanlines) - static_cast<int>(tier));
        if (distance < best_distance) {
            best = tier;
            best_distance = distance;
        }
    }
    return best;
}

bool is_accepted_quality(uint16_t quality) {
    return std::find(kAcceptedQualities.begin(), kAcceptedQualities.end(), quality) !=
           kAcceptedQualities.end();
}

json to_json(const ManifestVideo &manifest) {
    json j;
    j["title"] = manifest.title;
    j["duration"] = manifest.duration;

    json sources = json::array();
    for (const auto &s : manifest.sources) {
        sources.push_back({{"url", s.url},
                           {"contentType", s.content_type},
                           {"quality", s.quality},
                           {"bitrate", s.bitrate}});
    }
    j["sources"] = sources;

    json audio = json::array();
    for (const auto &a : manifest.audio_tracks) {
        audio.push_back({{"url", a.url},
                         {"label", a.label},
                         {"language", a.language},
                         {"contentType", a.content_type}});
    }
    j["audioTracks"] = audio;

    json text = json::array();
    for (const auto &t : manifest.text_tracks) {
        text.push_back({{"url", t.url}, {"name", t.name}, {"contentType", t.content_type}});
    }
    j["textTracks"] = text;
    return j;
}

Status write_manifest(const std::string &path, const ManifestVideo &manifest) {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        std::string msg = "open failed for " + path + " (" +
                          std::generic_category().message(errno) + ")";
        CG_LOG("error", msg);
        return error_status(ErrorCode::OutputError, msg);
    }
    out << to_json(manifest).dump(2) << "\n";
    if (!out.good()) {
        std::string msg = "write failed for " + path;
        CG_LOG("error", msg);
        return error_status(ErrorCode::OutputError, msg);
    }
    CG_LOG("debug", "wrote manifest " << path);
    return ok_status();
}

}  // namespace cytubegen
