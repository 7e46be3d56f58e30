//
//  manifest.hpp
//  CytubeGen
//
//  Created by the CytubeGen authors on 10/19/26.
//  Copyright © 2026 CytubeGen authors. All rights reserved.
//

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "status.hpp"

namespace cytubegen {

// Quality tiers the player accepts for `sources[].quality`.
inline constexpr std::array<uint16_t, 8> kAcceptedQualities = {240, 360, 480, 540,
                                                               720, 1080, 1440, 2160};

struct Source {
    std::string url;
    std::string content_type;
    uint16_t quality = 0;
    uint64_t bitrate = 0;  // kbps
};

struct AudioTrack {
    std::string url;
    std::string label;
    std::string language;
    std::string content_type;
};

struct TextTrack {
    std::string url;
    std::string name;
    std::string content_type;
};

/**
 * @brief Custom-media manifest handed to the player.
 *
 * The player trusts these declarations and never inspects the files, so container and
 * quality values must describe the produced files exactly.
 */
struct ManifestVideo {
    std::string title;
    double duration = 0.0;
    std::vector<Source> sources;
    std::vector<AudioTrack> audio_tracks;
    std::vector<TextTrack> text_tracks;
};

// Nearest accepted tier; ties resolve to the lower tier.
uint16_t snap_quality(uint16_t scanlines);
bool is_accepted_quality(uint16_t quality);

nlohmann::json to_json(const ManifestVideo &manifest);

// Pretty-printed JSON (indent 2). Returns OutputError on I/O failure.
Status write_manifest(const std::string &path, const ManifestVideo &manifest);

}  // namespace cytubegen
