//
//  track.hpp
//  CytubeGen
//
//  Created by the CytubeGen authors on 10/19/26.
//  Copyright © 2026 CytubeGen authors. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "status.hpp"

namespace cytubegen {

// Longest language tag kept from the probe; longer tags are truncated.
inline constexpr size_t kMaxLanguageLength = 4;

enum class TrackKind { Video, Audio, Subtitle };

/**
 * @brief One media stream as reported by the probe tool.
 *
 * Only video/audio/subtitle streams are kept; data and attachment streams are
 * dropped while parsing.
 */
struct Track {
    uint16_t index = 0;                     ///< Stream index used by `-map 0:<index>`
    TrackKind kind = TrackKind::Video;
    std::string codec;                      ///< Lowercase codec name ("h264", "aac", ...)
    std::optional<uint16_t> scanline_count; ///< coded_height, video only
    std::optional<std::string> language;    ///< At most four characters
    std::optional<std::string> title;
};

// Container-level facts plus the ordered track list.
struct ProbeResult {
    std::vector<Track> tracks;
    std::optional<std::string> title;
    double duration = 0.0;  // seconds
    uint64_t bitrate = 0;   // kbps
};

struct ProbeOutcome {
    Status status;
    ProbeResult probe;
};

const char *track_kind_name(TrackKind kind);

}  // namespace cytubegen
