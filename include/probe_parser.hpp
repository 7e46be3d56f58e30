//
//  probe_parser.hpp
//  CytubeGen
//
//  Created by the CytubeGen authors on 10/19/26.
//  Copyright © 2026 CytubeGen authors. All rights reserved.
//

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "track.hpp"

namespace cytubegen {

/**
 * @brief Parse the probe tool's compact output into a ProbeResult.
 *
 * Each line is `<kind>|<key>=<value>|...`. `format` lines fill the container-level
 * facts; `stream` lines become Tracks. Streams whose `codec_type` is not video, audio or
 * subtitle are skipped. A stream without `index`, `codec_name` or `codec_type` fails the
 * whole parse with `ErrorCode::ParseError`.
 */
ProbeOutcome parse_probe_output(std::string_view text);

// Map a probe `codec_type` value onto a TrackKind (case-insensitive).
std::optional<TrackKind> parse_track_kind(std::string_view value);

}  // namespace cytubegen
