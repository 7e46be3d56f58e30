//
//  plan_builder.hpp
//  CytubeGen
//
//  Created by the CytubeGen authors on 10/19/26.
//  Copyright © 2026 CytubeGen authors. All rights reserved.
//

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "compatibility.hpp"
#include "manifest.hpp"
#include "status.hpp"
#include "stream_operation.hpp"
#include "track.hpp"
#include "track_classifier.hpp"

namespace cytubegen {

struct PlanConfig {
    std::string url_prefix;                      ///< Prepended verbatim to every file name
    std::optional<std::string> preferred_language;
    std::string fallback_title;                  ///< Used when the probe has no title
};

struct PlanOutcome {
    Status status;
    TranscodePlan plan;
    ManifestVideo manifest;
};

/**
 * @brief Decide what to copy, what to encode, and describe the result.
 *
 * Pure function of its inputs. The plan and manifest always agree on file names: every
 * manifest url is `url_prefix + destination` of the matching operation.
 */
PlanOutcome build_plan(const ProbeResult &probe, const PlanConfig &config);

/**
 * @brief Pick the audio track muxed with the primary video.
 *
 * One point for a codec the video container accepts (or no container), one for the
 * preferred language (or none requested). Strictly higher scores win, so the first
 * maximal candidate in probe order is chosen. Returns nullptr when there is no audio.
 */
const Track *select_primary_audio(const std::vector<const Track *> &audio,
                                  const std::optional<VideoContainer> &container,
                                  const std::optional<std::string> &preferred_language);

std::string audio_file_name(const Track &track, AudioContainer container);
std::string subtitle_file_name(const Track &track);

}  // namespace cytubegen
