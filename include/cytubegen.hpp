//
//  cytubegen.hpp
//  CytubeGen
//
//  Created by the CytubeGen authors on 10/19/26.
//  Copyright © 2026 CytubeGen authors. All rights reserved.
//

#pragma once

#include <string>

#include "options.hpp"
#include "plan_builder.hpp"
#include "status.hpp"
#include "track.hpp"

namespace cytubegen {

/// @defgroup api CytubeGen Public API
/// Turn one media file into player-compatible files plus a custom-media manifest.
/// @{

/**
 * @brief Return the CytubeGen version string (e.g. `v0.3`).
 */
std::string version_string();  ///< @ingroup api

/// Build the plan for an already-probed input; `input_path` only supplies the fallback title.
PlanOutcome plan_for(const std::string &input_path, const ProbeResult &probe,
                     const Options &options);  ///< @ingroup api

/**
 * @brief Probe, plan, write the manifest and run the transcode tool.
 *
 * @param input_path Media file to convert.
 * @param options Output directory, URL prefix, language preference and tool names.
 *        With `dry_run` the manifest is written but the transcode tool is not started.
 */
Status generate(const std::string &input_path, const Options &options);  ///< @ingroup api

/// @}

}  // namespace cytubegen
