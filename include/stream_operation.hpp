//
//  stream_operation.hpp
//  CytubeGen
//
//  Created by the CytubeGen authors on 10/19/26.
//  Copyright © 2026 CytubeGen authors. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "track.hpp"

namespace cytubegen {

enum class StreamAction { Copy, Encode };

/**
 * @brief One entry of the transcode plan.
 *
 * Operations sharing a `destination` are muxed into the same output file, in plan order.
 */
struct StreamOperation {
    uint16_t source_index = 0;
    TrackKind kind = TrackKind::Video;
    StreamAction action = StreamAction::Copy;
    std::string encoder;         ///< Encode only: transcode-tool encoder name
    int channels = 0;            ///< Encode only: forced channel count, 0 keeps the source layout
    bool allow_experimental = false;  ///< e.g. FLAC in MP4
    std::string destination;     ///< File name relative to the output directory
    std::string format;          ///< Forced muxer for the destination (`-f`), empty for none
    std::string mapping;         ///< Stream selector, "0:<index>"
};

using TranscodePlan = std::vector<StreamOperation>;

StreamOperation make_copy(const Track &track, std::string destination);
StreamOperation make_encode(const Track &track, std::string encoder, int channels,
                            std::string destination);

}  // namespace cytubegen
