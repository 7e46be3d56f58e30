//
//  track_classifier.hpp
//  CytubeGen
//
//  Created by the CytubeGen authors on 10/19/26.
//  Copyright © 2026 CytubeGen authors. All rights reserved.
//

#pragma once

#include <vector>

#include "track.hpp"

namespace cytubegen {

// Tracks grouped by kind. Pointers refer into the ProbeResult and keep probe order.
struct ClassifiedTracks {
    std::vector<const Track *> video;
    std::vector<const Track *> audio;
    std::vector<const Track *> subtitle;
};

ClassifiedTracks classify_tracks(const std::vector<Track> &tracks);

}  // namespace cytubegen
