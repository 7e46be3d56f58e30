//
//  track_classifier.cpp
//  CytubeGen
//
//  Created by the CytubeGen authors on 10/19/26.
//  Copyright © 2026 CytubeGen authors. All rights reserved.
//

#include "track_classifier.hpp"

namespace cytubegen {

ClassifiedTracks classify_tracks(const std::vector<Track> &tracks) {
    ClassifiedTracks out;
    for (const auto &track : tracks) {
        switch (track.kind) {
        case TrackKind::Video:
            out.video.push_back(&track);
            break;
        case TrackKind::Audio:
            out.audio.push_back(&track);
            break;
        case TrackKind::Subtitle:
            out.subtitle.push_back(&track);
            break;
        }
    }
    return out;
}

}  // namespace cytubegen
