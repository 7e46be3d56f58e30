//
//  stream_operation.cpp
//  CytubeGen
//
//  Created by the CytubeGen authors on 10/19/26.
//  Copyright © 2026 CytubeGen authors. All rights reserved.
//

#include "stream_operation.hpp"

#include <utility>

namespace cytubegen {

namespace {
std::string mapping_for(const Track &track) { return "0:" + std::to_string(track.index); }
}  // namespace

StreamOperation make_copy(const Track &track, std::string destination) {
    StreamOperation op{};
    op.source_index = track.index;
    op.kind = track.kind;
    op.action = StreamAction::Copy;
    op.destination = std::move(destination);
    op.mapping = mapping_for(track);
    return op;
}

StreamOperation make_encode(const Track &track, std::string encoder, int channels,
                            std::string destination) {
    StreamOperation op{};
    op.source_index = track.index;
    op.kind = track.kind;
    op.action = StreamAction::Encode;
    op.encoder = std::move(encoder);
    op.channels = channels;
    op.destination = std::move(destination);
    op.mapping = mapping_for(track);
    return op;
}

}  // namespace cytubegen
