//
//  compatibility.cpp
//  CytubeGen
//
//  Created by the CytubeGen authors on 10/19/26.
//  Copyright © 2026 CytubeGen authors. All rights reserved.
//

#include "compatibility.hpp"

#include <algorithm>

namespace cytubegen {

namespace {

const VideoContainerInfo kMp4Info{"mp4", "video/mp4", "aac",
                                  {"aac", "alac", "flac", "opus", "mp3"}};
const VideoContainerInfo kWebmInfo{"webm", "video/webm", "libopus", {"opus", "vorbis"}};
const VideoContainerInfo kOggInfo{"ogv", "video/ogg", "libopus", {"opus", "vorbis", "flac"}};

const AudioContainerInfo kM4aInfo{"m4a", "audio/mp4", ""};
const AudioContainerInfo kOggAudioInfo{"ogg", "audio/ogg", ""};
// Same name and MIME type as M4A, but muxed as plain MP4 so MP3 is accepted.
const AudioContainerInfo kPseudoM4aInfo{"m4a", "audio/mp4", "mp4"};

}  // namespace

const VideoContainerInfo &container_info(VideoContainer container) {
    switch (container) {
    case VideoContainer::MP4:
        return kMp4Info;
    case VideoContainer::WEBM:
        return kWebmInfo;
    case VideoContainer::OGG:
        return kOggInfo;
    }
    return kMp4Info;
}

const AudioContainerInfo &container_info(AudioContainer container) {
    switch (container) {
    case AudioContainer::OGG:
        return kOggAudioInfo;
    case AudioContainer::M4A:
        return kM4aInfo;
    case AudioContainer::PseudoM4A:
        return kPseudoM4aInfo;
    }
    return kM4aInfo;
}

std::optional<VideoContainer> find_video_container(std::string_view video_codec) {
    if (video_codec == "av1" || video_codec == "vp8" || video_codec == "vp9") {
        return VideoContainer::WEBM;
    }
    if (video_codec == "h264" ||   // H.264
        video_codec == "hevc" ||   // H.265
        video_codec == "mpeg4" ||  // MP4V-ES
        video_codec == "mpeg2video") {
        return VideoContainer::MP4;
    }
    if (video_codec == "theora") {
        return VideoContainer::OGG;
    }
    return std::nullopt;
}

std::optional<AudioContainer> find_audio_container(std::string_view audio_codec) {
    // FLAC is rejected as a bare container by the platform, but FLAC inside Ogg is only
    // ever declared as audio/ogg, so it plays.
    if (audio_codec == "aac" || audio_codec == "alac" || audio_codec == "aac_latm") {
        return AudioContainer::M4A;
    }
    if (audio_codec == "opus" || audio_codec == "vorbis" || audio_codec == "flac") {
        return AudioContainer::OGG;
    }
    if (audio_codec == "mp3") {
        return AudioContainer::PseudoM4A;
    }
    return std::nullopt;
}

bool accepts_audio_codec(VideoContainer container, std::string_view audio_codec) {
    const auto &accepted = container_info(container).accepted_audio_codecs;
    return std::find(accepted.begin(), accepted.end(), audio_codec) != accepted.end();
}

bool is_bitmap_subtitle(std::string_view subtitle_codec) {
    return std::find(kBitmapSubtitleCodecs.begin(), kBitmapSubtitleCodecs.end(),
                     subtitle_codec) != kBitmapSubtitleCodecs.end();
}

const char *container_name(VideoContainer container) {
    switch (container) {
    case VideoContainer::MP4:
        return "MP4";
    case VideoContainer::WEBM:
        return "WEBM";
    case VideoContainer::OGG:
        return "OGG";
    }
    return "unknown";
}

const char *container_name(AudioContainer container) {
    switch (container) {
    case AudioContainer::M4A:
        return "M4A";
    case AudioContainer::OGG:
        return "OGG";
    case AudioContainer::PseudoM4A:
        return "PseudoM4A";
    }
    return "unknown";
}

}  // namespace cytubegen
