//
//  compatibility.hpp
//  CytubeGen
//
//  Created by the CytubeGen authors on 10/19/26.
//  Copyright © 2026 CytubeGen authors. All rights reserved.
//

#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <vector>

namespace cytubegen {

/// Video containers the player accepts.
enum class VideoContainer { MP4, WEBM, OGG };

/**
 * @brief Audio-only containers used for alternate audio tracks.
 *
 * `PseudoM4A` is an MP4-structured file named `.m4a` and declared as `audio/mp4`. It carries
 * codecs (MP3) that the muxer refuses to put in a true M4A-branded file.
 */
enum class AudioContainer { M4A, OGG, PseudoM4A };

struct VideoContainerInfo {
    const char *extension;
    const char *mime_type;
    const char *preferred_audio_encoder;
    std::vector<std::string_view> accepted_audio_codecs;
};

struct AudioContainerInfo {
    const char *extension;
    const char *mime_type;
    const char *muxer;  ///< Forced output format; empty lets the extension decide
};

// Subtitle codecs that are bitmaps; they cannot be turned into WebVTT without OCR.
inline constexpr std::array<std::string_view, 4> kBitmapSubtitleCodecs = {
    "dvb_subtitle",
    "dvd_subtitle",
    "hdmv_pgs_subtitle",
    "xsub",
};

// Encoders used when the video codec fits no accepted container.
inline constexpr const char *kFallbackVideoEncoder = "libsvtav1";
inline constexpr const char *kFallbackAudioEncoder = "libopus";
inline constexpr VideoContainer kFallbackContainer = VideoContainer::WEBM;

// Channel count forced on every audio re-encode.
inline constexpr int kEncodeChannels = 2;

const VideoContainerInfo &container_info(VideoContainer container);
const AudioContainerInfo &container_info(AudioContainer container);

std::optional<VideoContainer> find_video_container(std::string_view video_codec);
std::optional<AudioContainer> find_audio_container(std::string_view audio_codec);

bool accepts_audio_codec(VideoContainer container, std::string_view audio_codec);
bool is_bitmap_subtitle(std::string_view subtitle_codec);

const char *container_name(VideoContainer container);
const char *container_name(AudioContainer container);

}  // namespace cytubegen
