//
//  plan_builder.cpp
//  CytubeGen
//
//  Created by the CytubeGen authors on 10/19/26.
//  Copyright © 2026 CytubeGen authors. All rights reserved.
//

#include "plan_builder.hpp"

#include <utility>

#include "compatibility.hpp"
#include "language.hpp"
#include "logging.hpp"

namespace cytubegen {

namespace {

constexpr const char *kUnknownLanguage = "unknown";
constexpr const char *kSubtitleEncoder = "webvtt";
constexpr const char *kSubtitleMimeType = "text/vtt";

std::string language_or_unknown(const Track &track) {
    return track.language ? *track.language : std::string(kUnknownLanguage);
}

uint16_t manifest_quality(const Track &video) {
    const uint16_t height = *video.scanline_count;
    const uint16_t quality = snap_quality(height);
    if (quality != height) {
        CG_LOG("warn", "video #" << video.index << " height " << height
                                 << " is not an accepted quality; declaring " << quality);
    }
    return quality;
}

// Adds the main.<ext> operations and Source. Returns false on a fatal precondition.
bool plan_primary(const Track &video, const Track &audio, const ProbeResult &probe,
                  const PlanConfig &config, PlanOutcome &out) {
    if (!video.scanline_count) {
        std::string msg = "video track #" + std::to_string(video.index) + " (" + video.codec +
                          ") has no coded height";
        CG_LOG("error", msg);
        out.status = error_status(ErrorCode::MissingScanlineCount, msg);
        return false;
    }

    const auto container = find_video_container(video.codec);
    std::string filename;
    std::string mime_type;
    if (container) {
        const auto &info = container_info(*container);
        filename = std::string("main.") + info.extension;
        mime_type = info.mime_type;

        out.plan.push_back(make_copy(video, filename));
        if (accepts_audio_codec(*container, audio.codec)) {
            auto op = make_copy(audio, filename);
            // The muxer treats FLAC in MP4 as experimental and refuses it otherwise.
            op.allow_experimental = *container == VideoContainer::MP4 && audio.codec == "flac";
            out.plan.push_back(std::move(op));
            CG_LOG("plan", "remux video #" << video.index << " + audio #" << audio.index
                                           << " into " << filename);
        } else {
            out.plan.push_back(
                make_encode(audio, info.preferred_audio_encoder, kEncodeChannels, filename));
            CG_LOG("plan", "remux video #" << video.index << ", encode audio #" << audio.index
                                           << " (" << audio.codec << " not in "
                                           << codec_list(info.accepted_audio_codecs) << " -> "
                                           << info.preferred_audio_encoder << ") into "
                                           << filename);
        }
    } else {
        const auto &info = container_info(kFallbackContainer);
        filename = std::string("main.") + info.extension;
        mime_type = info.mime_type;
        CG_LOG("info", "video codec " << video.codec << " fits no accepted container; "
                                      << "re-encoding to " << kFallbackVideoEncoder);
        out.plan.push_back(make_encode(video, kFallbackVideoEncoder, 0, filename));
        out.plan.push_back(
            make_encode(audio, kFallbackAudioEncoder, kEncodeChannels, filename));
    }

    Source source{};
    source.url = config.url_prefix + filename;
    source.content_type = mime_type;
    source.quality = manifest_quality(video);
    // Overall bitrate of the input, not the video stream alone.
    source.bitrate = probe.bitrate;
    out.manifest.sources.push_back(std::move(source));
    return true;
}

void plan_secondary_audio(const std::vector<const Track *> &audio, const Track &primary,
                          const PlanConfig &config, PlanOutcome &out) {
    for (const auto *track : audio) {
        if (track->index == primary.index) {
            continue;
        }
        const auto container = find_audio_container(track->codec);
        if (!container) {
            CG_LOG("info", "dropping audio #" << track->index << ": codec " << track->codec
                                              << " fits no audio container");
            continue;
        }
        const std::string language = language_or_unknown(*track);
        const std::string filename = audio_file_name(*track, *container);
        auto op = make_copy(*track, filename);
        op.format = container_info(*container).muxer;
        out.plan.push_back(std::move(op));

        AudioTrack entry{};
        entry.url = config.url_prefix + filename;
        entry.label = build_language_label(language, track->title);
        entry.language = manifest_language_code(language);
        entry.content_type = container_info(*container).mime_type;
        out.manifest.audio_tracks.push_back(std::move(entry));
    }
}

void plan_subtitles(const std::vector<const Track *> &subtitles, const PlanConfig &config,
                    PlanOutcome &out) {
    for (const auto *track : subtitles) {
        if (is_bitmap_subtitle(track->codec)) {
            CG_LOG("info", "dropping bitmap subtitle #" << track->index << " (" << track->codec
                                                        << ")");
            continue;
        }
        const std::string filename = subtitle_file_name(*track);
        out.plan.push_back(make_encode(*track, kSubtitleEncoder, 0, filename));

        TextTrack entry{};
        entry.url = config.url_prefix + filename;
        if (track->language) {
            entry.name = build_language_label(*track->language, track->title);
        } else if (track->title) {
            entry.name = *track->title;
        } else {
            entry.name = "Unknown";
        }
        entry.content_type = kSubtitleMimeType;
        out.manifest.text_tracks.push_back(std::move(entry));
    }
}

}  // namespace

std::string audio_file_name(const Track &track, AudioContainer container) {
    return "audio_" + std::to_string(track.index) + "_" + language_or_unknown(track) + "." +
           container_info(container).extension;
}

std::string subtitle_file_name(const Track &track) {
    return "sub_" + std::to_string(track.index) + "_" + language_or_unknown(track) + ".vtt";
}

const Track *select_primary_audio(const std::vector<const Track *> &audio,
                                  const std::optional<VideoContainer> &container,
                                  const std::optional<std::string> &preferred_language) {
    if (audio.empty()) {
        return nullptr;
    }
    const Track *chosen = audio.front();
    int highest_score = 0;
    for (const auto *candidate : audio) {
        int score = 0;
        if (!container || accepts_audio_codec(*container, candidate->codec)) {
            ++score;
        }
        if (!preferred_language || candidate->language == preferred_language) {
            ++score;
        }
        CG_LOG("plan", "audio #" << candidate->index << " codec=" << candidate->codec
                                 << " lang=" << candidate->language.value_or("-")
                                 << " score=" << score);
        if (score > highest_score) {
            chosen = candidate;
            highest_score = score;
        }
    }
    return chosen;
}

PlanOutcome build_plan(const ProbeResult &probe, const PlanConfig &config) {
    PlanOutcome out{};
    const auto groups = classify_tracks(probe.tracks);
    CG_LOG("debug", "build_plan video=" << groups.video.size() << " audio="
                                        << groups.audio.size()
                                        << " subtitle=" << groups.subtitle.size());

    if (!groups.video.empty()) {
        const Track &video = *groups.video.front();
        const auto container = find_video_container(video.codec);
        const Track *audio =
            select_primary_audio(groups.audio, container, config.preferred_language);
        if (audio) {
            if (!plan_primary(video, *audio, probe, config, out)) {
                out.plan.clear();
                out.manifest = ManifestVideo{};
                return out;
            }
            plan_secondary_audio(groups.audio, *audio, config, out);
        } else {
            CG_LOG("warn", "video #" << video.index << " has no audio to pair with; "
                                     << "no source emitted");
        }
    }

    plan_subtitles(groups.subtitle, config, out);

    out.manifest.title = probe.title ? *probe.title : config.fallback_title;
    out.manifest.duration = probe.duration;
    out.status = ok_status();
    return out;
}

}  // namespace cytubegen
