//
//  probe_parser.cpp
//  CytubeGen
//
//  Created by the CytubeGen authors on 10/19/26.
//  Copyright © 2026 CytubeGen authors. All rights reserved.
//

#include "probe_parser.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>
#include <vector>

#include "logging.hpp"

namespace cytubegen {

namespace {

struct Token {
    std::string_view key;
    std::string_view value;
};

std::vector<std::string_view> split(std::string_view s, char sep) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(sep, start);
        if (pos == std::string_view::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

// Split a record into its kind and key=value tokens. Tokens without '=' are dropped.
std::string_view split_record(std::string_view line, std::vector<Token> &tokens) {
    auto parts = split(line, '|');
    for (size_t i = 1; i < parts.size(); ++i) {
        auto eq = parts[i].find('=');
        if (eq == std::string_view::npos) {
            CG_LOG("probe", "ignoring token without '=': " << parts[i]);
            continue;
        }
        tokens.push_back({parts[i].substr(0, eq), parts[i].substr(eq + 1)});
    }
    return parts.front();
}

std::optional<uint64_t> parse_unsigned(std::string_view v) {
    if (v.empty()) {
        return std::nullopt;
    }
    uint64_t out = 0;
    for (char c : v) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (out > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
            return std::nullopt;
        }
        out = out * 10 + digit;
    }
    return out;
}

std::optional<double> parse_double(std::string_view v) {
    if (v.empty()) {
        return std::nullopt;
    }
    std::string s(v);
    char *end = nullptr;
    errno = 0;
    double out = std::strtod(s.c_str(), &end);
    if (errno != 0 || end != s.c_str() + s.size()) {
        return std::nullopt;
    }
    return out;
}

void parse_format_line(const std::vector<Token> &tokens, ProbeResult &out) {
    for (const auto &t : tokens) {
        if (t.key == "duration") {
            if (auto d = parse_double(t.value)) {
                out.duration = *d;
            } else {
                CG_LOG("warn", "format duration is not numeric (" << t.value << "); using 0");
            }
        } else if (t.key == "bit_rate") {
            // The probe reports bit/s.
            if (auto b = parse_unsigned(t.value)) {
                out.bitrate = *b / 1000;
            } else {
                CG_LOG("warn", "format bit_rate is not numeric (" << t.value << "); using 0");
            }
        } else if (t.key == "tag:title") {
            out.title = std::string(t.value);
        } else {
            CG_LOG("probe", "unrecognized format key " << t.key);
        }
    }
}

// Returns nullopt with `skip == true` for non-media streams, nullopt with `error` set
// for structurally broken lines.
std::optional<Track> parse_stream_line(std::string_view line, const std::vector<Token> &tokens,
                                       bool &skip, std::string &error) {
    std::optional<TrackKind> kind;
    bool saw_kind = false;
    std::optional<uint16_t> index;
    std::optional<std::string> codec;
    Track track;
    for (const auto &t : tokens) {
        if (t.key == "codec_type") {
            saw_kind = true;
            kind = parse_track_kind(t.value);
            if (!kind) {
                CG_LOG("probe", "skipping stream of type " << t.value);
                skip = true;
                return std::nullopt;
            }
        } else if (t.key == "index") {
            auto v = parse_unsigned(t.value);
            if (!v || *v > std::numeric_limits<uint16_t>::max()) {
                error = "invalid index '" + std::string(t.value) + "' in line: " +
                        std::string(line);
                return std::nullopt;
            }
            index = static_cast<uint16_t>(*v);
        } else if (t.key == "codec_name") {
            std::string c(t.value);
            for (auto &ch : c) {
                ch = static_cast<char>(::tolower(static_cast<unsigned char>(ch)));
            }
            codec = std::move(c);
        } else if (t.key == "coded_height") {
            auto v = parse_unsigned(t.value);
            if (v && *v > 0 && *v <= std::numeric_limits<uint16_t>::max()) {
                track.scanline_count = static_cast<uint16_t>(*v);
            }
        } else if (t.key == "tag:language") {
            std::string lang(t.value.substr(0, kMaxLanguageLength));
            if (t.value.size() > kMaxLanguageLength) {
                CG_LOG("probe", "truncating language tag " << t.value << " to " << lang);
            }
            if (!lang.empty()) {
                track.language = std::move(lang);
            }
        } else if (t.key == "tag:title") {
            track.title = std::string(t.value);
        } else {
            CG_LOG("probe", "unrecognized stream key " << t.key);
        }
    }
    if (!saw_kind) {
        error = "missing codec_type in line: " + std::string(line);
        return std::nullopt;
    }
    if (!index) {
        error = "missing index in line: " + std::string(line);
        return std::nullopt;
    }
    if (!codec || codec->empty()) {
        error = "missing codec_name in line: " + std::string(line);
        return std::nullopt;
    }
    track.kind = *kind;
    track.index = *index;
    track.codec = std::move(*codec);
    if (track.kind != TrackKind::Video) {
        track.scanline_count.reset();
    }
    return track;
}

}  // namespace

const char *track_kind_name(TrackKind kind) {
    switch (kind) {
    case TrackKind::Video:
        return "video";
    case TrackKind::Audio:
        return "audio";
    case TrackKind::Subtitle:
        return "subtitle";
    }
    return "unknown";
}

std::optional<TrackKind> parse_track_kind(std::string_view value) {
    std::string v(value);
    for (auto &c : v) {
        c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    }
    if (v == "video") return TrackKind::Video;
    if (v == "audio") return TrackKind::Audio;
    if (v == "subtitle") return TrackKind::Subtitle;
    return std::nullopt;
}

ProbeOutcome parse_probe_output(std::string_view text) {
    ProbeOutcome outcome{};
    size_t line_no = 0;
    for (auto raw : split(text, '\n')) {
        ++line_no;
        if (!raw.empty() && raw.back() == '\r') {
            raw.remove_suffix(1);
        }
        if (raw.empty()) {
            continue;
        }
        std::vector<Token> tokens;
        auto kind = split_record(raw, tokens);
        if (kind == "format") {
            parse_format_line(tokens, outcome.probe);
        } else if (kind == "stream") {
            bool skip = false;
            std::string error;
            auto track = parse_stream_line(raw, tokens, skip, error);
            if (track) {
                CG_LOG("probe", "stream #" << track->index << " " << track_kind_name(track->kind)
                                           << " codec=" << track->codec);
                outcome.probe.tracks.push_back(std::move(*track));
            } else if (!skip) {
                std::string msg = "probe line " + std::to_string(line_no) + ": " + error;
                CG_LOG("error", msg);
                outcome.status = error_status(ErrorCode::ParseError, msg);
                outcome.probe = ProbeResult{};
                return outcome;
            }
        } else {
            CG_LOG("probe", "ignoring record kind " << kind);
        }
    }
    CG_LOG("debug", "parsed probe: tracks=" << outcome.probe.tracks.size()
                                            << " duration=" << outcome.probe.duration
                                            << " bitrate=" << outcome.probe.bitrate << "kbps");
    outcome.status = ok_status();
    return outcome;
}

}  // namespace cytubegen
