// Translation of a plan into transcode-tool arguments and shell rendering.
#include <string>
#include <vector>

#include "plan_builder.hpp"
#include "test_support.hpp"
#include "transcode_command.hpp"

using namespace cytubegen;
using test_support::audio;
using test_support::check;
using test_support::subtitle;
using test_support::video;

namespace {

std::string joined(const std::vector<std::string> &args) {
    std::string s;
    for (const auto &a : args) {
        if (!s.empty()) s += ' ';
        s += a;
    }
    return s;
}

PlanOutcome plan_of(std::vector<Track> tracks) {
    ProbeResult p{};
    p.tracks = std::move(tracks);
    PlanConfig c{};
    c.url_prefix = "u/";
    return build_plan(p, c);
}

bool test_remux_arguments() {
    auto out = plan_of({video(0, "h264", 1080), audio(1, "aac", std::string("jpn")),
                        audio(2, "opus", std::string("eng")),
                        subtitle(3, "subrip", std::string("eng"))});
    auto args = transcode_arguments(out.plan, "in.mkv", "out");
    const std::string expected =
        "-hide_banner -strict -2 -i in.mkv "
        "-map 0:0 -map 0:1 -c:v copy -c:a copy out/main.mp4 "
        "-map 0:2 -c copy out/audio_2_eng.ogg "
        "-map 0:3 -c:s webvtt out/sub_3_eng.vtt";
    return check(joined(args) == expected, "remux arguments, got: " + joined(args));
}

bool test_encode_arguments() {
    auto out = plan_of({video(0, "vp9", 720), audio(1, "flac")});
    auto args = transcode_arguments(out.plan, "in.mkv", "out");
    const std::string expected =
        "-hide_banner -strict -2 -i in.mkv "
        "-map 0:0 -map 0:1 -c:v copy -c:a libopus -ac 2 out/main.webm";
    bool ok = check(joined(args) == expected, "encode arguments, got: " + joined(args));

    auto fallback = plan_of({video(0, "vc1", 1080), audio(1, "ac3")});
    args = transcode_arguments(fallback.plan, "in.mkv", "out");
    const std::string expected_fallback =
        "-hide_banner -strict -2 -i in.mkv "
        "-map 0:0 -map 0:1 -c:v libsvtav1 -c:a libopus -ac 2 out/main.webm";
    ok &= check(joined(args) == expected_fallback, "fallback arguments, got: " + joined(args));
    return ok;
}

bool test_experimental_flag() {
    auto out = plan_of({video(0, "h264", 1080), audio(1, "flac")});
    auto args = transcode_arguments(out.plan, "in.mkv", "out");
    const std::string expected =
        "-hide_banner -strict -2 -i in.mkv "
        "-map 0:0 -map 0:1 -c:v copy -c:a copy -strict experimental out/main.mp4";
    return check(joined(args) == expected, "flac-in-mp4 arguments, got: " + joined(args));
}

bool test_mp3_alternate_forces_mp4_muxer() {
    auto out = plan_of({video(0, "h264", 1080), audio(1, "aac"),
                        audio(2, "mp3", std::string("eng")), audio(3, "aac", std::string("jpn"))});
    auto args = transcode_arguments(out.plan, "in.mkv", "out");
    const std::string expected =
        "-hide_banner -strict -2 -i in.mkv "
        "-map 0:0 -map 0:1 -c:v copy -c:a copy out/main.mp4 "
        "-map 0:2 -c copy -f mp4 out/audio_2_eng.m4a "
        "-map 0:3 -c copy out/audio_3_jpn.m4a";
    return check(joined(args) == expected, "mp3 alternate arguments, got: " + joined(args));
}

bool test_shell_quoting() {
    bool ok = check(shell_quote("plain-file_1.mkv") == "plain-file_1.mkv", "plain unquoted");
    ok &= check(shell_quote("two words") == "'two words'", "space quoted");
    ok &= check(shell_quote("it's") == "'it'\\''s'", "single quote escaped");
    ok &= check(shell_quote("") == "''", "empty quoted");
    ok &= check(shell_quote("$(rm)") == "'$(rm)'", "substitution quoted");
    ok &= check(format_command_line("ffmpeg", {"-i", "a b.mkv"}) == "ffmpeg -i 'a b.mkv'",
                "command line");
    return ok;
}

bool test_failed_tool() {
    auto status = run_transcode("false", {});
    return check(!status.ok && status.code == ErrorCode::TranscodeFailed,
                 "non-zero exit is TranscodeFailed");
}

}  // namespace

int main() {
    bool ok = true;
    ok &= test_remux_arguments();
    ok &= test_encode_arguments();
    ok &= test_experimental_flag();
    ok &= test_mp3_alternate_forces_mp4_muxer();
    ok &= test_shell_quoting();
    ok &= test_failed_tool();
    return ok ? 0 : 1;
}
