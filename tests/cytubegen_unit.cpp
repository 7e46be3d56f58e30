// End-to-end driver: a scripted probe tool feeds generate(), which plans, writes the
// manifest and (unless dry_run) starts the transcode tool.
#include <filesystem>
#include <fstream>
#include <string>

#include <nlohmann/json.hpp>

#include "cytubegen.hpp"
#include "test_support.hpp"

using namespace cytubegen;
using test_support::check;

namespace fs = std::filesystem;

namespace {

const char *kProbeOutput =
    "stream|index=0|codec_name=h264|codec_type=video|coded_height=1080\n"
    "stream|index=1|codec_name=aac|codec_type=audio|tag:language=eng\n"
    "stream|index=2|codec_name=subrip|codec_type=subtitle|tag:language=eng\n"
    "format|duration=42.5|bit_rate=2000000\n";

struct Fixture {
    fs::path root;
    fs::path input;
    fs::path probe_script;
};

Fixture make_fixture() {
    Fixture f;
    f.root = fs::temp_directory_path() / "cytubegen_driver_unit";
    fs::remove_all(f.root);
    fs::create_directories(f.root);

    f.input = f.root / "Some Movie.mkv";
    {
        std::ofstream media(f.input, std::ios::binary);
        media << "placeholder";
    }

    // Prints fixed compact output regardless of its arguments.
    f.probe_script = f.root / "fake_probe.sh";
    {
        std::ofstream script(f.probe_script);
        script << "#!/bin/sh\ncat <<'EOF'\n" << kProbeOutput << "EOF\n";
    }
    fs::permissions(f.probe_script, fs::perms::owner_all, fs::perm_options::replace);
    return f;
}

Options options_for(const Fixture &f, const fs::path &output_dir) {
    Options o;
    o.url_prefix = "https://media.example/movie/";
    o.output_dir = output_dir.string();
    o.probe_tool = f.probe_script.string();
    o.transcode_tool = "false";
    return o;
}

bool test_dry_run_writes_manifest() {
    auto f = make_fixture();
    auto o = options_for(f, f.root / "out");
    o.dry_run = true;
    auto status = generate(f.input.string(), o);
    bool ok = check(status.ok, "dry run succeeds without starting the transcode tool: " +
                                   status.message);
    const auto manifest_path = f.root / "out" / "manifest.json";
    ok &= check(fs::exists(manifest_path), "manifest written");
    if (!fs::exists(manifest_path)) {
        return false;
    }
    nlohmann::json j;
    std::ifstream in(manifest_path);
    in >> j;
    ok &= check(j["title"] == "Some Movie", "title falls back to input stem");
    ok &= check(j["duration"].get<double>() == 42.5, "duration carried");
    ok &= check(j["sources"].size() == 1 &&
                    j["sources"][0]["url"] == "https://media.example/movie/main.mp4",
                "source url");
    ok &= check(j["sources"][0]["bitrate"] == 2000, "bitrate in kbps");
    ok &= check(j["textTracks"].size() == 1, "subtitle track listed");
    fs::remove_all(f.root);
    return ok;
}

bool test_transcode_failure_reported() {
    auto f = make_fixture();
    auto o = options_for(f, f.root / "out");
    auto status = generate(f.input.string(), o);
    bool ok = check(!status.ok && status.code == ErrorCode::TranscodeFailed,
                    "failing transcode tool is TranscodeFailed");
    ok &= check(fs::exists(f.root / "out" / "manifest.json"),
                "manifest is written before the transcode starts");
    fs::remove_all(f.root);
    return ok;
}

bool test_output_dir_failure() {
    auto f = make_fixture();
    // A regular file where a directory is needed.
    const auto blocker = f.root / "blocker";
    {
        std::ofstream out(blocker);
        out << "x";
    }
    auto o = options_for(f, blocker / "out");
    o.dry_run = true;
    auto status = generate(f.input.string(), o);
    bool ok = check(!status.ok && status.code == ErrorCode::OutputError,
                    "uncreatable output directory is OutputError");
    fs::remove_all(f.root);
    return ok;
}

bool test_missing_input() {
    auto f = make_fixture();
    auto o = options_for(f, f.root / "out");
    o.dry_run = true;
    auto status = generate((f.root / "absent.mkv").string(), o);
    bool ok = check(!status.ok && status.code == ErrorCode::ProbeUnavailable,
                    "missing input is ProbeUnavailable");
    ok &= check(!fs::exists(f.root / "out"), "nothing written for a failed probe");
    fs::remove_all(f.root);
    return ok;
}

bool test_plan_for_title() {
    ProbeResult probe{};
    Options o;
    o.url_prefix = "p/";
    auto planned = plan_for("/videos/Episode 07.webm", probe, o);
    bool ok = check(planned.status.ok, "empty probe plans");
    ok &= check(planned.manifest.title == "Episode 07", "stem used as title");
    probe.title = "Tagged";
    planned = plan_for("/videos/Episode 07.webm", probe, o);
    ok &= check(planned.manifest.title == "Tagged", "probe title preferred");
    return ok;
}

}  // namespace

int main() {
    set_log_verbosity(LogVerbosity::Error);
    bool ok = true;
    ok &= check(!version_string().empty(), "version string");
    ok &= test_plan_for_title();
    ok &= test_dry_run_writes_manifest();
    ok &= test_transcode_failure_reported();
    ok &= test_output_dir_failure();
    ok &= test_missing_input();
    return ok ? 0 : 1;
}
