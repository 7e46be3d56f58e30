//
//  cytubegen.cpp
//  CytubeGen
//
//  Created by the CytubeGen authors on 10/19/26.
//  Copyright © 2026 CytubeGen authors. All rights reserved.
//

#include "cytubegen.hpp"
#include "cytubegen_version.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <system_error>

#include "logging.hpp"
#include "manifest.hpp"
#include "probe_runner.hpp"
#include "transcode_command.hpp"

namespace cytubegen {

std::string version_string() { return CYTUBEGEN_VERSION_DISPLAY; }

PlanOutcome plan_for(const std::string &input_path, const ProbeResult &probe,
                     const Options &options) {
    PlanConfig config{};
    config.url_prefix = options.url_prefix;
    config.preferred_language = options.preferred_language;
    config.fallback_title = std::filesystem::path(input_path).stem().string();
    return build_plan(probe, config);
}

Status generate(const std::string &input_path, const Options &options) {
    const auto t0 = std::chrono::steady_clock::now();
    CG_LOG("debug", "generate input=" << input_path << " output=" << options.output_dir
                                      << " prefix=" << options.url_prefix << " lang="
                                      << options.preferred_language.value_or("-")
                                      << " dry_run=" << options.dry_run);

    auto probed = run_probe(input_path, options.probe_tool);
    if (!probed.status.ok) {
        return probed.status;
    }
    const auto t_probe = std::chrono::steady_clock::now();

    auto planned = plan_for(input_path, probed.probe, options);
    if (!planned.status.ok) {
        return planned.status;
    }
    CG_LOG("info", "plan: " << planned.plan.size() << " stream operations, "
                            << planned.manifest.sources.size() << " sources, "
                            << planned.manifest.audio_tracks.size() << " audio tracks, "
                            << planned.manifest.text_tracks.size() << " text tracks");

    std::error_code ec;
    std::filesystem::create_directories(options.output_dir, ec);
    if (ec) {
        std::string msg = "cannot create " + options.output_dir + " (" + ec.message() + ")";
        CG_LOG("error", msg);
        return error_status(ErrorCode::OutputError, msg);
    }
    const auto manifest_path =
        (std::filesystem::path(options.output_dir) / options.manifest_name).string();
    auto written = write_manifest(manifest_path, planned.manifest);
    if (!written.ok) {
        return written;
    }

    const auto args = transcode_arguments(planned.plan, input_path, options.output_dir);
    if (options.print_plan) {
        std::cout << format_command_line(options.transcode_tool, args) << "\n";
    }
    if (options.dry_run) {
        CG_LOG("info", "dry run: skipping " << options.transcode_tool);
        return ok_status();
    }
    auto ran = run_transcode(options.transcode_tool, args);

    const auto t1 = std::chrono::steady_clock::now();
    const auto probe_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(t_probe - t0).count();
    const auto total_ms = std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count();
    CG_LOG("debug", "generate timings ms: probe=" << probe_ms << " total=" << total_ms);
    return ran;
}

}  // namespace cytubegen
