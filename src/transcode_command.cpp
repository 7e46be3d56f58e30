//
//  transcode_command.cpp
//  CytubeGen
//
//  Created by the CytubeGen authors on 10/19/26.
//  Copyright © 2026 CytubeGen authors. All rights reserved.
//

#include "transcode_command.hpp"

#include <cstdlib>
#include <filesystem>
#include <sys/wait.h>

#include "logging.hpp"

namespace cytubegen {

namespace {

const char *stream_specifier(TrackKind kind) {
    switch (kind) {
    case TrackKind::Video:
        return "v";
    case TrackKind::Audio:
        return "a";
    case TrackKind::Subtitle:
        return "s";
    }
    return "v";
}

// Options for one output file. Audio-only outputs made of copies use a plain `-c copy`.
void append_output(std::vector<std::string> &args, const std::vector<const StreamOperation *> &ops,
                   const std::string &path) {
    bool copy_only = true;
    bool experimental = false;
    std::string format;
    for (const auto *op : ops) {
        args.push_back("-map");
        args.push_back(op->mapping);
        copy_only &= op->action == StreamAction::Copy && op->kind == TrackKind::Audio;
        experimental |= op->allow_experimental;
        if (format.empty()) {
            format = op->format;
        }
    }
    if (copy_only) {
        args.push_back("-c");
        args.push_back("copy");
    } else {
        for (const auto *op : ops) {
            const std::string spec = stream_specifier(op->kind);
            args.push_back("-c:" + spec);
            if (op->action == StreamAction::Copy) {
                args.push_back("copy");
                continue;
            }
            args.push_back(op->encoder);
            if (op->channels > 0) {
                args.push_back("-ac");
                args.push_back(std::to_string(op->channels));
            }
        }
    }
    if (experimental) {
        args.push_back("-strict");
        args.push_back("experimental");
    }
    if (!format.empty()) {
        args.push_back("-f");
        args.push_back(format);
    }
    args.push_back(path);
}

}  // namespace

std::vector<std::string> transcode_arguments(const TranscodePlan &plan,
                                             const std::string &input_path,
                                             const std::string &output_dir) {
    std::vector<std::string> args = {"-hide_banner", "-strict", "-2", "-i", input_path};

    std::vector<std::string> destinations;
    for (const auto &op : plan) {
        bool seen = false;
        for (const auto &d : destinations) {
            seen |= d == op.destination;
        }
        if (!seen) {
            destinations.push_back(op.destination);
        }
    }
    for (const auto &dest : destinations) {
        std::vector<const StreamOperation *> ops;
        for (const auto &op : plan) {
            if (op.destination == dest) {
                ops.push_back(&op);
            }
        }
        append_output(args, ops, (std::filesystem::path(output_dir) / dest).string());
    }
    return args;
}

std::string shell_quote(const std::string &arg) {
    if (!arg.empty() && arg.find_first_not_of("abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ"
                                              "0123456789-_./:=,+@%") == std::string::npos) {
        return arg;
    }
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

std::string format_command_line(const std::string &tool, const std::vector<std::string> &args) {
    std::string line = shell_quote(tool);
    for (const auto &a : args) {
        line += ' ';
        line += shell_quote(a);
    }
    return line;
}

Status run_transcode(const std::string &tool, const std::vector<std::string> &args) {
    const std::string cmd = format_command_line(tool, args);
    CG_LOG("exec", cmd);
    int ret = std::system(cmd.c_str());
    if (ret == -1) {
        std::string msg = "failed to start " + tool;
        CG_LOG("error", msg);
        return error_status(ErrorCode::TranscodeFailed, msg);
    }
    if (!WIFEXITED(ret) || WEXITSTATUS(ret) != 0) {
        std::string msg = tool + " exited with status " +
                          std::to_string(WIFEXITED(ret) ? WEXITSTATUS(ret) : ret);
        CG_LOG("error", msg);
        return error_status(ErrorCode::TranscodeFailed, msg);
    }
    return ok_status();
}

}  // namespace cytubegen
