/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "common.h"

#include "bundle/bundle_render.h"
#include "cli_options.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string_view>
#include <string>

namespace fs = std::filesystem;

using kt::cli::Command;
using kt::cli::kExitFailed;
using kt::cli::kExitUsage;
using kt::cli::Settings;

static void print_usage() {
    KT_LOG_INFO(
        "Usage:\n" \
        "    kindle_tool inspect <input> [--json] [--offset <n>] [--max-depth <n>] [--debug]\n" \
        "    kindle_tool dump <input> [output] [--chunk-size <n>] [--max-depth <n>] [--debug]\n" \
        "    kindle_tool dm [input] [output] [--chunk-size <n>]\n" \
        "    kindle_tool sm [input] [output] [--chunk-size <n>]\n\n" \
        "Commands:\n" \
        "    inspect, info      display the metadata of a firmware file\n" \
        "    dump, convert      extract the deobfuscated payload (default output: stdout)\n" \
        "    dm                 deobfuscate a data stream (default: stdin to stdout)\n" \
        "    sm                 obfuscate a data stream (default: stdin to stdout)\n\n" \
        "Options not listed for a command are rejected.\n\n" \
        "Options:\n" \
        "    --json             print the inspected bundle as JSON\n" \
        "    --offset <n>       decode the bundle starting at byte offset n\n" \
        "    --max-depth <n>    maximum nested signature envelopes (default 8)\n" \
        "    --chunk-size <n>   payload streaming chunk size in bytes (default 8192)\n" \
        "    --debug            enables extra logging\n"
    );
}

static bool is_std_stream(const std::string& arg) { return arg == "-"; }

static int run_inspect(const Settings& settings) {
    if (settings.positional.size() != 1) {
        KT_LOG_ERROR("inspect takes exactly one input file");
        return kExitUsage;
    }
    const fs::path input = settings.positional[0];
    const auto res = kt::KindleTool::InspectFile(input, settings.decode, settings.offset);
    if (settings.json) {
        auto j = kt::bundle::bundle_to_json(res.bundle);
        j["headerEnd"] = res.header_end;
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cout << kt::bundle::render_bundle_text(res.bundle);
        std::cout.flush();
    }
    return 0;
}

static int run_dump(const Settings& settings) {
    if (settings.positional.empty() || settings.positional.size() > 2) {
        KT_LOG_ERROR("dump takes an input file and an optional output file");
        return kExitUsage;
    }
    const fs::path input = settings.positional[0];
    auto in = kt::fs_utils::open_input_file(input);

    std::uint64_t written = 0;
    if (settings.positional.size() == 2 && !is_std_stream(settings.positional[1])) {
        const fs::path output = settings.positional[1];
        KT_LOG_STATUS(
            "extracting payload from '%s' to '%s'...", input.string().c_str(),
            output.string().c_str()
        );
        auto out = kt::fs_utils::open_output_file(output);
        written = kt::KindleTool::DumpPayload(in, out, settings.decode);
    } else {
        KT_LOG_STATUS("extracting payload from '%s' to stdout...", input.string().c_str());
        written = kt::KindleTool::DumpPayload(in, std::cout, settings.decode);
    }
    if (settings.debug) {
        KT_LOG_STATUS("Wrote %llu payload bytes", static_cast<unsigned long long>(written));
    }
    return 0;
}

static int run_transform(const Settings& settings, kt::bundle::TransformDirection direction) {
    if (settings.positional.size() > 2) {
        KT_LOG_ERROR("expected at most an input and an output");
        return kExitUsage;
    }

    std::ifstream in_file;
    std::istream* in = &std::cin;
    if (!settings.positional.empty() && !is_std_stream(settings.positional[0])) {
        in_file = kt::fs_utils::open_input_file(settings.positional[0]);
        in = &in_file;
    }
    std::ofstream out_file;
    std::ostream* out = &std::cout;
    if (settings.positional.size() == 2 && !is_std_stream(settings.positional[1])) {
        out_file = kt::fs_utils::open_output_file(settings.positional[1]);
        out = &out_file;
    }

    const bool deobfuscate = direction == kt::bundle::TransformDirection::Deobfuscate;
    KT_LOG_STATUS("%s", deobfuscate ? "deobfuscating stream..." : "obfuscating stream...");
    kt::KindleTool::TransformStream(*in, *out, direction, settings.decode.payload_chunk_size);
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return kExitUsage;
    }

    const std::string_view command_arg = argv[1];
    if (command_arg == "--help" || command_arg == "-h" || command_arg == "help") {
        print_usage();
        return 0;
    }
    const auto command = kt::cli::parse_command(command_arg);
    if (!command.has_value()) {
        KT_LOG_ERROR("Unknown command: %s", std::string(command_arg).c_str());
        print_usage();
        return kExitUsage;
    }

    Settings settings;
    settings.command = *command;
    if (const int rc = kt::cli::parse_options(argc, argv, 2, settings); rc != 0) {
        return rc;
    }

    try {
        switch (settings.command) {
            case Command::Inspect:
                return run_inspect(settings);
            case Command::Dump:
                return run_dump(settings);
            case Command::Deobfuscate:
                return run_transform(settings, kt::bundle::TransformDirection::Deobfuscate);
            case Command::Obfuscate:
                return run_transform(settings, kt::bundle::TransformDirection::Obfuscate);
        }
    } catch (const std::exception& e) {
        const std::string input = settings.positional.empty() ? "-" : settings.positional[0];
        KT_LOG_ERROR("Failed: %s (%s)", input.c_str(), e.what());
        return kExitFailed;
    }
    return kExitFailed;
}
