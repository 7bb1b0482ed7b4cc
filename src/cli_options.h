/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "bundle/bundle_decoder.h"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kt::cli {
constexpr int kExitUsage = 1;
constexpr int kExitBadOption = 2;
constexpr int kExitFailed = 3;

enum class Command {
    Inspect,
    Dump,
    Deobfuscate,
    Obfuscate,
};

struct Settings {
    Command command = Command::Inspect;
    std::vector<std::string> positional;
    bool json = false;
    bool debug = false;
    std::uint64_t offset = 0;
    bundle::DecodeOptions decode{};
};

std::optional<Command> parse_command(std::string_view name);
std::string_view command_name(Command command);

// Options that do not apply to the command are rejected, not ignored.
bool option_applies(Command command, std::string_view option);

/**
 * Parses the arguments following the command word into settings.
 * Returns 0 on success or kExitBadOption after logging the offending argument.
 */
int parse_options(int argc, const char* const* argv, int first, Settings& settings);
}  // namespace kt::cli
