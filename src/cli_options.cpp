/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "cli_options.h"

#include "utils/log.h"

#include <charconv>
#include <system_error>

namespace kt::cli {
static std::optional<std::uint64_t> parse_number(std::string_view s) {
    int base = 10;
    if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
        s.remove_prefix(2);
        base = 16;
    }
    std::uint64_t v = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v, base);
    if (ec != std::errc() || ptr != s.data() + s.size() || s.empty()) {
        return std::nullopt;
    }
    return v;
}

std::optional<Command> parse_command(std::string_view name) {
    if (name == "inspect" || name == "info") {
        return Command::Inspect;
    }
    if (name == "dump" || name == "convert") {
        return Command::Dump;
    }
    if (name == "dm") {
        return Command::Deobfuscate;
    }
    if (name == "sm") {
        return Command::Obfuscate;
    }
    return std::nullopt;
}

std::string_view command_name(Command command) {
    switch (command) {
        case Command::Inspect:
            return "inspect";
        case Command::Dump:
            return "dump";
        case Command::Deobfuscate:
            return "dm";
        case Command::Obfuscate:
            return "sm";
    }
    return "?";
}

bool option_applies(Command command, std::string_view option) {
    if (option == "--json" || option == "--offset") {
        return command == Command::Inspect;
    }
    if (option == "--max-depth" || option == "--debug") {
        return command == Command::Inspect || command == Command::Dump;
    }
    if (option == "--chunk-size") {
        return command != Command::Inspect;
    }
    return false;
}

int parse_options(int argc, const char* const* argv, int first, Settings& settings) {
    for (int i = first; i < argc; i++) {
        const std::string_view arg = argv[i];
        const bool is_option = arg.size() > 1 && arg[0] == '-' && arg[1] == '-';
        if (!is_option) {
            settings.positional.emplace_back(arg);
            continue;
        }
        if (arg != "--json" && arg != "--debug" && arg != "--offset" && arg != "--max-depth"
            && arg != "--chunk-size") {
            KT_LOG_ERROR("Unknown option: %s", std::string(arg).c_str());
            return kExitBadOption;
        }
        if (!option_applies(settings.command, arg)) {
            KT_LOG_ERROR(
                "Option %s does not apply to %s", std::string(arg).c_str(),
                std::string(command_name(settings.command)).c_str()
            );
            return kExitBadOption;
        }

        if (arg == "--json") {
            settings.json = true;
            continue;
        }
        if (arg == "--debug") {
            settings.debug = true;
            settings.decode.debug = true;
            continue;
        }

        if (i + 1 >= argc) {
            KT_LOG_ERROR("Missing value for %s", std::string(arg).c_str());
            return kExitBadOption;
        }
        const auto value = parse_number(argv[++i]);
        if (!value.has_value()) {
            KT_LOG_ERROR("Invalid value for %s: %s", std::string(arg).c_str(), argv[i]);
            return kExitBadOption;
        }
        if (arg == "--offset") {
            settings.offset = *value;
        } else if (arg == "--max-depth") {
            settings.decode.max_envelope_depth = static_cast<std::size_t>(*value);
        } else {
            if (*value == 0) {
                KT_LOG_ERROR("--chunk-size must be non-zero");
                return kExitBadOption;
            }
            settings.decode.payload_chunk_size = static_cast<std::size_t>(*value);
        }
    }
    return 0;
}
}  // namespace kt::cli
