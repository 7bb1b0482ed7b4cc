/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace kt::bundle {
constexpr std::string_view kUnknownName = "Unknown";

// Name lookups never fail; unlisted codes resolve to kUnknownName.
std::string_view device_name(std::uint16_t code);
std::string_view platform_name(std::uint32_t code);
std::string_view cert_file_name(std::uint32_t cert_num);
}  // namespace kt::bundle
