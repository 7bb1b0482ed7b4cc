/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdint>
#include <span>

namespace kt::bundle {
// Nibble swap followed by XOR. The two directions use different constants but are exact inverses
// because swap(0x7A) == 0xA7.
inline std::uint8_t obfuscate_byte(std::uint8_t b) {
    return static_cast<std::uint8_t>(((b >> 4) | (b << 4)) ^ 0x7Au);
}

inline std::uint8_t deobfuscate_byte(std::uint8_t b) {
    return static_cast<std::uint8_t>(((b >> 4) | (b << 4)) ^ 0xA7u);
}

void obfuscate_in_place(std::span<std::uint8_t> data);
void deobfuscate_in_place(std::span<std::uint8_t> data);
}  // namespace kt::bundle
