/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "bundle/bundle_obfuscation.h"

namespace kt::bundle {
void obfuscate_in_place(std::span<std::uint8_t> data) {
    for (auto& b : data) {
        b = obfuscate_byte(b);
    }
}

void deobfuscate_in_place(std::span<std::uint8_t> data) {
    for (auto& b : data) {
        b = deobfuscate_byte(b);
    }
}
}  // namespace kt::bundle
