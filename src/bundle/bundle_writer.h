/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "bundle/bundle_types.h"

#include <cstdint>
#include <vector>

namespace kt::bundle {
// Serialises a bundle tree (magic included) using the on-disk layouts. Throws
// std::invalid_argument when a field cannot be represented (hash not 32 bytes, wrong signature
// length for the cert, counts overflowing their count field, magic not matching the body).
std::vector<std::uint8_t> build_bundle(const UpdateBundle& bundle);
}  // namespace kt::bundle
