/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "bundle/bundle_decoder.h"

#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>

namespace kt::bundle {
enum class TransformDirection {
    Obfuscate,
    Deobfuscate,
};

// Decodes (and discards) the bundle header, then streams the rest of `in` deobfuscated into `out`
// one chunk at a time. Returns the number of payload bytes written.
std::uint64_t extract_payload(std::istream& in, std::ostream& out, const DecodeOptions& opt = {});

// Applies the byte transform to the whole of `in`. Returns the number of bytes written.
std::uint64_t transform_stream(
    std::istream& in,
    std::ostream& out,
    TransformDirection direction,
    std::size_t chunk_size = 8192
);
}  // namespace kt::bundle
