/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "bundle/bundle_decoder.h"
#include "bundle/bundle_payload.h"
#include "bundle/bundle_types.h"

#include <cstdint>
#include <filesystem>
#include <istream>
#include <ostream>

namespace kt {

struct InspectResult {
    bundle::UpdateBundle bundle;
    std::uint64_t header_start = 0;
    std::uint64_t header_end = 0;
};

class KindleTool {
   public:
    static InspectResult InspectFile(
        const std::filesystem::path& path,
        const bundle::DecodeOptions& opt = {},
        std::uint64_t offset = 0
    );
    static InspectResult InspectStream(
        std::istream& in,
        const bundle::DecodeOptions& opt = {},
        std::uint64_t offset = 0
    );

    static std::uint64_t
    DumpPayload(std::istream& in, std::ostream& out, const bundle::DecodeOptions& opt = {});

    static std::uint64_t TransformStream(
        std::istream& in,
        std::ostream& out,
        bundle::TransformDirection direction,
        std::size_t chunk_size = 8192
    );
};

}  // namespace kt
