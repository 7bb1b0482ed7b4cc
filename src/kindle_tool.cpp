/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "kindle_tool.h"

#include "bundle/bundle_reader.h"
#include "utils/fs_utils.h"
#include "utils/log.h"

#include <chrono>
#include <string>

namespace kt {

InspectResult KindleTool::InspectFile(
    const std::filesystem::path& path,
    const bundle::DecodeOptions& opt,
    std::uint64_t offset
) {
    auto in = fs_utils::open_input_file(path);
    return InspectStream(in, opt, offset);
}

InspectResult KindleTool::InspectStream(
    std::istream& in,
    const bundle::DecodeOptions& opt,
    std::uint64_t offset
) {
    const auto t0 = std::chrono::steady_clock::now();
    bundle::FieldReader reader(in);
    if (offset != 0) {
        reader.seek(offset);
    }

    InspectResult result{};
    result.header_start = reader.position();
    result.bundle = bundle::decode_bundle(reader, opt);
    result.header_end = reader.position();

    if (opt.debug) {
        const auto t1 = std::chrono::steady_clock::now();
        const auto us = std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0).count();
        KT_LOG_STATUS(
            "Decoded %s: header=0x%llX..0x%llX decode=%lldus",
            std::string(bundle::magic_str(result.bundle.magic)).c_str(),
            static_cast<unsigned long long>(result.header_start),
            static_cast<unsigned long long>(result.header_end), static_cast<long long>(us)
        );
    }
    return result;
}

std::uint64_t
KindleTool::DumpPayload(std::istream& in, std::ostream& out, const bundle::DecodeOptions& opt) {
    const auto t0 = std::chrono::steady_clock::now();
    const std::uint64_t written = bundle::extract_payload(in, out, opt);
    if (opt.debug) {
        const auto t1 = std::chrono::steady_clock::now();
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(t1 - t0).count();
        KT_LOG_STATUS(
            "Payload: bytes=%llu chunk=%zu time=%lldms", static_cast<unsigned long long>(written),
            opt.payload_chunk_size, static_cast<long long>(ms)
        );
    }
    return written;
}

std::uint64_t KindleTool::TransformStream(
    std::istream& in,
    std::ostream& out,
    bundle::TransformDirection direction,
    std::size_t chunk_size
) {
    return bundle::transform_stream(in, out, direction, chunk_size);
}

}  // namespace kt
