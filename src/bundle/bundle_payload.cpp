/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "bundle/bundle_payload.h"

#include "bundle/bundle_obfuscation.h"
#include "utils/log.h"

#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace kt::bundle {
static std::uint64_t copy_transformed(
    FieldReader& reader,
    std::ostream& out,
    TransformDirection direction,
    std::size_t chunk_size
) {
    if (chunk_size == 0) {
        throw std::invalid_argument(std::string("chunk size must be non-zero"));
    }

    std::vector<std::uint8_t> buf(chunk_size);
    std::uint64_t total = 0;
    for (;;) {
        const std::size_t n = reader.read_some(buf);
        if (n == 0) {
            break;
        }
        const auto chunk = std::span<std::uint8_t>(buf.data(), n);
        if (direction == TransformDirection::Deobfuscate) {
            deobfuscate_in_place(chunk);
        } else {
            obfuscate_in_place(chunk);
        }
        out.write(reinterpret_cast<const char*>(chunk.data()), static_cast<std::streamsize>(n));
        if (!out) {
            throw std::runtime_error(
                std::string("Failed to write output after ") + std::to_string(total) + " bytes"
            );
        }
        total += n;
    }
    out.flush();
    if (!out) {
        throw std::runtime_error(
            std::string("Failed to write output after ") + std::to_string(total) + " bytes"
        );
    }
    return total;
}

std::uint64_t extract_payload(std::istream& in, std::ostream& out, const DecodeOptions& opt) {
    FieldReader reader(in);
    const UpdateBundle header = decode_bundle(reader, opt);
    if (opt.debug) {
        KT_LOG_STATUS(
            "%s header ends at offset 0x%llX", std::string(magic_str(header.magic)).c_str(),
            static_cast<unsigned long long>(reader.position())
        );
    }
    return copy_transformed(reader, out, TransformDirection::Deobfuscate, opt.payload_chunk_size);
}

std::uint64_t transform_stream(
    std::istream& in,
    std::ostream& out,
    TransformDirection direction,
    std::size_t chunk_size
) {
    FieldReader reader(in);
    return copy_transformed(reader, out, direction, chunk_size);
}
}  // namespace kt::bundle
