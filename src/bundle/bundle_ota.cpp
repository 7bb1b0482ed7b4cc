/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "bundle/bundle_decoder.h"

namespace kt::bundle {
OtaV1 decode_ota_v1(FieldReader& reader) {
    OtaV1 out{};
    out.md5_hash = reader.read_obfuscated_hash();
    out.source_rev = reader.read_u32_le();
    out.target_rev = reader.read_u32_le();
    out.device_code = reader.read_u16_le();
    out.optional = reader.read_u8();
    out.padding = reader.read_u8();
    return out;
}

OtaV2 decode_ota_v2(FieldReader& reader) {
    OtaV2 out{};
    out.source_rev = reader.read_u64_le();
    out.target_rev = reader.read_u64_le();

    const std::uint16_t num_devices = reader.read_u16_le();
    out.device_codes.reserve(num_devices);
    for (std::uint16_t i = 0; i < num_devices; i++) {
        out.device_codes.push_back(reader.read_u16_le());
    }

    out.critical = reader.read_u8();
    out.padding = reader.read_u8();
    out.md5_hash = reader.read_obfuscated_hash();

    // Each entry carries its own length, so a bogus count runs out of stream long before memory.
    const std::uint16_t num_metadata = reader.read_u16_le();
    for (std::uint16_t i = 0; i < num_metadata; i++) {
        out.metadata.push_back(reader.read_obfuscated_string());
    }
    return out;
}
}  // namespace kt::bundle
