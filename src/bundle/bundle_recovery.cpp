/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "bundle/bundle_decoder.h"
#include "bundle/bundle_layout.h"

#include <stdexcept>
#include <string>

namespace kt::bundle {
namespace {
namespace layout = recovery_layout;

void check_block(std::span<const std::uint8_t> block) {
    if (block.size() < kRecoveryBlockSize) {
        throw std::invalid_argument(
            "Recovery header region must be " + std::to_string(kRecoveryBlockSize) + " bytes"
        );
    }
}
}  // namespace

RecoveryV1 parse_recovery_v1_block(std::span<const std::uint8_t> block) {
    check_block(block);

    RecoveryV1 out{};
    out.md5_hash = deobfuscate_hash(block.subspan(layout::kHash, kObfuscatedHashSize));
    out.magic1 = read_u32_le(block, layout::kMagic1);
    out.magic2 = read_u32_le(block, layout::kMagic2);
    out.minor = read_u32_le(block, layout::kMinor);
    out.header_rev = read_u32_le(block, layout::kHeaderRev);

    const std::uint32_t code = read_u32_le(block, layout::kCode);
    if (out.header_rev == 2) {
        out.device_info = RecoveryPlatform{code, read_u32_le(block, layout::kBoard)};
        out.target_ota = read_u64_le(block, layout::kTargetOta);
    } else {
        out.device_info = RecoveryDevice{static_cast<std::uint16_t>(code & 0xFFFFu)};
    }
    return out;
}

RecoveryV2 parse_recovery_v2_block(std::span<const std::uint8_t> block) {
    check_block(block);

    RecoveryV2 out{};
    out.target_ota = read_u64_le(block, layout::kTargetOta);
    out.md5_hash = deobfuscate_hash(block.subspan(layout::kHash, kObfuscatedHashSize));
    out.magic1 = read_u32_le(block, layout::kMagic1);
    out.magic2 = read_u32_le(block, layout::kMagic2);
    out.minor = read_u32_le(block, layout::kMinor);
    out.platform_code = read_u32_le(block, layout::kCode);
    out.header_rev = read_u32_le(block, layout::kHeaderRev);
    out.board = read_u32_le(block, layout::kBoard);

    const std::uint8_t num_devices = block[layout::kDeviceCount];
    out.device_codes.reserve(num_devices);
    for (std::size_t i = 0; i < num_devices; i++) {
        out.device_codes.push_back(read_u16_le(block, layout::kDeviceList + 2 * i));
    }
    return out;
}

RecoveryV1 decode_recovery_v1(FieldReader& reader) {
    const auto block = reader.read_bytes(kRecoveryBlockSize);
    return parse_recovery_v1_block(block);
}

RecoveryV2 decode_recovery_v2(FieldReader& reader) {
    const auto block = reader.read_bytes(kRecoveryBlockSize);
    return parse_recovery_v2_block(block);
}
}  // namespace kt::bundle
