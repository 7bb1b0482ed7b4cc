/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "bundle/bundle_writer.h"

#include "bundle/bundle_obfuscation.h"
#include "bundle/bundle_layout.h"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

namespace kt::bundle {
namespace {
namespace layout = recovery_layout;

void write_u16_le(std::vector<std::uint8_t>& out, std::uint16_t v) {
    out.push_back(static_cast<std::uint8_t>(v & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFFu));
}

void write_u16_be(std::vector<std::uint8_t>& out, std::uint16_t v) {
    out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>(v & 0xFFu));
}

void write_u32_le(std::vector<std::uint8_t>& out, std::uint32_t v) {
    out.push_back(static_cast<std::uint8_t>(v & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFFu));
}

void write_u64_le(std::vector<std::uint8_t>& out, std::uint64_t v) {
    for (int i = 0; i < 8; i++) {
        out.push_back(static_cast<std::uint8_t>((v >> (8 * i)) & 0xFFu));
    }
}

void put_u32_le(std::vector<std::uint8_t>& block, std::size_t off, std::uint32_t v) {
    for (int i = 0; i < 4; i++) {
        block[off + static_cast<std::size_t>(i)] =
            static_cast<std::uint8_t>((v >> (8 * i)) & 0xFFu);
    }
}

void put_u64_le(std::vector<std::uint8_t>& block, std::size_t off, std::uint64_t v) {
    for (int i = 0; i < 8; i++) {
        block[off + static_cast<std::size_t>(i)] =
            static_cast<std::uint8_t>((v >> (8 * i)) & 0xFFu);
    }
}

std::vector<std::uint8_t> obfuscated_hash(const std::string& hash) {
    if (hash.size() != kObfuscatedHashSize) {
        throw std::invalid_argument(
            "hash must be " + std::to_string(kObfuscatedHashSize) + " bytes, got "
            + std::to_string(hash.size())
        );
    }
    std::vector<std::uint8_t> raw(hash.begin(), hash.end());
    obfuscate_in_place(raw);
    return raw;
}

void write_hash(std::vector<std::uint8_t>& out, const std::string& hash) {
    const auto raw = obfuscated_hash(hash);
    out.insert(out.end(), raw.begin(), raw.end());
}

void put_hash(std::vector<std::uint8_t>& block, std::size_t off, const std::string& hash) {
    const auto raw = obfuscated_hash(hash);
    std::copy(raw.begin(), raw.end(), block.begin() + static_cast<std::ptrdiff_t>(off));
}

template <typename Count>
Count checked_count(std::size_t n, const char* what) {
    if (n > std::numeric_limits<Count>::max()) {
        throw std::invalid_argument(
            std::string(what) + " count does not fit: " + std::to_string(n)
        );
    }
    return static_cast<Count>(n);
}

void append_bundle(std::vector<std::uint8_t>& out, const UpdateBundle& bundle);

void append_body(std::vector<std::uint8_t>& out, const OtaV1& ota) {
    write_hash(out, ota.md5_hash);
    write_u32_le(out, ota.source_rev);
    write_u32_le(out, ota.target_rev);
    write_u16_le(out, ota.device_code);
    out.push_back(ota.optional);
    out.push_back(ota.padding);
}

void append_body(std::vector<std::uint8_t>& out, const OtaV2& ota) {
    write_u64_le(out, ota.source_rev);
    write_u64_le(out, ota.target_rev);
    write_u16_le(out, checked_count<std::uint16_t>(ota.device_codes.size(), "device"));
    for (const auto code : ota.device_codes) {
        write_u16_le(out, code);
    }
    out.push_back(ota.critical);
    out.push_back(ota.padding);
    write_hash(out, ota.md5_hash);
    write_u16_le(out, checked_count<std::uint16_t>(ota.metadata.size(), "metadata"));
    for (const auto& meta : ota.metadata) {
        write_u16_be(out, checked_count<std::uint16_t>(meta.size(), "metadata byte"));
        std::vector<std::uint8_t> raw(meta.begin(), meta.end());
        obfuscate_in_place(raw);
        out.insert(out.end(), raw.begin(), raw.end());
    }
}

void append_body(std::vector<std::uint8_t>& out, const RecoveryV1& rec) {
    std::vector<std::uint8_t> block(kRecoveryBlockSize, 0);
    put_hash(block, layout::kHash, rec.md5_hash);
    put_u32_le(block, layout::kMagic1, rec.magic1);
    put_u32_le(block, layout::kMagic2, rec.magic2);
    put_u32_le(block, layout::kMinor, rec.minor);
    put_u32_le(block, layout::kHeaderRev, rec.header_rev);

    if (const auto* platform = std::get_if<RecoveryPlatform>(&rec.device_info)) {
        if (rec.header_rev != 2) {
            throw std::invalid_argument(
                std::string("platform recovery header needs header_rev 2")
            );
        }
        put_u32_le(block, layout::kCode, platform->platform);
        put_u32_le(block, layout::kBoard, platform->board);
        put_u64_le(block, layout::kTargetOta, rec.target_ota.value_or(0));
    } else {
        if (rec.header_rev == 2) {
            throw std::invalid_argument(
                std::string("header_rev 2 requires a platform recovery header")
            );
        }
        put_u32_le(block, layout::kCode, std::get<RecoveryDevice>(rec.device_info).code);
    }
    out.insert(out.end(), block.begin(), block.end());
}

void append_body(std::vector<std::uint8_t>& out, const RecoveryV2& rec) {
    std::vector<std::uint8_t> block(kRecoveryBlockSize, 0);
    put_u64_le(block, layout::kTargetOta, rec.target_ota);
    put_hash(block, layout::kHash, rec.md5_hash);
    put_u32_le(block, layout::kMagic1, rec.magic1);
    put_u32_le(block, layout::kMagic2, rec.magic2);
    put_u32_le(block, layout::kMinor, rec.minor);
    put_u32_le(block, layout::kCode, rec.platform_code);
    put_u32_le(block, layout::kHeaderRev, rec.header_rev);
    put_u32_le(block, layout::kBoard, rec.board);
    block[layout::kDeviceCount] = checked_count<std::uint8_t>(rec.device_codes.size(), "device");
    std::size_t off = layout::kDeviceList;
    for (const auto code : rec.device_codes) {
        block[off] = static_cast<std::uint8_t>(code & 0xFFu);
        block[off + 1] = static_cast<std::uint8_t>((code >> 8) & 0xFFu);
        off += 2;
    }
    out.insert(out.end(), block.begin(), block.end());
}

void append_body(std::vector<std::uint8_t>& out, const SignatureEnvelope& env) {
    const std::size_t sig_size = signature_size_for_cert(env.cert_num);
    if (env.signature.size() != sig_size) {
        throw std::invalid_argument(
            "cert " + std::to_string(env.cert_num) + " needs a " + std::to_string(sig_size)
            + "-byte signature, got " + std::to_string(env.signature.size())
        );
    }
    if (!env.wrapped_bundle) {
        throw std::invalid_argument(std::string("signature envelope has no wrapped bundle"));
    }
    write_u32_le(out, env.cert_num);
    out.insert(out.end(), kSignatureReservedSize, 0);
    out.insert(out.end(), env.signature.begin(), env.signature.end());
    append_bundle(out, *env.wrapped_bundle);
}

void append_bundle(std::vector<std::uint8_t>& out, const UpdateBundle& bundle) {
    if (!magic_matches_body(bundle.magic, bundle.body)) {
        throw std::invalid_argument(
            "magic " + std::string(magic_str(bundle.magic)) + " does not match the record shape"
        );
    }
    const auto tag = magic_str(bundle.magic);
    out.insert(out.end(), tag.begin(), tag.end());
    std::visit([&out](const auto& body) { append_body(out, body); }, bundle.body);
}
}  // namespace

std::vector<std::uint8_t> build_bundle(const UpdateBundle& bundle) {
    std::vector<std::uint8_t> out;
    append_bundle(out, bundle);
    return out;
}
}  // namespace kt::bundle
