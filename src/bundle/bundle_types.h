/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace kt::bundle {
// Size of the Recovery header region following the magic (magic + region = 128 KiB).
constexpr std::size_t kRecoveryBlockSize = 131068;
constexpr std::size_t kSignatureReservedSize = 56;

enum class BundleMagic {
    SP01,
    FC02,
    FD03,
    FC04,
    FD04,
    FL01,
    FB01,
    FB02,
    FB03,
};

std::string_view magic_str(BundleMagic magic);
std::string_view magic_description(BundleMagic magic);
std::optional<BundleMagic> parse_magic(std::string_view tag);

std::size_t signature_size_for_cert(std::uint32_t cert_num);

struct OtaV1 {
    std::string md5_hash;
    std::uint32_t source_rev = 0;
    std::uint32_t target_rev = 0;
    std::uint16_t device_code = 0;
    std::uint8_t optional = 0;
    std::uint8_t padding = 0;
};

struct OtaV2 {
    std::uint64_t source_rev = 0;
    std::uint64_t target_rev = 0;
    std::vector<std::uint16_t> device_codes;
    std::uint8_t critical = 0;
    std::uint8_t padding = 0;
    std::string md5_hash;
    std::vector<std::string> metadata;
};

struct RecoveryDevice {
    std::uint16_t code = 0;
};

struct RecoveryPlatform {
    std::uint32_t platform = 0;
    std::uint32_t board = 0;
};

// header_rev == 2 selects RecoveryPlatform and makes target_ota meaningful.
struct RecoveryV1 {
    std::string md5_hash;
    std::uint32_t magic1 = 0;
    std::uint32_t magic2 = 0;
    std::uint32_t minor = 0;
    std::uint32_t header_rev = 0;
    std::variant<RecoveryDevice, RecoveryPlatform> device_info;
    std::optional<std::uint64_t> target_ota;
};

struct RecoveryV2 {
    std::uint64_t target_ota = 0;
    std::string md5_hash;
    std::uint32_t magic1 = 0;
    std::uint32_t magic2 = 0;
    std::uint32_t minor = 0;
    std::uint32_t platform_code = 0;
    std::uint32_t header_rev = 0;
    std::uint32_t board = 0;
    std::vector<std::uint16_t> device_codes;
};

struct UpdateBundle;

struct SignatureEnvelope {
    std::uint32_t cert_num = 0;
    std::vector<std::uint8_t> signature;
    std::unique_ptr<UpdateBundle> wrapped_bundle;
};

using BundleBody = std::variant<SignatureEnvelope, OtaV1, OtaV2, RecoveryV1, RecoveryV2>;

// magic selects the body alternative; it is kept only to tell aliased tags apart on display.
struct UpdateBundle {
    BundleMagic magic = BundleMagic::SP01;
    BundleBody body;
};

// Index of the BundleBody alternative a magic decodes to.
std::size_t magic_body_index(BundleMagic magic);
bool magic_matches_body(BundleMagic magic, const BundleBody& body);
}  // namespace kt::bundle
