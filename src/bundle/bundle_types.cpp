/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "bundle/bundle_types.h"

#include <utility>

namespace kt::bundle {
namespace {
struct MagicInfo {
    BundleMagic magic;
    std::string_view tag;
    std::string_view description;
    std::size_t body_index;
};

static const std::array<MagicInfo, 9> kMagicInfo = {{
    {BundleMagic::SP01, "SP01", "(Signing Envelope)", 0},
    {BundleMagic::FC02, "FC02", "(OTA [ota])", 1},
    {BundleMagic::FD03, "FD03", "(Versionless [vls])", 1},
    {BundleMagic::FC04, "FC04", "(OTA [ota])", 2},
    {BundleMagic::FD04, "FD04", "(Versionless [vls])", 2},
    {BundleMagic::FL01, "FL01", "(Language [lang])", 2},
    {BundleMagic::FB01, "FB01", "(Fullbin)", 3},
    {BundleMagic::FB02, "FB02", "(Fullbin)", 3},
    {BundleMagic::FB03, "FB03", "(Fullbin [OTA?, fwo?])", 4},
}};

const MagicInfo& info_for(BundleMagic magic) {
    return kMagicInfo[static_cast<std::size_t>(magic)];
}
}  // namespace

std::string_view magic_str(BundleMagic magic) { return info_for(magic).tag; }

std::string_view magic_description(BundleMagic magic) { return info_for(magic).description; }

std::optional<BundleMagic> parse_magic(std::string_view tag) {
    for (const auto& info : kMagicInfo) {
        if (info.tag == tag) {
            return info.magic;
        }
    }
    return std::nullopt;
}

std::size_t signature_size_for_cert(std::uint32_t cert_num) { return cert_num == 2 ? 256 : 128; }

std::size_t magic_body_index(BundleMagic magic) { return info_for(magic).body_index; }

bool magic_matches_body(BundleMagic magic, const BundleBody& body) {
    return magic_body_index(magic) == body.index();
}
}  // namespace kt::bundle
