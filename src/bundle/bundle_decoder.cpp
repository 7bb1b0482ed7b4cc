/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "bundle/bundle_decoder.h"

#include "bundle/bundle_error.h"
#include "utils/log.h"

#include <array>
#include <memory>
#include <string_view>
#include <variant>

namespace kt::bundle {
namespace {
using BodyDecoder = BundleBody (*)(FieldReader&, const DecodeOptions&, std::size_t);

UpdateBundle decode_at_depth(FieldReader& reader, const DecodeOptions& opt, std::size_t depth);

BundleBody decode_signed_body(FieldReader& reader, const DecodeOptions& opt, std::size_t depth) {
    return decode_signature_envelope(reader, opt, depth);
}

BundleBody decode_ota_v1_body(FieldReader& reader, const DecodeOptions&, std::size_t) {
    return decode_ota_v1(reader);
}

BundleBody decode_ota_v2_body(FieldReader& reader, const DecodeOptions&, std::size_t) {
    return decode_ota_v2(reader);
}

BundleBody decode_recovery_v1_body(FieldReader& reader, const DecodeOptions&, std::size_t) {
    return decode_recovery_v1(reader);
}

BundleBody decode_recovery_v2_body(FieldReader& reader, const DecodeOptions&, std::size_t) {
    return decode_recovery_v2(reader);
}

// Indexed by BundleBody alternative.
static const std::array<BodyDecoder, std::variant_size_v<BundleBody>> kBodyDecoders = {{
    &decode_signed_body,
    &decode_ota_v1_body,
    &decode_ota_v2_body,
    &decode_recovery_v1_body,
    &decode_recovery_v2_body,
}};

UpdateBundle decode_at_depth(FieldReader& reader, const DecodeOptions& opt, std::size_t depth) {
    const std::uint64_t tag_offset = reader.position();
    std::array<std::uint8_t, 4> raw{};
    reader.read_exact(raw);
    const std::array<char, 4> tag = {
        static_cast<char>(raw[0]), static_cast<char>(raw[1]), static_cast<char>(raw[2]),
        static_cast<char>(raw[3])
    };
    const std::string_view tag_view(tag.data(), tag.size());

    const auto magic = parse_magic(tag_view);
    if (!magic.has_value()) {
        throw BundleError::unknown_magic(tag_offset, tag);
    }
    if (*magic == BundleMagic::SP01 && depth >= opt.max_envelope_depth) {
        throw BundleError::recursion_limit(tag_offset, opt.max_envelope_depth);
    }
    if (opt.debug) {
        KT_LOG_STATUS(
            "Decoding %.*s at offset 0x%llX (depth %zu)", 4, tag.data(),
            static_cast<unsigned long long>(tag_offset), depth
        );
    }
    UpdateBundle out{};
    out.magic = *magic;
    out.body = kBodyDecoders[magic_body_index(*magic)](reader, opt, depth);
    return out;
}
}  // namespace

SignatureEnvelope
decode_signature_envelope(FieldReader& reader, const DecodeOptions& opt, std::size_t depth) {
    SignatureEnvelope out{};
    out.cert_num = reader.read_u32_le();
    reader.skip(kSignatureReservedSize);
    out.signature = reader.read_bytes(signature_size_for_cert(out.cert_num));
    out.wrapped_bundle = std::make_unique<UpdateBundle>(decode_at_depth(reader, opt, depth + 1));
    return out;
}

UpdateBundle decode_bundle(FieldReader& reader, const DecodeOptions& opt) {
    return decode_at_depth(reader, opt, 0);
}

UpdateBundle decode_bundle(std::istream& in, const DecodeOptions& opt) {
    FieldReader reader(in);
    return decode_bundle(reader, opt);
}
}  // namespace kt::bundle
