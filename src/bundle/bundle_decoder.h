/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "bundle/bundle_reader.h"
#include "bundle/bundle_types.h"

#include <cstddef>
#include <cstdint>
#include <istream>
#include <span>

namespace kt::bundle {
struct DecodeOptions {
    // Nested SP01 envelopes allowed before RecursionLimitExceeded.
    std::size_t max_envelope_depth = 8;
    std::size_t payload_chunk_size = 8192;
    bool debug = false;
};

// Reads the 4-byte magic at the current position and decodes one complete bundle tree.
UpdateBundle decode_bundle(FieldReader& reader, const DecodeOptions& opt = {});
UpdateBundle decode_bundle(std::istream& in, const DecodeOptions& opt = {});

// Record decoders; the reader is positioned just past the magic.
OtaV1 decode_ota_v1(FieldReader& reader);
OtaV2 decode_ota_v2(FieldReader& reader);
RecoveryV1 decode_recovery_v1(FieldReader& reader);
RecoveryV2 decode_recovery_v2(FieldReader& reader);
SignatureEnvelope
decode_signature_envelope(FieldReader& reader, const DecodeOptions& opt, std::size_t depth);

// Offset-based views over an already loaded kRecoveryBlockSize region.
RecoveryV1 parse_recovery_v1_block(std::span<const std::uint8_t> block);
RecoveryV2 parse_recovery_v2_block(std::span<const std::uint8_t> block);
}  // namespace kt::bundle
