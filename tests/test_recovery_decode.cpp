/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "bundle/bundle_decoder.h"
#include "bundle/bundle_writer.h"
#include "bundle/device_table.h"
#include "test_helpers.h"

using namespace kt::bundle;

static void put_u32(Bytes& b, std::size_t off, std::uint32_t v) {
    for (int i = 0; i < 4; i++) {
        b[off + static_cast<std::size_t>(i)] = static_cast<std::uint8_t>((v >> (8 * i)) & 0xFFu);
    }
}

// Magic followed by a hand-filled region; offsets below are relative to the region start.
static Bytes recovery_v1_bytes(const char* tag, std::uint32_t header_rev, std::uint32_t code) {
    Bytes out;
    append_tag(out, tag);
    Bytes block(kRecoveryBlockSize, 0);
    for (int i = 0; i < 8; i++) {
        block[4 + static_cast<std::size_t>(i)] = static_cast<std::uint8_t>(0x10 + i);
    }
    for (std::size_t i = 0; i < kSampleHash.size(); i++) {
        block[12 + i] = obfuscate_byte(static_cast<std::uint8_t>(kSampleHash[i]));
    }
    put_u32(block, 44, 0xAAAA0001u);
    put_u32(block, 48, 0xBBBB0002u);
    put_u32(block, 52, 7);
    put_u32(block, 56, code);
    put_u32(block, 60, header_rev);
    put_u32(block, 64, 0x55);
    out.insert(out.end(), block.begin(), block.end());
    return out;
}

static void test_header_rev_2_is_platform() {
    const Bytes data = recovery_v1_bytes("FB01", 2, 0x0A);
    auto in = stream_of(data);
    FieldReader r(in);
    const UpdateBundle b = decode_bundle(r);
    assert(b.magic == BundleMagic::FB01);
    assert(r.position() == 4 + kRecoveryBlockSize);

    const auto& rec = std::get<RecoveryV1>(b.body);
    assert(rec.md5_hash == kSampleHash);
    assert(rec.magic1 == 0xAAAA0001u);
    assert(rec.magic2 == 0xBBBB0002u);
    assert(rec.minor == 7);
    assert(rec.header_rev == 2);
    const auto* platform = std::get_if<RecoveryPlatform>(&rec.device_info);
    assert(platform != nullptr);
    assert(platform->platform == 0x0A);
    assert(platform_name(platform->platform) == "Zelda");
    assert(platform->board == 0x55);
    assert(rec.target_ota.has_value());
    assert(*rec.target_ota == 0x1716151413121110ULL);
}

static void test_other_header_rev_is_device() {
    const Bytes data = recovery_v1_bytes("FB02", 1, 0xABCD000Eu);
    auto in = stream_of(data);
    const UpdateBundle b = decode_bundle(in);
    assert(b.magic == BundleMagic::FB02);

    const auto& rec = std::get<RecoveryV1>(b.body);
    assert(rec.header_rev == 1);
    const auto* device = std::get_if<RecoveryDevice>(&rec.device_info);
    assert(device != nullptr);
    assert(device->code == 0x0E);
    assert(device_name(device->code) == "Silver Kindle 4 Non-Touch (2011)");
    assert(!rec.target_ota.has_value());
}

static void test_short_region_fails_at_region_start() {
    Bytes data = recovery_v1_bytes("FB01", 2, 0x0A);
    data.resize(data.size() - 1);
    auto in = stream_of(data);
    const auto err = expect_bundle_error([&] { decode_bundle(in); });
    assert(err.kind() == ErrorKind::UnexpectedEnd);
    assert(err.offset() == 4);
}

static void test_recovery_v2_round_trip() {
    RecoveryV2 rec{};
    rec.target_ota = 123456789012ULL;
    rec.md5_hash = kSampleHash;
    rec.magic1 = 1;
    rec.magic2 = 2;
    rec.minor = 3;
    rec.platform_code = 0x0C;
    rec.header_rev = 2;
    rec.board = 0x22;
    rec.device_codes = {0x1D, 0x1F, 0x20};

    UpdateBundle b{};
    b.magic = BundleMagic::FB03;
    b.body = rec;
    const Bytes data = build_bundle(b);
    assert(data.size() == 4 + kRecoveryBlockSize);
    // Count byte sits 7 padding bytes after the board field.
    assert(data[4 + 75] == 3);
    assert(data[4 + 76] == 0x1D);

    auto in = stream_of(data);
    const UpdateBundle out = decode_bundle(in);
    const auto& got = std::get<RecoveryV2>(out.body);
    assert(got.target_ota == rec.target_ota);
    assert(got.md5_hash == rec.md5_hash);
    assert(got.magic1 == 1 && got.magic2 == 2 && got.minor == 3);
    assert(got.platform_code == 0x0C);
    assert(got.header_rev == 2);
    assert(got.board == 0x22);
    assert(got.device_codes == rec.device_codes);
}

static void test_recovery_v1_writer_matches_layout() {
    RecoveryV1 rec{};
    rec.md5_hash = kSampleHash;
    rec.magic1 = 0xAAAA0001u;
    rec.magic2 = 0xBBBB0002u;
    rec.minor = 7;
    rec.header_rev = 2;
    rec.device_info = RecoveryPlatform{0x0A, 0x55};
    rec.target_ota = 0x1716151413121110ULL;

    UpdateBundle b{};
    b.magic = BundleMagic::FB01;
    b.body = std::move(rec);
    assert(build_bundle(b) == recovery_v1_bytes("FB01", 2, 0x0A));
}

int main() {
    test_header_rev_2_is_platform();
    test_other_header_rev_is_device();
    test_short_region_fails_at_region_start();
    test_recovery_v2_round_trip();
    test_recovery_v1_writer_matches_layout();
    std::printf("test_recovery_decode OK\n");
    return 0;
}
