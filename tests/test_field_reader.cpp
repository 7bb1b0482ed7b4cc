/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "bundle/bundle_decoder.h"
#include "bundle/bundle_reader.h"
#include "test_helpers.h"

#include <array>
#include <istream>
#include <streambuf>
#include <utility>

using namespace kt::bundle;

static void test_endian_reads() {
    const Bytes data = {0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08, 0x09, 0x0A, 0x0B,
                        0x0C, 0x0D, 0x0E, 0x0F, 0x10, 0x11, 0x12, 0x13, 0x14, 0x15, 0x16,
                        0x17, 0x18, 0x19, 0x1A, 0x1B, 0x1C, 0x1D, 0x1E, 0x1F};
    auto in = stream_of(data);
    FieldReader r(in);
    assert(r.read_u8() == 0x01);
    assert(r.read_u16_le() == 0x0302);
    assert(r.read_u16_be() == 0x0405);
    assert(r.read_u32_le() == 0x09080706u);
    assert(r.read_u32_be() == 0x0A0B0C0Du);
    assert(r.read_u64_le() == 0x1514131211100F0EULL);
    assert(r.position() == 21);
    assert(r.read_u64_be() == 0x161718191A1B1C1DULL);
    assert(r.position() == 29);
}

static void test_unexpected_end_reports_offset() {
    const Bytes data = {0, 1, 2, 3, 4, 5, 6, 7};
    auto in = stream_of(data);
    FieldReader r(in);
    r.skip(6);
    const auto err = expect_bundle_error([&] { r.read_u32_le(); });
    assert(err.kind() == ErrorKind::UnexpectedEnd);
    assert(err.offset() == 6);

    auto in2 = stream_of(data);
    FieldReader r2(in2);
    r2.read_u16_le();
    const auto err2 = expect_bundle_error([&] { r2.skip(100); });
    assert(err2.kind() == ErrorKind::UnexpectedEnd);
    assert(err2.offset() == 2);
}

static void test_obfuscated_hash_and_string() {
    Bytes data;
    append_obfuscated(data, kSampleHash);
    append_u16_be(data, 5);
    append_obfuscated(data, "hello");
    append_u16_be(data, 0);
    auto in = stream_of(data);
    FieldReader r(in);
    assert(r.read_obfuscated_hash() == kSampleHash);
    assert(r.read_obfuscated_string() == "hello");
    assert(r.read_obfuscated_string().empty());
    assert(r.position() == data.size());
}

static void test_string_length_is_big_endian() {
    // 0x0001 big-endian: a little-endian read would ask for 256 bytes and fail.
    Bytes data = {0x00, 0x01};
    append_obfuscated(data, "x");
    auto in = stream_of(data);
    FieldReader r(in);
    assert(r.read_obfuscated_string() == "x");
}

static void test_lossy_text() {
    const std::string replacement = "\xEF\xBF\xBD";
    assert(decode_text_lossy(Bytes{0x61, 0xFF, 0x62}) == "a" + replacement + "b");
    assert(decode_text_lossy(Bytes{0xE2, 0x82, 0xAC}) == "\xE2\x82\xAC");
    assert(decode_text_lossy(Bytes{0xE2, 0x82}) == replacement);
    assert(decode_text_lossy(Bytes{0xE2, 0x82, 0x41}) == replacement + "A");
    assert(decode_text_lossy(Bytes{0xED, 0xA0, 0x80}) == replacement + replacement + replacement);

    // A hash that deobfuscates to invalid UTF-8 is still returned, never rejected.
    Bytes raw(kObfuscatedHashSize, obfuscate_byte(0xFF));
    auto in = stream_of(raw);
    FieldReader r(in);
    const std::string hash = r.read_obfuscated_hash();
    assert(hash.size() == kObfuscatedHashSize * replacement.size());
}

static void test_seek() {
    const Bytes data = {10, 11, 12, 13, 14, 15, 16, 17, 18, 19};
    auto in = stream_of(data);
    FieldReader r(in);
    r.seek(4);
    assert(r.position() == 4);
    assert(r.read_u8() == 14);
    r.seek(10);
    assert(r.position() == 10);

    const auto err = expect_bundle_error([&] { r.seek(11); });
    assert(err.kind() == ErrorKind::SeekOutOfRange);
    assert(err.offset() == 11);

    r.seek(0);
    assert(r.read_u8() == 10);
}

// Hands out one byte per underflow and cannot seek, like a pipe.
class PipeBuf : public std::streambuf {
public:
    explicit PipeBuf(Bytes data) : _data(std::move(data)) {}

protected:
    int_type underflow() override {
        if (gptr() < egptr()) {
            return traits_type::to_int_type(*gptr());
        }
        if (_next >= _data.size()) {
            return traits_type::eof();
        }
        _current = static_cast<char>(_data[_next++]);
        setg(&_current, &_current, &_current + 1);
        return traits_type::to_int_type(_current);
    }

private:
    Bytes _data;
    std::size_t _next = 0;
    char _current = 0;
};

static void test_seek_on_unseekable_stream() {
    PipeBuf buf(ota_v1_bytes("FC02"));
    std::istream in(&buf);
    FieldReader r(in);

    const auto err = expect_bundle_error([&] { r.seek(2); });
    assert(err.kind() == ErrorKind::SeekOutOfRange);
    assert(err.offset() == 2);
    assert(r.position() == 0);

    const UpdateBundle b = decode_bundle(r);
    assert(b.magic == BundleMagic::FC02);
    assert(r.position() == 48);
}

static void test_read_some_until_end() {
    const Bytes data(100, 0x42);
    auto in = stream_of(data);
    FieldReader r(in);
    std::array<std::uint8_t, 64> buf{};
    assert(r.read_some(buf) == 64);
    assert(r.read_some(buf) == 36);
    assert(r.read_some(buf) == 0);
    assert(r.position() == 100);
}

int main() {
    test_endian_reads();
    test_unexpected_end_reports_offset();
    test_obfuscated_hash_and_string();
    test_string_length_is_big_endian();
    test_lossy_text();
    test_seek();
    test_seek_on_unseekable_stream();
    test_read_some_until_end();
    std::printf("test_field_reader OK\n");
    return 0;
}
