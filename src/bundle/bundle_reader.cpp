/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "bundle/bundle_reader.h"

#include "bundle/bundle_error.h"
#include "bundle/bundle_obfuscation.h"

#include <algorithm>
#include <array>

namespace kt::bundle {
namespace {
constexpr char kReplacementChar[] = "\xEF\xBF\xBD";
constexpr std::size_t kSkipChunk = 4096;
}  // namespace

std::uint16_t read_u16_le(std::span<const std::uint8_t> s, std::size_t off) {
    return static_cast<std::uint16_t>(s[off] | (static_cast<std::uint16_t>(s[off + 1]) << 8));
}

std::uint32_t read_u32_le(std::span<const std::uint8_t> s, std::size_t off) {
    return static_cast<std::uint32_t>(s[off]) | (static_cast<std::uint32_t>(s[off + 1]) << 8)
           | (static_cast<std::uint32_t>(s[off + 2]) << 16)
           | (static_cast<std::uint32_t>(s[off + 3]) << 24);
}

std::uint64_t read_u64_le(std::span<const std::uint8_t> s, std::size_t off) {
    std::uint64_t v = 0;
    for (int i = 7; i >= 0; i--) {
        v = (v << 8) | static_cast<std::uint64_t>(s[off + static_cast<std::size_t>(i)]);
    }
    return v;
}

std::uint16_t read_u16_be(std::span<const std::uint8_t> s, std::size_t off) {
    return static_cast<std::uint16_t>((static_cast<std::uint16_t>(s[off]) << 8) | s[off + 1]);
}

std::uint32_t read_u32_be(std::span<const std::uint8_t> s, std::size_t off) {
    return (static_cast<std::uint32_t>(s[off]) << 24)
           | (static_cast<std::uint32_t>(s[off + 1]) << 16)
           | (static_cast<std::uint32_t>(s[off + 2]) << 8) | static_cast<std::uint32_t>(s[off + 3]);
}

std::string decode_text_lossy(std::span<const std::uint8_t> bytes) {
    std::string out;
    out.reserve(bytes.size());
    std::size_t i = 0;
    while (i < bytes.size()) {
        const std::uint8_t b = bytes[i];
        if (b < 0x80) {
            out.push_back(static_cast<char>(b));
            i++;
            continue;
        }

        std::size_t need = 0;
        std::uint8_t lo = 0x80;
        std::uint8_t hi = 0xBF;
        if (b >= 0xC2 && b <= 0xDF) {
            need = 1;
        } else if (b == 0xE0) {
            need = 2;
            lo = 0xA0;
        } else if ((b >= 0xE1 && b <= 0xEC) || b == 0xEE || b == 0xEF) {
            need = 2;
        } else if (b == 0xED) {
            need = 2;
            hi = 0x9F;
        } else if (b == 0xF0) {
            need = 3;
            lo = 0x90;
        } else if (b >= 0xF1 && b <= 0xF3) {
            need = 3;
        } else if (b == 0xF4) {
            need = 3;
            hi = 0x8F;
        } else {
            out += kReplacementChar;
            i++;
            continue;
        }

        // One replacement per maximal invalid prefix.
        std::size_t j = 1;
        for (; j <= need; j++) {
            if (i + j >= bytes.size()) {
                break;
            }
            const std::uint8_t c = bytes[i + j];
            const bool ok = (j == 1) ? (c >= lo && c <= hi) : (c >= 0x80 && c <= 0xBF);
            if (!ok) {
                break;
            }
        }
        if (j > need) {
            out.append(reinterpret_cast<const char*>(bytes.data() + i), need + 1);
            i += need + 1;
        } else {
            out += kReplacementChar;
            i += j;
        }
    }
    return out;
}

std::string deobfuscate_hash(std::span<const std::uint8_t> raw) {
    std::vector<std::uint8_t> buf(raw.begin(), raw.end());
    deobfuscate_in_place(buf);
    return decode_text_lossy(buf);
}

FieldReader::FieldReader(std::istream& in) : _in(in) {
    const auto start = _in.tellg();
    if (start >= 0) {
        _pos = static_cast<std::uint64_t>(start);
    } else {
        _in.clear(_in.rdstate() & ~std::ios::failbit);
    }
}

void FieldReader::read_exact(std::span<std::uint8_t> out) {
    if (out.empty()) {
        return;
    }
    _in.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
    const auto got = static_cast<std::size_t>(_in.gcount());
    if (got != out.size()) {
        throw BundleError::unexpected_end(_pos, out.size());
    }
    _pos += got;
}

std::uint8_t FieldReader::read_u8() {
    std::array<std::uint8_t, 1> b{};
    read_exact(b);
    return b[0];
}

std::uint16_t FieldReader::read_u16_le() {
    std::array<std::uint8_t, 2> b{};
    read_exact(b);
    return bundle::read_u16_le(b, 0);
}

std::uint16_t FieldReader::read_u16_be() {
    std::array<std::uint8_t, 2> b{};
    read_exact(b);
    return bundle::read_u16_be(b, 0);
}

std::uint32_t FieldReader::read_u32_le() {
    std::array<std::uint8_t, 4> b{};
    read_exact(b);
    return bundle::read_u32_le(b, 0);
}

std::uint32_t FieldReader::read_u32_be() {
    std::array<std::uint8_t, 4> b{};
    read_exact(b);
    return bundle::read_u32_be(b, 0);
}

std::uint64_t FieldReader::read_u64_le() {
    std::array<std::uint8_t, 8> b{};
    read_exact(b);
    return bundle::read_u64_le(b, 0);
}

std::uint64_t FieldReader::read_u64_be() {
    std::array<std::uint8_t, 8> b{};
    read_exact(b);
    std::uint64_t v = 0;
    for (const auto x : b) {
        v = (v << 8) | static_cast<std::uint64_t>(x);
    }
    return v;
}

std::vector<std::uint8_t> FieldReader::read_bytes(std::size_t count) {
    std::vector<std::uint8_t> out(count);
    read_exact(out);
    return out;
}

void FieldReader::skip(std::size_t count) {
    const std::uint64_t start = _pos;
    std::array<std::uint8_t, kSkipChunk> scratch{};
    std::size_t left = count;
    while (left > 0) {
        const std::size_t n = std::min(left, scratch.size());
        _in.read(reinterpret_cast<char*>(scratch.data()), static_cast<std::streamsize>(n));
        const auto got = static_cast<std::size_t>(_in.gcount());
        _pos += got;
        if (got != n) {
            throw BundleError::unexpected_end(start, count);
        }
        left -= n;
    }
}

std::string FieldReader::read_obfuscated_hash() {
    std::array<std::uint8_t, kObfuscatedHashSize> raw{};
    read_exact(raw);
    return deobfuscate_hash(raw);
}

std::string FieldReader::read_obfuscated_string() {
    const std::uint16_t len = read_u16_be();
    auto buf = read_bytes(len);
    deobfuscate_in_place(buf);
    return decode_text_lossy(buf);
}

std::size_t FieldReader::read_some(std::span<std::uint8_t> out) {
    if (out.empty() || _in.eof()) {
        return 0;
    }
    _in.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
    const auto got = static_cast<std::size_t>(_in.gcount());
    if (_in.bad()) {
        throw std::runtime_error(std::string("Stream read failed"));
    }
    _pos += got;
    return got;
}

void FieldReader::seek(std::uint64_t offset) {
    _in.clear();
    _in.seekg(0, std::ios::end);
    const auto end = _in.tellg();
    if (!_in || end < 0) {
        _in.clear();
        throw BundleError::seek_out_of_range(offset);
    }
    if (offset > static_cast<std::uint64_t>(end)) {
        _in.seekg(static_cast<std::streamoff>(_pos), std::ios::beg);
        throw BundleError::seek_out_of_range(offset);
    }
    _in.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!_in) {
        _in.clear();
        throw BundleError::seek_out_of_range(offset);
    }
    _pos = offset;
}
}  // namespace kt::bundle
