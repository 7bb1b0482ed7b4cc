/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <span>
#include <string>
#include <vector>

namespace kt::bundle {
constexpr std::size_t kObfuscatedHashSize = 32;

std::uint16_t read_u16_le(std::span<const std::uint8_t> s, std::size_t off);
std::uint32_t read_u32_le(std::span<const std::uint8_t> s, std::size_t off);
std::uint64_t read_u64_le(std::span<const std::uint8_t> s, std::size_t off);
std::uint16_t read_u16_be(std::span<const std::uint8_t> s, std::size_t off);
std::uint32_t read_u32_be(std::span<const std::uint8_t> s, std::size_t off);

// Best-effort UTF-8: invalid sequences become U+FFFD, never an error.
std::string decode_text_lossy(std::span<const std::uint8_t> bytes);

// Deobfuscates a 32-byte hash field that is already in memory.
std::string deobfuscate_hash(std::span<const std::uint8_t> raw);

// Forward reader over a byte stream. Tracks the absolute offset so errors can name it; works on
// non-seekable streams except for seek().
class FieldReader {
   public:
    explicit FieldReader(std::istream& in);

    std::uint64_t position() const { return _pos; }

    std::uint8_t read_u8();
    std::uint16_t read_u16_le();
    std::uint16_t read_u16_be();
    std::uint32_t read_u32_le();
    std::uint32_t read_u32_be();
    std::uint64_t read_u64_le();
    std::uint64_t read_u64_be();

    void read_exact(std::span<std::uint8_t> out);
    std::vector<std::uint8_t> read_bytes(std::size_t count);
    void skip(std::size_t count);

    std::string read_obfuscated_hash();
    // u16 big-endian length, then that many obfuscated bytes.
    std::string read_obfuscated_string();

    // Returns 0 only at end of stream.
    std::size_t read_some(std::span<std::uint8_t> out);

    void seek(std::uint64_t offset);

   private:
    std::istream& _in;
    std::uint64_t _pos = 0;
};
}  // namespace kt::bundle
