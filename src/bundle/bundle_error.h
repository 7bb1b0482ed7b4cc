/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace kt::bundle {
enum class ErrorKind {
    UnexpectedEnd,
    SeekOutOfRange,
    UnknownMagic,
    RecursionLimitExceeded,
};

const char* error_kind_name(ErrorKind kind);

// Terminal decode failure. offset() is the absolute stream position where the failing read, seek
// or tag started.
class BundleError : public std::runtime_error {
   public:
    BundleError(ErrorKind kind, std::uint64_t offset, const std::string& detail);

    static BundleError unexpected_end(std::uint64_t offset, std::size_t wanted);
    static BundleError seek_out_of_range(std::uint64_t offset);
    static BundleError unknown_magic(std::uint64_t offset, const std::array<char, 4>& tag);
    static BundleError recursion_limit(std::uint64_t offset, std::size_t max_depth);

    ErrorKind kind() const { return _kind; }
    std::uint64_t offset() const { return _offset; }
    const std::array<char, 4>& tag() const { return _tag; }

   private:
    ErrorKind _kind;
    std::uint64_t _offset;
    std::array<char, 4> _tag{};
};
}  // namespace kt::bundle
