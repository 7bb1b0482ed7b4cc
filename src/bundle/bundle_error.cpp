/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "bundle/bundle_error.h"

#include <cstdio>

namespace kt::bundle {
static std::string format_message(ErrorKind kind, std::uint64_t offset, const std::string& detail) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), " at offset 0x%llX", static_cast<unsigned long long>(offset));
    std::string out = error_kind_name(kind);
    out += buf;
    if (!detail.empty()) {
        out += " (" + detail + ")";
    }
    return out;
}

static std::string printable_tag(const std::array<char, 4>& tag) {
    std::string out;
    for (const char c : tag) {
        const auto u = static_cast<unsigned char>(c);
        if (u >= 0x20 && u < 0x7F) {
            out.push_back(c);
        } else {
            char hex[8];
            std::snprintf(hex, sizeof(hex), "\\x%02X", u);
            out += hex;
        }
    }
    return out;
}

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnexpectedEnd:
            return "unexpected end of stream";
        case ErrorKind::SeekOutOfRange:
            return "seek out of range";
        case ErrorKind::UnknownMagic:
            return "unknown bundle magic";
        case ErrorKind::RecursionLimitExceeded:
            return "signature envelope nesting too deep";
    }
    return "unknown error";
}

BundleError::BundleError(ErrorKind kind, std::uint64_t offset, const std::string& detail)
    : std::runtime_error(format_message(kind, offset, detail)), _kind(kind), _offset(offset) {}

BundleError BundleError::unexpected_end(std::uint64_t offset, std::size_t wanted) {
    return BundleError(
        ErrorKind::UnexpectedEnd, offset, "needed " + std::to_string(wanted) + " bytes"
    );
}

BundleError BundleError::seek_out_of_range(std::uint64_t offset) {
    return BundleError(ErrorKind::SeekOutOfRange, offset, {});
}

BundleError BundleError::unknown_magic(std::uint64_t offset, const std::array<char, 4>& tag) {
    BundleError err(ErrorKind::UnknownMagic, offset, "'" + printable_tag(tag) + "'");
    err._tag = tag;
    return err;
}

BundleError BundleError::recursion_limit(std::uint64_t offset, std::size_t max_depth) {
    return BundleError(
        ErrorKind::RecursionLimitExceeded, offset, "limit is " + std::to_string(max_depth)
    );
}
}  // namespace kt::bundle
