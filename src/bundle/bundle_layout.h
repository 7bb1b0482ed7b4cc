/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "bundle/bundle_reader.h"
#include "bundle/bundle_types.h"

#include <cstddef>

// Field offsets inside the Recovery header region, relative to the first byte after the magic.
namespace kt::bundle::recovery_layout {
constexpr std::size_t kTargetOta = 4;
constexpr std::size_t kHash = 12;
constexpr std::size_t kMagic1 = kHash + kObfuscatedHashSize;
constexpr std::size_t kMagic2 = kMagic1 + 4;
constexpr std::size_t kMinor = kMagic2 + 4;
constexpr std::size_t kCode = 56;
constexpr std::size_t kHeaderRev = kCode + 4;
constexpr std::size_t kBoard = kHeaderRev + 4;
constexpr std::size_t kDeviceCount = kBoard + 4 + 7;
constexpr std::size_t kDeviceList = kDeviceCount + 1;

static_assert(kMinor + 4 <= kCode);
static_assert(kDeviceList + 2 * 0xFF <= kRecoveryBlockSize);
}  // namespace kt::bundle::recovery_layout
