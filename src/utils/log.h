/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdarg>

namespace kt::log {
void info(const char* fmt, ...);
// stderr without prefix; stdout may be carrying payload bytes.
void status(const char* fmt, ...);
void error(const char* fmt, ...);
}  // namespace kt::log

#define KT_LOG_INFO(fmt, ...) ::kt::log::info(fmt, ##__VA_ARGS__)
#define KT_LOG_STATUS(fmt, ...) ::kt::log::status(fmt, ##__VA_ARGS__)
#define KT_LOG_ERROR(fmt, ...) ::kt::log::error(fmt, ##__VA_ARGS__)
