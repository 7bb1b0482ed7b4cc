/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <filesystem>
#include <fstream>

namespace kt::fs_utils {
std::ifstream open_input_file(const std::filesystem::path& path);
std::ofstream open_output_file(const std::filesystem::path& path);
void ensure_dir(const std::filesystem::path& dir);
}  // namespace kt::fs_utils
