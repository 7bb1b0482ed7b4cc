/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "bundle/bundle_types.h"

#include <nlohmann/json.hpp>

#include <string>

namespace kt::bundle {
std::string render_bundle_text(const UpdateBundle& bundle);
nlohmann::ordered_json bundle_to_json(const UpdateBundle& bundle);
}  // namespace kt::bundle
