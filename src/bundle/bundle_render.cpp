/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "bundle/bundle_render.h"

#include "bundle/device_table.h"

#include <cinttypes>
#include <cstdarg>
#include <cstdio>
#include <span>

namespace kt::bundle {
namespace {
std::string to_hex_bytes(std::span<const std::uint8_t> bytes) {
    static const char hexdig[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(2 + bytes.size() * 2);
    out.push_back('0');
    out.push_back('x');
    for (const auto b : bytes) {
        out.push_back(hexdig[(b >> 4) & 0xFu]);
        out.push_back(hexdig[b & 0xFu]);
    }
    return out;
}

void appendf(std::string& out, const char* fmt, ...) {
    char buf[512];
    va_list args;
    va_start(args, fmt);
    const int n = std::vsnprintf(buf, sizeof(buf), fmt, args);
    va_end(args);
    if (n < 0) {
        return;
    }
    if (static_cast<std::size_t>(n) < sizeof(buf)) {
        out.append(buf, static_cast<std::size_t>(n));
        return;
    }
    std::string big(static_cast<std::size_t>(n) + 1, '\0');
    va_start(args, fmt);
    std::vsnprintf(big.data(), big.size(), fmt, args);
    va_end(args);
    big.resize(static_cast<std::size_t>(n));
    out += big;
}

void field(std::string& out, const char* label, const std::string& value) {
    appendf(out, "%-14s %s\n", label, value.c_str());
}

void field(std::string& out, const char* label, std::uint64_t value) {
    appendf(out, "%-14s %" PRIu64 "\n", label, value);
}

std::string code_name(std::string_view name, std::uint32_t code, int width) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), " (0x%0*X)", width, code);
    return std::string(name) + buf;
}

nlohmann::ordered_json device_json(std::uint16_t code) {
    nlohmann::ordered_json j = nlohmann::ordered_json::object();
    j["code"] = code;
    j["name"] = std::string(device_name(code));
    return j;
}

nlohmann::ordered_json platform_json(std::uint32_t code) {
    nlohmann::ordered_json j = nlohmann::ordered_json::object();
    j["code"] = code;
    j["name"] = std::string(platform_name(code));
    return j;
}

void render_body(std::string& out, const SignatureEnvelope& env) {
    field(out, "Bundle Type:", std::string("Signature Envelope"));
    field(out, "Cert Number:", env.cert_num);
    field(out, "Cert File:", std::string(cert_file_name(env.cert_num)));
    out += "\n--- Wrapped Bundle ---\n";
    if (env.wrapped_bundle) {
        out += render_bundle_text(*env.wrapped_bundle);
    }
}

void render_body(std::string& out, const OtaV1& ota) {
    field(out, "Bundle Type:", std::string("OTA V1"));
    field(out, "MD5 Hash:", ota.md5_hash);
    field(out, "Minimum OTA:", ota.source_rev);
    field(out, "Target OTA:", ota.target_rev);
    field(out, "Device:", code_name(device_name(ota.device_code), ota.device_code, 4));
    field(out, "Optional:", ota.optional);
    appendf(
        out, "%-14s %u (0x%02X)\n", "Padding Byte:", static_cast<unsigned>(ota.padding),
        static_cast<unsigned>(ota.padding)
    );
}

void render_body(std::string& out, const OtaV2& ota) {
    field(out, "Bundle Type:", std::string("OTA V2"));
    field(out, "Minimum OTA:", ota.source_rev);
    field(out, "Target OTA:", ota.target_rev);
    field(out, "Critical:", ota.critical);
    appendf(
        out, "%-14s %u (0x%02X)\n", "Padding Byte:", static_cast<unsigned>(ota.padding),
        static_cast<unsigned>(ota.padding)
    );
    field(out, "MD5 Hash:", ota.md5_hash);
    field(out, "Device Count:", ota.device_codes.size());
    for (const auto code : ota.device_codes) {
        out += "  - " + code_name(device_name(code), code, 4) + "\n";
    }
    field(out, "Metadata Count:", ota.metadata.size());
    for (const auto& meta : ota.metadata) {
        out += "  - " + meta + "\n";
    }
}

void render_body(std::string& out, const RecoveryV1& rec) {
    field(out, "Bundle Type:", std::string("Recovery V1"));
    field(out, "MD5 Hash:", rec.md5_hash);
    field(out, "Magic 1:", rec.magic1);
    field(out, "Magic 2:", rec.magic2);
    field(out, "Minor:", rec.minor);
    field(out, "Header Rev:", rec.header_rev);
    if (rec.target_ota.has_value()) {
        field(out, "Target OTA:", *rec.target_ota);
    }
    if (const auto* platform = std::get_if<RecoveryPlatform>(&rec.device_info)) {
        field(out, "Platform:", std::string(platform_name(platform->platform)));
        field(out, "Board:", code_name(kUnknownName, platform->board, 2));
    } else {
        const auto code = std::get<RecoveryDevice>(rec.device_info).code;
        field(out, "Device:", code_name(device_name(code), code, 4));
    }
}

void render_body(std::string& out, const RecoveryV2& rec) {
    field(out, "Bundle Type:", std::string("Recovery V2"));
    field(out, "Target OTA:", rec.target_ota);
    field(out, "MD5 Hash:", rec.md5_hash);
    field(out, "Magic 1:", rec.magic1);
    field(out, "Magic 2:", rec.magic2);
    field(out, "Minor:", rec.minor);
    field(out, "Platform:", code_name(platform_name(rec.platform_code), rec.platform_code, 2));
    field(out, "Header Rev:", rec.header_rev);
    field(out, "Board:", code_name(kUnknownName, rec.board, 2));
    field(out, "Device Count:", rec.device_codes.size());
    for (const auto code : rec.device_codes) {
        out += " - " + code_name(device_name(code), code, 4) + "\n";
    }
}

void body_json(nlohmann::ordered_json& j, const SignatureEnvelope& env) {
    j["type"] = "Signature Envelope";
    j["certNumber"] = env.cert_num;
    j["certFile"] = std::string(cert_file_name(env.cert_num));
    j["signature"] = to_hex_bytes(env.signature);
    if (env.wrapped_bundle) {
        j["wrapped"] = bundle_to_json(*env.wrapped_bundle);
    }
}

void body_json(nlohmann::ordered_json& j, const OtaV1& ota) {
    j["type"] = "OTA V1";
    j["md5Hash"] = ota.md5_hash;
    j["minimumOta"] = ota.source_rev;
    j["targetOta"] = ota.target_rev;
    j["device"] = device_json(ota.device_code);
    j["optional"] = ota.optional;
    j["padding"] = ota.padding;
}

void body_json(nlohmann::ordered_json& j, const OtaV2& ota) {
    j["type"] = "OTA V2";
    j["minimumOta"] = ota.source_rev;
    j["targetOta"] = ota.target_rev;
    j["critical"] = ota.critical;
    j["padding"] = ota.padding;
    j["md5Hash"] = ota.md5_hash;
    auto devices = nlohmann::ordered_json::array();
    for (const auto code : ota.device_codes) {
        devices.push_back(device_json(code));
    }
    j["devices"] = std::move(devices);
    j["metadata"] = ota.metadata;
}

void body_json(nlohmann::ordered_json& j, const RecoveryV1& rec) {
    j["type"] = "Recovery V1";
    j["md5Hash"] = rec.md5_hash;
    j["magic1"] = rec.magic1;
    j["magic2"] = rec.magic2;
    j["minor"] = rec.minor;
    j["headerRev"] = rec.header_rev;
    if (rec.target_ota.has_value()) {
        j["targetOta"] = *rec.target_ota;
    }
    if (const auto* platform = std::get_if<RecoveryPlatform>(&rec.device_info)) {
        j["platform"] = platform_json(platform->platform);
        j["board"] = platform->board;
    } else {
        j["device"] = device_json(std::get<RecoveryDevice>(rec.device_info).code);
    }
}

void body_json(nlohmann::ordered_json& j, const RecoveryV2& rec) {
    j["type"] = "Recovery V2";
    j["targetOta"] = rec.target_ota;
    j["md5Hash"] = rec.md5_hash;
    j["magic1"] = rec.magic1;
    j["magic2"] = rec.magic2;
    j["minor"] = rec.minor;
    j["platform"] = platform_json(rec.platform_code);
    j["headerRev"] = rec.header_rev;
    j["board"] = rec.board;
    auto devices = nlohmann::ordered_json::array();
    for (const auto code : rec.device_codes) {
        devices.push_back(device_json(code));
    }
    j["devices"] = std::move(devices);
}
}  // namespace

std::string render_bundle_text(const UpdateBundle& bundle) {
    std::string out;
    appendf(
        out, "%-14s %s %s\n", "Bundle Magic:", std::string(magic_str(bundle.magic)).c_str(),
        std::string(magic_description(bundle.magic)).c_str()
    );
    std::visit([&out](const auto& body) { render_body(out, body); }, bundle.body);
    return out;
}

nlohmann::ordered_json bundle_to_json(const UpdateBundle& bundle) {
    nlohmann::ordered_json j = nlohmann::ordered_json::object();
    j["magic"] = std::string(magic_str(bundle.magic));
    j["description"] = std::string(magic_description(bundle.magic));
    std::visit([&j](const auto& body) { body_json(j, body); }, bundle.body);
    return j;
}
}  // namespace kt::bundle
