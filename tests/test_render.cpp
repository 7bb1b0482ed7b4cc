/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "bundle/bundle_render.h"
#include "bundle/device_table.h"
#include "test_helpers.h"

using namespace kt::bundle;

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

static UpdateBundle signed_ota_v1() {
    SignatureEnvelope env{};
    env.cert_num = 2;
    env.signature.assign(256, 0xAB);
    env.wrapped_bundle = std::make_unique<UpdateBundle>(make_ota_v1());
    UpdateBundle b{};
    b.magic = BundleMagic::SP01;
    b.body = std::move(env);
    return b;
}

static void test_lookups_fall_back_to_unknown() {
    assert(device_name(0x0E) == "Silver Kindle 4 Non-Touch (2011)");
    assert(device_name(0xFFFF) == kUnknownName);
    assert(platform_name(0x0A) == "Zelda");
    assert(platform_name(0x1000) == kUnknownName);
    assert(cert_file_name(0) == "pubdevkey01.pem (Developer)");
    assert(cert_file_name(2) == "pubprodkey02.pem (Official 2K)");
    assert(cert_file_name(7) == kUnknownName);
}

static void test_text_report() {
    const std::string text = render_bundle_text(signed_ota_v1());
    assert(text.rfind("Bundle Magic:  SP01 (Signing Envelope)\n", 0) == 0);
    assert(contains(text, "Cert File:     pubprodkey02.pem (Official 2K)\n"));
    assert(contains(text, "\n--- Wrapped Bundle ---\n"));
    assert(contains(text, "Bundle Magic:  FC02 (OTA [ota])\n"));
    assert(contains(text, "MD5 Hash:      " + kSampleHash + "\n"));
    assert(contains(text, "Device:        Silver Kindle 4 Non-Touch (2011) (0x000E)\n"));
    assert(contains(text, "Padding Byte:  0 (0x00)\n"));
}

static void test_text_report_recovery() {
    RecoveryV1 rec{};
    rec.md5_hash = kSampleHash;
    rec.header_rev = 2;
    rec.device_info = RecoveryPlatform{0x0A, 0x3C};
    rec.target_ota = 42;
    UpdateBundle b{};
    b.magic = BundleMagic::FB02;
    b.body = std::move(rec);
    const std::string text = render_bundle_text(b);
    assert(contains(text, "Target OTA:    42\n"));
    assert(contains(text, "Platform:      Zelda\n"));
    assert(contains(text, "Board:         Unknown (0x3C)\n"));

    RecoveryV1 dev{};
    dev.md5_hash = kSampleHash;
    dev.header_rev = 1;
    dev.device_info = RecoveryDevice{0xFFFF};
    UpdateBundle b2{};
    b2.magic = BundleMagic::FB01;
    b2.body = std::move(dev);
    const std::string text2 = render_bundle_text(b2);
    assert(contains(text2, "Device:        Unknown (0xFFFF)\n"));
    assert(!contains(text2, "Target OTA:"));
}

static void test_json_tree() {
    const auto j = bundle_to_json(signed_ota_v1());
    assert(j.at("magic") == "SP01");
    assert(j.at("certNumber") == 2);
    assert(j.at("signature").get<std::string>().size() == 2 + 2 * 256);
    const auto& inner = j.at("wrapped");
    assert(inner.at("magic") == "FC02");
    assert(inner.at("type") == "OTA V1");
    assert(inner.at("device").at("code") == 0x0E);
    assert(inner.at("device").at("name") == "Silver Kindle 4 Non-Touch (2011)");

    OtaV2 ota{};
    ota.md5_hash = kSampleHash;
    ota.device_codes = {0x0E, 0xFFFF};
    ota.metadata = {"x=1"};
    UpdateBundle b{};
    b.magic = BundleMagic::FD04;
    b.body = ota;
    const auto j2 = bundle_to_json(b);
    assert(j2.at("description") == "(Versionless [vls])");
    assert(j2.at("devices").size() == 2);
    assert(j2.at("devices")[1].at("name") == "Unknown");
    assert(j2.at("metadata")[0] == "x=1");
}

int main() {
    test_lookups_fall_back_to_unknown();
    test_text_report();
    test_text_report_recovery();
    test_json_tree();
    std::printf("test_render OK\n");
    return 0;
}
