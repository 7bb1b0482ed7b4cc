/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "bundle/bundle_decoder.h"
#include "bundle/bundle_writer.h"
#include "test_helpers.h"

using namespace kt::bundle;

static Bytes envelope_prefix(std::uint32_t cert_num, std::size_t sig_size) {
    Bytes out;
    append_tag(out, "SP01");
    append_u32_le(out, cert_num);
    out.insert(out.end(), 56, 0xEE);
    out.insert(out.end(), sig_size, 0x5A);
    return out;
}

static void test_signature_size_follows_cert() {
    const struct {
        std::uint32_t cert;
        std::size_t sig;
    } cases[] = {{0, 128}, {1, 128}, {2, 256}, {9, 128}};

    for (const auto& c : cases) {
        Bytes data = envelope_prefix(c.cert, c.sig);
        const std::size_t inner_at = data.size();
        const Bytes inner = ota_v1_bytes("FC02");
        data.insert(data.end(), inner.begin(), inner.end());

        auto in = stream_of(data);
        FieldReader r(in);
        const UpdateBundle b = decode_bundle(r);
        assert(b.magic == BundleMagic::SP01);
        const auto& env = std::get<SignatureEnvelope>(b.body);
        assert(env.cert_num == c.cert);
        assert(env.signature.size() == c.sig);
        assert(env.signature.front() == 0x5A && env.signature.back() == 0x5A);
        assert(env.wrapped_bundle);
        assert(env.wrapped_bundle->magic == BundleMagic::FC02);
        assert(std::get<OtaV1>(env.wrapped_bundle->body).md5_hash == kSampleHash);
        assert(r.position() == inner_at + inner.size());
    }
}

static void test_cert_2_with_short_signature_fails() {
    Bytes data = envelope_prefix(2, 128);
    const Bytes inner = ota_v1_bytes("FC02");
    data.insert(data.end(), inner.begin(), inner.end());
    auto in = stream_of(data);
    const auto err = expect_bundle_error([&] { decode_bundle(in); });
    assert(err.kind() == ErrorKind::UnexpectedEnd);
    assert(err.offset() == 4 + 4 + 56);
}

static UpdateBundle wrap(UpdateBundle inner, std::uint32_t cert_num) {
    SignatureEnvelope env{};
    env.cert_num = cert_num;
    env.signature.assign(signature_size_for_cert(cert_num), 0x33);
    env.wrapped_bundle = std::make_unique<UpdateBundle>(std::move(inner));
    UpdateBundle out{};
    out.magic = BundleMagic::SP01;
    out.body = std::move(env);
    return out;
}

static void test_nested_envelopes() {
    const UpdateBundle tree = wrap(wrap(make_ota_v1(BundleMagic::FD03), 0), 2);
    auto in = stream_of(build_bundle(tree));
    const UpdateBundle b = decode_bundle(in);

    const auto& outer = std::get<SignatureEnvelope>(b.body);
    assert(outer.cert_num == 2);
    assert(outer.signature.size() == 256);
    const auto& middle = std::get<SignatureEnvelope>(outer.wrapped_bundle->body);
    assert(middle.cert_num == 0);
    assert(middle.signature.size() == 128);
    assert(middle.wrapped_bundle->magic == BundleMagic::FD03);
}

static Bytes envelope_chain(std::size_t count) {
    Bytes data;
    for (std::size_t i = 0; i < count; i++) {
        const Bytes prefix = envelope_prefix(1, 128);
        data.insert(data.end(), prefix.begin(), prefix.end());
    }
    const Bytes inner = ota_v1_bytes("FC02");
    data.insert(data.end(), inner.begin(), inner.end());
    return data;
}

static void test_depth_limit() {
    const std::size_t header = 4 + 4 + 56 + 128;

    DecodeOptions opt{};
    opt.max_envelope_depth = 8;
    {
        auto in = stream_of(envelope_chain(8));
        const UpdateBundle b = decode_bundle(in, opt);
        assert(b.magic == BundleMagic::SP01);
    }
    {
        auto in = stream_of(envelope_chain(9));
        const auto err = expect_bundle_error([&] { decode_bundle(in, opt); });
        assert(err.kind() == ErrorKind::RecursionLimitExceeded);
        assert(err.offset() == 8 * header);
    }
    {
        // A long forged chain stops at the limit instead of exhausting the stack.
        auto in = stream_of(envelope_chain(20000));
        const auto err = expect_bundle_error([&] { decode_bundle(in); });
        assert(err.kind() == ErrorKind::RecursionLimitExceeded);
    }
    {
        opt.max_envelope_depth = 0;
        auto in = stream_of(envelope_chain(1));
        const auto err = expect_bundle_error([&] { decode_bundle(in, opt); });
        assert(err.kind() == ErrorKind::RecursionLimitExceeded);
        assert(err.offset() == 0);
    }
}

static void test_writer_rejects_wrong_signature_size() {
    UpdateBundle b = wrap(make_ota_v1(), 1);
    std::get<SignatureEnvelope>(b.body).cert_num = 2;
    bool threw = false;
    try {
        build_bundle(b);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

int main() {
    test_signature_size_follows_cert();
    test_cert_2_with_short_signature_fails();
    test_nested_envelopes();
    test_depth_limit();
    test_writer_rejects_wrong_signature_size();
    std::printf("test_signature_envelope OK\n");
    return 0;
}
