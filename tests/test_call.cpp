// tests/test_call.cpp
#include <cstdint>
#include <gtest/gtest.h>
#include <string>

#include "proto/call.hpp"
#include "util/log.hpp"

using namespace call;

static wire::Bytes bytes(const std::string &s)
{
    return wire::Bytes(s.begin(), s.end());
}

static RequestBody sample_request()
{
    RequestBody b;
    b.ttl             = 1000;
    b.trace.span_id   = 7;
    b.trace.parent_id = 3;
    b.trace.trace_id  = 0xABCDEF0123456789ull;
    b.trace.flags     = 0x01;
    b.service         = "keyvalue";
    b.headers         = header::HeaderMap{{"cn", "client"}, {"as", "raw"}};
    b.csum            = checksum::Checksum(checksum::Type::Crc32C);
    b.args            = {bytes("get"), bytes(""), bytes("some-key")};
    return b;
}

static ResponseBody sample_response()
{
    ResponseBody b;
    b.code          = ResponseCode::Error;
    b.trace.span_id = 99;
    b.headers       = header::HeaderMap{{"as", "raw"}};
    b.csum          = checksum::Checksum(checksum::Type::Crc32);
    b.args          = {bytes("get"), bytes(""), bytes("not found")};
    return b;
}

TEST(Call, RequestRoundTrip)
{
    RequestBody  in = sample_request();
    frame::Frame f;
    auto         w = encode(in, f);
    ASSERT_TRUE(w.ok());
    EXPECT_EQ(w.offset, f.buffer.size());
    EXPECT_EQ(f.buffer.size(), f.overhead + byte_length(in).length);
    EXPECT_FALSE(call_flags::is_fragment(in.flags));

    auto r = read_request(f.buffer, f.overhead);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.offset, f.buffer.size());
    EXPECT_EQ(r.value, in);
    EXPECT_FALSE(r.value.verify_checksum().has_value());
}

TEST(Call, ResponseRoundTrip)
{
    ResponseBody in = sample_response();
    frame::Frame f;
    ASSERT_TRUE(encode(in, f).ok());

    auto r = read_response(f.buffer, f.overhead);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value, in);
    EXPECT_EQ(r.value.code, ResponseCode::Error);
    EXPECT_FALSE(r.value.verify_checksum().has_value());
}

TEST(Call, RequestExactBytes)
{
    RequestBody b;
    b.ttl     = 1000;
    b.service = "svc";
    b.headers = header::HeaderMap{{"cn", "c"}};
    b.args    = {bytes("ep")};

    ASSERT_EQ(byte_length(b).length, 45u);
    wire::Buffer buf(45, 0xCC);
    auto         w = write_into(b, buf, 0);
    ASSERT_TRUE(w.ok());
    EXPECT_EQ(w.offset, 45u);

    wire::Buffer want;
    want.push_back(0x00);                                   // flags
    want.insert(want.end(), {0x00, 0x00, 0x03, 0xE8});      // ttl
    want.insert(want.end(), 25, 0x00);                      // tracing
    want.insert(want.end(), {3, 's', 'v', 'c'});            // service
    want.insert(want.end(), {1, 2, 'c', 'n', 1, 'c'});      // headers
    want.push_back(0x00);                                   // csum none
    want.insert(want.end(), {0x00, 0x02, 'e', 'p'});        // arg1
    EXPECT_EQ(buf, want);
}

TEST(Call, ResponseFixedSection)
{
    ResponseBody b;
    b.code = ResponseCode::Error;
    wire::Buffer buf(byte_length(b).length);
    ASSERT_EQ(buf.size(), 27u + 1u + 1u);
    ASSERT_TRUE(write_into(b, buf, 0).ok());
    EXPECT_EQ(buf[ResponseLayout::CODE], 0x01);
    EXPECT_EQ(buf[ResponseLayout::HEADERS], 0x00);
}

TEST(Call, ZeroTtlRejectedBothWays)
{
    RequestBody b = sample_request();
    b.ttl         = 0;
    frame::Frame f;
    auto         w = encode(b, f);
    ASSERT_FALSE(w.ok());
    EXPECT_EQ(w.err->code, wire::Errc::invalid_ttl);
    EXPECT_FALSE(w.err->is_parse_error);

    b.ttl = 1;
    ASSERT_TRUE(encode(b, f).ok());
    ASSERT_TRUE(read_request(f.buffer, f.overhead).ok());

    // zero the ttl on the wire
    for (std::size_t i = 0; i < wire::U32_BYTES; ++i)
        f.buffer[f.overhead + RequestLayout::TTL + i] = 0;
    auto r = read_request(f.buffer, f.overhead);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.err->code, wire::Errc::invalid_ttl);
    EXPECT_TRUE(r.err->is_parse_error);
    EXPECT_EQ(r.err->offset, f.overhead + RequestLayout::TTL);
}

TEST(Call, HeaderCountLimits)
{
    for (std::size_t n : {0u, 255u})
    {
        RequestBody b = sample_request();
        b.headers     = header::HeaderMap{};
        for (std::size_t i = 0; i < n; ++i)
            b.headers.set("h" + std::to_string(i), "v");

        frame::Frame f;
        ASSERT_TRUE(encode(b, f).ok()) << n;
        auto r = read_request(f.buffer, f.overhead);
        ASSERT_TRUE(r.ok()) << n;
        EXPECT_EQ(r.value.headers.size(), n);
    }

    RequestBody b = sample_request();
    for (std::size_t i = 0; i < 256; ++i)
        b.headers.set("x" + std::to_string(i), "v");
    frame::Frame f;
    auto         w = encode(b, f);
    ASSERT_FALSE(w.ok());
    EXPECT_EQ(w.err->code, wire::Errc::too_many_headers);
    EXPECT_TRUE(f.buffer.empty());
}

TEST(Call, FragmentsWhenFrameIsFull)
{
    RequestBody b;
    b.ttl     = 500;
    b.service = "svc";
    b.csum    = checksum::Checksum(checksum::Type::Crc32);
    b.args    = {bytes("endpoint"), bytes(""), bytes(std::string(200, 'x'))};

    frame::Frame f;
    auto         w = encode(b, f, 116);
    ASSERT_TRUE(w.ok());
    EXPECT_EQ(f.buffer.size(), 116u);
    EXPECT_TRUE(call_flags::is_fragment(b.flags));

    auto r = read_request(f.buffer, f.overhead);
    ASSERT_TRUE(r.ok());
    EXPECT_TRUE(call_flags::is_fragment(r.value.flags));
    ASSERT_EQ(r.value.args.size(), 3u);
    EXPECT_EQ(r.value.args[0], bytes("endpoint"));
    EXPECT_TRUE(r.value.args[1].empty());
    EXPECT_EQ(r.value.args[2], bytes(std::string(46, 'x')));
    EXPECT_FALSE(r.value.verify_checksum().has_value());

    // what did not fit goes into the continuation
    auto fitted = args::fit(checksum::Checksum(checksum::Type::Crc32), b.args,
                            116 - f.overhead - 35);
    ASSERT_TRUE(fitted.ok());
    auto rest = args::remainder(b.args, fitted.value);
    ASSERT_EQ(rest.size(), 1u);
    EXPECT_EQ(rest[0], bytes(std::string(154, 'x')));
}

TEST(Call, ArgLongerThanOneChunkFragments)
{
    RequestBody b;
    b.ttl     = 100;
    b.service = "svc";
    b.args    = {bytes("ep"), bytes(""), wire::Bytes(70000, 'x')};

    frame::Frame f;
    auto         w = encode(b, f);
    ASSERT_TRUE(w.ok());
    EXPECT_EQ(f.buffer.size(), constants::MAX_FRAME_SIZE);
    EXPECT_TRUE(call_flags::is_fragment(b.flags));

    // 65519 body bytes: 35 fixed/service/headers, 1 csum, 4 + 2 for arg1/arg2
    auto r = read_request(f.buffer, f.overhead);
    ASSERT_TRUE(r.ok());
    ASSERT_EQ(r.value.args.size(), 3u);
    EXPECT_EQ(r.value.args[2].size(), 65475u);

    auto fitted = args::fit(b.csum, b.args, constants::MAX_FRAME_SIZE - f.overhead - 35);
    ASSERT_TRUE(fitted.ok());
    auto rest = args::remainder(b.args, fitted.value);
    ASSERT_EQ(rest.size(), 1u);
    EXPECT_EQ(rest[0].size(), 70000u - 65475u);
}

TEST(Call, FragmentFlagKeptWhenCallerSetsIt)
{
    ResponseBody b = sample_response();
    b.flags        = call_flags::FRAGMENT;
    frame::Frame f;
    ASSERT_TRUE(encode(b, f).ok());
    EXPECT_EQ(f.buffer[f.overhead + ResponseLayout::FLAGS], call_flags::FRAGMENT);
}

TEST(Call, TamperedArgFailsChecksum)
{
    RequestBody  b = sample_request();
    frame::Frame f;
    ASSERT_TRUE(encode(b, f).ok());

    f.buffer.back() ^= 0x20;
    auto r = read_request(f.buffer, f.overhead);
    ASSERT_TRUE(r.ok());
    auto err = r.value.verify_checksum();
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, wire::Errc::checksum_mismatch);
}

TEST(Call, TruncatedBodyFails)
{
    RequestBody  b = sample_request();
    frame::Frame f;
    ASSERT_TRUE(encode(b, f).ok());

    auto fixed = f.buffer;
    fixed.resize(f.overhead + RequestLayout::SERVICE - 1);
    auto r = read_request(fixed, f.overhead);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.err->code, wire::Errc::short_buffer);

    auto cut = f.buffer;
    cut.pop_back();
    r = read_request(cut, f.overhead);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.err->code, wire::Errc::length_overflow);
}

TEST(Call, MaxFrameSmallerThanOverhead)
{
    RequestBody  b = sample_request();
    frame::Frame f;
    auto         w = encode(b, f, f.overhead);
    ASSERT_FALSE(w.ok());
    EXPECT_EQ(w.err->code, wire::Errc::short_buffer);
}

TEST(Call, BodyVariant)
{
    Body req = sample_request();
    Body res = sample_response();
    EXPECT_EQ(type_code(req), REQUEST_TYPE);
    EXPECT_EQ(type_code(res), RESPONSE_TYPE);
    EXPECT_EQ(byte_length(req).length, byte_length(std::get<RequestBody>(req)).length);

    wire::Buffer buf(byte_length(res).length);
    ASSERT_TRUE(write_into(res, buf, 0).ok());
    EXPECT_EQ(flags_of(res), 0);
    EXPECT_FALSE(verify_checksum(res).has_value());

    auto back = read_response(buf, 0);
    ASSERT_TRUE(back.ok());
    EXPECT_EQ(back.value, std::get<ResponseBody>(res));
}

TEST(Call, CopyKeepsContinuation)
{
    RequestBody b = sample_request();
    b.cont        = std::make_unique<RequestBody>(sample_request());
    b.cont->args  = {bytes("tail")};

    RequestBody copy = b;
    ASSERT_TRUE(copy.cont);
    EXPECT_NE(copy.cont.get(), b.cont.get());
    EXPECT_EQ(copy.cont->args, b.cont->args);
    EXPECT_EQ(copy, b);
}

TEST(Call, ReadBodyDispatchesOnType)
{
    RequestBody  req = sample_request();
    frame::Frame f;
    ASSERT_TRUE(encode(req, f).ok());

    auto r = read_body(REQUEST_TYPE, f.buffer, f.overhead);
    ASSERT_TRUE(r.ok());
    ASSERT_TRUE(std::holds_alternative<RequestBody>(r.value));
    EXPECT_EQ(std::get<RequestBody>(r.value), req);
    EXPECT_EQ(type_code(r.value), REQUEST_TYPE);

    ResponseBody res = sample_response();
    frame::Frame g;
    ASSERT_TRUE(encode(res, g).ok());
    auto s = read_body(RESPONSE_TYPE, g.buffer, g.overhead);
    ASSERT_TRUE(s.ok());
    EXPECT_EQ(std::get<ResponseBody>(s.value), res);

    auto bad = read_body(0x05, f.buffer, f.overhead);
    ASSERT_FALSE(bad.ok());
    EXPECT_EQ(bad.err->code, wire::Errc::invalid_type);
    EXPECT_EQ(bad.err->value, 0x05u);

    // errors from the body decoders pass through unchanged
    wire::Buffer short_body(f.buffer.begin(), f.buffer.begin() + 20);
    auto         cut = read_body(REQUEST_TYPE, short_body, f.overhead);
    ASSERT_FALSE(cut.ok());
    EXPECT_EQ(cut.err->code, wire::Errc::short_buffer);
}

TEST(Call, DecodeFailuresLoggedAtDebug)
{
    const tchan::Level saved = tchan::log_level();
    tchan::set_log_level(tchan::Level::Debug);

    ResponseBody res = sample_response();
    frame::Frame f;
    ASSERT_TRUE(encode(res, f).ok());
    f.buffer.pop_back();

    testing::internal::CaptureStderr();
    auto        r   = read_response(f.buffer, f.overhead);
    std::string err = testing::internal::GetCapturedStderr();
    ASSERT_FALSE(r.ok());
    EXPECT_NE(err.find("[DEBUG]"), std::string::npos);
    EXPECT_NE(err.find("length_overflow"), std::string::npos);

    tchan::set_log_level(tchan::Level::Info);
    testing::internal::CaptureStderr();
    EXPECT_FALSE(read_response(f.buffer, f.overhead).ok());
    EXPECT_TRUE(testing::internal::GetCapturedStderr().empty());

    tchan::set_log_level(saved);
}
