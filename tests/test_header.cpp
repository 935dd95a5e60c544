// tests/test_header.cpp
#include <cstdio>
#include <gtest/gtest.h>
#include <string>

#include "proto/frame.hpp"
#include "proto/header.hpp"

using namespace header;

static HeaderMap many_headers(std::size_t n)
{
    HeaderMap h;
    for (std::size_t i = 0; i < n; ++i)
    {
        char key[8];
        std::snprintf(key, sizeof key, "k%03zu", i);
        h.set(key, std::to_string(i));
    }
    return h;
}

static wire::Buffer encode(const HeaderMap &h)
{
    auto len = byte_length(h);
    EXPECT_TRUE(len.ok());
    wire::Buffer buf(len.length);
    auto         w = write_into(h, buf, 0);
    EXPECT_TRUE(w.ok());
    EXPECT_EQ(w.offset, buf.size());
    return buf;
}

TEST(Header, MapKeepsInsertionOrder)
{
    HeaderMap h{{"z", "1"}, {"a", "2"}};
    h.set("m", "3");
    h.set("z", "4");  // replaced in place

    ASSERT_EQ(h.size(), 3u);
    auto it = h.begin();
    EXPECT_EQ(it->first, "z");
    EXPECT_EQ(it->second, "4");
    ++it;
    EXPECT_EQ(it->first, "a");
    ++it;
    EXPECT_EQ(it->first, "m");
    EXPECT_EQ(h.get("a").value(), "2");
    EXPECT_FALSE(h.get("q").has_value());
    EXPECT_TRUE(h.contains("m"));
    EXPECT_FALSE(h.contains("q"));
}

TEST(Header, WireLayout)
{
    HeaderMap h{{"cn", "me"}, {"as", ""}};
    auto      buf = encode(h);
    EXPECT_EQ(buf, (wire::Buffer{2, 2, 'c', 'n', 2, 'm', 'e', 2, 'a', 's', 0}));
}

TEST(Header, Empty)
{
    auto buf = encode(HeaderMap{});
    ASSERT_EQ(buf, (wire::Buffer{0}));
    auto r = read_from(buf, 0);
    ASSERT_TRUE(r.ok());
    EXPECT_TRUE(r.value.empty());
    EXPECT_EQ(r.offset, 1u);
}

TEST(Header, RoundTrip255)
{
    HeaderMap h   = many_headers(255);
    auto      buf = encode(h);
    auto      r   = read_from(buf, 0);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value, h);
    EXPECT_EQ(r.offset, buf.size());
}

TEST(Header, TooManyFailsBeforeWrite)
{
    HeaderMap h   = many_headers(256);
    auto      len = byte_length(h);
    ASSERT_FALSE(len.ok());
    EXPECT_EQ(len.err->code, wire::Errc::too_many_headers);
    EXPECT_EQ(len.err->value, 256u);

    wire::Buffer buf(4096, 0xAA);
    auto         w = write_into(h, buf, 0);
    ASSERT_FALSE(w.ok());
    EXPECT_EQ(buf[0], 0xAA);
}

TEST(Header, LongValue)
{
    HeaderMap ok{{"k", std::string(255, 'v')}};
    EXPECT_TRUE(byte_length(ok).ok());

    HeaderMap bad{{"k", std::string(256, 'v')}};
    auto      len = byte_length(bad);
    ASSERT_FALSE(len.ok());
    EXPECT_EQ(len.err->code, wire::Errc::string_too_long);
}

TEST(Header, TruncatedMidEntry)
{
    auto buf = encode(HeaderMap{{"key", "value"}});
    buf.resize(buf.size() - 2);
    auto r = read_from(buf, 0);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.err->code, wire::Errc::length_overflow);
}

TEST(Header, CountExceedsBuffer)
{
    wire::Buffer buf{200, 1, 'a', 1, 'b'};
    auto         r = read_from(buf, 0);
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.err->code, wire::Errc::length_overflow);
    EXPECT_EQ(r.err->value, 200u);
}

TEST(Header, LazyReadFindsOneValue)
{
    HeaderMap    h{{"as", "json"}, {"cn", "caller"}, {"re", "c"}};
    frame::Frame f(encode(h), 0);

    auto r = lazy_read(f, 0);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.value.count(), 3u);
    EXPECT_EQ(r.value.get_string_value("cn").value(), "caller");
    EXPECT_EQ(r.value.get_string_value(CALLER_NAME).value(), "caller");
    EXPECT_FALSE(r.value.get_string_value("c").has_value());
    EXPECT_EQ(r.value.materialize(), h);
    EXPECT_EQ(r.offset, f.buffer.size());
}

TEST(Header, LazySkipMatchesRead)
{
    HeaderMap    h = many_headers(40);
    wire::Buffer body{9, 9, 9};
    auto         enc = encode(h);
    body.insert(body.end(), enc.begin(), enc.end());
    body.push_back(0x00);  // whatever follows

    frame::Frame f(body, 0);
    auto         skip = lazy_skip(f, 3);
    auto         read = read_from(f.buffer, 3);
    ASSERT_TRUE(skip.ok());
    ASSERT_TRUE(read.ok());
    EXPECT_EQ(skip.offset, read.offset);
    EXPECT_EQ(skip.value, 40u);
}

TEST(Header, LazySkipSameErrorAsRead)
{
    auto buf = encode(HeaderMap{{"key", "value"}});
    buf.resize(buf.size() - 1);
    frame::Frame f(buf, 0);

    auto skip = lazy_skip(f, 0);
    auto lazy = lazy_read(f, 0);
    auto read = read_from(f.buffer, 0);
    ASSERT_FALSE(skip.ok());
    ASSERT_FALSE(lazy.ok());
    ASSERT_FALSE(read.ok());
    EXPECT_EQ(skip.err->code, read.err->code);
    EXPECT_EQ(lazy.err->code, read.err->code);
}
