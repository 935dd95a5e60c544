#include <arpa/inet.h>  // htonl, htons, ntohl, ntohs
#include <cstdint>
#include <cstdio>
#include <cstring>

#include "proto/rw.hpp"

namespace wire
{

static bool fits(const Buffer &buf, std::size_t off, std::size_t n)
{
    return off <= buf.size() && n <= buf.size() - off;
}

Error make_error(Errc code, std::size_t offset, std::uint64_t value, std::uint64_t expected)
{
    Error e;
    e.code     = code;
    e.offset   = offset;
    e.value    = value;
    e.expected = expected;
    return e;
}

const char *errc_name(Errc code)
{
    switch (code)
    {
        case Errc::ok:
            return "ok";
        case Errc::short_buffer:
            return "short_buffer";
        case Errc::length_overflow:
            return "length_overflow";
        case Errc::string_too_long:
            return "string_too_long";
        case Errc::too_many_headers:
            return "too_many_headers";
        case Errc::invalid_ttl:
            return "invalid_ttl";
        case Errc::invalid_checksum_type:
            return "invalid_checksum_type";
        case Errc::unsupported_checksum:
            return "unsupported_checksum";
        case Errc::checksum_mismatch:
            return "checksum_mismatch";
        case Errc::invalid_string:
            return "invalid_string";
        case Errc::invalid_type:
            return "invalid_type";
    }
    return "unknown";
}

std::string describe(const Error &e)
{
    char buf[160];
    switch (e.code)
    {
        case Errc::invalid_ttl:
            std::snprintf(buf, sizeof(buf), "%s: ttl=%llu (%s) at offset %zu", errc_name(e.code),
                          static_cast<unsigned long long>(e.value),
                          e.is_parse_error ? "parse" : "write", e.offset);
            break;
        case Errc::checksum_mismatch:
            std::snprintf(buf, sizeof(buf), "%s: got 0x%08llx, want 0x%08llx",
                          errc_name(e.code), static_cast<unsigned long long>(e.value),
                          static_cast<unsigned long long>(e.expected));
            break;
        default:
            std::snprintf(buf, sizeof(buf), "%s: value=%llu at offset %zu", errc_name(e.code),
                          static_cast<unsigned long long>(e.value), e.offset);
            break;
    }
    return std::string(buf);
}

ReadResult<std::uint8_t> read_u8(const Buffer &buf, std::size_t off)
{
    if (!fits(buf, off, U8_BYTES))
        return ReadResult<std::uint8_t>::error(
            make_error(Errc::short_buffer, off, U8_BYTES), off);
    return ReadResult<std::uint8_t>::just(off + U8_BYTES, buf[off]);
}

ReadResult<std::uint16_t> read_u16(const Buffer &buf, std::size_t off)
{
    if (!fits(buf, off, U16_BYTES))
        return ReadResult<std::uint16_t>::error(
            make_error(Errc::short_buffer, off, U16_BYTES), off);
    std::uint16_t be;
    std::memcpy(&be, buf.data() + off, sizeof be);
    return ReadResult<std::uint16_t>::just(off + U16_BYTES, ntohs(be));
}

ReadResult<std::uint32_t> read_u32(const Buffer &buf, std::size_t off)
{
    if (!fits(buf, off, U32_BYTES))
        return ReadResult<std::uint32_t>::error(
            make_error(Errc::short_buffer, off, U32_BYTES), off);
    std::uint32_t be;
    std::memcpy(&be, buf.data() + off, sizeof be);
    return ReadResult<std::uint32_t>::just(off + U32_BYTES, ntohl(be));
}

ReadResult<std::uint64_t> read_u64(const Buffer &buf, std::size_t off)
{
    if (!fits(buf, off, U64_BYTES))
        return ReadResult<std::uint64_t>::error(
            make_error(Errc::short_buffer, off, U64_BYTES), off);
    std::uint64_t v = 0;
    for (std::size_t i = 0; i < U64_BYTES; ++i)
        v = (v << 8) | buf[off + i];
    return ReadResult<std::uint64_t>::just(off + U64_BYTES, v);
}

WriteResult write_u8(std::uint8_t v, Buffer &buf, std::size_t off)
{
    if (!fits(buf, off, U8_BYTES))
        return WriteResult::error(make_error(Errc::short_buffer, off, U8_BYTES), off);
    buf[off] = v;
    return WriteResult::just(off + U8_BYTES);
}

WriteResult write_u16(std::uint16_t v, Buffer &buf, std::size_t off)
{
    if (!fits(buf, off, U16_BYTES))
        return WriteResult::error(make_error(Errc::short_buffer, off, U16_BYTES), off);
    std::uint16_t be = htons(v);
    std::memcpy(buf.data() + off, &be, sizeof be);
    return WriteResult::just(off + U16_BYTES);
}

WriteResult write_u32(std::uint32_t v, Buffer &buf, std::size_t off)
{
    if (!fits(buf, off, U32_BYTES))
        return WriteResult::error(make_error(Errc::short_buffer, off, U32_BYTES), off);
    std::uint32_t be = htonl(v);
    std::memcpy(buf.data() + off, &be, sizeof be);
    return WriteResult::just(off + U32_BYTES);
}

WriteResult write_u64(std::uint64_t v, Buffer &buf, std::size_t off)
{
    if (!fits(buf, off, U64_BYTES))
        return WriteResult::error(make_error(Errc::short_buffer, off, U64_BYTES), off);
    for (std::size_t i = 0; i < U64_BYTES; ++i)
        buf[off + i] = static_cast<std::uint8_t>(v >> (8 * (U64_BYTES - 1 - i)));
    return WriteResult::just(off + U64_BYTES);
}

ReadResult<Bytes> read_bytes(const Buffer &buf, std::size_t off, std::size_t n)
{
    if (!fits(buf, off, n))
        return ReadResult<Bytes>::error(make_error(Errc::length_overflow, off, n), off);
    Bytes out(buf.begin() + off, buf.begin() + off + n);
    return ReadResult<Bytes>::just(off + n, std::move(out));
}

WriteResult write_bytes(const std::uint8_t *p, std::size_t n, Buffer &buf, std::size_t off)
{
    if (!fits(buf, off, n))
        return WriteResult::error(make_error(Errc::short_buffer, off, n), off);
    if (n)
        std::memcpy(buf.data() + off, p, n);
    return WriteResult::just(off + n);
}

LengthResult str1_length(std::string_view s)
{
    if (s.size() > STR1_MAX)
        return LengthResult::error(make_error(Errc::string_too_long, 0, s.size(), STR1_MAX));
    return LengthResult::just(U8_BYTES + s.size());
}

ReadResult<std::size_t> skip_str1(const Buffer &buf, std::size_t off)
{
    auto len = read_u8(buf, off);
    if (!len.ok())
        return ReadResult<std::size_t>::error(*len.err, off);
    if (!fits(buf, len.offset, len.value))
        return ReadResult<std::size_t>::error(
            make_error(Errc::length_overflow, len.offset, len.value), len.offset);
    return ReadResult<std::size_t>::just(len.offset + len.value, len.value);
}

ReadResult<std::string> read_str1(const Buffer &buf, std::size_t off)
{
    auto res = skip_str1(buf, off);
    if (!res.ok())
        return ReadResult<std::string>::error(*res.err, res.offset);
    const char *p = reinterpret_cast<const char *>(buf.data()) + off + U8_BYTES;
    return ReadResult<std::string>::just(res.offset, std::string(p, res.value));
}

WriteResult write_str1(std::string_view s, Buffer &buf, std::size_t off)
{
    if (s.size() > STR1_MAX)
        return WriteResult::error(make_error(Errc::string_too_long, off, s.size(), STR1_MAX),
                                  off);
    auto res = write_u8(static_cast<std::uint8_t>(s.size()), buf, off);
    if (!res.ok())
        return res;
    return write_bytes(reinterpret_cast<const std::uint8_t *>(s.data()), s.size(), buf,
                       res.offset);
}

LengthResult str2_length(std::string_view s)
{
    if (s.size() > STR2_MAX)
        return LengthResult::error(make_error(Errc::string_too_long, 0, s.size(), STR2_MAX));
    return LengthResult::just(U16_BYTES + s.size());
}

ReadResult<std::string> read_str2(const Buffer &buf, std::size_t off)
{
    auto len = read_u16(buf, off);
    if (!len.ok())
        return ReadResult<std::string>::error(*len.err, off);
    if (!fits(buf, len.offset, len.value))
        return ReadResult<std::string>::error(
            make_error(Errc::length_overflow, len.offset, len.value), len.offset);
    const char *p = reinterpret_cast<const char *>(buf.data()) + len.offset;
    return ReadResult<std::string>::just(len.offset + len.value, std::string(p, len.value));
}

WriteResult write_str2(std::string_view s, Buffer &buf, std::size_t off)
{
    if (s.size() > STR2_MAX)
        return WriteResult::error(make_error(Errc::string_too_long, off, s.size(), STR2_MAX),
                                  off);
    auto res = write_u16(static_cast<std::uint16_t>(s.size()), buf, off);
    if (!res.ok())
        return res;
    return write_bytes(reinterpret_cast<const std::uint8_t *>(s.data()), s.size(), buf,
                       res.offset);
}

WriteResult ByteSlot::reserve(Buffer &buf, std::size_t at, ByteSlot &out)
{
    if (!fits(buf, at, U8_BYTES))
        return WriteResult::error(make_error(Errc::short_buffer, at, U8_BYTES), at);
    out.buf_       = &buf;
    out.at_        = at;
    out.committed_ = false;
    return WriteResult::just(at + U8_BYTES);
}

WriteResult ByteSlot::commit(std::uint8_t value, std::size_t end)
{
    if (!buf_)
        return WriteResult::error(make_error(Errc::short_buffer, at_, U8_BYTES), at_);
    auto res = write_u8(value, *buf_, at_);
    if (!res.ok())
        return res;
    committed_ = true;
    return WriteResult::just(end);
}

}  // namespace wire
