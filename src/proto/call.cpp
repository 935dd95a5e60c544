#include <algorithm>

#include "proto/call.hpp"
#include "util/log.hpp"

namespace call
{

static_assert(RequestLayout::SERVICE == 30, "request fixed section is 30 bytes");
static_assert(ResponseLayout::HEADERS == 27, "response fixed section is 27 bytes");

static wire::Error invalid_ttl(std::uint32_t ttl, std::size_t off, bool parse)
{
    auto e           = wire::make_error(wire::Errc::invalid_ttl, off, ttl);
    e.is_parse_error = parse;
    return e;
}

// ---------------------------------------------------------------------------
// bodies
// ---------------------------------------------------------------------------

RequestBody::RequestBody(const RequestBody &o)
    : flags(o.flags),
      ttl(o.ttl),
      trace(o.trace),
      service(o.service),
      headers(o.headers),
      csum(o.csum),
      args(o.args),
      cont(o.cont ? std::make_unique<RequestBody>(*o.cont) : nullptr)
{
}

RequestBody &RequestBody::operator=(const RequestBody &o)
{
    if (this != &o)
    {
        RequestBody tmp(o);
        *this = std::move(tmp);
    }
    return *this;
}

bool RequestBody::operator==(const RequestBody &o) const
{
    return flags == o.flags && ttl == o.ttl && trace == o.trace && service == o.service &&
           headers == o.headers && csum == o.csum && args == o.args;
}

ResponseBody::ResponseBody(const ResponseBody &o)
    : flags(o.flags),
      code(o.code),
      trace(o.trace),
      headers(o.headers),
      csum(o.csum),
      args(o.args),
      cont(o.cont ? std::make_unique<ResponseBody>(*o.cont) : nullptr)
{
}

ResponseBody &ResponseBody::operator=(const ResponseBody &o)
{
    if (this != &o)
    {
        ResponseBody tmp(o);
        *this = std::move(tmp);
    }
    return *this;
}

bool ResponseBody::operator==(const ResponseBody &o) const
{
    return flags == o.flags && code == o.code && trace == o.trace && headers == o.headers &&
           csum == o.csum && args == o.args;
}

std::uint8_t type_code(const Body &b)
{
    return std::holds_alternative<RequestBody>(b) ? REQUEST_TYPE : RESPONSE_TYPE;
}

std::uint8_t flags_of(const Body &b)
{
    return std::visit([](const auto &body) { return body.flags; }, b);
}

std::optional<wire::Error> verify_checksum(const Body &b)
{
    return std::visit([](const auto &body) { return body.verify_checksum(); }, b);
}

// ---------------------------------------------------------------------------
// byte_length
// ---------------------------------------------------------------------------

wire::LengthResult byte_length(const RequestBody &body)
{
    // flags:1 ttl:4
    std::size_t length = RequestLayout::TRACING;

    // tracing:24 traceflags:1
    auto res = tracing::byte_length(body.trace);
    if (!res.ok())
        return res;
    length += res.length;

    // service~1
    res = wire::str1_length(body.service);
    if (!res.ok())
        return res;
    length += res.length;

    // nh:1 (hk~1 hv~1){nh}
    res = header::byte_length(body.headers);
    if (!res.ok())
        return res;
    length += res.length;

    // csumtype:1 (csum:4){0,1} (arg~2)*
    res = args::byte_length(body.csum, body.args);
    if (!res.ok())
        return res;
    return wire::LengthResult::just(length + res.length);
}

wire::LengthResult byte_length(const ResponseBody &body)
{
    // flags:1 code:1
    std::size_t length = ResponseLayout::TRACING;

    // tracing:24 traceflags:1
    auto res = tracing::byte_length(body.trace);
    if (!res.ok())
        return res;
    length += res.length;

    // nh:1 (hk~1 hv~1){nh}
    res = header::byte_length(body.headers);
    if (!res.ok())
        return res;
    length += res.length;

    // csumtype:1 (csum:4){0,1} (arg~2)*
    res = args::byte_length(body.csum, body.args);
    if (!res.ok())
        return res;
    return wire::LengthResult::just(length + res.length);
}

wire::LengthResult byte_length(const Body &body)
{
    return std::visit([](const auto &b) { return byte_length(b); }, body);
}

// ---------------------------------------------------------------------------
// read
// ---------------------------------------------------------------------------

// Decode failures are logged once, at debug, where they are returned.
template <typename T>
static wire::ReadResult<T> decode_failed(const char *what, const wire::Error &e, std::size_t off)
{
    LOG_DEBUG("%s: %s", what, wire::describe(e).c_str());
    return wire::ReadResult<T>::error(e, off);
}

wire::ReadResult<RequestBody> read_request(const wire::Buffer &buf, std::size_t off)
{
    using Result = wire::ReadResult<RequestBody>;
    RequestBody body;

    // flags:1
    auto flags = wire::read_u8(buf, off + RequestLayout::FLAGS);
    if (!flags.ok())
        return decode_failed<RequestBody>("call req", *flags.err, flags.offset);
    body.flags = flags.value;

    // ttl:4
    auto ttl = wire::read_u32(buf, off + RequestLayout::TTL);
    if (!ttl.ok())
        return decode_failed<RequestBody>("call req", *ttl.err, ttl.offset);
    if (ttl.value == 0)
    {
        return decode_failed<RequestBody>(
            "call req", invalid_ttl(ttl.value, off + RequestLayout::TTL, true),
            off + RequestLayout::TTL);
    }
    body.ttl = ttl.value;

    // tracing:24 traceflags:1
    auto trace = tracing::read_from(buf, off + RequestLayout::TRACING);
    if (!trace.ok())
        return decode_failed<RequestBody>("call req", *trace.err, trace.offset);
    body.trace = trace.value;

    // service~1
    auto service = wire::read_str1(buf, off + RequestLayout::SERVICE);
    if (!service.ok())
        return decode_failed<RequestBody>("call req", *service.err, service.offset);
    body.service = std::move(service.value);

    // nh:1 (hk~1 hv~1){nh}
    auto headers = header::read_from(buf, service.offset);
    if (!headers.ok())
        return decode_failed<RequestBody>("call req", *headers.err, headers.offset);
    body.headers = std::move(headers.value);

    // csumtype:1 (csum:4){0,1} (arg~2)*
    auto rest = args::read_from(body.csum, body.args, buf, headers.offset);
    if (!rest.ok())
        return decode_failed<RequestBody>("call req", *rest.err, rest.offset);

    return Result::just(rest.offset, std::move(body));
}

wire::ReadResult<ResponseBody> read_response(const wire::Buffer &buf, std::size_t off)
{
    using Result = wire::ReadResult<ResponseBody>;
    ResponseBody body;

    // flags:1
    auto flags = wire::read_u8(buf, off + ResponseLayout::FLAGS);
    if (!flags.ok())
        return decode_failed<ResponseBody>("call res", *flags.err, flags.offset);
    body.flags = flags.value;

    // code:1
    auto code = wire::read_u8(buf, off + ResponseLayout::CODE);
    if (!code.ok())
        return decode_failed<ResponseBody>("call res", *code.err, code.offset);
    body.code = static_cast<ResponseCode>(code.value);

    // tracing:24 traceflags:1
    auto trace = tracing::read_from(buf, off + ResponseLayout::TRACING);
    if (!trace.ok())
        return decode_failed<ResponseBody>("call res", *trace.err, trace.offset);
    body.trace = trace.value;

    // nh:1 (hk~1 hv~1){nh}
    auto headers = header::read_from(buf, off + ResponseLayout::HEADERS);
    if (!headers.ok())
        return decode_failed<ResponseBody>("call res", *headers.err, headers.offset);
    body.headers = std::move(headers.value);

    // csumtype:1 (csum:4){0,1} (arg~2)*
    auto rest = args::read_from(body.csum, body.args, buf, headers.offset);
    if (!rest.ok())
        return decode_failed<ResponseBody>("call res", *rest.err, rest.offset);

    return Result::just(rest.offset, std::move(body));
}

wire::ReadResult<Body> read_body(std::uint8_t type, const wire::Buffer &buf, std::size_t off)
{
    using Result = wire::ReadResult<Body>;
    switch (type)
    {
        case REQUEST_TYPE:
        {
            auto r = read_request(buf, off);
            if (!r.ok())
                return Result::error(*r.err, r.offset);
            return Result::just(r.offset, Body(std::move(r.value)));
        }
        case RESPONSE_TYPE:
        {
            auto r = read_response(buf, off);
            if (!r.ok())
                return Result::error(*r.err, r.offset);
            return Result::just(r.offset, Body(std::move(r.value)));
        }
        default:
            return decode_failed<Body>("call body",
                                       wire::make_error(wire::Errc::invalid_type, off, type), off);
    }
}

// ---------------------------------------------------------------------------
// write
// ---------------------------------------------------------------------------

wire::WriteResult write_into(RequestBody &body, wire::Buffer &buf, std::size_t off)
{
    // flags:1, patched after the argument stream
    wire::ByteSlot flags_slot;
    auto           res = wire::ByteSlot::reserve(buf, off + RequestLayout::FLAGS, flags_slot);
    if (!res.ok())
        return res;

    if (body.ttl == 0)
    {
        auto e = invalid_ttl(body.ttl, res.offset, false);
        LOG_WARN("call req: %s", wire::describe(e).c_str());
        return wire::WriteResult::error(e, res.offset);
    }

    // ttl:4
    res = wire::write_u32(body.ttl, buf, res.offset);
    if (!res.ok())
        return res;

    // tracing:24 traceflags:1
    res = tracing::write_into(body.trace, buf, res.offset);
    if (!res.ok())
        return res;

    // service~1
    res = wire::write_str1(body.service, buf, res.offset);
    if (!res.ok())
        return res;

    // nh:1 (hk~1 hv~1){nh}
    res = header::write_into(body.headers, buf, res.offset);
    if (!res.ok())
        return res;

    // csumtype:1 (csum:4){0,1} (arg~2)*, may set FRAGMENT
    res = args::write_into(body.flags, body.csum, body.args, buf, res.offset);
    if (!res.ok())
        return res;

    return flags_slot.commit(body.flags, res.offset);
}

wire::WriteResult write_into(ResponseBody &body, wire::Buffer &buf, std::size_t off)
{
    // flags:1, patched after the argument stream
    wire::ByteSlot flags_slot;
    auto           res = wire::ByteSlot::reserve(buf, off + ResponseLayout::FLAGS, flags_slot);
    if (!res.ok())
        return res;

    // code:1
    res = wire::write_u8(static_cast<std::uint8_t>(body.code), buf, res.offset);
    if (!res.ok())
        return res;

    // tracing:24 traceflags:1
    res = tracing::write_into(body.trace, buf, res.offset);
    if (!res.ok())
        return res;

    // nh:1 (hk~1 hv~1){nh}
    res = header::write_into(body.headers, buf, res.offset);
    if (!res.ok())
        return res;

    // csumtype:1 (csum:4){0,1} (arg~2)*, may set FRAGMENT
    res = args::write_into(body.flags, body.csum, body.args, buf, res.offset);
    if (!res.ok())
        return res;

    return flags_slot.commit(body.flags, res.offset);
}

wire::WriteResult write_into(Body &body, wire::Buffer &buf, std::size_t off)
{
    return std::visit([&](auto &b) { return write_into(b, buf, off); }, body);
}

template <typename B>
static wire::WriteResult encode_body(B &body, frame::Frame &out, std::size_t max_frame_size)
{
    if (max_frame_size <= out.overhead)
        return wire::WriteResult::error(
            wire::make_error(wire::Errc::short_buffer, out.overhead, max_frame_size),
            out.overhead);

    auto len = byte_length(body);
    if (!len.ok())
    {
        LOG_WARN("encode: %s", wire::describe(*len.err).c_str());
        return wire::WriteResult::error(*len.err, out.overhead);
    }

    const std::size_t capacity = max_frame_size - out.overhead;
    out.buffer.resize(out.overhead + std::min(len.length, capacity));
    out.cache.clear();

    auto res = write_into(body, out.buffer, out.overhead);
    if (!res.ok())
    {
        LOG_DEBUG("encode: %s", wire::describe(*res.err).c_str());
        return res;
    }
    // a split argument may leave a byte or two unused
    out.buffer.resize(res.offset);
    return res;
}

wire::WriteResult encode(RequestBody &body, frame::Frame &out, std::size_t max_frame_size)
{
    return encode_body(body, out, max_frame_size);
}

wire::WriteResult encode(ResponseBody &body, frame::Frame &out, std::size_t max_frame_size)
{
    return encode_body(body, out, max_frame_size);
}

}  // namespace call
