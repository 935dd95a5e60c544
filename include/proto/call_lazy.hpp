#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "proto/args.hpp"
#include "proto/call.hpp"
#include "proto/checksum.hpp"
#include "proto/frame.hpp"
#include "proto/header.hpp"
#include "proto/rw.hpp"
#include "proto/tracing.hpp"
#include "util/log.hpp"

/*
Field-at-a-time access to a received call body, straight from frame.buffer.

  fixed offsets    flags, ttl|code, tracing, service start
  computed once    HeadersStart  (after service~1, requests)
                   ChecksumStart (after the header section)
                   header spans  (one scan serves every read_header)

Computed offsets and decoded strings go into frame.cache, so a later read
(arg1 after service, headers after arg1, ...) starts where an earlier one
stopped. Every reader returns what read_request()/read_response() would
return for that field, including the error for a malformed buffer.
*/

namespace call
{

template <typename Kind>
class LazyReader
{
  public:
    using Layout = typename Kind::Layout;

    explicit LazyReader(frame::Frame &f) : f_(f) {}

    std::size_t base() const { return f_.overhead; }

    // flags:1
    wire::ReadResult<std::uint8_t> read_flags() const
    {
        return wire::read_u8(f_.buffer, base() + Layout::FLAGS);
    }

    // True when this frame holds the last fragment of the argument stream.
    wire::ReadResult<bool> is_frame_terminal() const
    {
        auto flags = read_flags();
        if (!flags.ok())
            return wire::ReadResult<bool>::error(*flags.err, flags.offset);
        return wire::ReadResult<bool>::just(flags.offset, !call_flags::is_fragment(flags.value));
    }

    // ttl:4
    wire::ReadResult<std::uint32_t> read_ttl() const
    {
        static_assert(Kind::HAS_SERVICE, "only call requests carry a ttl");
        auto res = wire::read_u32(f_.buffer, base() + Layout::TTL);
        if (res.ok() && res.value == 0)
        {
            auto e           = wire::make_error(wire::Errc::invalid_ttl, base() + Layout::TTL, 0);
            e.is_parse_error = true;
            return wire::ReadResult<std::uint32_t>::error(e, base() + Layout::TTL);
        }
        return res;
    }

    // In-place ttl rewrite for relays; no offset moves, so the cache stays valid.
    wire::WriteResult write_ttl(std::uint32_t ttl)
    {
        static_assert(Kind::HAS_SERVICE, "only call requests carry a ttl");
        if (ttl == 0)
        {
            LOG_WARN("refusing to write ttl=0");
            return wire::WriteResult::error(
                wire::make_error(wire::Errc::invalid_ttl, base() + Layout::TTL, ttl),
                base() + Layout::TTL);
        }
        return wire::write_u32(ttl, f_.buffer, base() + Layout::TTL);
    }

    // code:1
    wire::ReadResult<ResponseCode> read_code() const
    {
        static_assert(!Kind::HAS_SERVICE, "only call responses carry a code");
        auto res = wire::read_u8(f_.buffer, base() + Layout::CODE);
        if (!res.ok())
            return wire::ReadResult<ResponseCode>::error(*res.err, res.offset);
        return wire::ReadResult<ResponseCode>::just(res.offset,
                                                    static_cast<ResponseCode>(res.value));
    }

    // tracing:24 traceflags:1
    wire::ReadResult<tracing::Tracing> read_tracing() const
    {
        return tracing::read_from(f_.buffer, base() + Layout::TRACING);
    }

    // service~1
    wire::ReadResult<std::string> read_service()
    {
        static_assert(Kind::HAS_SERVICE, "only call requests carry a service");
        if (f_.cache.service)
            return *f_.cache.service;

        auto res = wire::read_str1(f_.buffer, base() + Layout::SERVICE);
        if (res.ok())
            f_.cache.set_offset(frame::Slot::HeadersStart, res.offset);
        f_.cache.service = res;
        return res;
    }

    // nh:1 (hk~1 hv~1){nh}
    wire::ReadResult<header::LazyHeaders> read_headers()
    {
        if (f_.cache.header_spans)
        {
            if (auto end = f_.cache.offset(frame::Slot::ChecksumStart))
                return wire::ReadResult<header::LazyHeaders>::just(
                    *end, header::LazyHeaders(&f_.buffer, *f_.cache.header_spans));
        }

        auto start = headers_start();
        if (!start.ok())
            return wire::ReadResult<header::LazyHeaders>::error(*start.err, start.offset);

        auto res = header::lazy_read(f_, start.value);
        if (res.ok())
        {
            f_.cache.set_offset(frame::Slot::ChecksumStart, res.offset);
            f_.cache.header_spans = res.value.entries();
        }
        return res;
    }

    // One header by name; value is nullopt when the body does not carry it.
    wire::ReadResult<std::optional<std::string>> read_header(std::string_view name)
    {
        using Result = wire::ReadResult<std::optional<std::string>>;
        auto res     = read_headers();
        if (!res.ok())
            return Result::error(*res.err, res.offset);
        return Result::just(res.offset, res.value.get_string_value(name));
    }

    // "cn" header; empty when absent.
    wire::ReadResult<std::string> read_caller_name()
    {
        if (f_.cache.caller_name)
            return *f_.cache.caller_name;

        auto res = read_header(header::CALLER_NAME);
        wire::ReadResult<std::string> out =
            res.ok() ? wire::ReadResult<std::string>::just(res.offset, res.value.value_or(""))
                     : wire::ReadResult<std::string>::error(*res.err, res.offset);
        f_.cache.caller_name = out;
        return out;
    }

    // arg1 (endpoint name) as raw bytes
    wire::ReadResult<wire::Bytes> read_arg1()
    {
        auto off = arg1_start();
        if (!off.ok())
            return wire::ReadResult<wire::Bytes>::error(*off.err, off.offset);
        return args::argrw::read_from(f_.buffer, off.value);
    }

    // arg1 as text, rejected when it holds control bytes
    wire::ReadResult<std::string> read_arg1_str()
    {
        if (f_.cache.arg1_str)
            return *f_.cache.arg1_str;

        auto off = arg1_start();
        if (!off.ok())
            return wire::ReadResult<std::string>::error(*off.err, off.offset);
        auto res          = args::strrw::read_from(f_.buffer, off.value);
        f_.cache.arg1_str = res;
        return res;
    }

  private:
    // value = absolute offset of nh:1
    wire::ReadResult<std::size_t> headers_start()
    {
        using Result = wire::ReadResult<std::size_t>;
        if constexpr (!Kind::HAS_SERVICE)
        {
            return Result::just(base() + Layout::HEADERS, base() + Layout::HEADERS);
        }
        else
        {
            if (auto cached = f_.cache.offset(frame::Slot::HeadersStart))
                return Result::just(*cached, *cached);

            // skip service~1 without copying it
            auto res = wire::skip_str1(f_.buffer, base() + Layout::SERVICE);
            if (!res.ok())
                return Result::error(*res.err, res.offset);
            f_.cache.set_offset(frame::Slot::HeadersStart, res.offset);
            return Result::just(res.offset, res.offset);
        }
    }

    // value = absolute offset of csumtype:1
    wire::ReadResult<std::size_t> checksum_start()
    {
        using Result = wire::ReadResult<std::size_t>;
        if (auto cached = f_.cache.offset(frame::Slot::ChecksumStart))
            return Result::just(*cached, *cached);

        auto start = headers_start();
        if (!start.ok())
            return start;
        auto res = header::lazy_skip(f_, start.value);
        if (!res.ok())
            return Result::error(*res.err, res.offset);
        f_.cache.set_offset(frame::Slot::ChecksumStart, res.offset);
        return Result::just(res.offset, res.offset);
    }

    // value = absolute offset of the first arg~2
    wire::ReadResult<std::size_t> arg1_start()
    {
        using Result = wire::ReadResult<std::size_t>;
        auto start   = checksum_start();
        if (!start.ok())
            return start;
        auto res = checksum::lazy_skip(f_, start.value);
        if (!res.ok())
            return Result::error(*res.err, res.offset);
        return Result::just(res.offset, res.offset);
    }

    frame::Frame &f_;
};

using RequestReader  = LazyReader<RequestKind>;
using ResponseReader = LazyReader<ResponseKind>;

}  // namespace call
