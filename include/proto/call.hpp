#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include "proto/args.hpp"
#include "proto/call_flags.hpp"
#include "proto/checksum.hpp"
#include "proto/frame.hpp"
#include "proto/header.hpp"
#include "proto/rw.hpp"
#include "proto/tracing.hpp"

/*
Call request:  flags:1 ttl:4 tracing:24 traceflags:1 service~1 nh:1 (hk~1 hv~1){nh}
               csumtype:1 (csum:4){0,1} (arg~2)*
Call response: flags:1 code:1 tracing:24 traceflags:1 nh:1 (hk~1 hv~1){nh}
               csumtype:1 (csum:4){0,1} (arg~2)*

Write order: the flags byte is reserved first and patched last, because the
argument writer decides FRAGMENT only once it knows what fits.
*/

namespace call
{

inline constexpr std::uint8_t REQUEST_TYPE  = 0x03;
inline constexpr std::uint8_t RESPONSE_TYPE = 0x04;

enum class ResponseCode : std::uint8_t
{
    Ok    = 0x00,
    Error = 0x01,
};

// Body-relative offsets of the fixed sections. The eager codec and the lazy
// readers both take their positions from here.
struct RequestLayout
{
    static constexpr std::size_t FLAGS   = 0;
    static constexpr std::size_t TTL     = FLAGS + wire::U8_BYTES;
    static constexpr std::size_t TRACING = TTL + wire::U32_BYTES;
    static constexpr std::size_t SERVICE = TRACING + tracing::WIDTH;  // first variable section
};

struct ResponseLayout
{
    static constexpr std::size_t FLAGS   = 0;
    static constexpr std::size_t CODE    = FLAGS + wire::U8_BYTES;
    static constexpr std::size_t TRACING = CODE + wire::U8_BYTES;
    static constexpr std::size_t HEADERS = TRACING + tracing::WIDTH;  // first variable section
};

struct RequestBody
{
    std::uint8_t       flags{0};
    std::uint32_t      ttl{0};
    tracing::Tracing   trace{};
    std::string        service;
    header::HeaderMap  headers;
    checksum::Checksum csum;
    args::Args         args;

    // Next fragment of the same request, attached by the reassembly layer.
    std::unique_ptr<RequestBody> cont;

    RequestBody() = default;
    RequestBody(const RequestBody &o);
    RequestBody(RequestBody &&) = default;
    RequestBody &operator=(const RequestBody &o);
    RequestBody &operator=(RequestBody &&) = default;

    std::optional<wire::Error> verify_checksum() const { return csum.verify(args); }

    // Wire fields only; continuations are not compared.
    bool operator==(const RequestBody &o) const;
    bool operator!=(const RequestBody &o) const { return !(*this == o); }
};

struct ResponseBody
{
    std::uint8_t       flags{0};
    ResponseCode       code{ResponseCode::Ok};
    tracing::Tracing   trace{};
    header::HeaderMap  headers;
    checksum::Checksum csum;
    args::Args         args;

    std::unique_ptr<ResponseBody> cont;

    ResponseBody() = default;
    ResponseBody(const ResponseBody &o);
    ResponseBody(ResponseBody &&) = default;
    ResponseBody &operator=(const ResponseBody &o);
    ResponseBody &operator=(ResponseBody &&) = default;

    std::optional<wire::Error> verify_checksum() const { return csum.verify(args); }

    bool operator==(const ResponseBody &o) const;
    bool operator!=(const ResponseBody &o) const { return !(*this == o); }
};

using Body = std::variant<RequestBody, ResponseBody>;

std::uint8_t               type_code(const Body &b);
std::uint8_t               flags_of(const Body &b);
std::optional<wire::Error> verify_checksum(const Body &b);

// --- eager codec ---
wire::LengthResult byte_length(const RequestBody &body);
wire::LengthResult byte_length(const ResponseBody &body);
wire::LengthResult byte_length(const Body &body);

wire::ReadResult<RequestBody>  read_request(const wire::Buffer &buf, std::size_t off);
wire::ReadResult<ResponseBody> read_response(const wire::Buffer &buf, std::size_t off);
// Dispatch on the frame's type byte; anything else is invalid_type.
wire::ReadResult<Body>         read_body(std::uint8_t type, const wire::Buffer &buf,
                                         std::size_t off);

// buf.size() - off is the space left in the frame. May set FRAGMENT on body.flags.
wire::WriteResult write_into(RequestBody &body, wire::Buffer &buf, std::size_t off);
wire::WriteResult write_into(ResponseBody &body, wire::Buffer &buf, std::size_t off);
wire::WriteResult write_into(Body &body, wire::Buffer &buf, std::size_t off);

// Lays the body out after out.overhead, in a buffer no larger than
// max_frame_size. The envelope bytes are left for the framing layer.
wire::WriteResult encode(RequestBody &body, frame::Frame &out,
                         std::size_t max_frame_size = constants::MAX_FRAME_SIZE);
wire::WriteResult encode(ResponseBody &body, frame::Frame &out,
                         std::size_t max_frame_size = constants::MAX_FRAME_SIZE);

// Kind tags for LazyReader (proto/call_lazy.hpp).
struct RequestKind
{
    using Body   = RequestBody;
    using Layout = RequestLayout;

    static constexpr std::uint8_t TYPE        = REQUEST_TYPE;
    static constexpr bool         HAS_SERVICE = true;
};

struct ResponseKind
{
    using Body   = ResponseBody;
    using Layout = ResponseLayout;

    static constexpr std::uint8_t TYPE        = RESPONSE_TYPE;
    static constexpr bool         HAS_SERVICE = false;
};

}  // namespace call
