#pragma once
#include <cstddef>
#include <cstdint>

#include "proto/rw.hpp"

namespace tracing
{

// spanid:8 parentid:8 traceid:8 traceflags:1
inline constexpr std::size_t ID_BYTES = 24;
inline constexpr std::size_t WIDTH    = ID_BYTES + 1;

struct Tracing
{
    std::uint64_t span_id{0};
    std::uint64_t parent_id{0};
    std::uint64_t trace_id{0};
    std::uint8_t  flags{0};

    bool operator==(const Tracing &o) const
    {
        return span_id == o.span_id && parent_id == o.parent_id && trace_id == o.trace_id &&
               flags == o.flags;
    }
    bool operator!=(const Tracing &o) const { return !(*this == o); }
};

wire::LengthResult           byte_length(const Tracing &t);
wire::ReadResult<Tracing>    read_from(const wire::Buffer &buf, std::size_t off);
wire::WriteResult            write_into(const Tracing &t, wire::Buffer &buf, std::size_t off);

// New trace: random trace id, span id == trace id, no parent.
Tracing root(std::uint8_t flags = 0);
// Same trace, parent = p.span_id, fresh span id, flags inherited.
Tracing child_of(const Tracing &p);

}  // namespace tracing
