#include <sodium.h>

#include "proto/tracing.hpp"
#include "util/log.hpp"

namespace tracing
{

static bool ensure_sodium_init()
{
    static int ok = (sodium_init() >= 0);  // -1 means failed
    return ok;
}

static std::uint64_t random_id()
{
    if (!ensure_sodium_init())
        LOG_ERROR("sodium_init failed, ids come from an uninitialized RNG");
    std::uint64_t id = 0;
    // zero means "no span" on the wire
    while (id == 0)
        randombytes_buf(&id, sizeof id);
    return id;
}

wire::LengthResult byte_length(const Tracing & /*t*/)
{
    return wire::LengthResult::just(WIDTH);
}

wire::ReadResult<Tracing> read_from(const wire::Buffer &buf, std::size_t off)
{
    using Result = wire::ReadResult<Tracing>;
    const std::size_t start = off;

    // the fixed width is checked up front so a short read reports the whole field
    if (off > buf.size() || buf.size() - off < WIDTH)
        return Result::error(wire::make_error(wire::Errc::short_buffer, start, WIDTH), start);

    Tracing t;
    auto    span = wire::read_u64(buf, off);
    t.span_id    = span.value;
    auto parent  = wire::read_u64(buf, span.offset);
    t.parent_id  = parent.value;
    auto trace   = wire::read_u64(buf, parent.offset);
    t.trace_id   = trace.value;
    auto flags   = wire::read_u8(buf, trace.offset);
    t.flags      = flags.value;

    return Result::just(flags.offset, t);
}

wire::WriteResult write_into(const Tracing &t, wire::Buffer &buf, std::size_t off)
{
    auto res = wire::write_u64(t.span_id, buf, off);
    if (!res.ok())
        return res;
    res = wire::write_u64(t.parent_id, buf, res.offset);
    if (!res.ok())
        return res;
    res = wire::write_u64(t.trace_id, buf, res.offset);
    if (!res.ok())
        return res;
    return wire::write_u8(t.flags, buf, res.offset);
}

Tracing root(std::uint8_t flags)
{
    Tracing t;
    t.trace_id  = random_id();
    t.span_id   = t.trace_id;
    t.parent_id = 0;
    t.flags     = flags;
    return t;
}

Tracing child_of(const Tracing &p)
{
    Tracing t;
    t.trace_id  = p.trace_id;
    t.parent_id = p.span_id;
    t.span_id   = random_id();
    t.flags     = p.flags;
    return t;
}

}  // namespace tracing
