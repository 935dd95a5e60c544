#include <algorithm>

#include "proto/args.hpp"
#include "proto/call_flags.hpp"
#include "util/log.hpp"

namespace args
{

namespace argrw
{

wire::LengthResult byte_length(const wire::Bytes &arg)
{
    if (arg.size() > ARG_MAX)
        return wire::LengthResult::error(
            wire::make_error(wire::Errc::string_too_long, 0, arg.size(), ARG_MAX));
    return wire::LengthResult::just(wire::U16_BYTES + arg.size());
}

wire::ReadResult<wire::Bytes> read_from(const wire::Buffer &buf, std::size_t off)
{
    auto len = wire::read_u16(buf, off);
    if (!len.ok())
        return wire::ReadResult<wire::Bytes>::error(*len.err, off);
    return wire::read_bytes(buf, len.offset, len.value);
}

wire::WriteResult write_into(const wire::Bytes &arg, wire::Buffer &buf, std::size_t off)
{
    if (arg.size() > ARG_MAX)
        return wire::WriteResult::error(
            wire::make_error(wire::Errc::string_too_long, off, arg.size(), ARG_MAX), off);
    auto res = wire::write_u16(static_cast<std::uint16_t>(arg.size()), buf, off);
    if (!res.ok())
        return res;
    return wire::write_bytes(arg.data(), arg.size(), buf, res.offset);
}

}  // namespace argrw

namespace strrw
{

bool is_printable(const std::uint8_t *p, std::size_t n)
{
    for (std::size_t i = 0; i < n; ++i)
    {
        const std::uint8_t c = p[i];
        if (c == '\t' || c == '\r' || c == '\n')
            continue;
        if (c < 0x20 || c == 0x7F)
            return false;
    }
    return true;
}

wire::ReadResult<std::string> read_from(const wire::Buffer &buf, std::size_t off)
{
    using Result = wire::ReadResult<std::string>;

    auto str = wire::read_str2(buf, off);
    if (!str.ok())
        return str;
    const auto *p = reinterpret_cast<const std::uint8_t *>(str.value.data());
    if (!is_printable(p, str.value.size()))
        return Result::error(
            wire::make_error(wire::Errc::invalid_string, off + wire::U16_BYTES,
                             str.value.size()),
            off);
    return str;
}

}  // namespace strrw

wire::ReadResult<Fit> fit(const checksum::Checksum &csum, const Args &args, std::size_t capacity)
{
    using Result = wire::ReadResult<Fit>;

    auto cw = checksum::byte_length(csum.type);
    if (!cw.ok())
        return Result::error(*cw.err, 0);
    if (capacity < cw.length)
        return Result::error(wire::make_error(wire::Errc::short_buffer, 0, cw.length), 0);

    Fit         f;
    std::size_t room = capacity - cw.length;
    f.bytes          = cw.length;

    for (std::size_t i = 0; i < args.size(); ++i)
    {
        const std::size_t w = wire::U16_BYTES + args[i].size();
        if (args[i].size() <= ARG_MAX && w <= room)
        {
            room -= w;
            f.bytes += w;
            f.whole++;
            continue;
        }
        // args[i] is split, one arg~2 chunk per frame at most ARG_MAX long;
        // an empty chunk is not worth a length prefix
        f.fragmented = true;
        if (room > wire::U16_BYTES)
        {
            f.partial = std::min(room - wire::U16_BYTES, ARG_MAX);
            f.bytes += wire::U16_BYTES + f.partial;
        }
        break;
    }
    return Result::just(0, f);
}

Args remainder(const Args &args, const Fit &f)
{
    Args rest;
    if (!f.fragmented || f.whole >= args.size())
        return rest;

    const auto &split = args[f.whole];
    rest.emplace_back(split.begin() + static_cast<std::ptrdiff_t>(f.partial), split.end());
    for (std::size_t i = f.whole + 1; i < args.size(); ++i)
        rest.push_back(args[i]);
    return rest;
}

wire::LengthResult byte_length(const checksum::Checksum &csum, const Args &args)
{
    auto res = checksum::byte_length(csum.type);
    if (!res.ok())
        return res;
    // unsplit width; an arg longer than ARG_MAX never fits one frame and is
    // chunked by fit()
    std::size_t length = res.length;
    for (const auto &a : args)
        length += wire::U16_BYTES + a.size();
    return wire::LengthResult::just(length);
}

wire::ReadResult<std::size_t> read_from(checksum::Checksum &csum, Args &args,
                                        const wire::Buffer &buf, std::size_t off)
{
    using Result = wire::ReadResult<std::size_t>;

    auto cres = checksum::read_from(buf, off);
    if (!cres.ok())
        return Result::error(*cres.err, cres.offset);
    csum = cres.value;
    off  = cres.offset;

    args.clear();
    while (off < buf.size())
    {
        auto a = argrw::read_from(buf, off);
        if (!a.ok())
            return Result::error(*a.err, a.offset);
        args.push_back(std::move(a.value));
        off = a.offset;
    }
    return Result::just(off, args.size());
}

wire::WriteResult write_into(std::uint8_t &flags, checksum::Checksum &csum, const Args &args,
                             wire::Buffer &buf, std::size_t off)
{
    const std::size_t capacity = off <= buf.size() ? buf.size() - off : 0;

    auto f = fit(csum, args, capacity);
    if (!f.ok())
    {
        auto e   = *f.err;
        e.offset = off;
        return wire::WriteResult::error(e, off);
    }

    // digest over exactly what lands in this frame
    std::optional<wire::Error> derr;
    if (!f.value.fragmented)
    {
        derr = csum.update(args);
    }
    else
    {
        Args sent(args.begin(), args.begin() + static_cast<std::ptrdiff_t>(f.value.whole));
        if (f.value.partial)
        {
            const auto &split = args[f.value.whole];
            sent.emplace_back(split.begin(),
                              split.begin() + static_cast<std::ptrdiff_t>(f.value.partial));
        }
        derr = csum.update(sent);
        LOG_DEBUG("args fragmented: %zu whole, %zu partial bytes, %zu of %zu args left",
                  f.value.whole, f.value.partial, args.size() - f.value.whole, args.size());
    }
    if (derr)
    {
        derr->offset = off;
        return wire::WriteResult::error(*derr, off);
    }

    auto res = checksum::write_into(csum, buf, off);
    if (!res.ok())
        return res;

    for (std::size_t i = 0; i < f.value.whole; ++i)
    {
        res = argrw::write_into(args[i], buf, res.offset);
        if (!res.ok())
            return res;
    }
    if (f.value.partial)
    {
        const auto &split = args[f.value.whole];
        res = wire::write_u16(static_cast<std::uint16_t>(f.value.partial), buf, res.offset);
        if (!res.ok())
            return res;
        res = wire::write_bytes(split.data(), f.value.partial, buf, res.offset);
        if (!res.ok())
            return res;
    }

    // only ever set here; a FRAGMENT the caller put on stays
    if (f.value.fragmented)
        flags = call_flags::with_fragment(flags, true);
    return res;
}

}  // namespace args
