#include <array>

#include "proto/checksum.hpp"
#include "proto/frame.hpp"
#include "util/log.hpp"

namespace checksum
{

namespace
{

using Table = std::array<std::uint32_t, 256>;

Table make_table(std::uint32_t poly)
{
    Table t{};
    for (std::uint32_t i = 0; i < 256; ++i)
    {
        std::uint32_t c = i;
        for (int k = 0; k < 8; ++k)
            c = (c & 1) ? (poly ^ (c >> 1)) : (c >> 1);
        t[i] = c;
    }
    return t;
}

std::uint32_t run(const Table &t, std::uint32_t prior, const std::uint8_t *p, std::size_t n)
{
    std::uint32_t c = ~prior;
    for (std::size_t i = 0; i < n; ++i)
        c = t[(c ^ p[i]) & 0xFF] ^ (c >> 8);
    return ~c;
}

template <std::uint32_t (*Fn)(std::uint32_t, const std::uint8_t *, std::size_t)>
std::uint32_t over_args(const Args &args, std::uint32_t prior)
{
    std::uint32_t c = prior;
    for (const auto &a : args)
        c = Fn(c, a.data(), a.size());
    return c;
}

}  // namespace

std::uint32_t crc32(std::uint32_t prior, const std::uint8_t *p, std::size_t n)
{
    static const Table table = make_table(0xEDB88320u);  // IEEE 802.3, reflected
    return run(table, prior, p, n);
}

std::uint32_t crc32c(std::uint32_t prior, const std::uint8_t *p, std::size_t n)
{
    static const Table table = make_table(0x82F63B78u);  // Castagnoli, reflected
    return run(table, prior, p, n);
}

bool is_defined(std::uint8_t type)
{
    return type <= static_cast<std::uint8_t>(Type::Crc32C);
}

const char *type_name(Type t)
{
    switch (t)
    {
        case Type::None:
            return "none";
        case Type::Crc32:
            return "crc32";
        case Type::FarmHash32:
            return "farmhash32";
        case Type::Crc32C:
            return "crc32c";
    }
    return "unknown";
}

Registry &Registry::global()
{
    static Registry reg = [] {
        Registry r;
        r.add(Type::Crc32, over_args<crc32>);
        r.add(Type::Crc32C, over_args<crc32c>);
        return r;
    }();
    return reg;
}

void Registry::add(Type t, DigestFn fn)
{
    if (t == Type::None)
    {
        LOG_WARN("checksum type none carries no digest, ignoring registration");
        return;
    }
    fns_[static_cast<std::uint8_t>(t)] = std::move(fn);
}

void Registry::remove(Type t)
{
    fns_.erase(static_cast<std::uint8_t>(t));
}

const DigestFn *Registry::find(Type t) const
{
    auto it = fns_.find(static_cast<std::uint8_t>(t));
    if (it == fns_.end() || !it->second)
        return nullptr;
    return &it->second;
}

wire::ReadResult<std::uint32_t> compute(Type t, const Args &args, std::uint32_t prior,
                                        const Registry &reg)
{
    using Result = wire::ReadResult<std::uint32_t>;
    if (t == Type::None)
        return Result::just(0, 0);
    if (!is_defined(static_cast<std::uint8_t>(t)))
        return Result::error(
            wire::make_error(wire::Errc::invalid_checksum_type, 0, static_cast<std::uint8_t>(t)),
            0);

    const DigestFn *fn = reg.find(t);
    if (!fn)
        return Result::error(
            wire::make_error(wire::Errc::unsupported_checksum, 0, static_cast<std::uint8_t>(t)),
            0);
    return Result::just(0, (*fn)(args, prior));
}

std::optional<wire::Error> Checksum::update(const Args &args, std::uint32_t prior)
{
    auto res = compute(type, args, prior);
    if (!res.ok())
        return res.err;
    value = res.value;
    return std::nullopt;
}

std::optional<wire::Error> Checksum::verify(const Args &args, std::uint32_t prior) const
{
    if (type == Type::None)
        return std::nullopt;

    auto res = compute(type, args, prior);
    if (!res.ok())
        return res.err;
    if (res.value != value)
    {
        auto e = wire::make_error(wire::Errc::checksum_mismatch, 0, res.value, value);
        LOG_WARN("%s %s", type_name(type), wire::describe(e).c_str());
        return e;
    }
    return std::nullopt;
}

wire::LengthResult byte_length(Type t)
{
    const auto tag = static_cast<std::uint8_t>(t);
    if (!is_defined(tag))
        return wire::LengthResult::error(
            wire::make_error(wire::Errc::invalid_checksum_type, 0, tag));
    if (t == Type::None)
        return wire::LengthResult::just(wire::U8_BYTES);
    return wire::LengthResult::just(wire::U8_BYTES + VALUE_WIDTH);
}

wire::ReadResult<Checksum> read_from(const wire::Buffer &buf, std::size_t off)
{
    using Result = wire::ReadResult<Checksum>;

    auto tag = wire::read_u8(buf, off);
    if (!tag.ok())
        return Result::error(*tag.err, off);
    if (!is_defined(tag.value))
        return Result::error(wire::make_error(wire::Errc::invalid_checksum_type, off, tag.value),
                             off);

    Checksum c(static_cast<Type>(tag.value));
    if (c.type == Type::None)
        return Result::just(tag.offset, c);

    auto v = wire::read_u32(buf, tag.offset);
    if (!v.ok())
        return Result::error(*v.err, v.offset);
    c.value = v.value;
    return Result::just(v.offset, c);
}

wire::WriteResult write_into(const Checksum &c, wire::Buffer &buf, std::size_t off)
{
    const auto tag = static_cast<std::uint8_t>(c.type);
    if (!is_defined(tag))
        return wire::WriteResult::error(
            wire::make_error(wire::Errc::invalid_checksum_type, off, tag), off);

    auto res = wire::write_u8(tag, buf, off);
    if (!res.ok() || c.type == Type::None)
        return res;
    return wire::write_u32(c.value, buf, res.offset);
}

wire::ReadResult<std::size_t> lazy_skip(const frame::Frame &f, std::size_t off)
{
    using Result = wire::ReadResult<std::size_t>;

    auto tag = wire::read_u8(f.buffer, off);
    if (!tag.ok())
        return Result::error(*tag.err, off);
    auto width = byte_length(static_cast<Type>(tag.value));
    if (!width.ok())
    {
        auto e   = *width.err;
        e.offset = off;
        return Result::error(e, off);
    }
    if (off > f.buffer.size() || f.buffer.size() - off < width.length)
        return Result::error(wire::make_error(wire::Errc::short_buffer, tag.offset, VALUE_WIDTH),
                             tag.offset);
    return Result::just(off + width.length, tag.value);
}

}  // namespace checksum
