#include "proto/frame.hpp"
#include "proto/header.hpp"
#include "util/log.hpp"

namespace header
{

HeaderMap::HeaderMap(std::initializer_list<Entry> init)
{
    for (const auto &e : init)
        set(e.first, e.second);
}

void HeaderMap::set(std::string key, std::string value)
{
    for (auto &e : entries_)
    {
        if (e.first == key)
        {
            e.second = std::move(value);
            return;
        }
    }
    entries_.emplace_back(std::move(key), std::move(value));
}

std::optional<std::string> HeaderMap::get(std::string_view key) const
{
    for (const auto &e : entries_)
    {
        if (e.first == key)
            return e.second;
    }
    return std::nullopt;
}

bool HeaderMap::contains(std::string_view key) const
{
    return get(key).has_value();
}

std::optional<std::string_view> LazyHeaders::view(const Span &s) const
{
    if (!buf_ || s.off > buf_->size() || s.len > buf_->size() - s.off)
        return std::nullopt;
    return std::string_view(reinterpret_cast<const char *>(buf_->data()) + s.off, s.len);
}

std::optional<std::string> LazyHeaders::get_string_value(std::string_view key) const
{
    // last match wins, same as HeaderMap::set during an eager read
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it)
    {
        auto k = view(it->key);
        if (!k || *k != key)
            continue;
        auto v = view(it->value);
        if (!v)
            return std::nullopt;
        return std::string(*v);
    }
    return std::nullopt;
}

HeaderMap LazyHeaders::materialize() const
{
    HeaderMap out;
    for (const auto &e : entries_)
    {
        auto k = view(e.key);
        auto v = view(e.value);
        if (!k || !v)
            break;
        out.set(std::string(*k), std::string(*v));
    }
    return out;
}

wire::LengthResult byte_length(const HeaderMap &headers)
{
    if (headers.size() > MAX_COUNT)
        return wire::LengthResult::error(
            wire::make_error(wire::Errc::too_many_headers, 0, headers.size(), MAX_COUNT));

    std::size_t length = wire::U8_BYTES;  // nh:1
    for (const auto &e : headers)
    {
        auto k = wire::str1_length(e.first);
        if (!k.ok())
            return k;
        auto v = wire::str1_length(e.second);
        if (!v.ok())
            return v;
        length += k.length + v.length;
    }
    return wire::LengthResult::just(length);
}

// Walks nh:1 (hk~1 hv~1){nh}, recording spans; shared by the eager and lazy readers.
static wire::ReadResult<std::vector<LazyHeaders::EntrySpan>> scan(const wire::Buffer &buf,
                                                                  std::size_t         off)
{
    using Result = wire::ReadResult<std::vector<LazyHeaders::EntrySpan>>;

    auto nh = wire::read_u8(buf, off);
    if (!nh.ok())
        return Result::error(*nh.err, off);
    off = nh.offset;

    // every entry needs at least its two length bytes
    const std::size_t remaining = buf.size() - off;
    if (static_cast<std::size_t>(nh.value) * 2 > remaining)
        return Result::error(wire::make_error(wire::Errc::length_overflow, off, nh.value), off);

    std::vector<LazyHeaders::EntrySpan> entries;
    entries.reserve(nh.value);
    for (std::size_t i = 0; i < nh.value; ++i)
    {
        LazyHeaders::EntrySpan e;

        auto k = wire::skip_str1(buf, off);
        if (!k.ok())
            return Result::error(*k.err, k.offset);
        e.key = {off + wire::U8_BYTES, k.value};
        off   = k.offset;

        auto v = wire::skip_str1(buf, off);
        if (!v.ok())
            return Result::error(*v.err, v.offset);
        e.value = {off + wire::U8_BYTES, v.value};
        off     = v.offset;

        entries.push_back(e);
    }
    return Result::just(off, std::move(entries));
}

wire::ReadResult<HeaderMap> read_from(const wire::Buffer &buf, std::size_t off)
{
    auto res = scan(buf, off);
    if (!res.ok())
        return wire::ReadResult<HeaderMap>::error(*res.err, res.offset);
    LazyHeaders view(&buf, std::move(res.value));
    return wire::ReadResult<HeaderMap>::just(res.offset, view.materialize());
}

wire::WriteResult write_into(const HeaderMap &headers, wire::Buffer &buf, std::size_t off)
{
    if (headers.size() > MAX_COUNT)
        return wire::WriteResult::error(
            wire::make_error(wire::Errc::too_many_headers, off, headers.size(), MAX_COUNT), off);

    auto res = wire::write_u8(static_cast<std::uint8_t>(headers.size()), buf, off);
    if (!res.ok())
        return res;
    for (const auto &e : headers)
    {
        res = wire::write_str1(e.first, buf, res.offset);
        if (!res.ok())
            return res;
        res = wire::write_str1(e.second, buf, res.offset);
        if (!res.ok())
            return res;
    }
    return res;
}

wire::ReadResult<LazyHeaders> lazy_read(const frame::Frame &f, std::size_t off)
{
    auto res = scan(f.buffer, off);
    if (!res.ok())
    {
        LOG_DEBUG("header scan failed: %s", wire::describe(*res.err).c_str());
        return wire::ReadResult<LazyHeaders>::error(*res.err, res.offset);
    }
    return wire::ReadResult<LazyHeaders>::just(res.offset,
                                               LazyHeaders(&f.buffer, std::move(res.value)));
}

wire::ReadResult<std::size_t> lazy_skip(const frame::Frame &f, std::size_t off)
{
    const wire::Buffer &buf = f.buffer;

    auto nh = wire::read_u8(buf, off);
    if (!nh.ok())
        return wire::ReadResult<std::size_t>::error(*nh.err, off);
    off = nh.offset;

    const std::size_t remaining = buf.size() - off;
    if (static_cast<std::size_t>(nh.value) * 2 > remaining)
        return wire::ReadResult<std::size_t>::error(
            wire::make_error(wire::Errc::length_overflow, off, nh.value), off);

    // 2 * nh length-prefixed strings, nothing copied
    for (std::size_t i = 0; i < 2u * nh.value; ++i)
    {
        auto s = wire::skip_str1(buf, off);
        if (!s.ok())
            return wire::ReadResult<std::size_t>::error(*s.err, s.offset);
        off = s.offset;
    }
    return wire::ReadResult<std::size_t>::just(off, nh.value);
}

}  // namespace header
