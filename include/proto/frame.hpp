#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "proto/header.hpp"
#include "proto/rw.hpp"
#include "util/constants.hpp"

namespace frame
{

// Offsets the lazy readers compute once and reuse.
enum class Slot : std::uint8_t
{
    HeadersStart  = 0,  // first byte after service~1 (requests only)
    ChecksumStart = 1,  // first byte after the header section
    Count
};

// Memo owned by one received frame. Each slot is written once; a later
// set for the same slot keeps the first value.
class FrameCache
{
  public:
    std::optional<std::size_t> offset(Slot s) const
    {
        const auto &v = offsets_[static_cast<std::size_t>(s)];
        return v;
    }

    bool set_offset(Slot s, std::size_t off)
    {
        auto &v = offsets_[static_cast<std::size_t>(s)];
        if (v)
            return false;
        v = off;
        return true;
    }

    // Decoded strings kept alongside the offsets.
    std::optional<wire::ReadResult<std::string>> service;
    std::optional<wire::ReadResult<std::string>> caller_name;
    std::optional<wire::ReadResult<std::string>> arg1_str;
    // one scan of the header section, reused by every named lookup
    std::optional<std::vector<header::LazyHeaders::EntrySpan>> header_spans;

    void clear()
    {
        offsets_.fill(std::nullopt);
        service.reset();
        caller_name.reset();
        arg1_str.reset();
        header_spans.reset();
    }

  private:
    std::array<std::optional<std::size_t>, static_cast<std::size_t>(Slot::Count)> offsets_{};
};

// One frame as handed over by the transport: bytes, the position where the
// body starts, and the cache for that body.
struct Frame
{
    wire::Buffer buffer;
    std::size_t  overhead{constants::FRAME_OVERHEAD};
    FrameCache   cache;

    Frame() = default;
    explicit Frame(wire::Buffer buf, std::size_t overhead_ = constants::FRAME_OVERHEAD)
        : buffer(std::move(buf)), overhead(overhead_)
    {
    }

    // Replaces the bytes; cached offsets belong to the old bytes and are dropped.
    void reset(wire::Buffer buf)
    {
        buffer = std::move(buf);
        cache.clear();
    }
};

}  // namespace frame
