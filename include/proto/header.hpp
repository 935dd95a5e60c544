#pragma once
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "proto/rw.hpp"

namespace frame
{
struct Frame;
}

// header1: nh:1 (hk~1 hv~1){nh}
namespace header
{

inline constexpr std::size_t MAX_COUNT = 0xFF;

// Well-known transport header carrying the caller's service name.
inline constexpr std::string_view CALLER_NAME = "cn";

// Ordered string map. Iteration follows insertion order; set() on an existing
// key replaces the value in place.
class HeaderMap
{
  public:
    using Entry          = std::pair<std::string, std::string>;
    using const_iterator = std::vector<Entry>::const_iterator;

    HeaderMap() = default;
    HeaderMap(std::initializer_list<Entry> init);

    void                       set(std::string key, std::string value);
    std::optional<std::string> get(std::string_view key) const;
    bool                       contains(std::string_view key) const;

    std::size_t    size() const { return entries_.size(); }
    bool           empty() const { return entries_.empty(); }
    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    bool operator==(const HeaderMap &o) const { return entries_ == o.entries_; }
    bool operator!=(const HeaderMap &o) const { return !(*this == o); }

  private:
    std::vector<Entry> entries_;
};

// Offsets of one encoded header section, recorded without copying any string.
// Spans index the buffer the section was scanned from; after Frame::reset a
// view no longer describes the bytes, and spans past the end read as absent.
class LazyHeaders
{
  public:
    struct Span
    {
        std::size_t off{0};
        std::size_t len{0};
    };
    struct EntrySpan
    {
        Span key;
        Span value;
    };

    LazyHeaders() = default;
    LazyHeaders(const wire::Buffer *buf, std::vector<EntrySpan> entries)
        : buf_(buf), entries_(std::move(entries))
    {
    }

    std::size_t                   count() const { return entries_.size(); }
    const std::vector<EntrySpan> &entries() const { return entries_; }

    // Value of the last entry named `key`, compared byte for byte in the buffer.
    std::optional<std::string> get_string_value(std::string_view key) const;

    HeaderMap materialize() const;

  private:
    std::optional<std::string_view> view(const Span &s) const;

    const wire::Buffer    *buf_{nullptr};
    std::vector<EntrySpan> entries_;
};

wire::LengthResult          byte_length(const HeaderMap &headers);
wire::ReadResult<HeaderMap> read_from(const wire::Buffer &buf, std::size_t off);
wire::WriteResult           write_into(const HeaderMap &headers, wire::Buffer &buf,
                                       std::size_t off);

// Frame-relative helpers used by the lazy readers; `off` is an absolute buffer offset.
wire::ReadResult<LazyHeaders> lazy_read(const frame::Frame &f, std::size_t off);
wire::ReadResult<std::size_t> lazy_skip(const frame::Frame &f, std::size_t off);

}  // namespace header
