#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/*
Read/write results shared by every codec in proto/.

  read_*  (buf, off)       -> ReadResult<T>  {err | value, offset after the field}
  write_* (v, buf, off)    -> WriteResult    {err | offset after the field}
  *_length(v)              -> LengthResult   {err | encoded width}

The first error wins: callers return it unchanged, nothing is retried or skipped.
*/

namespace wire
{

using Buffer = std::vector<std::uint8_t>;
using Bytes  = std::vector<std::uint8_t>;

inline constexpr std::size_t U8_BYTES  = 1;
inline constexpr std::size_t U16_BYTES = 2;
inline constexpr std::size_t U32_BYTES = 4;
inline constexpr std::size_t U64_BYTES = 8;

inline constexpr std::size_t STR1_MAX = 0xFF;
inline constexpr std::size_t STR2_MAX = 0xFFFF;

enum class Errc : std::uint8_t
{
    ok = 0,
    short_buffer,           // field extends past the end of the buffer
    length_overflow,        // length prefix points past the end of the buffer
    string_too_long,        // value does not fit its length prefix
    too_many_headers,       // header count does not fit nh:1
    invalid_ttl,            // ttl == 0
    invalid_checksum_type,  // csumtype not defined
    unsupported_checksum,   // csumtype defined but no digest registered
    checksum_mismatch,      // digest disagrees with the arguments
    invalid_string,         // non-printable byte in a string view of an argument
    invalid_type,           // call type byte is neither request nor response
};

struct Error
{
    Errc          code{Errc::ok};
    std::size_t   offset{0};
    std::uint64_t value{0};     // offending value: ttl, length, count, computed digest
    std::uint64_t expected{0};  // what the check wanted, if it has an expectation
    bool          is_parse_error{false};
};

Error       make_error(Errc code, std::size_t offset, std::uint64_t value = 0,
                       std::uint64_t expected = 0);
const char *errc_name(Errc code);
std::string describe(const Error &e);

template <typename T>
struct ReadResult
{
    std::optional<Error> err;
    std::size_t          offset{0};
    T                    value{};

    bool ok() const { return !err.has_value(); }

    static ReadResult just(std::size_t offset, T value)
    {
        ReadResult r;
        r.offset = offset;
        r.value  = std::move(value);
        return r;
    }

    static ReadResult error(const Error &e, std::size_t offset)
    {
        ReadResult r;
        r.err    = e;
        r.offset = offset;
        return r;
    }
};

struct WriteResult
{
    std::optional<Error> err;
    std::size_t          offset{0};

    bool ok() const { return !err.has_value(); }

    static WriteResult just(std::size_t offset) { return WriteResult{std::nullopt, offset}; }
    static WriteResult error(const Error &e, std::size_t offset) { return WriteResult{e, offset}; }
};

struct LengthResult
{
    std::optional<Error> err;
    std::size_t          length{0};

    bool ok() const { return !err.has_value(); }

    static LengthResult just(std::size_t length) { return LengthResult{std::nullopt, length}; }
    static LengthResult error(const Error &e) { return LengthResult{e, 0}; }
};

// --- fixed width, big-endian ---
ReadResult<std::uint8_t>  read_u8(const Buffer &buf, std::size_t off);
ReadResult<std::uint16_t> read_u16(const Buffer &buf, std::size_t off);
ReadResult<std::uint32_t> read_u32(const Buffer &buf, std::size_t off);
ReadResult<std::uint64_t> read_u64(const Buffer &buf, std::size_t off);

WriteResult write_u8(std::uint8_t v, Buffer &buf, std::size_t off);
WriteResult write_u16(std::uint16_t v, Buffer &buf, std::size_t off);
WriteResult write_u32(std::uint32_t v, Buffer &buf, std::size_t off);
WriteResult write_u64(std::uint64_t v, Buffer &buf, std::size_t off);

// --- raw spans ---
// Fails with length_overflow when [off, off + n) is not inside buf.
ReadResult<Bytes> read_bytes(const Buffer &buf, std::size_t off, std::size_t n);
WriteResult       write_bytes(const std::uint8_t *p, std::size_t n, Buffer &buf, std::size_t off);

// --- str1: len:1 bytes{len} ---
LengthResult              str1_length(std::string_view s);
ReadResult<std::string>   read_str1(const Buffer &buf, std::size_t off);
WriteResult               write_str1(std::string_view s, Buffer &buf, std::size_t off);
// Validates the prefix and span without copying; value is the payload length.
ReadResult<std::size_t>   skip_str1(const Buffer &buf, std::size_t off);

// --- str2: len:2 bytes{len} ---
LengthResult            str2_length(std::string_view s);
ReadResult<std::string> read_str2(const Buffer &buf, std::size_t off);
WriteResult             write_str2(std::string_view s, Buffer &buf, std::size_t off);

// One byte claimed now and written later, once its final value is known.
// The flags byte of a call body is the only user: fragmentation is decided
// by the argument writer, after the rest of the body is already laid out.
class ByteSlot
{
  public:
    ByteSlot() = default;

    static WriteResult reserve(Buffer &buf, std::size_t at, ByteSlot &out);

    std::size_t position() const { return at_; }
    std::size_t next() const { return at_ + U8_BYTES; }
    bool        committed() const { return committed_; }

    // Patches the reserved byte; the result carries `end`, the offset after the whole write.
    WriteResult commit(std::uint8_t value, std::size_t end);

  private:
    Buffer     *buf_{nullptr};
    std::size_t at_{0};
    bool        committed_{false};
};

}  // namespace wire
