#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <unordered_map>
#include <vector>

#include "proto/rw.hpp"

namespace frame
{
struct Frame;
}

// csumtype:1 (csum:4){0,1}
namespace checksum
{

enum class Type : std::uint8_t
{
    None       = 0x00,
    Crc32      = 0x01,
    FarmHash32 = 0x02,
    Crc32C     = 0x03,
};

inline constexpr std::size_t VALUE_WIDTH = 4;

using Args = std::vector<wire::Bytes>;

// Digest over the concatenated argument bytes. `prior` is the digest of the
// preceding frames of the same message (0 for the first frame).
using DigestFn = std::function<std::uint32_t(const Args &args, std::uint32_t prior)>;

bool        is_defined(std::uint8_t type);
const char *type_name(Type t);

// Type tag -> digest function. global() comes with Crc32 and Crc32C;
// FarmHash32 is a defined wire type with no built-in digest.
class Registry
{
  public:
    static Registry &global();

    void            add(Type t, DigestFn fn);
    void            remove(Type t);
    const DigestFn *find(Type t) const;

  private:
    std::unordered_map<std::uint8_t, DigestFn> fns_;
};

struct Checksum
{
    Type          type{Type::None};
    std::uint32_t value{0};

    Checksum() = default;
    explicit Checksum(Type t, std::uint32_t v = 0) : type(t), value(v) {}

    bool operator==(const Checksum &o) const
    {
        // value is meaningless without digest bytes
        return type == o.type && (type == Type::None || value == o.value);
    }
    bool operator!=(const Checksum &o) const { return !(*this == o); }

    // Recomputes `value` over args; fails for types without a registered digest.
    std::optional<wire::Error> update(const Args &args, std::uint32_t prior = 0);

    // nullopt: verified. Otherwise checksum_mismatch (value = computed,
    // expected = carried) or the error from computing the digest.
    std::optional<wire::Error> verify(const Args &args, std::uint32_t prior = 0) const;
};

wire::LengthResult             byte_length(Type t);
wire::ReadResult<Checksum>     read_from(const wire::Buffer &buf, std::size_t off);
wire::WriteResult              write_into(const Checksum &c, wire::Buffer &buf, std::size_t off);
wire::ReadResult<std::size_t>  lazy_skip(const frame::Frame &f, std::size_t off);
wire::ReadResult<std::uint32_t> compute(Type t, const Args &args, std::uint32_t prior = 0,
                                        const Registry &reg = Registry::global());

// Chainable: crc32(crc32(0, a), b) == crc32(0, a || b)
std::uint32_t crc32(std::uint32_t prior, const std::uint8_t *p, std::size_t n);
std::uint32_t crc32c(std::uint32_t prior, const std::uint8_t *p, std::size_t n);

}  // namespace checksum
