#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

#include "proto/checksum.hpp"
#include "proto/rw.hpp"

/*
Argument stream of a call body:

  csumtype:1 (csum:4){0,1} (arg~2)*

The arguments run to the end of the frame. When they do not all fit, the
writer emits the prefix that does, sets FRAGMENT on the caller's flags, and
the digest covers exactly the bytes written. The unwritten tail
(remainder()) goes out in continuation frames, which are not built here.
*/

namespace args
{

using Args = checksum::Args;

inline constexpr std::size_t ARG_MAX = wire::STR2_MAX;

// How much of an argument list fits into `capacity` bytes after the checksum.
struct Fit
{
    std::size_t whole{0};       // leading args written completely
    std::size_t partial{0};     // bytes of args[whole] written, 0 if none
    std::size_t bytes{0};       // encoded width of what is written, checksum included
    bool        fragmented{false};
};

wire::ReadResult<Fit> fit(const checksum::Checksum &csum, const Args &args,
                          std::size_t capacity);
Args                  remainder(const Args &args, const Fit &f);

wire::LengthResult byte_length(const checksum::Checksum &csum, const Args &args);

// Decodes the checksum and every argument up to the end of buf; value = arg count.
wire::ReadResult<std::size_t> read_from(checksum::Checksum &csum, Args &args,
                                        const wire::Buffer &buf, std::size_t off);

// Capacity is the rest of buf. May set FRAGMENT in `flags`; recomputes csum.value.
wire::WriteResult write_into(std::uint8_t &flags, checksum::Checksum &csum, const Args &args,
                             wire::Buffer &buf, std::size_t off);

// arg~2 as raw bytes
namespace argrw
{
wire::LengthResult      byte_length(const wire::Bytes &arg);
wire::ReadResult<wire::Bytes> read_from(const wire::Buffer &buf, std::size_t off);
wire::WriteResult       write_into(const wire::Bytes &arg, wire::Buffer &buf, std::size_t off);
}  // namespace argrw

// arg~2 exposed as text: no ASCII control bytes except tab, CR and LF.
namespace strrw
{
bool                          is_printable(const std::uint8_t *p, std::size_t n);
wire::ReadResult<std::string> read_from(const wire::Buffer &buf, std::size_t off);
}  // namespace strrw

}  // namespace args
