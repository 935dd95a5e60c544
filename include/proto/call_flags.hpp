#pragma once
#include <cstdint>

// flags:1 of call request/response bodies. Only FRAGMENT has defined meaning;
// every other bit is carried through untouched.
namespace call_flags
{

inline constexpr std::uint8_t FRAGMENT = 1 << 0;  // more argument bytes follow in a continuation

inline constexpr bool is_fragment(std::uint8_t flags)
{
    return (flags & FRAGMENT) != 0;
}

inline constexpr std::uint8_t with_fragment(std::uint8_t flags, bool on)
{
    return on ? static_cast<std::uint8_t>(flags | FRAGMENT)
              : static_cast<std::uint8_t>(flags & ~FRAGMENT);
}

}  // namespace call_flags
