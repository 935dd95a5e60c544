#pragma once
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>

#include "util/log.hpp"

namespace constants
{
// Outer frame envelope: size:2 type:1 reserved:1 id:4 reserved:8
inline constexpr std::size_t FRAME_OVERHEAD = 16;
inline constexpr std::size_t MAX_FRAME_SIZE = 0xFFFF;
// smallest limit accepted from the environment
inline constexpr std::size_t MIN_FRAME_SIZE = FRAME_OVERHEAD + 64;

inline constexpr const char *ENV_LOG_LEVEL      = "TCHAN_LOG_LEVEL";
inline constexpr const char *ENV_MAX_FRAME_SIZE = "TCHAN_MAX_FRAME_SIZE";

// Frame-size limit for encoding, from TCHAN_MAX_FRAME_SIZE or MAX_FRAME_SIZE.
[[maybe_unused]] static std::size_t max_frame_size()
{
    const char *p = std::getenv(ENV_MAX_FRAME_SIZE);
    if (!p || !*p)
        return MAX_FRAME_SIZE;

    char *end = nullptr;
    errno     = 0;
    unsigned long v = std::strtoul(p, &end, 10);
    if (errno != 0 || end == p || *end != '\0')
    {
        LOG_WARN("ignoring %s=%s (not a number)", ENV_MAX_FRAME_SIZE, p);
        return MAX_FRAME_SIZE;
    }
    if (v < MIN_FRAME_SIZE)
    {
        LOG_WARN("%s=%lu below minimum, using %zu", ENV_MAX_FRAME_SIZE, v, MIN_FRAME_SIZE);
        return MIN_FRAME_SIZE;
    }
    if (v > MAX_FRAME_SIZE)
    {
        LOG_WARN("%s=%lu above maximum, using %zu", ENV_MAX_FRAME_SIZE, v, MAX_FRAME_SIZE);
        return MAX_FRAME_SIZE;
    }
    return static_cast<std::size_t>(v);
}

// Apply TCHAN_LOG_LEVEL; unset leaves the current level alone.
[[maybe_unused]] static void init_log_from_env()
{
    const char *p = std::getenv(ENV_LOG_LEVEL);
    if (!p || !*p)
        return;
    auto lv = tchan::parse_level(p);
    if (!lv)
    {
        LOG_WARN("unknown %s=%s, using info", ENV_LOG_LEVEL, p);
        tchan::set_log_level(tchan::Level::Info);
        return;
    }
    tchan::set_log_level(*lv);
}

}  // namespace constants
