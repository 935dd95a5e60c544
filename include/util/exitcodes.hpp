#pragma once

namespace exitc
{
inline constexpr int ok                = 0;
inline constexpr int bad_args          = 2;
inline constexpr int decode_error      = 3;
inline constexpr int checksum_mismatch = 4;
inline constexpr int encode_error      = 5;
}  // namespace exitc
