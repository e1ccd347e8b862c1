#pragma once

namespace exitc
{
inline constexpr int ok         = 0;
inline constexpr int bad_args   = 2;
inline constexpr int no_backend = 3;  // bus / bluetoothctl unreachable
inline constexpr int partial    = 4;  // some matched devices failed the action
inline constexpr int no_match   = 5;  // filter matched nothing
}  // namespace exitc
