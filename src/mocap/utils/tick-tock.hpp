#pragma once

#include <chrono>

namespace mocap
{
using timepoint_type = std::chrono::time_point<std::chrono::steady_clock>;

inline timepoint_type tick() noexcept
{
   return std::chrono::steady_clock::now();
}

// Seconds since `whence`
inline double tock(const timepoint_type& whence) noexcept
{
   return std::chrono::duration<double>(tick() - whence).count();
}

} // namespace mocap
