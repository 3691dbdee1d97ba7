#pragma once

#include <chrono>
#include <cstdint>

namespace sorter {

// wall-clock microseconds, same unit as buffer timestamps
inline int64_t now_us()
{
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count();
}

} // namespace sorter
