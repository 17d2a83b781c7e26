#pragma once
#include <stdint.h>
#include <chrono>
#include <thread>

// Monotonic milliseconds since an arbitrary epoch
inline uint32_t clock_ms() {
    return (uint32_t)std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

inline void sleep_ms(uint32_t ms) {
    if (ms == 0) return;
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}
