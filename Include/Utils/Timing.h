/**
 * @file Timing.h
 * @brief Platform-agnostic tick and delay utilities
 * @details The emulation engine stamps every transaction log entry with
 *          get_tick_ms(). The tick must be monotonic; its resolution may be
 *          coarse, so several entries can share one value.
 *
 * Usage:
 *   #include "Utils/Timing.h"
 *
 *   auto start = utils::get_tick_ms();
 *   // ... reader exchange ...
 *   auto elapsed = utils::elapsed_ms(start);
 */

#ifndef UTILS_TIMING_H
#define UTILS_TIMING_H

#include <stdint.h>

// Platform detection
#if defined(_WIN32) || defined(_WIN64)
    #define PLATFORM_WINDOWS
#elif defined(__linux__) || defined(__unix__)
    #define PLATFORM_LINUX
#elif defined(ARDUINO)
    #define PLATFORM_ARDUINO
#elif defined(__arm__) || defined(__thumb__)
    #define PLATFORM_EMBEDDED_ARM
#else
    #define PLATFORM_GENERIC
#endif

#if defined(PLATFORM_WINDOWS)
    #include <windows.h>
    #include <thread>
    #include <chrono>
#elif defined(PLATFORM_LINUX)
    #include <unistd.h>
    #include <time.h>
#elif defined(PLATFORM_ARDUINO)
    #include <Arduino.h>
#elif defined(PLATFORM_EMBEDDED_ARM)
    // Provided by the board support package (SysTick, HAL_GetTick, ...)
    extern "C" {
        void platform_delay_ms(uint32_t milliseconds);
        uint32_t platform_get_tick_ms(void);
    }
#endif

namespace utils {

/**
 * @brief Delay execution for the specified number of milliseconds
 * @note Never call this from an emulation handler; the reader is waiting.
 * @param milliseconds Number of milliseconds to delay
 */
inline void delay_ms(uint32_t milliseconds)
{
#if defined(PLATFORM_WINDOWS)
    std::this_thread::sleep_for(std::chrono::milliseconds(milliseconds));
#elif defined(PLATFORM_LINUX)
    usleep(milliseconds * 1000);
#elif defined(PLATFORM_ARDUINO)
    delay(milliseconds);
#elif defined(PLATFORM_EMBEDDED_ARM)
    platform_delay_ms(milliseconds);
#else
    #warning "No platform-specific delay implementation, using busy-wait"
    volatile uint32_t count = milliseconds * 1000;
    while (count--) {
        __asm__ __volatile__("nop");
    }
#endif
}

/**
 * @brief Get current monotonic tick count in milliseconds
 * @return Current tick count in milliseconds
 * @note Wraps around after ~49 days
 */
inline uint32_t get_tick_ms()
{
#if defined(PLATFORM_WINDOWS)
    auto now = std::chrono::steady_clock::now();
    return static_cast<uint32_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count()
    );
#elif defined(PLATFORM_LINUX)
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<uint32_t>((ts.tv_sec * 1000) + (ts.tv_nsec / 1000000));
#elif defined(PLATFORM_ARDUINO)
    return millis();
#elif defined(PLATFORM_EMBEDDED_ARM)
    return platform_get_tick_ms();
#else
    #warning "No platform-specific tick implementation"
    return 0;
#endif
}

/**
 * @brief Calculate elapsed time since a start tick, handling wraparound
 * @param start_tick Start tick count (from get_tick_ms)
 * @param current_tick Current tick count, or 0 to use the current time
 * @return Elapsed time in milliseconds
 */
inline uint32_t elapsed_ms(uint32_t start_tick, uint32_t current_tick = 0)
{
    if (current_tick == 0) {
        current_tick = get_tick_ms();
    }

    return current_tick - start_tick;
}

} // namespace utils

#endif // UTILS_TIMING_H
