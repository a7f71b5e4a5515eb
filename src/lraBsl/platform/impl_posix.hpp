#pragma once

#include "../core/types.hpp"

#include <time.h>
#include <unistd.h>

namespace lraBsl::platform::impl_posix {

inline timestamp_t get_system_time_us() noexcept {
    timespec ts{};
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<timestamp_t>(ts.tv_sec) * 1000000ULL + static_cast<timestamp_t>(ts.tv_nsec / 1000);
}
inline timestamp_t get_system_time() noexcept { return get_system_time_us() / 1000ULL; }

inline void delay_ms(duration_t ms) noexcept { usleep(static_cast<useconds_t>(ms * 1000ULL)); }
inline void delay_us(u32 us) noexcept { usleep(static_cast<useconds_t>(us)); }

} // namespace lraBsl::platform::impl_posix
