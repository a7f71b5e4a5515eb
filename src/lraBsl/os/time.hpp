#pragma once

#include "../core/types.hpp"
#include "../platform/platform.hpp"

namespace lraBsl::os {

inline timestamp_t time_ms() noexcept { return platform::get_system_time(); }

inline void delay_ms(duration_t milliseconds) noexcept { platform::delay_ms(milliseconds); }
inline void delay_us(u32 microseconds) noexcept { platform::delay_us(microseconds); }

// Absolute deadline helper for timeout-bounded polling loops
class deadline {
public:
    explicit deadline(timeout_ms_t timeout) noexcept
        : expires_at_(time_ms() + static_cast<u32>(timeout)) {}

    [[nodiscard]] bool expired() const noexcept { return time_ms() >= expires_at_; }

private:
    timestamp_t expires_at_;
};

} // namespace lraBsl::os
