#pragma once

#include "../core/types.hpp"
#include <cstdio>

// The serial transport needs termios; only POSIX hosts are supported
#if !defined(LRABSL_PLATFORM_POSIX)
  #if defined(__unix__) || defined(__APPLE__)
    #define LRABSL_PLATFORM_POSIX
  #else
    #error "lraBsl requires a POSIX host"
  #endif
#endif

#include "impl_posix.hpp"
namespace lraBsl::platform { namespace impl = lraBsl::platform::impl_posix; }

namespace lraBsl::platform {

inline timestamp_t get_system_time() noexcept { return impl::get_system_time(); }
inline void delay_ms(duration_t milliseconds) noexcept { impl::delay_ms(milliseconds); }
inline void delay_us(u32 microseconds) noexcept { impl::delay_us(microseconds); }

// Centralized logging
#ifndef LRABSL_ENABLE_LOGGING
#define LRABSL_ENABLE_LOGGING 1 /* NOLINT(cppcoreguidelines-macro-usage) */
#endif

namespace detail {
inline void log_sink(const char* msg) noexcept {
    if (msg) { std::puts(msg); }
}
} // namespace detail

inline void log(const char* message) noexcept {
#if LRABSL_ENABLE_LOGGING
    detail::log_sink(message);
#else
    (void)message;
#endif
}

template<typename... Args>
inline void logf(const char* fmt, Args... args) noexcept {
#if LRABSL_ENABLE_LOGGING
    char buffer[256]; std::snprintf(buffer, sizeof(buffer), fmt, args...); /* NOLINT(cppcoreguidelines-pro-type-vararg,hicpp-vararg,cppcoreguidelines-pro-bounds-array-to-pointer-decay) */ log(buffer);
#else
    (void)fmt; ((void)args, ...);
#endif
}

} // namespace lraBsl::platform
