#pragma once

#include "../core/types.hpp"
#include "../platform/platform.hpp"
#include "result.hpp"

namespace lraBsl {
namespace error {

/**
 * @brief Operator-facing text for a local failure
 */
constexpr const char* describe(error_code code) noexcept {
    switch (code) {
        case error_code::success:          return "success";
        case error_code::file_open_failed: return "file could not be opened";
        case error_code::invalid_image:    return "not an LRA1 update file";
        case error_code::port_open_failed: return "serial device not open";
        case error_code::timeout:          return "no response from bootloader";
        case error_code::malformed_frame:  return "malformed bootloader response";
        case error_code::io_error:         return "serial I/O failure";
        case error_code::invalid_config:   return "invalid configuration";
        default:                           return "unknown error";
    }
}

/**
 * @brief Failure record produced when a run aborts
 */
struct error_context {
    error_code code{error_code::success};
    status_t status{0};        // integer surfaced to the operator
    bool device_reported{false};
};

/**
 * @brief Context for a local failure
 */
inline error_context make_context(error_code code) noexcept {
    error_context ctx;
    ctx.code = code;
    ctx.status = to_status(code);
    return ctx;
}

/**
 * @brief Context for a non-zero status returned by the bootloader
 */
inline error_context make_device_context(status_t status) noexcept {
    error_context ctx;
    ctx.status = status;
    ctx.device_reported = true;
    return ctx;
}

/**
 * @brief Collapse a session result into the integer result of the run
 */
inline status_t to_run_status(const result<status_t>& outcome) noexcept {
    return outcome.is_error() ? to_status(outcome.error()) : outcome.value();
}

/**
 * @brief Log a failure; the numeric status is always part of the message
 */
inline void report_error(const error_context& ctx) noexcept {
    if (ctx.device_reported) {
        platform::logf("bootloader reported status %d (0x%04x)",
                       static_cast<int>(ctx.status),
                       static_cast<unsigned>(ctx.status) & 0xFFFFU);
    } else {
        platform::logf("%s (%d)", describe(ctx.code), static_cast<int>(ctx.status));
    }
}

} // namespace error
} // namespace lraBsl
