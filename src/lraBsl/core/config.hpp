#pragma once

#include <cstddef>

#include "types.hpp"
#include "../error/result.hpp"

#define LRABSL_VERSION "1.01" /* NOLINT(cppcoreguidelines-macro-usage) */

// Serial link
#ifndef LRABSL_BAUD_RATE
#define LRABSL_BAUD_RATE 115200
#endif

// Timeouts (ms) and polling granularity (us)
#ifndef LRABSL_PROBE_TIMEOUT_MS
#define LRABSL_PROBE_TIMEOUT_MS 50
#endif
#ifndef LRABSL_RESPONSE_TIMEOUT_MS
#define LRABSL_RESPONSE_TIMEOUT_MS 1000
#endif
#ifndef LRABSL_POLL_INTERVAL_US
#define LRABSL_POLL_INTERVAL_US 1000
#endif

// Firmware file bounds
#ifndef LRABSL_IMAGE_MIN_BYTES
#define LRABSL_IMAGE_MIN_BYTES 4096
#endif
#ifndef LRABSL_IMAGE_MAX_BYTES
#define LRABSL_IMAGE_MAX_BYTES 120000
#endif
#ifndef LRABSL_SIGNATURE_OFFSET
#define LRABSL_SIGNATURE_OFFSET 0xB8
#endif

// Flash layout
#ifndef LRABSL_UPDATE_BASE_ADDRESS
#define LRABSL_UPDATE_BASE_ADDRESS 0x002000
#endif
#ifndef LRABSL_INIT_BASE_ADDRESS
#define LRABSL_INIT_BASE_ADDRESS 0x01FE00
#endif
#ifndef LRABSL_INIT_IMAGE_BYTES
#define LRABSL_INIT_IMAGE_BYTES 512
#endif

// Transfer shape
#ifndef LRABSL_MAX_BLOCK_BYTES
#define LRABSL_MAX_BLOCK_BYTES 256
#endif
#ifndef LRABSL_RESPONSE_BYTES
#define LRABSL_RESPONSE_BYTES 8
#endif

// Reset sequencing (ms)
#ifndef LRABSL_BREAK_MS
#define LRABSL_BREAK_MS 1
#endif
#ifndef LRABSL_DTR_LOW_MS
#define LRABSL_DTR_LOW_MS 100
#endif
#ifndef LRABSL_DTR_SETTLE_MS
#define LRABSL_DTR_SETTLE_MS 50
#endif
#ifndef LRABSL_SW_RESET_SETTLE_MS
#define LRABSL_SW_RESET_SETTLE_MS 100
#endif

namespace lraBsl::config {

// Buffer capacities fixed at compile time (no dynamic allocation)
constexpr size_t image_capacity = LRABSL_IMAGE_MAX_BYTES;
constexpr size_t max_block_bytes = LRABSL_MAX_BLOCK_BYTES;
constexpr size_t max_response_bytes = 16;
constexpr size_t init_image_bytes = LRABSL_INIT_IMAGE_BYTES;

static_assert(max_block_bytes >= 1, "LRABSL_MAX_BLOCK_BYTES must be >= 1");
static_assert(max_block_bytes <= 0xFFFF - 4, "LRABSL_MAX_BLOCK_BYTES must fit a 16-bit frame length");
static_assert(LRABSL_RESPONSE_BYTES <= max_response_bytes, "LRABSL_RESPONSE_BYTES too large");
static_assert(LRABSL_IMAGE_MIN_BYTES <= LRABSL_IMAGE_MAX_BYTES, "image size bounds inverted");

/**
 * @brief Immutable protocol configuration
 *
 * Built once at startup and passed by const reference to every component.
 * Tests construct their own copy with shortened timeouts.
 */
struct bsl_config {
    u32 baud_rate{LRABSL_BAUD_RATE};

    timeout_ms_t probe_timeout{LRABSL_PROBE_TIMEOUT_MS};
    timeout_ms_t response_timeout{LRABSL_RESPONSE_TIMEOUT_MS};
    u32 poll_interval_us{LRABSL_POLL_INTERVAL_US};

    size_t image_min_bytes{LRABSL_IMAGE_MIN_BYTES};
    size_t image_max_bytes{LRABSL_IMAGE_MAX_BYTES};
    size_t signature_offset{LRABSL_SIGNATURE_OFFSET};

    flash_address_t update_base{LRABSL_UPDATE_BASE_ADDRESS};
    flash_address_t init_base{LRABSL_INIT_BASE_ADDRESS};

    size_t block_bytes{LRABSL_MAX_BLOCK_BYTES};
    size_t response_bytes{LRABSL_RESPONSE_BYTES};

    duration_t break_ms{LRABSL_BREAK_MS};
    duration_t dtr_low_ms{LRABSL_DTR_LOW_MS};
    duration_t dtr_settle_ms{LRABSL_DTR_SETTLE_MS};
    duration_t sw_reset_settle_ms{LRABSL_SW_RESET_SETTLE_MS};
};

constexpr bsl_config default_config() noexcept { return bsl_config{}; }

// Reject configurations the fixed-capacity buffers cannot honour
inline result<void> validate_config(const bsl_config& cfg) noexcept {
    if (cfg.block_bytes == 0 || cfg.block_bytes > max_block_bytes) {
        return result<void>(error_code::invalid_config);
    }
    if (cfg.response_bytes == 0 || cfg.response_bytes > max_response_bytes) {
        return result<void>(error_code::invalid_config);
    }
    if (cfg.image_min_bytes > cfg.image_max_bytes || cfg.image_max_bytes > image_capacity) {
        return result<void>(error_code::invalid_config);
    }
    return ok();
}

}  // namespace lraBsl::config
