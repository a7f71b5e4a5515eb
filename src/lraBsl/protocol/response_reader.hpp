#pragma once

/*
 * lraBsl Response Reader
 * - Collects a fixed-length bootloader response one byte at a time
 * - Every byte is bounded by its own timeout (poll + short sleep, never blocks)
 * - Status decoding is a pure function over the collected window
 *
 * TransportT must provide:
 *   size_t bytes_available() noexcept
 *   size_t read(u8* dst, size_t len) noexcept
 */

#include <lraBsl/core/config.hpp>
#include <lraBsl/core/types.hpp>
#include <lraBsl/error/result.hpp>
#include <lraBsl/os/time.hpp>
#include <lraBsl/protocol/bsl_defs.hpp>
#include <etl/array.h>
#include <cstddef>

namespace lraBsl::protocol {

// Read a single byte, polling until one is available or the timeout elapses
template <typename TransportT>
optional<u8> read_byte(TransportT& transport, timeout_ms_t timeout, u32 poll_interval_us) noexcept {
    const os::deadline until(timeout);
    while (true) {
        if (transport.bytes_available() > 0) {
            u8 byte = 0;
            if (transport.read(&byte, 1) == 1) { return byte; }
        }
        if (until.expired()) { return etl::nullopt; }
        os::delay_us(poll_interval_us);
    }
}

// Decode a response window: [1] must be the header, status = [0] << 8 | [5].
// Positions other than 0, 1 and 5 are reserved and ignored.
inline result<status_t> decode_status(byte_view window) noexcept {
    if (window.size() >= 2 && window[1] != bsl_header) {
        return result<status_t>(error_code::malformed_frame);
    }
    status_t status = 0;
    if (!window.empty()) {
        status = static_cast<status_t>(window[0]) << 8;
    }
    if (window.size() > 5) {
        status |= static_cast<status_t>(window[5]);
    }
    return result<status_t>(status);
}

template <typename TransportT>
class response_reader {
public:
    response_reader(TransportT& transport, const config::bsl_config& cfg) noexcept
        : transport_(transport), cfg_(cfg) {}

    // Read the configured response length
    result<status_t> read_response() noexcept { return read_response(cfg_.response_bytes); }

    result<status_t> read_response(size_t expected_len) noexcept {
        if (expected_len > window_.size()) {
            return result<status_t>(error_code::invalid_config);
        }
        for (size_t i = 0; i < expected_len; ++i) {
            const optional<u8> byte = read_byte(transport_, cfg_.response_timeout, cfg_.poll_interval_us);
            if (!byte.has_value()) {
                return result<status_t>(error_code::timeout);
            }
            window_[i] = byte.value();
        }
        return decode_status(byte_view(window_.data(), expected_len));
    }

private:
    TransportT& transport_;
    const config::bsl_config& cfg_;
    etl::array<u8, config::max_response_bytes> window_{};
};

} // namespace lraBsl::protocol
