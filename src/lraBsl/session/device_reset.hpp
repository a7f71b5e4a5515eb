#pragma once

// Ways to get a running LRA1 back into its bootloader before the handshake.
//
// TransportT must provide flush_input(), flush_output(),
// write(const u8*, size_t), send_break(duration_t) and set_dtr(bool).

#include <lraBsl/core/config.hpp>
#include <lraBsl/error/result.hpp>
#include <lraBsl/os/time.hpp>
#include <lraBsl/protocol/bsl_defs.hpp>

namespace lraBsl::session {

// Pulse DTR low (reset line) and give the device time to come up
template <typename TransportT>
result<void> reset_by_dtr(TransportT& transport, const config::bsl_config& cfg) noexcept {
    const result<void> low = transport.set_dtr(false);
    if (low.is_error()) { return low; }
    os::delay_ms(cfg.dtr_low_ms);
    const result<void> high = transport.set_dtr(true);
    if (high.is_error()) { return high; }
    os::delay_ms(cfg.dtr_settle_ms);
    return ok();
}

// Break, then the "\x03RESET\r\n" token understood by the application firmware
template <typename TransportT>
result<void> reset_by_command(TransportT& transport, const config::bsl_config& cfg) noexcept {
    transport.flush_input();
    transport.flush_output();
    const result<void> brk = transport.send_break(cfg.break_ms);
    if (brk.is_error()) { return brk; }
    const auto& token = protocol::reset_token;
    const result<void> sent = transport.write(token.data(), token.size());
    if (sent.is_error()) { return sent; }
    os::delay_ms(cfg.sw_reset_settle_ms);
    return ok();
}

} // namespace lraBsl::session
