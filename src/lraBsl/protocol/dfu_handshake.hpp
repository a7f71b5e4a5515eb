#pragma once

// DFU entry handshake: Probing -> Confirming -> Ready.
// Loops without limit until the device answers; the operator may need to reset it.

#include <lraBsl/core/config.hpp>
#include <lraBsl/core/types.hpp>
#include <lraBsl/error/result.hpp>
#include <lraBsl/protocol/bsl_defs.hpp>
#include <lraBsl/protocol/response_reader.hpp>
#include <etl/delegate.h>

namespace lraBsl::protocol {

enum class dfu_state : u8 {
    probing = 0,
    confirming,
    ready
};

template <typename TransportT>
class dfu_handshake {
public:
    // Invoked once, the first time a probe goes unanswered
    using notice_t = etl::delegate<void()>;

    dfu_handshake(TransportT& transport, const config::bsl_config& cfg) noexcept
        : transport_(transport), cfg_(cfg) {}

    void set_waiting_notice(notice_t notice) noexcept { notice_ = notice; }

    // Drive the device into DFU mode. Only a transport write failure ends it early.
    result<void> run() noexcept {
        transport_.flush_input();
        state_ = dfu_state::probing;
        bool notified = false;
        while (state_ != dfu_state::ready) {
            const result<void> step = (state_ == dfu_state::probing) ? probe() : confirm();
            if (step.is_error()) {
                return step;
            }
            if (state_ == dfu_state::probing && !notified) {
                notified = true;
                if (notice_.is_valid()) { notice_(); }
            }
        }
        return ok();
    }

    [[nodiscard]] dfu_state state() const noexcept { return state_; }
    [[nodiscard]] u32 probe_count() const noexcept { return probes_; }

private:
    result<void> probe() noexcept {
        ++probes_;
        const u8 probe_byte = dfu_probe;
        const result<void> sent = transport_.write(&probe_byte, 1);
        if (sent.is_error()) { return sent; }
        const optional<u8> reply = read_byte(transport_, cfg_.probe_timeout, cfg_.poll_interval_us);
        if (reply.has_value() && reply.value() == dfu_probe_ack) {
            state_ = dfu_state::confirming;
        }
        return ok();
    }

    result<void> confirm() noexcept {
        const result<void> sent = transport_.write(dfu_token.data(), dfu_token.size());
        if (sent.is_error()) { return sent; }
        const optional<u8> reply = read_byte(transport_, cfg_.probe_timeout, cfg_.poll_interval_us);
        state_ = (reply.has_value() && reply.value() == dfu_confirm_ack) ? dfu_state::ready
                                                                          : dfu_state::probing;
        return ok();
    }

    TransportT& transport_;
    const config::bsl_config& cfg_;
    notice_t notice_{};
    dfu_state state_{dfu_state::probing};
    u32 probes_{0};
};

} // namespace lraBsl::protocol
