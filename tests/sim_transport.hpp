#pragma once

// Test doubles: a recording transport and a scripted LRA1 bootloader behind it.

#include <lraBsl/core/config.hpp>
#include <lraBsl/core/types.hpp>
#include <lraBsl/error/result.hpp>
#include <lraBsl/protocol/bsl_defs.hpp>
#include <lraBsl/protocol/checksum.hpp>

#include <deque>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace lraBsl::test {

using bytes = std::vector<u8>;

class sim_transport {
public:
    // --- transport contract ---
    void flush_input() noexcept {
        ++input_flushes;
        events.emplace_back("flush_in");
        rx_.clear();
    }

    void flush_output() noexcept {
        events.emplace_back("flush_out");
    }

    result<void> write(const u8* data, size_t len) noexcept {
        if (fail_writes) {
            return result<void>(error_code::io_error);
        }
        bytes chunk(data, data + len);
        writes.push_back(chunk);
        events.emplace_back("write");
        if (on_write) { on_write(*this, chunk); }
        return ok();
    }

    size_t bytes_available() noexcept { return rx_.size(); }

    size_t read(u8* dst, size_t len) noexcept {
        size_t n = 0;
        while (n < len && !rx_.empty()) {
            dst[n++] = rx_.front();
            rx_.pop_front();
        }
        return n;
    }

    result<void> send_break(duration_t ms) noexcept {
        events.push_back("break:" + std::to_string(ms));
        return ok();
    }

    result<void> set_dtr(bool asserted) noexcept {
        events.emplace_back(asserted ? "dtr_high" : "dtr_low");
        return ok();
    }

    // --- test controls ---
    void queue_rx(const bytes& data) { rx_.insert(rx_.end(), data.begin(), data.end()); }

    std::function<void(sim_transport&, const bytes&)> on_write;
    std::vector<bytes> writes;
    std::vector<std::string> events;
    size_t input_flushes{0};
    bool fail_writes{false};

private:
    std::deque<u8> rx_;
};

// Bootloader model answering the handshake and framed commands
class sim_bootloader {
public:
    explicit sim_bootloader(sim_transport& transport) {
        transport.on_write = [this](sim_transport& t, const bytes& chunk) { handle(t, chunk); };
    }

    static bytes response(status_t status, u8 header = protocol::bsl_header) {
        bytes r(8, 0x00);
        r[0] = static_cast<u8>((status >> 8) & 0xFF);
        r[1] = header;
        r[5] = static_cast<u8>(status & 0xFF);
        return r;
    }

    size_t block_count() const {
        size_t n = 0;
        for (const auto& p : payloads) {
            if (!p.empty() && p[0] != static_cast<u8>(protocol::opcode::load_pc)) { ++n; }
        }
        return n;
    }

    // script
    u32 ignored_probes{0};                 // probes met with silence before 0x55
    u32 rejected_tokens{0};                // token confirmations answered with 0x00
    std::map<size_t, status_t> block_status; // 1-based block index -> status
    status_t load_pc_status{0};
    bool silent_frames{false};
    u8 response_header{protocol::bsl_header};

    // observations
    u32 probes{0};
    u32 tokens{0};
    std::vector<bytes> payloads;
    bool frames_valid{true};

private:
    void handle(sim_transport& t, const bytes& chunk) {
        if (chunk.size() == 1 && chunk[0] == protocol::dfu_probe) {
            ++probes;
            if (probes > ignored_probes) { t.queue_rx({protocol::dfu_probe_ack}); }
            return;
        }
        const bytes token(protocol::dfu_token.begin(), protocol::dfu_token.end());
        if (chunk == token) {
            ++tokens;
            t.queue_rx({tokens > rejected_tokens ? protocol::dfu_confirm_ack : u8{0x00}});
            return;
        }
        if (chunk.size() >= protocol::frame_overhead && chunk[0] == protocol::bsl_header) {
            const size_t len = static_cast<size_t>(chunk[1]) | (static_cast<size_t>(chunk[2]) << 8);
            if (chunk.size() != len + protocol::frame_overhead) {
                frames_valid = false;
                return;
            }
            bytes payload(chunk.begin() + 3, chunk.begin() + 3 + static_cast<long>(len));
            const u16 crc = protocol::crc16_ccitt(payload.data(), payload.size());
            if (chunk[3 + len] != (crc & 0xFF) || chunk[4 + len] != (crc >> 8)) {
                frames_valid = false;
            }
            payloads.push_back(payload);

            status_t status = 0;
            if (payload[0] == static_cast<u8>(protocol::opcode::load_pc)) {
                status = load_pc_status;
            } else {
                const auto it = block_status.find(block_count());
                if (it != block_status.end()) { status = it->second; }
            }
            if (!silent_frames) { t.queue_rx(response(status, response_header)); }
        }
    }
};

// Shortened timings so silent-device paths finish quickly
inline config::bsl_config fast_config() {
    config::bsl_config cfg = config::default_config();
    cfg.probe_timeout = timeout_ms_t(1);
    cfg.response_timeout = timeout_ms_t(5);
    cfg.poll_interval_us = 100;
    cfg.break_ms = 0;
    cfg.dtr_low_ms = 0;
    cfg.dtr_settle_ms = 0;
    cfg.sw_reset_settle_ms = 0;
    return cfg;
}

// Deterministic image content with the LRA1 signature in place
inline bytes make_image_bytes(size_t size, size_t signature_offset = LRABSL_SIGNATURE_OFFSET) {
    bytes data(size);
    for (size_t i = 0; i < size; ++i) {
        data[i] = static_cast<u8>((i * 7U + 3U) & 0xFFU);
    }
    const auto& sig = protocol::image_signature;
    for (size_t i = 0; i < sig.size() && signature_offset + i < size; ++i) {
        data[signature_offset + i] = sig[i];
    }
    return data;
}

inline u16 sum16(const bytes& data) {
    u32 sum = 0;
    for (const u8 b : data) { sum += b; }
    return static_cast<u16>(sum & 0xFFFFU);
}

} // namespace lraBsl::test
