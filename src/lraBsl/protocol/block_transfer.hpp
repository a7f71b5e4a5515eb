#pragma once

/*
 * lraBsl Block Transfer Engine
 * - Slices an image into blocks of at most cfg.block_bytes
 * - Each block: OP | ADDR(24, LE) | DATA, framed, followed by one response
 * - Any non-zero status aborts the whole transfer and is returned unchanged
 * - Finishes with LOAD_PC carrying the 16-bit sum of every data byte sent
 *
 * TransportT must provide:
 *   void flush_input() noexcept
 *   result<void> write(const u8* data, size_t len) noexcept
 *   size_t bytes_available() noexcept
 *   size_t read(u8* dst, size_t len) noexcept
 */

#include <lraBsl/core/config.hpp>
#include <lraBsl/core/types.hpp>
#include <lraBsl/error/result.hpp>
#include <lraBsl/protocol/bsl_defs.hpp>
#include <lraBsl/protocol/frame_encoder.hpp>
#include <lraBsl/protocol/response_reader.hpp>
#include <lraBsl/protocol/transfer_mode.hpp>
#include <etl/delegate.h>
#include <etl/vector.h>
#include <cstddef>

namespace lraBsl::protocol {

template <typename TransportT>
class block_transfer {
public:
    // (bytes remaining, total bytes), called once before the first block and
    // again after every accepted block
    using progress_t = etl::delegate<void(size_t, size_t)>;

    block_transfer(TransportT& transport, const config::bsl_config& cfg) noexcept
        : transport_(transport), cfg_(cfg), reader_(transport, cfg) {}

    void set_progress(progress_t progress) noexcept { progress_ = progress; }

    // Stream image into flash and issue LOAD_PC. Returns the device status of
    // the first failing block, or of the LOAD_PC command.
    result<status_t> run(transfer_session& session, byte_view image) noexcept {
        const result<void> valid = config::validate_config(cfg_);
        if (valid.is_error()) {
            return result<status_t>(valid.error());
        }
        if (!is_block_opcode(session.block_op) || session.offset + session.remaining > image.size()) {
            return result<status_t>(error_code::invalid_config);
        }
        report_progress(session);
        while (session.remaining > 0) {
            const size_t num = (session.remaining < cfg_.block_bytes) ? session.remaining : cfg_.block_bytes;

            payload_.clear();
            payload_.push_back(static_cast<u8>(session.block_op));
            payload_.push_back(session.address.low());
            payload_.push_back(session.address.mid());
            payload_.push_back(session.address.high());
            for (size_t i = 0; i < num; ++i) {
                const u8 b = image[session.offset + i];
                payload_.push_back(b);
                session.checksum.add(b);
            }

            const result<status_t> status = exchange(session.block_op);
            if (status.is_error() || status.value() != 0) {
                return status;
            }
            ++blocks_sent_;

            session.address += static_cast<u32>(num);
            session.offset += num;
            session.remaining -= num;
            report_progress(session);
        }

        const u16 sum = session.checksum.value();
        payload_.clear();
        payload_.push_back(static_cast<u8>(opcode::load_pc));
        payload_.push_back(0x00); // reserved
        payload_.push_back(static_cast<u8>(sum & 0xFFU));
        payload_.push_back(static_cast<u8>(sum >> 8));
        return exchange(opcode::load_pc);
    }

    [[nodiscard]] size_t blocks_sent() const noexcept { return blocks_sent_; }

private:
    void report_progress(const transfer_session& session) noexcept {
        if (progress_.is_valid()) { progress_(session.remaining, session.total); }
    }

    // Send the current payload as one frame and collect its response
    result<status_t> exchange(opcode op) noexcept {
        if (!encode_frame(byte_view(payload_.data(), payload_.size()), frame_)) {
            return result<status_t>(error_code::invalid_config);
        }
        // Stale input must not be mistaken for this command's response
        transport_.flush_input();
        const result<void> sent = transport_.write(frame_.data(), frame_.size());
        if (sent.is_error()) {
            return result<status_t>(sent.error());
        }
        if (op == opcode::rx_data_block_fast) {
            // Fast blocks are acknowledged by a single raw status byte.
            // A missing ack is a timeout like any other response byte.
            const optional<u8> ack = read_byte(transport_, cfg_.response_timeout, cfg_.poll_interval_us);
            if (!ack.has_value()) { return result<status_t>(error_code::timeout); }
            return result<status_t>(static_cast<status_t>(ack.value()));
        }
        return reader_.read_response();
    }

    TransportT& transport_;
    const config::bsl_config& cfg_;
    response_reader<TransportT> reader_;
    progress_t progress_{};
    etl::vector<u8, block_prefix_bytes + config::max_block_bytes> payload_{};
    frame_buffer frame_{};
    size_t blocks_sent_{0};
};

} // namespace lraBsl::protocol
