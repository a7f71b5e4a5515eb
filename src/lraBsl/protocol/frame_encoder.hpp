// lraBsl Frame Encoder - wraps a command payload into the BSL wire frame
// - State machine driven, one byte per step
// - Length and CRC little-endian; CRC covers the payload only
// - No RTTI, no dynamic allocation; header-only; ETL

#pragma once

#include <lraBsl/core/config.hpp>
#include <lraBsl/core/types.hpp>
#include <lraBsl/protocol/bsl_defs.hpp>
#include <lraBsl/protocol/checksum.hpp>
#include <etl/vector.h>
#include <cstddef>

namespace lraBsl::protocol {

// Encoder state machine states
enum class encode_state : u8 {
    ENCODE_HEADER = 0,
    ENCODE_LENGTH_LOW,
    ENCODE_LENGTH_HIGH,
    ENCODE_PAYLOAD,
    ENCODE_CRC_LOW,
    ENCODE_CRC_HIGH,
    ENCODE_COMPLETE
};

// Largest frame the transfer engine ever builds
inline constexpr size_t max_frame_bytes = frame_overhead + block_prefix_bytes + config::max_block_bytes;
using frame_buffer = etl::vector<u8, max_frame_bytes>;

class frame_encoder {
public:
    frame_encoder() = default;
    frame_encoder(const frame_encoder&) = delete;
    frame_encoder& operator=(const frame_encoder&) = delete;

    // Start encoding a payload. The payload must outlive the encode steps.
    bool start_encode(byte_view payload) noexcept {
        if (payload.size() > 0xFFFFU) {
            state_ = encode_state::ENCODE_COMPLETE;
            return false;
        }
        payload_ = payload;
        payload_index_ = 0;
        crc_.reset();
        for (const u8 b : payload_) { crc_.add(b); }
        state_ = encode_state::ENCODE_HEADER;
        return true;
    }

    // Step the state machine, emitting one byte at a time via reference
    bool encode_step(u8& out_byte) noexcept {
        switch (state_) {
            case encode_state::ENCODE_HEADER: {
                out_byte = bsl_header;
                state_ = encode_state::ENCODE_LENGTH_LOW;
                return true;
            }
            case encode_state::ENCODE_LENGTH_LOW: {
                out_byte = static_cast<u8>(payload_.size() & 0xFFU);
                state_ = encode_state::ENCODE_LENGTH_HIGH;
                return true;
            }
            case encode_state::ENCODE_LENGTH_HIGH: {
                out_byte = static_cast<u8>((payload_.size() >> 8) & 0xFFU);
                state_ = encode_state::ENCODE_PAYLOAD;
                return true;
            }
            case encode_state::ENCODE_PAYLOAD:
                if (payload_index_ < payload_.size()) {
                    out_byte = payload_[payload_index_++];
                    return true;
                }
                state_ = encode_state::ENCODE_CRC_LOW;
                [[fallthrough]];
            case encode_state::ENCODE_CRC_LOW: {
                out_byte = static_cast<u8>(crc_.value() & 0xFFU);
                state_ = encode_state::ENCODE_CRC_HIGH;
                return true;
            }
            case encode_state::ENCODE_CRC_HIGH: {
                out_byte = static_cast<u8>(crc_.value() >> 8);
                state_ = encode_state::ENCODE_COMPLETE;
                return true;
            }
            case encode_state::ENCODE_COMPLETE:
            default:
                return false;
        }
    }

    [[nodiscard]] encode_state state() const noexcept { return state_; }

private:
    encode_state state_{encode_state::ENCODE_COMPLETE};
    byte_view payload_{};
    size_t payload_index_{0};
    crc16_accum crc_{};
};

// Build a complete frame into out (cleared first). Returns false if it does not fit.
inline bool encode_frame(byte_view payload, etl::ivector<u8>& out) noexcept {
    out.clear();
    if (payload.size() + frame_overhead > out.capacity()) { return false; }
    frame_encoder encoder;
    if (!encoder.start_encode(payload)) { return false; }
    u8 byte = 0;
    while (encoder.encode_step(byte)) {
        out.push_back(byte);
    }
    return true;
}

} // namespace lraBsl::protocol
