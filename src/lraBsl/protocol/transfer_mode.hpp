#pragma once

#include <lraBsl/core/config.hpp>
#include <lraBsl/core/types.hpp>
#include <lraBsl/protocol/bsl_defs.hpp>
#include <lraBsl/protocol/checksum.hpp>

namespace lraBsl::protocol {

// Resolved once at startup, never changed mid-run
enum class transfer_mode : u8 {
    update = 0,
    verify,
    init
};

constexpr opcode block_opcode_for(transfer_mode mode) noexcept {
    return (mode == transfer_mode::verify) ? opcode::rx_data_block_verify : opcode::rx_data_block;
}

constexpr flash_address_t base_address_for(transfer_mode mode, const config::bsl_config& cfg) noexcept {
    return (mode == transfer_mode::init) ? cfg.init_base : cfg.update_base;
}

constexpr const char* mode_banner(transfer_mode mode) noexcept {
    switch (mode) {
        case transfer_mode::init:   return "Initializing";
        case transfer_mode::verify: return "Verifying";
        case transfer_mode::update:
        default:                    return "Updating";
    }
}

/**
 * @brief Mutable per-run transfer state
 *
 * Created at the start of a transfer and discarded once the load-PC
 * response has been obtained.
 */
struct transfer_session {
    opcode block_op{opcode::rx_data_block};
    flash_address_t address{0};
    size_t offset{0};
    size_t remaining{0};
    size_t total{0};
    sum16_accum checksum{};
};

constexpr transfer_session make_session(transfer_mode mode, const config::bsl_config& cfg, size_t image_bytes) noexcept {
    transfer_session session{};
    session.block_op = block_opcode_for(mode);
    session.address = base_address_for(mode, cfg);
    session.remaining = image_bytes;
    session.total = image_bytes;
    return session;
}

} // namespace lraBsl::protocol
