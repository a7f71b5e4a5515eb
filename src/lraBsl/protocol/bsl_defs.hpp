#pragma once

// LRA1 bootloader (BSL) wire vocabulary.
//
// Frame:    0x80 | LEN_LO | LEN_HI | PAYLOAD[LEN] | CRC_LO | CRC_HI
// Block:    OP | ADDR_LO | ADDR_MID | ADDR_HI | DATA...
// Load PC:  0x17 | 0x00 | SUM_LO | SUM_HI
// Response: fixed length; [1] == 0x80; status = [0] << 8 | [5]

#include <lraBsl/core/types.hpp>
#include <etl/array.h>

namespace lraBsl::protocol {

inline constexpr u8 bsl_header = 0x80;
inline constexpr size_t frame_overhead = 5;    // header + len(2) + crc(2)
inline constexpr size_t block_prefix_bytes = 4; // opcode + 24-bit address

enum class opcode : u8 {
    rx_data_block = 0x10,
    rx_data_block_verify = 0x12,
    load_pc = 0x17,
    // Known to the bootloader; no transfer mode selects it
    rx_data_block_fast = 0x1B,
};

constexpr bool is_block_opcode(opcode op) noexcept {
    return op == opcode::rx_data_block ||
           op == opcode::rx_data_block_verify ||
           op == opcode::rx_data_block_fast;
}

// DFU entry handshake
inline constexpr u8 dfu_probe = 0xAA;
inline constexpr u8 dfu_probe_ack = 0x55;
inline constexpr u8 dfu_confirm_ack = 0xAA;
inline constexpr etl::array<u8, 6> dfu_token = { 'i', '2', 'L', 'o', 'R', 'a' };

// Software reset token understood by the running LRA1 application
inline constexpr etl::array<u8, 8> reset_token = { 0x03, 'R', 'E', 'S', 'E', 'T', '\r', '\n' };

// Firmware file signature ("i2-ele ")
inline constexpr etl::array<u8, 7> image_signature = { 0x69, 0x32, 0x2D, 0x65, 0x6C, 0x65, 0x20 };

} // namespace lraBsl::protocol
