#pragma once

#include <lraBsl/core/types.hpp>

namespace lraBsl::protocol {

// CRC-16/CCITT-FALSE: poly 0x1021, init 0xFFFF, MSB first, no reflection, no final XOR.
// An empty input returns the initial register unchanged.
constexpr u16 crc16_ccitt(const u8* data, size_t len) noexcept {
    u16 crc = 0xFFFFU;
    for (size_t i = 0; i < len; ++i) {
        crc = static_cast<u16>(crc ^ (static_cast<u16>(data[i]) << 8));
        for (u8 bit = 0; bit < 8; ++bit) {
            if ((crc & 0x8000U) != 0) {
                crc = static_cast<u16>((crc << 1) ^ 0x1021U);
            } else {
                crc = static_cast<u16>(crc << 1);
            }
        }
    }
    return crc;
}

// Incremental CRC-16 accumulator for streaming scenarios
struct crc16_accum {
    u16 crc{0xFFFFU};
    inline void reset() noexcept { crc = 0xFFFFU; }
    inline void add(u8 b) noexcept {
        crc = static_cast<u16>(crc ^ (static_cast<u16>(b) << 8));
        for (u8 bit = 0; bit < 8; ++bit) {
            crc = ((crc & 0x8000U) != 0) ? static_cast<u16>((crc << 1) ^ 0x1021U)
                                         : static_cast<u16>(crc << 1);
        }
    }
    inline u16 value() const noexcept { return crc; }
};

// 16-bit wrapping additive checksum verified by the bootloader at load-PC time
constexpr u16 checksum_accumulate(u16 acc, u8 byte) noexcept {
    return static_cast<u16>((static_cast<u32>(acc) + byte) & 0xFFFFU);
}

struct sum16_accum {
    u16 sum{0};
    inline void reset() noexcept { sum = 0; }
    inline void add(u8 b) noexcept { sum = checksum_accumulate(sum, b); }
    inline u16 value() const noexcept { return sum; }
};

} // namespace lraBsl::protocol
