#pragma once

#include <cstddef>
#include <cstdint>

#include <etl/optional.h>
#include <etl/span.h>

namespace lraBsl {

// Basic integer types
using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using i8 = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

// Optional types
template<typename T>
using optional = etl::optional<T>;

// Read-only byte view
using byte_view = etl::span<const u8>;

// Time types (milliseconds since an arbitrary monotonic origin)
using timestamp_t = u64;
using duration_t = u32;

/* Bootloader status word: 0 = success, anything else is reported verbatim */
using status_t = i32;

/* 24-bit flash address as carried in block commands */
struct flash_address_t {
    u32 value;

    constexpr explicit flash_address_t(u32 val) noexcept : value(val & 0xFFFFFFU) {}
    constexpr explicit operator u32() const noexcept { return value; }

    constexpr u8 low() const noexcept { return static_cast<u8>(value & 0xFFU); }
    constexpr u8 mid() const noexcept { return static_cast<u8>((value >> 8) & 0xFFU); }
    constexpr u8 high() const noexcept { return static_cast<u8>((value >> 16) & 0xFFU); }

    constexpr flash_address_t& operator+=(u32 offset) noexcept {
        value = (value + offset) & 0xFFFFFFU;
        return *this;
    }

    constexpr bool operator==(flash_address_t other) const noexcept { return value == other.value; }
    constexpr bool operator!=(flash_address_t other) const noexcept { return value != other.value; }
};

/* Timeout strong type to avoid parameter confusion */
struct timeout_ms_t {
    u32 value;

    constexpr explicit timeout_ms_t(u32 val) noexcept : value(val) {}
    constexpr explicit operator u32() const noexcept { return value; }

    constexpr bool operator==(timeout_ms_t other) const noexcept { return value == other.value; }
    constexpr bool operator!=(timeout_ms_t other) const noexcept { return value != other.value; }
};

}  // namespace lraBsl
