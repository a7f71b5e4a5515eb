#pragma once

#include <cstdint>

#include <etl/optional.h>
#include <etl/utility.h>

namespace lraBsl {

// Local failure codes (device-reported statuses are values, not errors)
enum class error_code : int8_t {
    success = 0,
    file_open_failed,
    invalid_image,
    port_open_failed,
    timeout,
    malformed_frame,
    io_error,
    invalid_config
};

// Integer result surfaced to the operator and used as process exit status
constexpr int32_t to_status(error_code code) noexcept {
    switch (code) {
        case error_code::success:          return 0;
        case error_code::invalid_image:
        case error_code::timeout:          return -2;
        case error_code::malformed_frame:  return -3;
        case error_code::file_open_failed:
        case error_code::port_open_failed:
        case error_code::io_error:
        case error_code::invalid_config:
        default:                           return -1;
    }
}

// Result type for error handling without exceptions
template<typename T, typename E = error_code>
class result {
private:
    etl::optional<T> value_;
    etl::optional<E> error_;

public:
    explicit result(const T& value) noexcept : value_(value) {}

    explicit result(T&& value) noexcept : value_(etl::move(value)) {}

    explicit result(const E& error) noexcept : error_(error) {}

    [[nodiscard]] bool is_ok() const noexcept { return value_.has_value(); }

    [[nodiscard]] bool is_error() const noexcept { return error_.has_value(); }

    const T& value() const noexcept { return value_.value(); }

    T& value() noexcept { return value_.value(); }

    const E& error() const noexcept { return error_.value(); }
};

// Specialization for void result type
template<typename E>
class result<void, E> {
private:
    etl::optional<E> error_;

public:
    result() noexcept : error_() {}

    explicit result(const E& error) noexcept : error_(error) {}

    [[nodiscard]] bool is_ok() const noexcept { return !error_.has_value(); }

    [[nodiscard]] bool is_error() const noexcept { return error_.has_value(); }

    const E& error() const noexcept { return error_.value(); }
};

// Helper function for creating successful void results
inline result<void, error_code> ok() noexcept {
    return {};
}

}  // namespace lraBsl
