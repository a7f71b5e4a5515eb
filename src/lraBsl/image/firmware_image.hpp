#pragma once

#include <lraBsl/core/config.hpp>
#include <lraBsl/core/types.hpp>
#include <lraBsl/error/result.hpp>
#include <lraBsl/protocol/bsl_defs.hpp>
#include <etl/array.h>

namespace lraBsl::image {

// Size bounds and the "i2-ele " marker at cfg.signature_offset
inline result<void> validate_image(byte_view bytes, const config::bsl_config& cfg) noexcept {
    if (bytes.size() < cfg.image_min_bytes || bytes.size() > cfg.image_max_bytes) {
        return result<void>(error_code::invalid_image);
    }
    const auto& signature = protocol::image_signature;
    if (cfg.signature_offset + signature.size() > bytes.size()) {
        return result<void>(error_code::invalid_image);
    }
    for (size_t i = 0; i < signature.size(); ++i) {
        if (bytes[cfg.signature_offset + i] != signature[i]) {
            return result<void>(error_code::invalid_image);
        }
    }
    return ok();
}

/**
 * @brief Validated, read-only view of a firmware image
 *
 * Only obtainable through from_bytes() (validated) or blank() (the
 * zero-filled init image, exempt from validation). The underlying bytes
 * are owned by the caller and must outlive the view.
 */
class firmware_image {
public:
    static result<firmware_image> from_bytes(byte_view bytes, const config::bsl_config& cfg) noexcept {
        const result<void> valid = validate_image(bytes, cfg);
        if (valid.is_error()) {
            return result<firmware_image>(valid.error());
        }
        return result<firmware_image>(firmware_image(bytes));
    }

    // Zero-filled settings image written by init mode
    static firmware_image blank() noexcept {
        static const etl::array<u8, config::init_image_bytes> zeros{};
        return firmware_image(byte_view(zeros.data(), zeros.size()));
    }

    [[nodiscard]] byte_view bytes() const noexcept { return bytes_; }
    [[nodiscard]] size_t size() const noexcept { return bytes_.size(); }

private:
    explicit firmware_image(byte_view bytes) noexcept : bytes_(bytes) {}

    byte_view bytes_;
};

} // namespace lraBsl::image
