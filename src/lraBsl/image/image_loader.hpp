#pragma once

#include <lraBsl/core/config.hpp>
#include <lraBsl/core/types.hpp>
#include <lraBsl/error/result.hpp>
#include <lraBsl/image/firmware_image.hpp>
#include <etl/vector.h>
#include <cstdio>

namespace lraBsl::image {

// Storage large enough for the biggest accepted file
using image_storage = etl::vector<u8, config::image_capacity>;

namespace detail {
struct file_closer {
    std::FILE* fp{nullptr};
    ~file_closer() { if (fp != nullptr) { (void)std::fclose(fp); } }
};
} // namespace detail

// Load a firmware file into storage and validate it.
// Unreadable file -> file_open_failed; size out of bounds or bad signature -> invalid_image.
inline result<firmware_image> load_image_file(const char* path, etl::ivector<u8>& storage,
                                              const config::bsl_config& cfg) noexcept {
    storage.clear();
    detail::file_closer file{std::fopen(path, "rb")};
    if (file.fp == nullptr) {
        return result<firmware_image>(error_code::file_open_failed);
    }
    if (std::fseek(file.fp, 0, SEEK_END) != 0) {
        return result<firmware_image>(error_code::file_open_failed);
    }
    const long length = std::ftell(file.fp);
    if (length < 0 || std::fseek(file.fp, 0, SEEK_SET) != 0) {
        return result<firmware_image>(error_code::file_open_failed);
    }

    // Reject by size before touching the contents
    const auto size = static_cast<size_t>(length);
    if (size < cfg.image_min_bytes || size > cfg.image_max_bytes || size > storage.capacity()) {
        return result<firmware_image>(error_code::invalid_image);
    }

    storage.resize(size);
    if (std::fread(storage.data(), 1, size, file.fp) != size) {
        storage.clear();
        return result<firmware_image>(error_code::file_open_failed);
    }
    return firmware_image::from_bytes(byte_view(storage.data(), storage.size()), cfg);
}

} // namespace lraBsl::image
