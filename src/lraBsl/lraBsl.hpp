#pragma once

/**
 * @file lraBsl.hpp
 * @brief Main header for lraBsl - LRA1 bootloader flashing library
 *
 * Header-only, no RTTI and no dynamic allocation.
 * Depends only on ETL (Embedded Template Library) and POSIX for the serial port.
 *
 * @version 1.0.1
 * @date 2025
 */

#include "lraBsl/core/types.hpp"
#include "lraBsl/core/config.hpp"
#include "lraBsl/error/result.hpp"
#include "lraBsl/error/error_handler.hpp"
#include "lraBsl/image/firmware_image.hpp"
#include "lraBsl/image/image_loader.hpp"
#include "lraBsl/protocol/checksum.hpp"
#include "lraBsl/protocol/frame_encoder.hpp"
#include "lraBsl/protocol/response_reader.hpp"
#include "lraBsl/protocol/dfu_handshake.hpp"
#include "lraBsl/protocol/block_transfer.hpp"
#include "lraBsl/session/device_reset.hpp"
#include "lraBsl/session/flash_session.hpp"
#include "lraBsl/utils/helpers.hpp"

/**
 * @namespace lraBsl
 * @brief Main namespace for the LRA1 bootloader library
 */
namespace lraBsl {

    /**
     * @brief Get library version
     */
    constexpr const char* version() noexcept {
        return LRABSL_VERSION;
    }

} // namespace lraBsl
