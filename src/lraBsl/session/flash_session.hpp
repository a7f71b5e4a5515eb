#pragma once

#include <lraBsl/core/config.hpp>
#include <lraBsl/core/types.hpp>
#include <lraBsl/error/result.hpp>
#include <lraBsl/image/firmware_image.hpp>
#include <lraBsl/protocol/block_transfer.hpp>
#include <lraBsl/protocol/dfu_handshake.hpp>
#include <lraBsl/protocol/transfer_mode.hpp>
#include <etl/delegate.h>

namespace lraBsl::session {

struct session_observers {
    etl::delegate<void()> waiting{};                 // device did not answer the first probe
    etl::delegate<void(size_t, size_t)> progress{};  // remaining, total
};

/**
 * @brief Handshake, stream the image, issue LOAD_PC
 *
 * The transport is owned by the caller and must be closed by it whatever
 * the outcome. Returns the device status (0 on success), or a local error.
 */
template <typename TransportT>
result<status_t> run_flash_session(TransportT& transport,
                                   const image::firmware_image& image,
                                   protocol::transfer_mode mode,
                                   const config::bsl_config& cfg,
                                   const session_observers& observers = {}) noexcept {
    const result<void> valid = config::validate_config(cfg);
    if (valid.is_error()) {
        return result<status_t>(valid.error());
    }

    protocol::dfu_handshake<TransportT> handshake(transport, cfg);
    handshake.set_waiting_notice(observers.waiting);
    const result<void> ready = handshake.run();
    if (ready.is_error()) {
        return result<status_t>(ready.error());
    }

    protocol::transfer_session state = protocol::make_session(mode, cfg, image.size());
    protocol::block_transfer<TransportT> transfer(transport, cfg);
    transfer.set_progress(observers.progress);
    return transfer.run(state, image.bytes());
}

} // namespace lraBsl::session
