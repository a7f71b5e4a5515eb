/**
 * @file lra1_tool.cpp
 * @brief LRA1 firmware update / verify / settings-init over the BSL serial link
 */

#include <lraBsl/lraBsl.hpp>
#include <lraBsl/platform/serial_posix.hpp>
#include <lraBsl/utils/cli.hpp>

#include <cstdio>

using namespace lraBsl;

namespace {

// Large enough for the biggest firmware file; kept off the stack
image::image_storage g_image_storage; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

} // namespace

int main(int argc, char** argv) {
    utils::tool_options opts;
    const utils::parse_outcome parsed = utils::parse_options(argc, argv, opts);
    if (parsed == utils::parse_outcome::help) {
        return 0;
    }
    if (parsed == utils::parse_outcome::usage_error) {
        return 2;
    }

    const config::bsl_config cfg = config::default_config();

    optional<image::firmware_image> firmware;
    if (opts.mode == protocol::transfer_mode::init) {
        firmware = image::firmware_image::blank();
    } else {
        const result<image::firmware_image> loaded = image::load_image_file(opts.file, g_image_storage, cfg);
        if (loaded.is_error()) {
            if (loaded.error() == error_code::file_open_failed) {
                std::printf("Could not open file %s!\n", opts.file);
            } else {
                std::printf("The file is not an update file for LRA1.\n");
            }
            return to_status(loaded.error());
        }
        firmware = loaded.value();
    }
    std::printf("%s\n", protocol::mode_banner(opts.mode));

    status_t status = 0;
    optional<error::error_context> failure;
    {
        platform::serial_port port(opts.debug);
        if (port.open(opts.port, cfg.baud_rate).is_error()) {
            std::printf("%s device not open.\n", opts.port);
            return to_status(error_code::port_open_failed);
        }

        result<void> reset = ok();
        if (opts.sw_reset) {
            reset = session::reset_by_command(port, cfg);
        }
        if (reset.is_ok() && opts.dtr_reset) {
            reset = session::reset_by_dtr(port, cfg);
        }

        if (reset.is_error()) {
            status = to_status(reset.error());
            failure = error::make_context(reset.error());
        } else {
            auto on_waiting = []() {
                std::printf("Wait for DFU mode. Please reset LRA1.");
                std::fflush(stdout);
            };
            auto on_progress = [](size_t remaining, size_t total) {
                std::printf("\r%s", utils::progress_bar(remaining, total).c_str());
                std::fflush(stdout);
            };
            session::session_observers observers;
            observers.waiting = etl::delegate<void()>(on_waiting);
            observers.progress = etl::delegate<void(size_t, size_t)>(on_progress);

            const result<status_t> outcome =
                session::run_flash_session(port, firmware.value(), opts.mode, cfg, observers);
            status = error::to_run_status(outcome);
            if (outcome.is_error()) {
                failure = error::make_context(outcome.error());
            } else if (outcome.value() != 0) {
                failure = error::make_device_context(outcome.value());
            }
        }
        port.close();
    }

    if (status != 0) {
        std::printf("\nError occurred. (%d)\n", static_cast<int>(status));
        if (failure.has_value()) { error::report_error(failure.value()); }
        return status;
    }
    std::printf("\nSuccessful.\n");
    return 0;
}
