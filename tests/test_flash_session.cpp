#include <gtest/gtest.h>

#include <lraBsl/error/error_handler.hpp>
#include <lraBsl/image/firmware_image.hpp>
#include <lraBsl/session/flash_session.hpp>

#include "sim_transport.hpp"

using namespace lraBsl;
using lraBsl::protocol::transfer_mode;
using lraBsl::test::bytes;
using lraBsl::test::sim_bootloader;
using lraBsl::test::sim_transport;

namespace {

struct observer_log {
    int waiting{0};
    size_t progress_calls{0};
    size_t last_remaining{0};
    size_t last_total{0};

    void on_waiting() { ++waiting; }
    void on_progress(size_t remaining, size_t total) {
        ++progress_calls;
        last_remaining = remaining;
        last_total = total;
    }

    session::session_observers observers() {
        session::session_observers obs;
        obs.waiting = etl::delegate<void()>::create<observer_log, &observer_log::on_waiting>(*this);
        obs.progress =
            etl::delegate<void(size_t, size_t)>::create<observer_log, &observer_log::on_progress>(*this);
        return obs;
    }
};

class FlashSession : public ::testing::Test {
protected:
    image::firmware_image load(const bytes& data) {
        data_ = data;
        const result<image::firmware_image> r =
            image::firmware_image::from_bytes(byte_view(data_.data(), data_.size()), cfg_);
        EXPECT_TRUE(r.is_ok());
        return r.value();
    }

    config::bsl_config cfg_ = test::fast_config();
    sim_transport transport_;
    sim_bootloader device_{transport_};
    observer_log log_;
    bytes data_;
};

} // namespace

TEST_F(FlashSession, UpdateRunsHandshakeBlocksAndLoadPc) {
    const image::firmware_image fw = load(test::make_image_bytes(4200));
    const result<status_t> r = session::run_flash_session(transport_, fw, transfer_mode::update, cfg_, log_.observers());

    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value(), 0);
    EXPECT_EQ(error::to_run_status(r), 0);
    EXPECT_EQ(device_.probes, 1U);
    EXPECT_EQ(device_.tokens, 1U);
    EXPECT_EQ(device_.block_count(), 17U);
    EXPECT_TRUE(device_.frames_valid);
    EXPECT_EQ(log_.waiting, 0);
    EXPECT_EQ(log_.progress_calls, 18U);
    EXPECT_EQ(log_.last_remaining, 0U);
    EXPECT_EQ(log_.last_total, 4200U);

    const u16 sum = test::sum16(data_);
    EXPECT_EQ(device_.payloads.back(), (bytes{0x17, 0x00, static_cast<u8>(sum & 0xFF), static_cast<u8>(sum >> 8)}));
}

TEST_F(FlashSession, WaitingObserverFiresOnceForLateDevice) {
    device_.ignored_probes = 5;
    const image::firmware_image fw = load(test::make_image_bytes(4096));
    const result<status_t> r = session::run_flash_session(transport_, fw, transfer_mode::verify, cfg_, log_.observers());

    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(log_.waiting, 1);
    EXPECT_EQ(device_.probes, 6U);
    EXPECT_EQ(device_.payloads.front()[0], 0x12);
}

TEST_F(FlashSession, InitWritesBlankSettings) {
    const result<status_t> r =
        session::run_flash_session(transport_, image::firmware_image::blank(), transfer_mode::init, cfg_);

    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value(), 0);
    ASSERT_EQ(device_.payloads.size(), 3U);
    EXPECT_EQ(device_.payloads[0][1], 0x00);
    EXPECT_EQ(device_.payloads[0][2], 0xFE);
    EXPECT_EQ(device_.payloads[0][3], 0x01);
    EXPECT_EQ(device_.payloads[2], (bytes{0x17, 0x00, 0x00, 0x00}));
}

TEST_F(FlashSession, DeviceStatusPassesThrough) {
    device_.block_status[2] = 0x3B05;
    const image::firmware_image fw = load(test::make_image_bytes(4096));
    const result<status_t> r = session::run_flash_session(transport_, fw, transfer_mode::update, cfg_);

    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value(), 0x3B05);
    EXPECT_EQ(error::to_run_status(r), 0x3B05);
    EXPECT_EQ(device_.block_count(), 2U);
}

TEST_F(FlashSession, TimeoutMapsToMinusTwo) {
    device_.silent_frames = true;
    const image::firmware_image fw = load(test::make_image_bytes(4096));
    const result<status_t> r = session::run_flash_session(transport_, fw, transfer_mode::update, cfg_);

    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(error::to_run_status(r), -2);
}

TEST_F(FlashSession, InvalidConfigRejectedBeforeAnyTraffic) {
    cfg_.block_bytes = 0;
    const result<status_t> r =
        session::run_flash_session(transport_, image::firmware_image::blank(), transfer_mode::init, cfg_);

    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), error_code::invalid_config);
    EXPECT_TRUE(transport_.writes.empty());
}
