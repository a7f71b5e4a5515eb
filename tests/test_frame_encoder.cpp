#include <gtest/gtest.h>

#include <lraBsl/protocol/frame_encoder.hpp>

#include <vector>

using namespace lraBsl;
using namespace lraBsl::protocol;

namespace {

std::vector<u8> frame_of(const std::vector<u8>& payload) {
    frame_buffer out;
    EXPECT_TRUE(encode_frame(byte_view(payload.data(), payload.size()), out));
    return std::vector<u8>(out.begin(), out.end());
}

} // namespace

TEST(FrameEncoder, LayoutForLoadPcCommand) {
    const std::vector<u8> payload = {0x17, 0x00, 0x34, 0x12};
    const std::vector<u8> frame = frame_of(payload);
    const u16 crc = crc16_ccitt(payload.data(), payload.size());

    ASSERT_EQ(frame.size(), payload.size() + 5);
    EXPECT_EQ(frame[0], 0x80);
    EXPECT_EQ(frame[1], 0x04);
    EXPECT_EQ(frame[2], 0x00);
    EXPECT_EQ(std::vector<u8>(frame.begin() + 3, frame.begin() + 7), payload);
    EXPECT_EQ(frame[7], crc & 0xFF);
    EXPECT_EQ(frame[8], crc >> 8);
}

TEST(FrameEncoder, LengthAndCrcHoldForManySizes) {
    for (size_t len : {size_t{0}, size_t{1}, size_t{4}, size_t{47}, size_t{255}, size_t{260}}) {
        std::vector<u8> payload(len);
        for (size_t i = 0; i < len; ++i) { payload[i] = static_cast<u8>(i * 31U + 5U); }
        const std::vector<u8> frame = frame_of(payload);

        ASSERT_EQ(frame.size(), len + 5) << "len " << len;
        EXPECT_EQ(static_cast<size_t>(frame[1]) | (static_cast<size_t>(frame[2]) << 8), len);
        const u16 crc = crc16_ccitt(frame.data() + 3, len);
        EXPECT_EQ(frame[3 + len], crc & 0xFF);
        EXPECT_EQ(frame[4 + len], crc >> 8);
    }
}

TEST(FrameEncoder, EmptyPayloadCarriesInitialCrc) {
    const std::vector<u8> frame = frame_of({});
    EXPECT_EQ(frame, (std::vector<u8>{0x80, 0x00, 0x00, 0xFF, 0xFF}));
}

TEST(FrameEncoder, LengthIsLittleEndian) {
    std::vector<u8> payload(260, 0xA5);
    const std::vector<u8> frame = frame_of(payload);
    EXPECT_EQ(frame[1], 0x04);
    EXPECT_EQ(frame[2], 0x01);
}

TEST(FrameEncoder, StepperStopsAfterCrc) {
    const u8 payload[] = {0x01, 0x02};
    frame_encoder encoder;
    ASSERT_TRUE(encoder.start_encode(byte_view(payload, sizeof(payload))));
    u8 byte = 0;
    size_t emitted = 0;
    while (encoder.encode_step(byte)) { ++emitted; }
    EXPECT_EQ(emitted, 7U);
    EXPECT_EQ(encoder.state(), encode_state::ENCODE_COMPLETE);
    EXPECT_FALSE(encoder.encode_step(byte));
}

TEST(FrameEncoder, RejectsFrameLargerThanBuffer) {
    etl::vector<u8, 8> small;
    const u8 payload[4] = {1, 2, 3, 4};
    EXPECT_FALSE(encode_frame(byte_view(payload, sizeof(payload)), small));
    EXPECT_TRUE(small.empty());
}
