#include <gtest/gtest.h>

#include "coolledx/commands.hpp"
#include "coolledx/errors.hpp"
#include "coolledx/frame_codec.h"

using namespace coolledx;

namespace {

const HardwareProfile& hw() {
    return HardwareProfile::for_generation(DeviceGeneration::CoolLEDX);
}

std::string hex_of(const Command& c) {
    return c.hex_string(PanelDimensions(), hw());
}

}

TEST(Commands, ScalarFrames) {
    EXPECT_EQ(hex_of(SetSpeed(1)), "0100020607020503\n");
    EXPECT_EQ(hex_of(SetSpeed(0)), "01000206070003\n");
    EXPECT_EQ(hex_of(SetSpeed(255)), "0100020607ff03\n");
}

TEST(Commands, ScalarPayloads) {
    PanelDimensions panel;
    auto raw = [&](const Command& c) { return c.raw_data_chunks(panel, hw()); };

    EXPECT_EQ(raw(SetBrightness(0x80)), std::vector<Bytes>{(Bytes{0x08, 0x80})});
    EXPECT_EQ(raw(Initialize()), std::vector<Bytes>{(Bytes{0x23, 0x01})});
    EXPECT_EQ(raw(StartupWithBatteryLevel(15)), std::vector<Bytes>{(Bytes{0x23, 0x0F})});
    EXPECT_EQ(raw(TurnOnOffApp(true)), std::vector<Bytes>{(Bytes{0x09, 0x01})});
    EXPECT_EQ(raw(TurnOnOffApp(false)), std::vector<Bytes>{(Bytes{0x09, 0x00})});
    EXPECT_EQ(raw(TurnOnOffButton(true)), std::vector<Bytes>{(Bytes{0x13, 0x01})});
    EXPECT_EQ(raw(TurnOnOffButton(false)), std::vector<Bytes>{(Bytes{0x05, 0x00})});
    EXPECT_EQ(raw(ShowChargingAnimation()), std::vector<Bytes>{(Bytes{0x11})});
    EXPECT_EQ(raw(InvertDisplay()), std::vector<Bytes>{(Bytes{0x0C, 0x00})});
    EXPECT_EQ(raw(InvertDisplay(true)), std::vector<Bytes>{(Bytes{0x0C, 0x01})});
    EXPECT_EQ(raw(InvertOrSomething()), std::vector<Bytes>{(Bytes{0x15})});
    EXPECT_EQ(raw(PowerDown()), std::vector<Bytes>{(Bytes{0x12})});
    EXPECT_EQ(raw(SetMode(Mode::Snowflake)), std::vector<Bytes>{(Bytes{0x06, 0x06})});
    EXPECT_EQ(raw(SetMode(200)), std::vector<Bytes>{(Bytes{0x06, 200})});
}

TEST(Commands, ByteRangeIsValidated) {
    EXPECT_THROW(SetSpeed(256), ValidationError);
    EXPECT_THROW(SetSpeed(-1), ValidationError);
    EXPECT_THROW(SetBrightness(300), ValidationError);
    EXPECT_THROW(StartupWithBatteryLevel(-5), ValidationError);
    EXPECT_THROW(SetMode(1000), ValidationError);

    try {
        SetBrightness b(256);
        FAIL() << "no exception";
    } catch (const ValidationError& e) {
        EXPECT_STREQ(e.what(), "Brightness must be between 0x00 and 0xFF, not 256");
    }
}

TEST(Commands, AcknowledgmentFlags) {
    EXPECT_TRUE(SetSpeed(1).expects_acknowledgment());
    EXPECT_TRUE(SetBrightness(1).expects_acknowledgment());
    EXPECT_TRUE(Initialize().expects_acknowledgment());
    EXPECT_TRUE(TurnOnOffApp(true).expects_acknowledgment());
    EXPECT_TRUE(StartupWithBatteryLevel(1).expects_acknowledgment());
    EXPECT_TRUE(SendRawData("0102").expects_acknowledgment());

    EXPECT_FALSE(TurnOnOffButton(true).expects_acknowledgment());
    EXPECT_FALSE(ShowChargingAnimation().expects_acknowledgment());
    EXPECT_FALSE(InvertDisplay().expects_acknowledgment());
    EXPECT_FALSE(InvertOrSomething().expects_acknowledgment());
    EXPECT_FALSE(PowerDown().expects_acknowledgment());
    EXPECT_FALSE(SetMode(Mode::Static).expects_acknowledgment());
}

TEST(Commands, RawDataIsNotFramed) {
    SendRawData raw("01:00:02:06:07:02:05:03");
    EXPECT_TRUE(raw.is_raw_passthrough());
    EXPECT_EQ(hex_of(raw), "0100020607020503\n");

    EXPECT_THROW(SendRawData("xyz"), ValidationError);
    EXPECT_THROW(SendRawData("123"), ValidationError);
    EXPECT_THROW(SendRawData(""), ValidationError);
}

TEST(Commands, MusicBars) {
    Bytes heights = {0, 1, 2, 3, 4, 5, 6, 7};
    Bytes colors = {7, 6, 5, 4, 3, 2, 1, 0};
    SetMusicBars bars(heights, colors);

    std::vector<Bytes> raw = bars.raw_data_chunks(PanelDimensions(), hw());
    ASSERT_EQ(raw.size(), 1u);
    ASSERT_EQ(raw[0].size(), 17u);
    EXPECT_EQ(raw[0][0], 0x01);
    EXPECT_EQ(Bytes(raw[0].begin() + 1, raw[0].begin() + 9), heights);
    EXPECT_EQ(Bytes(raw[0].begin() + 9, raw[0].end()), colors);
    EXPECT_FALSE(bars.expects_acknowledgment());

    EXPECT_THROW(SetMusicBars(Bytes(7, 0), colors), ValidationError);
    EXPECT_THROW(SetMusicBars(heights, Bytes(9, 0)), ValidationError);
}

TEST(Commands, DescribeTruncatesHex) {
    EXPECT_EQ(SetSpeed(1).describe(PanelDimensions(), hw()), "SetSpeed[0100020607020503]");

    SendRawData raw(std::string(40, 'a'));
    EXPECT_EQ(raw.describe(PanelDimensions(), hw()), "SendRawData[" + std::string(32, 'a') + "...]");
}

TEST(Commands, ContentParametersAreValidatedUpFront) {
    TextOptions bad_color;
    bad_color.color = "notacolor";
    EXPECT_THROW(SetText("hi", bad_color), ValidationError);

    TextOptions bad_height;
    bad_height.font_height = 0;
    EXPECT_THROW(SetText("hi", bad_height), ValidationError);

    TextOptions bad_marker;
    bad_marker.start_marker = "";
    EXPECT_THROW(SetText("hi", bad_marker), ValidationError);

    FitOptions bad_bg;
    bad_bg.background_color = "#12";
    EXPECT_THROW(SetImage(cv::Mat(8, 8, CV_8UC3, cv::Scalar::all(0)), bad_bg), ValidationError);
    EXPECT_THROW(SetImage(cv::Mat()), ValidationError);
    EXPECT_THROW(SetImage(std::string()), ValidationError);

    std::vector<cv::Mat> frames(1, cv::Mat(8, 8, CV_8UC3, cv::Scalar::all(0)));
    EXPECT_THROW(SetAnimation(frames, 70000), ValidationError);
    EXPECT_THROW(SetAnimation(frames, -1), ValidationError);
    EXPECT_THROW(SetAnimation(std::vector<cv::Mat>()), ValidationError);
    EXPECT_THROW(SetAnimation(std::vector<cv::Mat>(256, frames[0])), ValidationError);
    EXPECT_THROW(SetJT(std::string()), ValidationError);
    EXPECT_THROW(SetJT::from_document(""), ValidationError);
}

TEST(Commands, ImageUsesImageCommandByte) {
    cv::Mat img(16, 96, CV_8UC3, cv::Scalar::all(255));
    SetImage cmd(img);
    std::vector<Bytes> raw = cmd.raw_data_chunks(PanelDimensions(), hw());
    ASSERT_FALSE(raw.empty());
    for (const auto& c : raw) {
        EXPECT_EQ(c[0], 0x03);
    }
    // 24 header + 2 length + 3 planes of 96 columns x 2 bytes
    const std::size_t total = (raw[0][2] << 8) | raw[0][3];
    EXPECT_EQ(total, 24u + 2u + 3u * 96u * 2u);
    EXPECT_EQ(raw.size(), (total + 127) / 128);
}

TEST(Commands, TextRenderedAsImageUsesImageCommandByte) {
    TextOptions opts;
    opts.font = "no-such-font-anywhere";
    opts.render_as_text = false;
    SetText cmd("AB", opts);
    std::vector<Bytes> raw = cmd.raw_data_chunks(PanelDimensions(), hw());
    ASSERT_FALSE(raw.empty());
    EXPECT_EQ(raw[0][0], 0x03);

    opts.render_as_text = true;
    std::vector<Bytes> text = SetText("AB", opts).raw_data_chunks(PanelDimensions(), hw());
    ASSERT_FALSE(text.empty());
    EXPECT_EQ(text[0][0], 0x02);
}
