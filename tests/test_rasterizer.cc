#include <gtest/gtest.h>

#include <string>
#include <vector>

#include <opencv2/imgcodecs.hpp>

#include "coolledx/commands.hpp"
#include "coolledx/errors.hpp"
#include "coolledx/frame_codec.h"
#include "coolledx/render/rasterizer.hpp"

using namespace coolledx;

namespace {

const cv::Scalar kBlack(0, 0, 0);
const cv::Scalar kWhite(255, 255, 255);

PanelDimensions panel_of(int w, int h) {
    PanelDimensions p;
    p.width = static_cast<std::uint16_t>(w);
    p.height = static_cast<std::uint16_t>(h);
    return p;
}

// 1 x h white column inside a w x h black image
cv::Mat column_image(int w, int h, int white_col) {
    cv::Mat img(h, w, CV_8UC3, kBlack);
    img.col(white_col).setTo(kWhite);
    return img;
}

std::size_t bits_length_at(const Bytes& payload, std::size_t offset) {
    return (static_cast<std::size_t>(payload[offset]) << 8) | payload[offset + 1];
}

}

// ===================== colour markers =====================

TEST(ColorRuns, SplitsOnMarkers) {
    std::vector<ColorRun> runs = split_color_runs("Hello <red>World<#00ff00>!", "<", ">");
    ASSERT_EQ(runs.size(), 3u);
    EXPECT_EQ(runs[0].text, "Hello ");
    EXPECT_TRUE(runs[0].has_color);
    EXPECT_EQ(runs[0].color, "red");
    EXPECT_EQ(runs[1].text, "World");
    EXPECT_EQ(runs[1].color, "#00ff00");
    EXPECT_EQ(runs[2].text, "!");
    EXPECT_FALSE(runs[2].has_color);
}

TEST(ColorRuns, PlainTextIsOneRun) {
    std::vector<ColorRun> runs = split_color_runs("plain", "<", ">");
    ASSERT_EQ(runs.size(), 1u);
    EXPECT_EQ(runs[0].text, "plain");
    EXPECT_FALSE(runs[0].has_color);
}

TEST(ColorRuns, CustomMarkers) {
    std::vector<ColorRun> runs = split_color_runs("a[[blue]]b", "[[", "]]");
    ASSERT_EQ(runs.size(), 2u);
    EXPECT_EQ(runs[0].text, "a");
    EXPECT_EQ(runs[0].color, "blue");
    EXPECT_EQ(runs[1].text, "b");
}

TEST(Colors, Parse) {
    cv::Scalar bgr;
    ASSERT_TRUE(parse_color("#ff8000", bgr));
    EXPECT_EQ(bgr, cv::Scalar(0x00, 0x80, 0xff));
    ASSERT_TRUE(parse_color("#0f0", bgr));
    EXPECT_EQ(bgr, cv::Scalar(0x00, 0xff, 0x00));
    ASSERT_TRUE(parse_color("Green", bgr));
    EXPECT_EQ(bgr, cv::Scalar(0x00, 0x80, 0x00));
    EXPECT_FALSE(parse_color("#12", bgr));
    EXPECT_FALSE(parse_color("nope", bgr));
}

// ===================== packing =====================

TEST(PackBitPlanes, HorizontalPadding) {
    cv::Mat col = column_image(1, 8, 0);

    BitPlanes left = pack_bit_planes(col, 4, 8, kBlack, HorizontalAlignment::Left, VerticalAlignment::Top);
    EXPECT_EQ(left.r, (Bytes{0xFF, 0x00, 0x00, 0x00}));

    BitPlanes center = pack_bit_planes(col, 4, 8, kBlack, HorizontalAlignment::Center, VerticalAlignment::Top);
    EXPECT_EQ(center.r, (Bytes{0x00, 0xFF, 0x00, 0x00}));

    BitPlanes right = pack_bit_planes(col, 4, 8, kBlack, HorizontalAlignment::Right, VerticalAlignment::Top);
    EXPECT_EQ(right.r, (Bytes{0x00, 0x00, 0x00, 0xFF}));
    EXPECT_EQ(right.g, right.r);
    EXPECT_EQ(right.b, right.r);
}

TEST(PackBitPlanes, HorizontalCropping) {
    cv::Mat img = column_image(4, 8, 3);

    EXPECT_EQ(pack_bit_planes(img, 2, 8, kBlack, HorizontalAlignment::Left, VerticalAlignment::Top).r,
              (Bytes{0x00, 0x00}));
    EXPECT_EQ(pack_bit_planes(img, 2, 8, kBlack, HorizontalAlignment::Center, VerticalAlignment::Top).r,
              (Bytes{0x00, 0x00}));
    EXPECT_EQ(pack_bit_planes(img, 2, 8, kBlack, HorizontalAlignment::Right, VerticalAlignment::Top).r,
              (Bytes{0x00, 0xFF}));
}

TEST(PackBitPlanes, VerticalAlignment) {
    cv::Mat img(4, 1, CV_8UC3, kWhite);
    EXPECT_EQ(pack_bit_planes(img, 1, 8, kBlack, HorizontalAlignment::None, VerticalAlignment::Top).r,
              (Bytes{0xF0}));
    EXPECT_EQ(pack_bit_planes(img, 1, 8, kBlack, HorizontalAlignment::None, VerticalAlignment::Center).r,
              (Bytes{0x3C}));
    EXPECT_EQ(pack_bit_planes(img, 1, 8, kBlack, HorizontalAlignment::None, VerticalAlignment::Bottom).r,
              (Bytes{0x0F}));
}

TEST(PackBitPlanes, MostSignificantBitIsTopRow) {
    cv::Mat img(16, 1, CV_8UC3, kBlack);
    img.at<cv::Vec3b>(0, 0) = cv::Vec3b(0, 0, 255);   // red, top
    img.at<cv::Vec3b>(15, 0) = cv::Vec3b(255, 0, 0);  // blue, bottom
    BitPlanes p = pack_bit_planes(img, 1, 16, kBlack, HorizontalAlignment::None, VerticalAlignment::Top);
    EXPECT_EQ(p.r, (Bytes{0x80, 0x00}));
    EXPECT_EQ(p.g, (Bytes{0x00, 0x00}));
    EXPECT_EQ(p.b, (Bytes{0x00, 0x01}));
}

TEST(PackBitPlanes, PaddingTakesBackground) {
    cv::Mat img(8, 1, CV_8UC3, kBlack);
    BitPlanes p = pack_bit_planes(img, 2, 8, cv::Scalar(0, 0, 255), HorizontalAlignment::Left, VerticalAlignment::Top);
    EXPECT_EQ(p.r, (Bytes{0x00, 0xFF}));
    EXPECT_EQ(p.g, (Bytes{0x00, 0x00}));
}

TEST(PackBitPlanes, HeightMustBeMultipleOfEight) {
    for (int h = 1; h < 64; ++h) {
        cv::Mat img(h, 4, CV_8UC3, kBlack);
        if (h % 8 != 0) {
            EXPECT_THROW(pack_bit_planes(img, 4, h, kBlack, HorizontalAlignment::None, VerticalAlignment::Top),
                         RenderError) << "height " << h;
            EXPECT_THROW(Rasterizer(panel_of(8, h)).render_image(img, FitOptions()), RenderError)
                << "height " << h;
        } else {
            BitPlanes p;
            EXPECT_NO_THROW(p = pack_bit_planes(img, 4, h, kBlack, HorizontalAlignment::None,
                                                VerticalAlignment::Top)) << "height " << h;
            EXPECT_EQ(p.r.size(), static_cast<std::size_t>(4 * h / 8)) << "height " << h;
        }
    }
}

// ===================== fitting =====================

TEST(FitImage, WidthScaleKeepsAspect) {
    cv::Mat img(2, 4, CV_8UC3, kWhite);
    int out_w = 0;
    cv::Mat fitted = fit_image(img, panel_of(8, 8), WidthTreatment::Scale, HeightTreatment::CropPad, out_w);
    EXPECT_EQ(fitted.cols, 8);
    EXPECT_EQ(fitted.rows, 4);
    EXPECT_EQ(out_w, 8);
}

TEST(FitImage, AsIsWidthWithScaledHeight) {
    cv::Mat img(2, 4, CV_8UC3, kWhite);
    int out_w = 0;
    cv::Mat fitted = fit_image(img, panel_of(8, 8), WidthTreatment::AsIs, HeightTreatment::Scale, out_w);
    EXPECT_EQ(fitted.rows, 8);
    EXPECT_EQ(fitted.cols, 16);
    EXPECT_EQ(out_w, 16);

    // never narrower than the panel
    cv::Mat tall(16, 2, CV_8UC3, kWhite);
    fit_image(tall, panel_of(8, 8), WidthTreatment::AsIs, HeightTreatment::Scale, out_w);
    EXPECT_EQ(out_w, 8);
}

TEST(FitImage, CropPadLeavesPixelsAlone) {
    cv::Mat img(3, 20, CV_8UC3, kWhite);
    int out_w = 0;
    cv::Mat fitted = fit_image(img, panel_of(8, 8), WidthTreatment::CropPad, HeightTreatment::CropPad, out_w);
    EXPECT_EQ(fitted.size(), img.size());
    EXPECT_EQ(out_w, 8);

    fitted = fit_image(img, panel_of(8, 8), WidthTreatment::AsIs, HeightTreatment::CropPad, out_w);
    EXPECT_EQ(out_w, 20);
}

TEST(FitImage, DegenerateScaleFails) {
    cv::Mat wide(1, 100, CV_8UC3, kWhite);
    int out_w = 0;
    // 8 * 1 / 100 rounds down to zero rows
    EXPECT_THROW(fit_image(wide, panel_of(8, 8), WidthTreatment::Scale, HeightTreatment::CropPad, out_w),
                 RenderError);
}

// ===================== image payloads =====================

TEST(Rasterizer, ImageFileGolden) {
    cv::Mat img(4, 3, CV_8UC3, kBlack);
    img.col(0).setTo(cv::Scalar(0, 0, 255));
    img.col(1).setTo(cv::Scalar(0, 255, 0));
    img.col(2).setTo(kWhite);
    const std::string path = ::testing::TempDir() + "coolledx_golden.png";
    ASSERT_TRUE(cv::imwrite(path, img));

    FitOptions fit;
    fit.width_treatment = WidthTreatment::AsIs;
    fit.height_treatment = HeightTreatment::CropPad;
    fit.horizontal_alignment = HorizontalAlignment::Center;
    fit.vertical_alignment = VerticalAlignment::Bottom;

    SetImage cmd(path, fit);
    const std::string expected = "01002b0207000023000023" + std::string(48, '0') +
                                 "00090f000f000f0f00000f06" + "03\n";
    EXPECT_EQ(cmd.hex_string(panel_of(8, 8), HardwareProfile::for_generation(DeviceGeneration::CoolLEDX)),
              expected);
}

TEST(Rasterizer, MissingImageFile) {
    Rasterizer r(panel_of(8, 8));
    EXPECT_THROW(r.render_image_file(::testing::TempDir() + "does_not_exist.png", FitOptions()), RenderError);
}

TEST(Rasterizer, GrayAndAlphaImagesAreAccepted) {
    Rasterizer r(panel_of(8, 8));
    cv::Mat gray(8, 8, CV_8UC1, cv::Scalar(255));
    Bytes a = r.render_image(gray, FitOptions());
    cv::Mat bgra(8, 8, CV_8UC4, cv::Scalar(255, 255, 255, 255));
    Bytes b = r.render_image(bgra, FitOptions());
    EXPECT_EQ(a, b);
    // every pixel lit
    EXPECT_EQ(a.size(), 24u + 2u + 24u);
    for (std::size_t i = 26; i < a.size(); ++i) {
        EXPECT_EQ(a[i], 0xFF);
    }
}

// ===================== animations =====================

TEST(Rasterizer, AnimationFramesAreComposited) {
    cv::Mat f0(8, 8, CV_8UC4, cv::Scalar(0, 0, 0, 0));
    f0.col(0).setTo(cv::Scalar(0, 0, 255, 255));
    cv::Mat f1(8, 8, CV_8UC4, cv::Scalar(0, 0, 0, 0));
    f1.col(1).setTo(cv::Scalar(0, 255, 0, 255));

    Rasterizer r(panel_of(8, 8));
    Bytes payload = r.render_animation({f0, f1}, 512, default_animation_fit());

    Bytes expected(24, 0x00);
    expected.push_back(0x02);
    expected.push_back(0x02);
    expected.push_back(0x00);
    // red: column 0 in both frames
    Bytes red_frame = {0xFF, 0, 0, 0, 0, 0, 0, 0};
    expected.insert(expected.end(), red_frame.begin(), red_frame.end());
    expected.insert(expected.end(), red_frame.begin(), red_frame.end());
    // green: column 1 from frame 1 on
    Bytes blank(8, 0x00);
    Bytes green_frame = {0, 0xFF, 0, 0, 0, 0, 0, 0};
    expected.insert(expected.end(), blank.begin(), blank.end());
    expected.insert(expected.end(), green_frame.begin(), green_frame.end());
    expected.insert(expected.end(), 16, 0x00);

    ASSERT_EQ(payload.size(), 75u);
    EXPECT_EQ(to_hex(payload), to_hex(expected));
}

TEST(Rasterizer, AnimationFillsThePanel) {
    // narrow source, AsIs still packs at full panel width
    std::vector<cv::Mat> frames(2, cv::Mat(8, 2, CV_8UC3, kWhite));
    FitOptions fit;
    fit.width_treatment = WidthTreatment::AsIs;
    fit.horizontal_alignment = HorizontalAlignment::Left;

    Rasterizer r(panel_of(8, 8));
    Bytes payload = r.render_animation(frames, 0, fit);
    ASSERT_EQ(payload.size(), 24u + 3u + 3u * 2u * 8u);
    EXPECT_EQ(payload[24], 2);
    EXPECT_EQ(payload[25], 0);
    EXPECT_EQ(payload[26], 0);
    // red plane of frame 0: two lit columns then background
    EXPECT_EQ(Bytes(payload.begin() + 27, payload.begin() + 35), (Bytes{0xFF, 0xFF, 0, 0, 0, 0, 0, 0}));
}

TEST(Rasterizer, AnimationLimits) {
    Rasterizer r(panel_of(8, 8));
    std::vector<cv::Mat> frames(256, cv::Mat(8, 8, CV_8UC3, kBlack));
    EXPECT_THROW(r.render_animation(frames, 0, default_animation_fit()), RenderError);
    EXPECT_THROW(r.render_animation({}, 0, default_animation_fit()), RenderError);
    frames.resize(2);
    EXPECT_THROW(r.render_animation(frames, 65536, default_animation_fit()), RenderError);
}

TEST(Rasterizer, AnimationBeyondSixteenBitTotalFails) {
    // 24 + 3 + 120 * 576 bytes on a 96x16 panel
    std::vector<cv::Mat> frames(120, cv::Mat(16, 96, CV_8UC3, kBlack));
    Rasterizer r(panel_of(96, 16));
    EXPECT_THROW(r.render_animation(frames, 0, default_animation_fit()), RenderError);

    SetAnimation cmd(frames, 0);
    EXPECT_THROW(cmd.raw_data_chunks(panel_of(96, 16),
                                     HardwareProfile::for_generation(DeviceGeneration::CoolLEDX)),
                 RenderError);

    // 113 frames still fit: 24 + 3 + 113 * 576 = 65115
    frames.resize(113);
    EXPECT_EQ(r.render_animation(frames, 0, default_animation_fit()).size(), 65115u);
}

namespace {

// red top half on every 4th column
cv::Mat animation_frame_0() {
    cv::Mat f(16, 96, CV_8UC3, kBlack);
    for (int x = 0; x < 96; x += 4) {
        f(cv::Rect(x, 0, 1, 8)).setTo(cv::Scalar(0, 0, 255));
    }
    return f;
}

// green bottom half on every 5th column, white last column
cv::Mat animation_frame_1() {
    cv::Mat f(16, 96, CV_8UC3, kBlack);
    for (int x = 0; x < 96; x += 5) {
        f(cv::Rect(x, 8, 1, 8)).setTo(cv::Scalar(0, 255, 0));
    }
    f.col(95).setTo(kWhite);
    return f;
}

}

TEST(Rasterizer, AnimationChunksGolden) {
    // 24 + 3 + 2 * 576 = 1179 (0x049b) bytes in ten chunks; speed 0x0102 is escaped
    SetAnimation cmd(std::vector<cv::Mat>{animation_frame_0(), animation_frame_1()}, 258);
    const HardwareProfile hw = HardwareProfile::for_generation(DeviceGeneration::CoolLEDX);
    std::vector<Bytes> chunks = cmd.command_chunks(panel_of(96, 16), hw);

    const std::vector<std::string> expected = {
        "0100880400049b000080000000000000000000000000000000000000000000000000020602050206ff00000000000000ff00000000000000ff00000000000000ff00000000000000ff00000000000000ff00000000000000ff00000000000000ff00000000000000ff00000000000000ff00000000000000ff00000000000000ff00000000000000ff00000000e103",
        "0100880400049b00020580000000ff00000000000000ff00000000000000ff00000000000000ff00000000000000ff00000000000000ff00000000000000ff00000000000000ff00000000000000ff00000000000000ff00000000000000ff0000000000000000000000000000000000000000000000000000000000000000000000000000000000000000e103",
        "0100880400049b0002068000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000001d03",
        "0100880400049b0002078000000000000000000000000000000000000000000000000000ffff00000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000001c03",
        "0100880400049b0004800000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000ff000000000000000000ff000000000000000000ff000000000000000000ff00000000001b03",
        "0100880400049b00058000000000ff000000000000000000ff000000000000000000ff000000000000000000ff000000000000000000ff000000000000000000ff000000000000000000ff000000000000000000ff000000000000000000ff000000000000000000ff000000000000000000ff000000000000000000ff000000000000000000ff000000e503",
        "0100880400049b000680000000000000ff000000000000000000ff0000000000000000ffff00000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000001903",
        "0100880400049b00078000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000001803",
        "0100880400049b00088000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000000001703",
        "0100230400049b00091b00000000000000000000000000000000000000000000000000ffff8d03",
    };
    ASSERT_EQ(chunks.size(), expected.size());
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        EXPECT_EQ(to_hex(chunks[i]), expected[i]) << "chunk " << i;

        DecodedFrame frame;
        std::string error;
        ASSERT_TRUE(FrameCodec::decode_frame(chunks[i], frame, error)) << error;
        const Bytes& c = frame.payload;
        EXPECT_EQ(c[0], 0x04);
        EXPECT_EQ((c[2] << 8) | c[3], 1179);
        EXPECT_EQ(static_cast<std::size_t>((c[4] << 8) | c[5]), i);
        EXPECT_EQ(static_cast<int>(c[6]), i + 1 < chunks.size() ? 128 : 1179 - 9 * 128);
        EXPECT_EQ(c.back(), FrameCodec::xor_checksum(c.data() + 1, c.size() - 2));
    }
}

TEST(Rasterizer, AnimationFileIsReadFrameByFrame) {
    // a numbered PNG sequence opens as a lossless multi-frame capture
    const std::string pattern = ::testing::TempDir() + "coolledx_anim_%03d.png";
    ASSERT_TRUE(cv::imwrite(::testing::TempDir() + "coolledx_anim_000.png", animation_frame_0()));
    ASSERT_TRUE(cv::imwrite(::testing::TempDir() + "coolledx_anim_001.png", animation_frame_1()));

    Rasterizer r(panel_of(96, 16));
    Bytes from_file = r.render_animation_file(pattern, 258, default_animation_fit());
    Bytes in_memory = r.render_animation({animation_frame_0(), animation_frame_1()}, 258,
                                         default_animation_fit());
    ASSERT_EQ(from_file.size(), 1179u);
    EXPECT_EQ(from_file[24], 2);
    EXPECT_EQ(to_hex(from_file), to_hex(in_memory));
}

TEST(Rasterizer, StillImageIsNotAnimated) {
    cv::Mat img(8, 8, CV_8UC3, kWhite);
    const std::string path = ::testing::TempDir() + "coolledx_still.png";
    ASSERT_TRUE(cv::imwrite(path, img));

    Rasterizer r(panel_of(8, 8));
    EXPECT_THROW(r.render_animation_file(path, 0, default_animation_fit()), RenderError);
}

// ===================== text =====================

TEST(Rasterizer, TextHeaderFollowsCharacterCount) {
    TextOptions opts;
    opts.font = "no-such-font-anywhere";  // Hershey fallback

    Rasterizer r(PanelDimensions{});
    Bytes payload = r.render_text("Hi!", opts, FitOptions());

    ASSERT_GT(payload.size(), 107u);
    for (std::size_t i = 0; i < 24; ++i) EXPECT_EQ(payload[i], 0x00);
    EXPECT_EQ(payload[24], 3);
    EXPECT_EQ(payload[25], 0x30);
    EXPECT_EQ(payload[27], 0x30);
    EXPECT_EQ(payload[28], 0x00);
    EXPECT_EQ(payload[104], 0x00);

    const std::size_t bits = bits_length_at(payload, 105);
    EXPECT_GT(bits, 0u);
    // three planes, two bytes per column at height 16
    EXPECT_EQ(bits % 6, 0u);
    EXPECT_EQ(payload.size(), 107u + bits);
}

TEST(Rasterizer, TextHeaderCountsCodePoints) {
    TextOptions opts;
    opts.font = "no-such-font-anywhere";
    Rasterizer r(PanelDimensions{});
    Bytes payload = r.render_text("\xc3\xa9t\xc3\xa9", opts, FitOptions());   // "été"
    EXPECT_EQ(payload[24], 3);
}

TEST(Rasterizer, LongTextUsesTwoByteLength) {
    TextOptions opts;
    opts.font = "no-such-font-anywhere";
    Rasterizer r(PanelDimensions{});
    Bytes payload = r.render_text(std::string(300, 'a'), opts, FitOptions());

    EXPECT_EQ(payload[24], 0x01);
    EXPECT_EQ(payload[25], 0x2C);
    // 79 placeholders, all used
    for (std::size_t i = 26; i < 105; ++i) EXPECT_EQ(payload[i], 0x30) << i;

    const std::size_t bits = bits_length_at(payload, 105);
    EXPECT_EQ(payload.size(), 107u + bits);
}

TEST(Rasterizer, ColorMarkersChangeTextColor) {
    TextOptions opts;
    opts.font = "no-such-font-anywhere";
    opts.font_height = 12;
    Rasterizer r(PanelDimensions{});
    cv::Mat img = r.render_text_image("<red>XX", opts, "black");

    ASSERT_GT(img.cols, 0);
    int red = 0, other = 0;
    for (int y = 0; y < img.rows; ++y) {
        for (int x = 0; x < img.cols; ++x) {
            const cv::Vec3b& px = img.at<cv::Vec3b>(y, x);
            if (px[2] >= 128 && px[1] < 128 && px[0] < 128) ++red;
            if (px[1] >= 128 || px[0] >= 128) ++other;
        }
    }
    EXPECT_GT(red, 0);
    EXPECT_EQ(other, 0);
}

TEST(Rasterizer, UnknownMarkerColorFails) {
    TextOptions opts;
    opts.font = "no-such-font-anywhere";
    Rasterizer r(PanelDimensions{});
    EXPECT_THROW(r.render_text("a<notacolor>b", opts, FitOptions()), ValidationError);
}

TEST(Rasterizer, MarkersCanBeDisabled) {
    TextOptions opts;
    opts.font = "no-such-font-anywhere";
    opts.use_markers = false;
    Rasterizer r(PanelDimensions{});
    // would be an unknown colour with markers on
    Bytes payload = r.render_text("a<notacolor>b", opts, FitOptions());
    EXPECT_EQ(payload[24], 13);
}
