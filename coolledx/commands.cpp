#include "commands.hpp"
#include "frame_codec.h"
#include "errors.hpp"
#include "render/rasterizer.hpp"

#include <sstream>

namespace coolledx {

static const std::size_t kMaxTruncatedLength = 32;

// ==================== Function Prototype Declaration ======================
static std::uint8_t checked_byte(int value, const char* what);
static void check_color(const std::string& color);
static void check_fit(const FitOptions& fit);

// ==================== Command =============================================

std::vector<Bytes> Command::command_chunks(const PanelDimensions& panel,
                                           const HardwareProfile& hardware) const {
    std::vector<Bytes> raw = raw_data_chunks(panel, hardware);
    if (is_raw_passthrough()) {
        return raw;
    }
    std::vector<Bytes> frames;
    frames.reserve(raw.size());
    for (const auto& r : raw) {
        frames.push_back(FrameCodec::encode_frame(r));
    }
    return frames;
}

std::string Command::hex_string(const PanelDimensions& panel, const HardwareProfile& hardware) const {
    std::string s;
    for (const auto& c : command_chunks(panel, hardware)) {
        s += to_hex(c);
        s += "\n";
    }
    return s;
}

std::string Command::describe(const PanelDimensions& panel, const HardwareProfile& hardware) const {
    std::string hex;
    for (const auto& c : command_chunks(panel, hardware)) {
        hex += to_hex(c);
    }
    if (hex.size() > kMaxTruncatedLength) {
        hex = hex.substr(0, kMaxTruncatedLength) + "...";
    }
    return name() + "[" + hex + "]";
}

// ==================== Settings ============================================

SendRawData::SendRawData(const std::string& hex) {
    if (!from_hex(hex, data_)) {
        throw ValidationError("Raw data is not a valid hex string: " + hex);
    }
    if (data_.empty()) {
        throw ValidationError("Raw data is empty");
    }
}

std::vector<Bytes> SendRawData::raw_data_chunks(const PanelDimensions&, const HardwareProfile&) const {
    return {data_};
}

std::vector<Bytes> Initialize::raw_data_chunks(const PanelDimensions&, const HardwareProfile& hardware) const {
    return {Bytes{hardware.command_byte(Action::Initialize), 0x01}};
}

SetSpeed::SetSpeed(int speed)
    : speed_(checked_byte(speed, "Speed"))
{}

std::vector<Bytes> SetSpeed::raw_data_chunks(const PanelDimensions&, const HardwareProfile& hardware) const {
    return {Bytes{hardware.command_byte(Action::Speed), speed_}};
}

SetBrightness::SetBrightness(int brightness)
    : brightness_(checked_byte(brightness, "Brightness"))
{}

std::vector<Bytes> SetBrightness::raw_data_chunks(const PanelDimensions&, const HardwareProfile& hardware) const {
    return {Bytes{hardware.command_byte(Action::Brightness), brightness_}};
}

std::vector<Bytes> TurnOnOffApp::raw_data_chunks(const PanelDimensions&, const HardwareProfile& hardware) const {
    return {Bytes{hardware.command_byte(Action::Switch), static_cast<std::uint8_t>(on_ ? 0x01 : 0x00)}};
}

std::vector<Bytes> TurnOnOffButton::raw_data_chunks(const PanelDimensions&, const HardwareProfile& hardware) const {
    const std::uint8_t cmd = hardware.command_byte(on_ ? Action::ButtonOn : Action::ButtonOff);
    return {Bytes{cmd, static_cast<std::uint8_t>(on_ ? 0x01 : 0x00)}};
}

std::vector<Bytes> ShowChargingAnimation::raw_data_chunks(const PanelDimensions&, const HardwareProfile& hardware) const {
    return {Bytes{hardware.command_byte(Action::ShowIcon)}};
}

std::vector<Bytes> InvertDisplay::raw_data_chunks(const PanelDimensions&, const HardwareProfile& hardware) const {
    return {Bytes{hardware.command_byte(Action::InvertDisplay), static_cast<std::uint8_t>(inverted_ ? 0x01 : 0x00)}};
}

std::vector<Bytes> InvertOrSomething::raw_data_chunks(const PanelDimensions&, const HardwareProfile& hardware) const {
    return {Bytes{hardware.command_byte(Action::InvertOrSomething)}};
}

StartupWithBatteryLevel::StartupWithBatteryLevel(int battery_level)
    : battery_level_(checked_byte(battery_level, "Battery level"))
{}

std::vector<Bytes> StartupWithBatteryLevel::raw_data_chunks(const PanelDimensions&, const HardwareProfile& hardware) const {
    return {Bytes{hardware.command_byte(Action::Initialize), battery_level_}};
}

std::vector<Bytes> PowerDown::raw_data_chunks(const PanelDimensions&, const HardwareProfile& hardware) const {
    return {Bytes{hardware.command_byte(Action::PowerDown)}};
}

SetMode::SetMode(int mode)
    : mode_(checked_byte(mode, "Mode"))
{}

std::vector<Bytes> SetMode::raw_data_chunks(const PanelDimensions&, const HardwareProfile& hardware) const {
    return {Bytes{hardware.command_byte(Action::Mode), mode_}};
}

SetMusicBars::SetMusicBars(const Bytes& heights, const Bytes& colors)
    : heights_(heights),
      colors_(colors)
{
    if (heights_.size() != BAR_COUNT) {
        throw ValidationError("Heights must be 8 bytes, not " + std::to_string(heights_.size()));
    }
    if (colors_.size() != BAR_COUNT) {
        throw ValidationError("Colors must be 8 bytes, not " + std::to_string(colors_.size()));
    }
}

std::vector<Bytes> SetMusicBars::raw_data_chunks(const PanelDimensions&, const HardwareProfile& hardware) const {
    Bytes data;
    data.reserve(1 + 2 * BAR_COUNT);
    data.push_back(hardware.command_byte(Action::Music));
    data.insert(data.end(), heights_.begin(), heights_.end());
    data.insert(data.end(), colors_.begin(), colors_.end());
    return {data};
}

// ==================== Content =============================================

SetText::SetText(const std::string& text, const TextOptions& text_options, const FitOptions& fit)
    : text_(text),
      text_options_(text_options),
      fit_(fit)
{
    check_color(text_options_.color);
    check_fit(fit_);
    if (text_options_.font_height <= 0) {
        throw ValidationError("Font height must be positive, not " + std::to_string(text_options_.font_height));
    }
    if (text_options_.use_markers &&
        (text_options_.start_marker.empty() || text_options_.end_marker.empty())) {
        throw ValidationError("Color markers must not be empty");
    }
}

std::vector<Bytes> SetText::raw_data_chunks(const PanelDimensions& panel, const HardwareProfile& hardware) const {
    Rasterizer rasterizer(panel);
    Bytes payload = rasterizer.render_text(text_, text_options_, fit_);
    const Action action = text_options_.render_as_text ? Action::Text : Action::Image;
    return FrameCodec::split(payload, hardware.command_byte(action));
}

SetImage::SetImage(const std::string& path, const FitOptions& fit)
    : path_(path),
      fit_(fit)
{
    if (path_.empty()) {
        throw ValidationError("Image path is empty");
    }
    check_fit(fit_);
}

SetImage::SetImage(const cv::Mat& image, const FitOptions& fit)
    : image_(image.clone()),
      fit_(fit)
{
    if (image_.empty()) {
        throw ValidationError("Image is empty");
    }
    check_fit(fit_);
}

std::vector<Bytes> SetImage::raw_data_chunks(const PanelDimensions& panel, const HardwareProfile& hardware) const {
    Rasterizer rasterizer(panel);
    Bytes payload = path_.empty() ? rasterizer.render_image(image_, fit_)
                                  : rasterizer.render_image_file(path_, fit_);
    return FrameCodec::split(payload, hardware.command_byte(Action::Image));
}

static int checked_speed(int speed) {
    if (speed < 0 || speed > 0xFFFF) {
        throw ValidationError("Animation speed must be between 0 and 65535, not " + std::to_string(speed));
    }
    return speed;
}

SetAnimation::SetAnimation(const std::string& path, int speed, const FitOptions& fit)
    : path_(path),
      speed_(checked_speed(speed)),
      fit_(fit)
{
    if (path_.empty()) {
        throw ValidationError("Animation path is empty");
    }
    check_fit(fit_);
}

SetAnimation::SetAnimation(const std::vector<cv::Mat>& frames, int speed, const FitOptions& fit)
    : speed_(checked_speed(speed)),
      fit_(fit)
{
    if (frames.empty()) {
        throw ValidationError("Animation has no frames");
    }
    if (frames.size() > Protocol::MAX_ANIMATION_FRAMES) {
        throw ValidationError("Animation has " + std::to_string(frames.size()) + " frames, at most 255 allowed");
    }
    for (const auto& f : frames) {
        if (f.empty()) {
            throw ValidationError("Animation frame is empty");
        }
        frames_.push_back(f.clone());
    }
    check_fit(fit_);
}

std::vector<Bytes> SetAnimation::raw_data_chunks(const PanelDimensions& panel, const HardwareProfile& hardware) const {
    Rasterizer rasterizer(panel);
    Bytes payload = path_.empty() ? rasterizer.render_animation(frames_, speed_, fit_)
                                  : rasterizer.render_animation_file(path_, speed_, fit_);
    return FrameCodec::split(payload, hardware.command_byte(Action::Animation));
}

SetJT::SetJT(const std::string& path)
    : path_(path)
{
    if (path_.empty()) {
        throw ValidationError("JT path is empty");
    }
}

std::shared_ptr<SetJT> SetJT::from_document(const std::string& json) {
    if (json.empty()) {
        throw ValidationError("JT document is empty");
    }
    std::shared_ptr<SetJT> cmd(new SetJT());
    cmd->document_ = json;
    return cmd;
}

std::vector<Bytes> SetJT::raw_data_chunks(const PanelDimensions& panel, const HardwareProfile& hardware) const {
    Rasterizer rasterizer(panel);
    JtPayload jt = path_.empty() ? rasterizer.render_jt(document_) : rasterizer.render_jt_file(path_);
    const Action action = jt.is_static_image ? Action::Image : Action::Animation;
    return FrameCodec::split(jt.payload, hardware.command_byte(action));
}

// ==================== Helpers =============================================

static std::uint8_t checked_byte(int value, const char* what) {
    if (value < 0x00 || value > 0xFF) {
        std::ostringstream ss;
        ss << what << " must be between 0x00 and 0xFF, not " << value;
        throw ValidationError(ss.str());
    }
    return static_cast<std::uint8_t>(value);
}

static void check_color(const std::string& color) {
    cv::Scalar bgr;
    if (!parse_color(color, bgr)) {
        throw ValidationError("Unknown color: " + color);
    }
}

static void check_fit(const FitOptions& fit) {
    check_color(fit.background_color);
}

}
