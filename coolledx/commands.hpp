#pragma once

#include <memory>
#include <string>
#include <vector>
#include <cstdint>

#include <opencv2/core.hpp>

#include "protocol_data.hpp"
#include "hardware_profile.hpp"
#include "render/render_types.hpp"

namespace coolledx {

// Base of every message sent to the sign. Parameters are validated in the
// constructors (ValidationError); encoding takes the panel and hardware of the
// current connection.
class Command {
public:
    typedef std::shared_ptr<Command> ptr;
    virtual ~Command() {}

    // Payloads before framing. Content commands return their chunks, each
    // already prefixed with the command byte.
    virtual std::vector<Bytes> raw_data_chunks(const PanelDimensions& panel,
                                               const HardwareProfile& hardware) const = 0;
    virtual bool expects_acknowledgment() const { return true; }
    virtual bool is_raw_passthrough() const { return false; }
    virtual std::string name() const = 0;

    // What goes on the wire, one entry per write.
    std::vector<Bytes> command_chunks(const PanelDimensions& panel, const HardwareProfile& hardware) const;
    // One hex line per chunk.
    std::string hex_string(const PanelDimensions& panel, const HardwareProfile& hardware) const;
    // "Name[first 32 hex chars...]"
    std::string describe(const PanelDimensions& panel, const HardwareProfile& hardware) const;
};

// ===================== Settings =========================

class SendRawData : public Command {
public:
    explicit SendRawData(const std::string& hex);
    std::vector<Bytes> raw_data_chunks(const PanelDimensions&, const HardwareProfile&) const override;
    bool is_raw_passthrough() const override { return true; }
    std::string name() const override { return "SendRawData"; }

private:
    Bytes data_;
};

class Initialize : public Command {
public:
    std::vector<Bytes> raw_data_chunks(const PanelDimensions&, const HardwareProfile& hardware) const override;
    std::string name() const override { return "Initialize"; }
};

class SetSpeed : public Command {
public:
    explicit SetSpeed(int speed);
    std::vector<Bytes> raw_data_chunks(const PanelDimensions&, const HardwareProfile& hardware) const override;
    std::string name() const override { return "SetSpeed"; }

private:
    std::uint8_t speed_;
};

class SetBrightness : public Command {
public:
    explicit SetBrightness(int brightness);
    std::vector<Bytes> raw_data_chunks(const PanelDimensions&, const HardwareProfile& hardware) const override;
    std::string name() const override { return "SetBrightness"; }

private:
    std::uint8_t brightness_;
};

class TurnOnOffApp : public Command {
public:
    explicit TurnOnOffApp(bool on) : on_(on) {}
    std::vector<Bytes> raw_data_chunks(const PanelDimensions&, const HardwareProfile& hardware) const override;
    std::string name() const override { return "TurnOnOffApp"; }

private:
    bool on_;
};

// Unproven on real hardware.
class TurnOnOffButton : public Command {
public:
    explicit TurnOnOffButton(bool on) : on_(on) {}
    std::vector<Bytes> raw_data_chunks(const PanelDimensions&, const HardwareProfile& hardware) const override;
    bool expects_acknowledgment() const override { return false; }
    std::string name() const override { return "TurnOnOffButton"; }

private:
    bool on_;
};

class ShowChargingAnimation : public Command {
public:
    std::vector<Bytes> raw_data_chunks(const PanelDimensions&, const HardwareProfile& hardware) const override;
    bool expects_acknowledgment() const override { return false; }
    std::string name() const override { return "ShowChargingAnimation"; }
};

class InvertDisplay : public Command {
public:
    explicit InvertDisplay(bool inverted = false) : inverted_(inverted) {}
    std::vector<Bytes> raw_data_chunks(const PanelDimensions&, const HardwareProfile& hardware) const override;
    bool expects_acknowledgment() const override { return false; }
    std::string name() const override { return "InvertDisplay"; }

private:
    bool inverted_;
};

class InvertOrSomething : public Command {
public:
    std::vector<Bytes> raw_data_chunks(const PanelDimensions&, const HardwareProfile& hardware) const override;
    bool expects_acknowledgment() const override { return false; }
    std::string name() const override { return "InvertOrSomething"; }
};

class StartupWithBatteryLevel : public Command {
public:
    explicit StartupWithBatteryLevel(int battery_level);
    std::vector<Bytes> raw_data_chunks(const PanelDimensions&, const HardwareProfile& hardware) const override;
    std::string name() const override { return "StartupWithBatteryLevel"; }

private:
    std::uint8_t battery_level_;
};

class PowerDown : public Command {
public:
    std::vector<Bytes> raw_data_chunks(const PanelDimensions&, const HardwareProfile& hardware) const override;
    bool expects_acknowledgment() const override { return false; }
    std::string name() const override { return "PowerDown"; }
};

class SetMode : public Command {
public:
    explicit SetMode(Mode mode) : mode_(static_cast<std::uint8_t>(mode)) {}
    explicit SetMode(int mode);
    std::vector<Bytes> raw_data_chunks(const PanelDimensions&, const HardwareProfile& hardware) const override;
    bool expects_acknowledgment() const override { return false; }
    std::string name() const override { return "SetMode"; }

private:
    std::uint8_t mode_;
};

class SetMusicBars : public Command {
public:
    static constexpr std::size_t BAR_COUNT = 8;

    SetMusicBars(const Bytes& heights, const Bytes& colors);
    std::vector<Bytes> raw_data_chunks(const PanelDimensions&, const HardwareProfile& hardware) const override;
    bool expects_acknowledgment() const override { return false; }
    std::string name() const override { return "SetMusicBars"; }

private:
    Bytes heights_;
    Bytes colors_;
};

// ===================== Content =========================

class SetText : public Command {
public:
    SetText(const std::string& text,
            const TextOptions& text_options = TextOptions(),
            const FitOptions& fit = FitOptions());
    std::vector<Bytes> raw_data_chunks(const PanelDimensions& panel, const HardwareProfile& hardware) const override;
    std::string name() const override { return "SetText"; }

private:
    std::string text_;
    TextOptions text_options_;
    FitOptions fit_;
};

class SetImage : public Command {
public:
    explicit SetImage(const std::string& path, const FitOptions& fit = FitOptions());
    explicit SetImage(const cv::Mat& image, const FitOptions& fit = FitOptions());
    std::vector<Bytes> raw_data_chunks(const PanelDimensions& panel, const HardwareProfile& hardware) const override;
    std::string name() const override { return "SetImage"; }

private:
    std::string path_;
    cv::Mat image_;
    FitOptions fit_;
};

class SetAnimation : public Command {
public:
    explicit SetAnimation(const std::string& path, int speed = kDefaultAnimationSpeed,
                          const FitOptions& fit = default_animation_fit());
    explicit SetAnimation(const std::vector<cv::Mat>& frames, int speed = kDefaultAnimationSpeed,
                          const FitOptions& fit = default_animation_fit());
    std::vector<Bytes> raw_data_chunks(const PanelDimensions& panel, const HardwareProfile& hardware) const override;
    std::string name() const override { return "SetAnimation"; }

private:
    std::string path_;
    std::vector<cv::Mat> frames_;
    int speed_;
    FitOptions fit_;
};

// Vendor JT file, passed through without re-rendering.
class SetJT : public Command {
public:
    explicit SetJT(const std::string& path);
    static std::shared_ptr<SetJT> from_document(const std::string& json);

    std::vector<Bytes> raw_data_chunks(const PanelDimensions& panel, const HardwareProfile& hardware) const override;
    std::string name() const override { return "SetJT"; }

private:
    SetJT() {}

    std::string path_;
    std::string document_;
};

}
