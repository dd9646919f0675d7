#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "coolledx/commands.hpp"
#include "coolledx/config.h"
#include "coolledx/errors.hpp"
#include "coolledx/frame_codec.h"
#include "coolledx/hardware_profile.hpp"
#include "coolledx/log.h"
#include "coolledx/decoder/traffic_decoder.hpp"

// Builds commands from the command line and prints what would go on the wire.

struct ToolArgs {
    std::string text, image, animation, jt, raw, funky, music, decode;
    int speed = -1, brightness = -1, mode = -1, onoff = -1, button = -1;
    int animation_speed = coolledx::kDefaultAnimationSpeed;
    bool from_sign = false;
    int width = coolledx::kDefaultWidth;
    int height = coolledx::kDefaultHeight;
    std::string hardware = "CoolLEDX";
    std::string log = "WARN";
    bool width_set = false, height_set = false, halign_set = false, valign_set = false;
    coolledx::TextOptions text_options;
    coolledx::FitOptions fit;
};

static void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "Content:\n"
              << "  -t, --text TEXT                 text, colours as <#rrggbb>\n"
              << "  -i, --image FILE                still image\n"
              << "  -n, --animation FILE            animated image\n"
              << "  -N, --animation-speed N         0..65535 (default 512)\n"
              << "      --jt FILE                   vendor JT file\n"
              << "  -r, --raw HEX                   raw bytes, sent unframed\n"
              << "Settings:\n"
              << "  -s, --speed N                   0..255\n"
              << "  -b, --brightness N              0..255\n"
              << "  -m, --mode N|NAME               static, left, right, up, down, snowflake, picture, laser\n"
              << "  -o, --onoff 0|1                 app switch\n"
              << "      --button 0|1                button on/off\n"
              << "      --music HEX                 8 heights then 8 colours (32 hex digits)\n"
              << "  -u, --funky CMD                 invert, revert, charging, startup, powerdown,\n"
              << "                                  initialize, invertorsomething\n"
              << "Rendering:\n"
              << "  -c, --color COLOR               text colour (default white)\n"
              << "  -C, --background-color COLOR    background (default black)\n"
              << "  -j, --start-color-marker S      default <\n"
              << "  -k, --end-color-marker S        default >\n"
              << "  -f, --font FONT                 font file or name (default arial)\n"
              << "  -H, --font-height N             pixels (default 13)\n"
              << "  -w, --width-treatment T         scale, croppad, asis\n"
              << "  -g, --height-treatment T        scale, croppad\n"
              << "  -z, --horizontal-alignment A    left, center, right, none\n"
              << "  -y, --vertical-alignment A      top, center, bottom\n"
              << "Device:\n"
              << "      --width N --height N        panel size (default 96x16)\n"
              << "      --hardware NAME             CoolLEDX, CoolLEDM, CoolLEDU, CoolLEDUX, CoolLEDMX\n"
              << "Diagnostics:\n"
              << "      --decode HEX                decode a captured frame\n"
              << "      --from-sign                 the captured frame came from the sign\n"
              << "  -l, --log LEVEL                 DEBUG, INFO, WARN, ERROR\n"
              << "  -h, --help\n";
}

static bool parse_args(int argc, char** argv, ToolArgs& a) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto value = [&](std::string& out) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                return false;
            }
            out = argv[++i];
            return true;
        };
        auto number = [&](int& out) {
            std::string v;
            if (!value(v)) return false;
            if (!coolledx::parse_int(v, out)) {
                std::cerr << "Not a number for " << arg << ": " << v << std::endl;
                return false;
            }
            return true;
        };
        std::string v;

        if (arg == "-h" || arg == "--help") { print_usage(argv[0]); std::exit(0); }
        else if (arg == "-t" || arg == "--text")       { if (!value(a.text)) return false; }
        else if (arg == "-i" || arg == "--image")      { if (!value(a.image)) return false; }
        else if (arg == "-n" || arg == "--animation")  { if (!value(a.animation)) return false; }
        else if (arg == "-N" || arg == "--animation-speed") { if (!number(a.animation_speed)) return false; }
        else if (arg == "--jt" || arg == "-jt" || arg == "--jtfile") { if (!value(a.jt)) return false; }
        else if (arg == "-r" || arg == "--raw")        { if (!value(a.raw)) return false; }
        else if (arg == "-s" || arg == "--speed")      { if (!number(a.speed)) return false; }
        else if (arg == "-b" || arg == "--brightness") { if (!number(a.brightness)) return false; }
        else if (arg == "-o" || arg == "--onoff")      { if (!number(a.onoff)) return false; }
        else if (arg == "--button")                    { if (!number(a.button)) return false; }
        else if (arg == "--music")                     { if (!value(a.music)) return false; }
        else if (arg == "-u" || arg == "--funky")      { if (!value(a.funky)) return false; }
        else if (arg == "-m" || arg == "--mode") {
            if (!value(v)) return false;
            coolledx::Mode m;
            if (coolledx::parse_mode(v, m)) {
                a.mode = static_cast<int>(m);
            } else if (!coolledx::parse_int(v, a.mode)) {
                std::cerr << "Unknown mode: " << v << std::endl;
                return false;
            }
        }
        else if (arg == "-c" || arg == "--color")            { if (!value(a.text_options.color)) return false; }
        else if (arg == "-C" || arg == "--background-color") { if (!value(a.fit.background_color)) return false; }
        else if (arg == "-j" || arg == "--start-color-marker") { if (!value(a.text_options.start_marker)) return false; }
        else if (arg == "-k" || arg == "--end-color-marker")   { if (!value(a.text_options.end_marker)) return false; }
        else if (arg == "-f" || arg == "--font")             { if (!value(a.text_options.font)) return false; }
        else if (arg == "-H" || arg == "--font-height")      { if (!number(a.text_options.font_height)) return false; }
        else if (arg == "-w" || arg == "--width-treatment") {
            if (!value(v) || !coolledx::parse_width_treatment(v, a.fit.width_treatment)) {
                std::cerr << "Bad width treatment: " << v << std::endl;
                return false;
            }
            a.width_set = true;
        }
        else if (arg == "-g" || arg == "--height-treatment") {
            if (!value(v) || !coolledx::parse_height_treatment(v, a.fit.height_treatment)) {
                std::cerr << "Bad height treatment: " << v << std::endl;
                return false;
            }
            a.height_set = true;
        }
        else if (arg == "-z" || arg == "--horizontal-alignment") {
            if (!value(v) || !coolledx::parse_horizontal_alignment(v, a.fit.horizontal_alignment)) {
                std::cerr << "Bad horizontal alignment: " << v << std::endl;
                return false;
            }
            a.halign_set = true;
        }
        else if (arg == "-y" || arg == "--vertical-alignment") {
            if (!value(v) || !coolledx::parse_vertical_alignment(v, a.fit.vertical_alignment)) {
                std::cerr << "Bad vertical alignment: " << v << std::endl;
                return false;
            }
            a.valign_set = true;
        }
        else if (arg == "--width")     { if (!number(a.width)) return false; }
        else if (arg == "--height")    { if (!number(a.height)) return false; }
        else if (arg == "--hardware")  { if (!value(a.hardware)) return false; }
        else if (arg == "--decode")    { if (!value(a.decode)) return false; }
        else if (arg == "--from-sign") { a.from_sign = true; }
        else if (arg == "-l" || arg == "--log") { if (!value(a.log)) return false; }
        else {
            std::cerr << "Unknown option: " << arg << std::endl;
            return false;
        }
    }
    return true;
}

// Animations keep their own defaults unless the user overrode a setting.
static coolledx::FitOptions animation_fit(const ToolArgs& a) {
    coolledx::FitOptions f = coolledx::default_animation_fit();
    f.background_color = a.fit.background_color;
    if (a.width_set)  f.width_treatment      = a.fit.width_treatment;
    if (a.height_set) f.height_treatment     = a.fit.height_treatment;
    if (a.halign_set) f.horizontal_alignment = a.fit.horizontal_alignment;
    if (a.valign_set) f.vertical_alignment   = a.fit.vertical_alignment;
    return f;
}

static std::vector<coolledx::Command::ptr> build_commands(const ToolArgs& a) {
    using namespace coolledx;
    std::vector<Command::ptr> cmds;

    if (!a.raw.empty()) cmds.push_back(std::make_shared<SendRawData>(a.raw));

    if (!a.funky.empty()) {
        if (a.funky == "invert")                 cmds.push_back(std::make_shared<InvertDisplay>(true));
        else if (a.funky == "revert")            cmds.push_back(std::make_shared<InvertDisplay>(false));
        else if (a.funky == "charging")          cmds.push_back(std::make_shared<ShowChargingAnimation>());
        else if (a.funky == "startup")           cmds.push_back(std::make_shared<StartupWithBatteryLevel>(15));
        else if (a.funky == "powerdown")         cmds.push_back(std::make_shared<PowerDown>());
        else if (a.funky == "initialize")        cmds.push_back(std::make_shared<Initialize>());
        else if (a.funky == "invertorsomething") cmds.push_back(std::make_shared<InvertOrSomething>());
        else throw ValidationError("Unknown funky command: " + a.funky);
    }

    if (!a.text.empty())      cmds.push_back(std::make_shared<SetText>(a.text, a.text_options, a.fit));
    if (!a.image.empty())     cmds.push_back(std::make_shared<SetImage>(a.image, a.fit));
    if (!a.animation.empty()) cmds.push_back(std::make_shared<SetAnimation>(a.animation, a.animation_speed, animation_fit(a)));
    if (!a.jt.empty())        cmds.push_back(std::make_shared<SetJT>(a.jt));

    if (!a.music.empty()) {
        Bytes bars;
        if (!from_hex(a.music, bars) || bars.size() != 2 * SetMusicBars::BAR_COUNT) {
            throw ValidationError("--music needs 16 bytes of hex: " + a.music);
        }
        cmds.push_back(std::make_shared<SetMusicBars>(Bytes(bars.begin(), bars.begin() + 8),
                                                      Bytes(bars.begin() + 8, bars.end())));
    }

    if (a.speed >= 0)      cmds.push_back(std::make_shared<SetSpeed>(a.speed));
    if (a.brightness >= 0) cmds.push_back(std::make_shared<SetBrightness>(a.brightness));
    if (a.mode >= 0)       cmds.push_back(std::make_shared<SetMode>(a.mode));
    if (a.onoff >= 0)      cmds.push_back(std::make_shared<TurnOnOffApp>(a.onoff != 0));
    if (a.button >= 0)     cmds.push_back(std::make_shared<TurnOnOffButton>(a.button != 0));
    return cmds;
}

int main(int argc, char** argv) {
    coolledx::Logger::ptr logger = COOLLEDX_LOG_ROOT();

    ToolArgs args;
    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 2;
    }

    coolledx::LogLevel::Level level = coolledx::LogLevel::FromString(args.log);
    if (level == coolledx::LogLevel::UNKNOWN) {
        std::cerr << "Unknown log level: " << args.log << std::endl;
        return 2;
    }
    coolledx::LoggerMgr::GetInstance()->setLevel(level);

    coolledx::DeviceGeneration generation;
    if (!coolledx::parse_generation(args.hardware, generation)) {
        std::cerr << "Unknown hardware: " << args.hardware << std::endl;
        return 2;
    }
    const coolledx::HardwareProfile& hardware = coolledx::HardwareProfile::for_generation(generation);

    if (!args.decode.empty()) {
        coolledx::Bytes raw;
        if (!coolledx::from_hex(args.decode, raw)) {
            std::cerr << "Not a hex string: " << args.decode << std::endl;
            return 2;
        }
        coolledx::TrafficDecoder decoder(hardware);
        coolledx::CapturedFrame frame = decoder.decode(raw, !args.from_sign,
                                                       args.from_sign ? "Us" : "Sign", 0);
        std::cout << decoder.describe(frame) << std::endl;
        return frame.ok ? 0 : 1;
    }

    if (args.width <= 0 || args.width > 0xFFFF || args.height <= 0 || args.height > 0xFFFF) {
        std::cerr << "Panel size out of range: " << args.width << "x" << args.height << std::endl;
        return 2;
    }
    coolledx::PanelDimensions panel;
    panel.width  = static_cast<std::uint16_t>(args.width);
    panel.height = static_cast<std::uint16_t>(args.height);

    try {
        std::vector<coolledx::Command::ptr> cmds = build_commands(args);
        if (cmds.empty()) {
            print_usage(argv[0]);
            return 2;
        }
        for (const auto& cmd : cmds) {
            COOLLEDX_LOG_INFO(logger) << "Encoding " << cmd->name() << " for " << hardware.name()
                                      << " " << panel.width << "x" << panel.height;
            std::cout << "# " << cmd->name()
                      << (cmd->expects_acknowledgment() ? "" : " (no acknowledgment)") << "\n"
                      << cmd->hex_string(panel, hardware);
        }
    } catch (const coolledx::CoolLedError& e) {
        COOLLEDX_LOG_ERROR(logger) << e.what();
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const cv::Exception& e) {
        COOLLEDX_LOG_ERROR(logger) << "OpenCV: " << e.what();
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
