#include "hardware_profile.hpp"
#include "log.h"
#include "config.h"

#include <algorithm>
#include <cctype>

namespace coolledx {

static coolledx::Logger::ptr g_logger = COOLLEDX_LOG_NAME("hardware");

// ===================== Command tables =========================

// Shared by every generation seen so far. Bytes marked unproven come from
// vendor documentation or captured app traffic and are not verified.
static const std::vector<std::pair<Action, std::uint8_t>> kCoolLedTable = {
    {Action::Music,             0x01},
    {Action::Text,              0x02},
    {Action::Image,             0x03},
    {Action::Animation,         0x04},
    {Action::Icon,              0x05},
    {Action::ButtonOff,         0x05},  // unproven
    {Action::Mode,              0x06},
    {Action::Speed,             0x07},
    {Action::Brightness,        0x08},
    {Action::Switch,            0x09},
    {Action::Xfer,              0x0A},  // unproven
    {Action::InvertDisplay,     0x0C},
    {Action::ClearMaybe,        0x0D},  // seen before text on a CoolLEDM
    {Action::ShowIcon,          0x11},  // unproven
    {Action::PowerDown,         0x12},  // unproven
    {Action::ButtonOn,          0x13},  // unproven
    {Action::InvertOrSomething, 0x15},  // unproven
    {Action::RequestSomething,  0x1F},
    {Action::Initialize,        0x23},
};

static const PanelDimensions kFallbackDimensions = {kDefaultWidth, kDefaultHeight};

// ===================== HardwareProfile =========================

HardwareProfile::HardwareProfile(DeviceGeneration generation, const std::string& name,
                                 const std::vector<std::pair<Action, std::uint8_t>>& table,
                                 bool variable_dimensions, PanelDimensions default_dimensions)
    : generation_(generation),
      name_(name),
      table_(table),
      variable_dimensions_(variable_dimensions),
      default_dimensions_(default_dimensions)
{}

const HardwareProfile& HardwareProfile::for_generation(DeviceGeneration generation) {
    static const HardwareProfile x (DeviceGeneration::CoolLEDX,  "CoolLEDX",  kCoolLedTable, true, kFallbackDimensions);
    static const HardwareProfile m (DeviceGeneration::CoolLEDM,  "CoolLEDM",  kCoolLedTable, true, kFallbackDimensions);
    static const HardwareProfile u (DeviceGeneration::CoolLEDU,  "CoolLEDU",  kCoolLedTable, true, kFallbackDimensions);
    static const HardwareProfile ux(DeviceGeneration::CoolLEDUX, "CoolLEDUX", kCoolLedTable, true, kFallbackDimensions);
    static const HardwareProfile mx(DeviceGeneration::CoolLEDMX, "CoolLEDMX", kCoolLedTable, true, kFallbackDimensions);

    switch (generation) {
        case DeviceGeneration::CoolLEDM:  return m;
        case DeviceGeneration::CoolLEDU:  return u;
        case DeviceGeneration::CoolLEDUX: return ux;
        case DeviceGeneration::CoolLEDMX: return mx;
        case DeviceGeneration::CoolLEDX:
        default:
            return x;
    }
}

const HardwareProfile& HardwareProfile::for_device_name(const std::string& name) {
    DeviceGeneration generation;
    if (!parse_generation(name, generation)) {
        COOLLEDX_LOG_WARN(g_logger) << "Unknown device name '" << name << "', assuming CoolLEDX";
        generation = DeviceGeneration::CoolLEDX;
    }
    return for_generation(generation);
}

std::uint8_t HardwareProfile::command_byte(Action action) const {
    for (const auto& kv : table_) {
        if (kv.first == action) {
            return kv.second;
        }
    }
    // every generation maps every action
    COOLLEDX_LOG_ERROR(g_logger) << name_ << " has no byte for " << action_name(action);
    return 0x00;
}

bool HardwareProfile::action_for_byte(std::uint8_t byte, Action& out) const {
    for (const auto& kv : table_) {
        if (kv.second == byte) {
            out = kv.first;
            return true;
        }
    }
    return false;
}

// ===================== Names =========================

const char* action_name(Action action) {
    switch (action) {
        case Action::Music:             return "Music";
        case Action::Text:              return "Text";
        case Action::Image:             return "Image";
        case Action::Animation:         return "Animation";
        case Action::Icon:              return "Icon";
        case Action::ButtonOff:         return "Button Off";
        case Action::Mode:              return "Mode";
        case Action::Speed:             return "Speed";
        case Action::Brightness:        return "Brightness";
        case Action::Switch:            return "Switch";
        case Action::Xfer:              return "Transfer";
        case Action::InvertDisplay:     return "Invert Display";
        case Action::ClearMaybe:        return "Clear Maybe";
        case Action::ShowIcon:          return "Show Icon";
        case Action::PowerDown:         return "Power Down";
        case Action::ButtonOn:          return "Power On";
        case Action::InvertOrSomething: return "Invert Or Something";
        case Action::RequestSomething:  return "Request Something";
        case Action::Initialize:        return "Initialize";
    }
    return "Unknown";
}

const char* generation_name(DeviceGeneration generation) {
    return HardwareProfile::for_generation(generation).name().c_str();
}

bool parse_generation(const std::string& name, DeviceGeneration& out) {
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    // longest prefix first, "coolledux" must not match "coolledu"
    static const std::vector<std::pair<std::string, DeviceGeneration>> prefixes = {
        {"coolledux", DeviceGeneration::CoolLEDUX},
        {"coolledmx", DeviceGeneration::CoolLEDMX},
        {"coolledx",  DeviceGeneration::CoolLEDX},
        {"coolledm",  DeviceGeneration::CoolLEDM},
        {"coolledu",  DeviceGeneration::CoolLEDU},
    };
    for (const auto& p : prefixes) {
        if (s.compare(0, p.first.size(), p.first) == 0) {
            out = p.second;
            return true;
        }
    }
    return false;
}

}
