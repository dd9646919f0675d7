#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <utility>

#include "protocol_data.hpp"

namespace coolledx {

enum class Action {
    Music,
    Text,
    Image,
    Animation,
    Icon,
    ButtonOff,
    Mode,
    Speed,
    Brightness,
    Switch,
    Xfer,
    InvertDisplay,
    ClearMaybe,
    ShowIcon,
    PowerDown,
    ButtonOn,
    InvertOrSomething,
    RequestSomething,
    Initialize
};

enum class DeviceGeneration {
    CoolLEDX,
    CoolLEDM,
    CoolLEDU,
    CoolLEDUX,
    CoolLEDMX
};

// Action to command-byte table for one device generation. Aliases (icon and
// buttonoff are both 0x05) are real and kept as-is.
class HardwareProfile {
public:
    static const HardwareProfile& for_generation(DeviceGeneration generation);
    // Picks the generation from an advertised device name, CoolLEDX if unknown.
    static const HardwareProfile& for_device_name(const std::string& name);

    DeviceGeneration generation() const { return generation_; }
    const std::string& name() const { return name_; }

    std::uint8_t command_byte(Action action) const;
    bool action_for_byte(std::uint8_t byte, Action& out) const;

    bool variable_dimensions() const { return variable_dimensions_; }
    PanelDimensions default_dimensions() const { return default_dimensions_; }

private:
    HardwareProfile(DeviceGeneration generation, const std::string& name,
                    const std::vector<std::pair<Action, std::uint8_t>>& table,
                    bool variable_dimensions, PanelDimensions default_dimensions);

    DeviceGeneration generation_;
    std::string name_;
    std::vector<std::pair<Action, std::uint8_t>> table_;
    bool variable_dimensions_;
    PanelDimensions default_dimensions_;
};

const char* action_name(Action action);
const char* generation_name(DeviceGeneration generation);
bool parse_generation(const std::string& name, DeviceGeneration& out);

}
