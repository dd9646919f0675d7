#pragma once

#include <string>
#include <cstdint>

#include "../protocol_data.hpp"
#include "../hardware_profile.hpp"

namespace coolledx {

// One captured frame, host to sign (is_send) or sign to host.
struct CapturedFrame {
    bool          ok = false;
    std::string   error;
    bool          is_send = true;
    std::string   peer;
    int           handle = 0;
    std::uint16_t declared_length = 0;
    Bytes         command;
    std::string   action;
    Bytes         raw;
};

// Passive decoder for sniffed traffic. Never throws on malformed input.
class TrafficDecoder {
public:
    explicit TrafficDecoder(const HardwareProfile& hardware);

    CapturedFrame decode(const Bytes& raw, bool is_send, const std::string& peer, int handle) const;
    std::string describe(const CapturedFrame& frame) const;
    std::string action_string(const Bytes& command) const;

private:
    const HardwareProfile& hardware_;
};

// "AA BB CC ..." 16 bytes per line
std::string hex_dump(const Bytes& data);

}
