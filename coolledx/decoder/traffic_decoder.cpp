#include "traffic_decoder.hpp"
#include "../frame_codec.h"

#include <cstdio>
#include <sstream>

namespace coolledx {

static const std::size_t kBytesPerLine = 16;

TrafficDecoder::TrafficDecoder(const HardwareProfile& hardware)
    : hardware_(hardware)
{}

CapturedFrame TrafficDecoder::decode(const Bytes& raw, bool is_send, const std::string& peer, int handle) const {
    CapturedFrame f;
    f.is_send = is_send;
    f.peer = peer;
    f.handle = handle;
    f.raw = raw;

    DecodedFrame decoded;
    if (!FrameCodec::decode_frame(raw, decoded, f.error)) {
        f.action = "Malformed";
        return f;
    }
    f.ok = true;
    f.declared_length = decoded.declared_length;
    f.command = decoded.payload;
    f.action = action_string(f.command);
    return f;
}

std::string TrafficDecoder::action_string(const Bytes& command) const {
    if (command.empty()) {
        return "NA";
    }
    Action action;
    if (hardware_.action_for_byte(command[0], action)) {
        return action_name(action);
    }
    char buf[16];
    std::snprintf(buf, sizeof(buf), "Unknown %02X", command[0]);
    return buf;
}

std::string TrafficDecoder::describe(const CapturedFrame& frame) const {
    std::ostringstream ss;
    ss << (frame.is_send ? "-> " : "<- ") << frame.peer << " (" << frame.action << ") [" << frame.handle << "]";
    if (!frame.ok) {
        ss << " " << frame.error;
        const std::string dump = hex_dump(frame.raw);
        if (!dump.empty()) {
            ss << "\n" << dump;
        }
        return ss.str();
    }

    if (frame.declared_length != frame.command.size()) {
        ss << " length " << frame.declared_length << " declared, " << frame.command.size() << " decoded";
    }
    if (!frame.is_send && frame.command.size() >= 2) {
        ss << " status " << error_code_name(frame.command[1]);
    }
    const std::string dump = hex_dump(frame.command);
    if (!dump.empty()) {
        ss << "\n" << dump;
    }
    return ss.str();
}

std::string hex_dump(const Bytes& data) {
    std::string out;
    char buf[4];
    for (std::size_t i = 0; i < data.size(); ++i) {
        if (i > 0) {
            out += (i % kBytesPerLine == 0) ? "\n" : " ";
        }
        std::snprintf(buf, sizeof(buf), "%02X", data[i]);
        out += buf;
    }
    return out;
}

}
