#include "protocol_data.hpp"
#include <cstdio>
#include <algorithm>
#include <cctype>

namespace coolledx {

ErrorCode error_code_from_byte(std::uint8_t code) {
    if (code <= static_cast<std::uint8_t>(ErrorCode::DataChecksumError)) {
        return static_cast<ErrorCode>(code);
    }
    return ErrorCode::Unknown;
}

std::string error_code_name(std::uint8_t code) {
    switch (error_code_from_byte(code)) {
        case ErrorCode::Success:            return "SUCCESS";
        case ErrorCode::TransmissionFailed: return "TRANSMISSION_FAILED";
        case ErrorCode::DeviceAbnormality:  return "DEVICE_ABNORMALITY";
        case ErrorCode::DataError:          return "DATA_ERROR";
        case ErrorCode::DataLengthError:    return "DATA_LENGTH_ERROR";
        case ErrorCode::DataIdError:        return "DATA_ID_ERROR";
        case ErrorCode::DataChecksumError:  return "DATA_CHECKSUM_ERROR";
        default:
            break;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "Unknown error code: %02X", code);
    return buf;
}

const char* command_status_name(CommandStatus status) {
    switch (status) {
        case CommandStatus::NotStarted:   return "NOT_STARTED";
        case CommandStatus::Transmitted:  return "TRANSMITTED";
        case CommandStatus::Acknowledged: return "ACKNOWLEDGED";
        case CommandStatus::Error:        return "ERROR";
    }
    return "UNKNOWN";
}

bool parse_mode(const std::string& name, Mode& out) {
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "static")    { out = Mode::Static;    return true; }
    if (s == "left")      { out = Mode::Left;      return true; }
    if (s == "right")     { out = Mode::Right;     return true; }
    if (s == "up")        { out = Mode::Up;        return true; }
    if (s == "down")      { out = Mode::Down;      return true; }
    if (s == "snowflake") { out = Mode::Snowflake; return true; }
    if (s == "picture")   { out = Mode::Picture;   return true; }
    if (s == "laser")     { out = Mode::Laser;     return true; }
    return false;
}

}
