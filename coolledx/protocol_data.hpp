// protocol_data.hpp
#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace coolledx {

using Bytes = std::vector<std::uint8_t>;

struct Protocol {
    static constexpr std::uint8_t STX = 0x01;
    static constexpr std::uint8_t ETX = 0x03;
    static constexpr std::uint8_t ESCAPE = 0x02;
    static constexpr std::uint8_t ESCAPE_OFFSET = 0x04;

    static constexpr std::size_t CHUNK_SIZE = 128;
    static constexpr std::size_t CHUNK_HEADER_SIZE = 6;     // reserved, total(2), index(2), size
    static constexpr std::size_t MAX_CHUNKED_PAYLOAD = 0xFFFF;  // total is a u16
    static constexpr std::size_t LENGTH_PREFIX_SIZE = 2;
    static constexpr std::size_t RESERVED_HEADER_SIZE = 24;

    static constexpr std::size_t TEXT_BUFFER_SIZE = 80;
    static constexpr std::size_t MAX_TEXT_LENGTH = 255;
    static constexpr std::uint8_t TEXT_PLACEHOLDER = 0x30;

    static constexpr std::size_t MAX_ANIMATION_FRAMES = 255;
    static constexpr int PIXELS_PER_BYTE = 8;
};

// Height must be a multiple of 8.
struct PanelDimensions {
    std::uint16_t width  = 96;
    std::uint16_t height = 16;
};

enum class ErrorCode : int {
    Unknown = -1,
    Success = 0,
    TransmissionFailed = 1,
    DeviceAbnormality = 2,
    DataError = 3,
    DataLengthError = 4,
    DataIdError = 5,
    DataChecksumError = 6
};

enum class CommandStatus {
    NotStarted,
    Transmitted,
    Acknowledged,
    Error
};

// Display modes for SetMode. The device accepts any byte.
enum class Mode : std::uint8_t {
    Static = 1,
    Left = 2,
    Right = 3,
    Up = 4,
    Down = 5,
    Snowflake = 6,
    Picture = 7,
    Laser = 8
};

ErrorCode error_code_from_byte(std::uint8_t code);
// Name of a raw status byte, "Unknown error code: XX" when unassigned.
std::string error_code_name(std::uint8_t code);
const char* command_status_name(CommandStatus status);
bool parse_mode(const std::string& name, Mode& out);

}
