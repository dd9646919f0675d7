#ifndef __COOLLEDX_FRAME_CODEC_H__
#define __COOLLEDX_FRAME_CODEC_H__

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include "protocol_data.hpp"

namespace coolledx {

    struct DecodedFrame {
        std::uint16_t declared_length = 0;
        Bytes payload;
        bool length_matches = false;
    };

    // Wire framing for the sign:
    //   0x01 | escape(len:u16BE | payload) | 0x03
    // Chunked content:
    //   cmd | 0x00 | total:u16BE | index:u16BE | size:u8 | data... | xor
    class FrameCodec {
        public:
        static Bytes escape(const Bytes& data);
        static bool unescape(const Bytes& data, Bytes& out, std::string& error);

        static Bytes encode_frame(const Bytes& payload);
        static bool decode_frame(const Bytes& frame, DecodedFrame& out, std::string& error);

        static std::uint8_t xor_checksum(const std::uint8_t* data, std::size_t size);
        static std::uint8_t xor_checksum(const Bytes& data);

        // Unframed chunks, each prefixed with the command byte.
        // Throws RenderError if the payload exceeds MAX_CHUNKED_PAYLOAD.
        static std::vector<Bytes> split(const Bytes& payload, std::uint8_t command_byte);
        // split() with every chunk passed through encode_frame().
        static std::vector<Bytes> chunk(const Bytes& payload, std::uint8_t command_byte);
    };

    std::string to_hex(const Bytes& data);
    bool from_hex(const std::string& hex, Bytes& out);
    // Decimal, or hex with a 0x prefix. False unless the whole string is a number that fits an int.
    bool parse_int(const std::string& s, int& out);
}

#endif
