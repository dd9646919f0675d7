#include "frame_codec.h"
#include "log.h"
#include "errors.hpp"
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstdio>
#include <algorithm>
#include <sstream>

namespace coolledx {

static coolledx::Logger::ptr g_logger = COOLLEDX_LOG_NAME("codec");

    Bytes FrameCodec::escape(const Bytes& data) {
        // 0x02 first, so the escapes added for 0x01 and 0x03 are not escaped again.
        Bytes pass1;
        pass1.reserve(data.size() * 2);
        for (std::uint8_t b : data) {
            if (b == Protocol::ESCAPE) {
                pass1.push_back(Protocol::ESCAPE);
                pass1.push_back(Protocol::ESCAPE + Protocol::ESCAPE_OFFSET);
            } else {
                pass1.push_back(b);
            }
        }

        Bytes out;
        out.reserve(pass1.size() * 2);
        for (std::uint8_t b : pass1) {
            if (b == Protocol::STX || b == Protocol::ETX) {
                out.push_back(Protocol::ESCAPE);
                out.push_back(static_cast<std::uint8_t>(b + Protocol::ESCAPE_OFFSET));
            } else {
                out.push_back(b);
            }
        }
        return out;
    }

    bool FrameCodec::unescape(const Bytes& data, Bytes& out, std::string& error) {
        out.clear();
        out.reserve(data.size());
        for (std::size_t i = 0; i < data.size(); ++i) {
            if (data[i] != Protocol::ESCAPE) {
                out.push_back(data[i]);
                continue;
            }
            if (i + 1 >= data.size()) {
                error = "Truncated escape sequence at end of frame";
                return false;
            }
            out.push_back(static_cast<std::uint8_t>(data[i + 1] - Protocol::ESCAPE_OFFSET));
            ++i;
        }
        return true;
    }

    Bytes FrameCodec::encode_frame(const Bytes& payload) {
        Bytes body;
        body.reserve(payload.size() + Protocol::LENGTH_PREFIX_SIZE);
        body.push_back(static_cast<std::uint8_t>((payload.size() >> 8) & 0xFF));
        body.push_back(static_cast<std::uint8_t>(payload.size() & 0xFF));
        body.insert(body.end(), payload.begin(), payload.end());

        Bytes escaped = escape(body);

        Bytes frame;
        frame.reserve(escaped.size() + 2);
        frame.push_back(Protocol::STX);
        frame.insert(frame.end(), escaped.begin(), escaped.end());
        frame.push_back(Protocol::ETX);
        return frame;
    }

    bool FrameCodec::decode_frame(const Bytes& frame, DecodedFrame& out, std::string& error) {
        Bytes decoded;
        if (!unescape(frame, decoded, error)) {
            return false;
        }
        if (decoded.empty()) {
            error = "Empty frame";
            return false;
        }
        if (decoded.front() != Protocol::STX) {
            char buf[64];
            snprintf(buf, sizeof(buf), "Invalid packet structure (opening byte != 0x01): %02X", decoded.front());
            error = buf;
            return false;
        }
        if (decoded.back() != Protocol::ETX) {
            char buf[64];
            snprintf(buf, sizeof(buf), "Invalid packet structure (closing byte != 0x03): %02X", decoded.back());
            error = buf;
            return false;
        }
        // STX, two length bytes, ETX
        if (decoded.size() < 4) {
            error = "Frame too short to carry a length";
            return false;
        }

        out.declared_length = static_cast<std::uint16_t>((decoded[1] << 8) | decoded[2]);
        out.payload.assign(decoded.begin() + 3, decoded.end() - 1);
        out.length_matches = out.declared_length == out.payload.size();
        if (!out.length_matches) {
            COOLLEDX_LOG_DEBUG(g_logger) << "Declared length " << out.declared_length
                                         << " differs from decoded length " << out.payload.size();
        }
        return true;
    }

    std::uint8_t FrameCodec::xor_checksum(const std::uint8_t* data, std::size_t size) {
        std::uint8_t x = 0;
        for (std::size_t i = 0; i < size; ++i) {
            x ^= data[i];
        }
        return x;
    }

    std::uint8_t FrameCodec::xor_checksum(const Bytes& data) {
        return xor_checksum(data.data(), data.size());
    }

    std::vector<Bytes> FrameCodec::split(const Bytes& payload, std::uint8_t command_byte) {
        std::vector<Bytes> chunks;
        const std::size_t total = payload.size();
        if (total > Protocol::MAX_CHUNKED_PAYLOAD) {
            std::stringstream ss;
            ss << "Content of " << total << " bytes does not fit the 16-bit chunk length (max "
               << Protocol::MAX_CHUNKED_PAYLOAD << ")";
            throw RenderError(ss.str());
        }

        for (std::size_t offset = 0, index = 0; offset < total; offset += Protocol::CHUNK_SIZE, ++index) {
            const std::size_t size = std::min(Protocol::CHUNK_SIZE, total - offset);

            Bytes c;
            c.reserve(1 + Protocol::CHUNK_HEADER_SIZE + size + 1);
            c.push_back(command_byte);
            c.push_back(0x00);
            c.push_back(static_cast<std::uint8_t>((total >> 8) & 0xFF));
            c.push_back(static_cast<std::uint8_t>(total & 0xFF));
            c.push_back(static_cast<std::uint8_t>((index >> 8) & 0xFF));
            c.push_back(static_cast<std::uint8_t>(index & 0xFF));
            c.push_back(static_cast<std::uint8_t>(size));
            c.insert(c.end(), payload.begin() + offset, payload.begin() + offset + size);

            // the command byte is not covered by the checksum
            c.push_back(xor_checksum(c.data() + 1, c.size() - 1));
            chunks.push_back(std::move(c));
        }
        return chunks;
    }

    std::vector<Bytes> FrameCodec::chunk(const Bytes& payload, std::uint8_t command_byte) {
        std::vector<Bytes> frames;
        for (const auto& c : split(payload, command_byte)) {
            frames.push_back(encode_frame(c));
        }
        return frames;
    }

    std::string to_hex(const Bytes& data) {
        static const char digits[] = "0123456789abcdef";
        std::string s;
        s.reserve(data.size() * 2);
        for (std::uint8_t b : data) {
            s.push_back(digits[b >> 4]);
            s.push_back(digits[b & 0x0F]);
        }
        return s;
    }

    static int hex_value(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    // Accepts "0a1b", "0a:1b" and "0a 1b".
    bool from_hex(const std::string& hex, Bytes& out) {
        out.clear();
        int hi = -1;
        for (char c : hex) {
            if (c == ':' || c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                if (hi >= 0) return false;
                continue;
            }
            int v = hex_value(c);
            if (v < 0) return false;
            if (hi < 0) {
                hi = v;
            } else {
                out.push_back(static_cast<std::uint8_t>((hi << 4) | v));
                hi = -1;
            }
        }
        return hi < 0;
    }

    bool parse_int(const std::string& s, int& out) {
        if (s.empty()) return false;
        const bool hex = s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X');
        char* end = nullptr;
        errno = 0;
        const long v = std::strtol(s.c_str(), &end, hex ? 16 : 10);
        if (*end != '\0' || errno == ERANGE) return false;
        if (v < INT_MIN || v > INT_MAX) return false;
        out = static_cast<int>(v);
        return true;
    }
}
