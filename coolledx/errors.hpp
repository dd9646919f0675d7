#pragma once
#include <stdexcept>
#include <string>
#include <cstdint>

#include "protocol_data.hpp"

namespace coolledx {

class CoolLedError : public std::runtime_error {
public:
    explicit CoolLedError(const std::string& what) : std::runtime_error(what) {}
};

// Bad command parameters. Raised before any I/O.
class ValidationError : public CoolLedError {
public:
    explicit ValidationError(const std::string& what) : CoolLedError(what) {}
};

class RenderError : public CoolLedError {
public:
    explicit RenderError(const std::string& what) : CoolLedError(what) {}
};

class ConnectionError : public CoolLedError {
public:
    ConnectionError(const std::string& target, int attempts, const std::string& reason)
        : CoolLedError("Failed to connect to " + target + " after " + std::to_string(attempts) +
                       " attempt(s): " + reason),
          target_(target),
          attempts_(attempts) {}

    const std::string& target() const { return target_; }
    int attempts() const { return attempts_; }

private:
    std::string target_;
    int attempts_;
};

// A write or subscribe on an open link failed.
class TransportError : public CoolLedError {
public:
    explicit TransportError(const std::string& what) : CoolLedError(what) {}
};

class AckTimeoutError : public CoolLedError {
public:
    explicit AckTimeoutError(const std::string& what) : CoolLedError(what) {}
};

class DeviceError : public CoolLedError {
public:
    explicit DeviceError(std::uint8_t code)
        : CoolLedError("Device reported error: " + error_code_name(code)),
          code_(code) {}

    std::uint8_t raw_code() const { return code_; }
    ErrorCode code() const { return error_code_from_byte(code_); }

private:
    std::uint8_t code_;
};

class CancelledError : public CoolLedError {
public:
    explicit CancelledError(const std::string& what) : CoolLedError(what) {}
};

}
