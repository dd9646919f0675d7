#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>

#include "transport.hpp"
#include "../commands.hpp"

namespace coolledx {

// Single pending-acknowledgment slot. The sender arms it before a write and
// waits; the notification handler resolves it by value.
class AckSlot {
public:
    enum class WaitResult {
        Resolved,
        Timeout,
        Cancelled
    };

    std::uint64_t arm();
    // false when nothing is pending
    bool resolve(std::uint8_t code);
    WaitResult wait(std::uint64_t token, std::chrono::milliseconds timeout, std::uint8_t& code);
    void cancel();
    void clear();
    bool pending() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::uint64_t token_ = 0;
    bool armed_ = false;
    bool resolved_ = false;
    bool cancelled_ = false;
    std::uint8_t code_ = 0;
};

// Sends one command at a time and tracks its status. Callers serialize.
class CommandSession {
public:
    CommandSession(Transport& transport, const std::string& characteristic,
                   std::chrono::milliseconds ack_timeout);

    // Throws ValidationError/RenderError before any write, TransportError,
    // AckTimeoutError, DeviceError or CancelledError afterwards.
    void send(const Command& command, const PanelDimensions& panel, const HardwareProfile& hardware);

    // Fed by the link with every notification on the characteristic.
    void on_notification(const Bytes& data);
    // Abandons an in-flight wait, e.g. on shutdown.
    void cancel();

    CommandStatus status() const;
    std::uint8_t error_code() const;
    bool busy() const { return slot_.pending(); }

    void set_ack_timeout(std::chrono::milliseconds timeout) { ack_timeout_ = timeout; }
    std::chrono::milliseconds ack_timeout() const { return ack_timeout_; }

private:
    void set_status(CommandStatus status);

    Transport& transport_;
    std::string characteristic_;
    std::chrono::milliseconds ack_timeout_;
    AckSlot slot_;

    mutable std::mutex status_mutex_;
    CommandStatus status_ = CommandStatus::NotStarted;
    std::uint8_t error_code_ = 0;
    std::string current_name_;
};

// Status carried by a notification: byte 1 of a decodable frame, else success.
std::uint8_t notification_status(const Bytes& data);

}
