#include "command_session.hpp"
#include "../errors.hpp"
#include "../frame_codec.h"
#include "../log.h"

#include <functional>

namespace coolledx {

static coolledx::Logger::ptr g_logger = COOLLEDX_LOG_NAME("session");

// ===================== AckSlot =========================

std::uint64_t AckSlot::arm() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++token_;
    armed_ = true;
    resolved_ = false;
    cancelled_ = false;
    code_ = 0;
    return token_;
}

bool AckSlot::resolve(std::uint8_t code) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!armed_ || resolved_) {
            return false;
        }
        resolved_ = true;
        code_ = code;
    }
    cv_.notify_all();
    return true;
}

AckSlot::WaitResult AckSlot::wait(std::uint64_t token, std::chrono::milliseconds timeout, std::uint8_t& code) {
    std::unique_lock<std::mutex> lock(mutex_);
    const bool woke = cv_.wait_for(lock, timeout, [&] {
        return token_ != token || resolved_ || cancelled_;
    });

    if (cancelled_ || token_ != token) {
        armed_ = false;
        return WaitResult::Cancelled;
    }
    if (!woke) {
        armed_ = false;
        return WaitResult::Timeout;
    }
    code = code_;
    armed_ = false;
    return WaitResult::Resolved;
}

void AckSlot::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!armed_) {
            return;
        }
        cancelled_ = true;
    }
    cv_.notify_all();
}

void AckSlot::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    armed_ = false;
    resolved_ = false;
}

bool AckSlot::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return armed_ && !resolved_;
}

// ===================== CommandSession =========================

namespace {

// Leaves the slot empty and the status terminal if send() unwinds.
class SendGuard {
public:
    SendGuard(AckSlot& slot, std::function<void()> on_unwind)
        : slot_(slot), on_unwind_(on_unwind) {}
    ~SendGuard() {
        slot_.clear();
        if (!done_) {
            on_unwind_();
        }
    }
    void done() { done_ = true; }

private:
    AckSlot& slot_;
    std::function<void()> on_unwind_;
    bool done_ = false;
};

}

CommandSession::CommandSession(Transport& transport, const std::string& characteristic,
                               std::chrono::milliseconds ack_timeout)
    : transport_(transport),
      characteristic_(characteristic),
      ack_timeout_(ack_timeout)
{}

void CommandSession::send(const Command& command, const PanelDimensions& panel,
                          const HardwareProfile& hardware) {
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        status_ = CommandStatus::NotStarted;
        error_code_ = 0;
        current_name_ = command.name();
    }

    // rendering errors surface here, before anything is written
    const std::vector<Bytes> chunks = command.command_chunks(panel, hardware);
    const bool expects_ack = command.expects_acknowledgment();

    SendGuard guard(slot_, [this] {
        std::lock_guard<std::mutex> lock(status_mutex_);
        if (status_ != CommandStatus::Acknowledged) {
            status_ = CommandStatus::Error;
        }
    });

    for (std::size_t i = 0; i < chunks.size(); ++i) {
        const Bytes& chunk = chunks[i];
        COOLLEDX_LOG_DEBUG(g_logger) << "Sending chunk " << i + 1 << "/" << chunks.size()
                                     << " of " << command.name() << ": " << to_hex(chunk);

        // ---- 1) arm before writing, a fast reply must not be lost ----
        const std::uint64_t token = expects_ack ? slot_.arm() : 0;
        set_status(CommandStatus::Transmitted);

        // ---- 2) write ----
        if (!transport_.write(characteristic_, chunk, expects_ack)) {
            const std::string reason = transport_.last_error();
            COOLLEDX_LOG_ERROR(g_logger) << "Write of " << command.name() << " chunk " << i
                                         << " failed: " << reason;
            throw TransportError("Write failed for " + command.name() + ": " + reason);
        }
        if (!expects_ack) {
            continue;
        }

        // ---- 3) wait for the sign ----
        std::uint8_t code = 0;
        switch (slot_.wait(token, ack_timeout_, code)) {
            case AckSlot::WaitResult::Resolved:
                break;
            case AckSlot::WaitResult::Timeout:
                COOLLEDX_LOG_ERROR(g_logger) << "Command " << command.name()
                                             << " did not receive a notification within "
                                             << ack_timeout_.count() << " ms";
                throw AckTimeoutError("Command " + command.name() + " was not acknowledged within " +
                                      std::to_string(ack_timeout_.count()) + " ms (chunk " +
                                      std::to_string(i + 1) + "/" + std::to_string(chunks.size()) + ")");
            case AckSlot::WaitResult::Cancelled:
                COOLLEDX_LOG_WARN(g_logger) << "Command " << command.name() << " cancelled";
                throw CancelledError("Command " + command.name() + " was cancelled");
        }

        if (code != static_cast<std::uint8_t>(ErrorCode::Success)) {
            {
                std::lock_guard<std::mutex> lock(status_mutex_);
                status_ = CommandStatus::Error;
                error_code_ = code;
            }
            COOLLEDX_LOG_ERROR(g_logger) << "Command " << command.name() << " received an error response: "
                                         << error_code_name(code) << "(" << static_cast<int>(code) << ")";
            throw DeviceError(code);
        }
        set_status(CommandStatus::Acknowledged);
    }

    guard.done();
}

void CommandSession::on_notification(const Bytes& data) {
    const std::uint8_t code = notification_status(data);
    if (!slot_.resolve(code)) {
        COOLLEDX_LOG_ERROR(g_logger) << "Received a notification without a current command: " << to_hex(data);
        return;
    }
    std::string name;
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        name = current_name_;
    }
    COOLLEDX_LOG_DEBUG(g_logger) << "Notification for " << name << ": " << error_code_name(code);
}

void CommandSession::cancel() {
    slot_.cancel();
}

CommandStatus CommandSession::status() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return status_;
}

std::uint8_t CommandSession::error_code() const {
    std::lock_guard<std::mutex> lock(status_mutex_);
    return error_code_;
}

void CommandSession::set_status(CommandStatus status) {
    std::lock_guard<std::mutex> lock(status_mutex_);
    status_ = status;
}

std::uint8_t notification_status(const Bytes& data) {
    DecodedFrame frame;
    std::string error;
    if (FrameCodec::decode_frame(data, frame, error) && frame.payload.size() >= 2) {
        return frame.payload[1];
    }
    return static_cast<std::uint8_t>(ErrorCode::Success);
}

}
