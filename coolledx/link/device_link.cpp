#include "device_link.hpp"
#include "../errors.hpp"
#include "../frame_codec.h"
#include "../log.h"
#include "../decoder/traffic_decoder.hpp"

#include <algorithm>
#include <cctype>
#include <thread>

namespace coolledx {

static coolledx::Logger::ptr g_logger = COOLLEDX_LOG_NAME("link");

static bool same_uuid(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

    DeviceLink::DeviceLink(Transport::ptr transport, const LinkOptions& options)
        : transport_(transport)
        , options_(options)
        , session_(*transport, options.characteristic_uuid, options.ack_timeout)
        , panel_{kDefaultWidth, kDefaultHeight}
        , hardware_(&HardwareProfile::for_generation(options.hardware))
        , subscribed_(false)
        , connected_(false)
        , guard_(std::make_shared<CallbackGuard>()) {
        guard_->link = this;
        COOLLEDX_LOG_DEBUG(g_logger) << "DeviceLink created for " << target();
    }

    DeviceLink::~DeviceLink() {
        {
            std::lock_guard<std::mutex> lock(guard_->mutex);
            guard_->link = nullptr;
        }
        session_.cancel();
        if (connected_ || subscribed_) {
            disconnect();
        }
    }

    void DeviceLink::connect() {
        COOLLEDX_LOG_DEBUG(g_logger) << "Initiating a connection to the device: " << target();

        const int attempts = std::max(1, options_.connection_retries);
        std::string error;
        bool ok = false;
        for (int attempt = 1; attempt <= attempts; ++attempt) {
            if (attempt_connect(error)) {
                ok = true;
                break;
            }
            COOLLEDX_LOG_WARN(g_logger) << "Connection to " << target() << " failed (attempt "
                                        << attempt << "/" << attempts << "): " << error;
            if (attempt < attempts) {
                COOLLEDX_LOG_INFO(g_logger) << "Retrying connection in " << options_.retry_delay.count()
                                            << " ms (" << attempts - attempt << " attempts remaining)...";
                std::this_thread::sleep_for(options_.retry_delay);
            }
        }
        if (!ok) {
            COOLLEDX_LOG_ERROR(g_logger) << "Connection failed after " << attempts << " attempts.";
            throw ConnectionError(target(), attempts, error);
        }

        if (!subscribed_) {
            std::shared_ptr<CallbackGuard> guard = guard_;
            bool sub = transport_->subscribe(options_.characteristic_uuid,
                [guard](const std::string& characteristic, const Bytes& data) {
                    std::lock_guard<std::mutex> lock(guard->mutex);
                    if (guard->link) {
                        guard->link->handle_notify(characteristic, data);
                    }
                });
            if (!sub) {
                const std::string reason = transport_->last_error();
                transport_->disconnect();
                connected_ = false;
                throw TransportError("Subscribe to " + options_.characteristic_uuid + " failed: " + reason);
            }
            subscribed_ = true;
        }
    }

    bool DeviceLink::attempt_connect(std::string& error) {
        const bool by_address = !options_.device_address.empty();
        const std::string& wanted = by_address ? options_.device_address : options_.device_name;

        // 1) scan
        Advertisement adv;
        if (!transport_->scan(wanted, by_address, options_.connection_timeout, adv)) {
            error = "Unable to locate " + wanted + " when scanning";
            const std::string reason = transport_->last_error();
            if (!reason.empty()) {
                error += ": " + reason;
            }
            return false;
        }
        COOLLEDX_LOG_DEBUG(g_logger) << "Found target device: " << adv.handle.name << " (" << adv.handle.address << ")";

        // 2) advertisement
        PanelDimensions dims;
        if (!parse_dimensions(adv.manufacturer_data, dims, error)) {
            error = "Device " + adv.handle.address + " unusable: " + error;
            return false;
        }

        // 3) connect
        std::shared_ptr<CallbackGuard> guard = guard_;
        auto on_disconnect = [guard] {
            std::lock_guard<std::mutex> lock(guard->mutex);
            if (guard->link) {
                guard->link->handle_disconnect();
            }
        };
        if (!transport_->connect(adv.handle, options_.connection_timeout, on_disconnect)) {
            error = transport_->last_error();
            return false;
        }

        const HardwareProfile& hw = options_.force_hardware
            ? HardwareProfile::for_generation(options_.hardware)
            : HardwareProfile::for_device_name(adv.handle.name.empty() ? options_.device_name : adv.handle.name);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            panel_ = dims;
            hardware_ = &hw;
        }
        subscribed_ = false;
        connected_ = true;
        COOLLEDX_LOG_INFO(g_logger) << "Connected to " << adv.handle.address << " (" << hw.name() << ", "
                                    << dims.width << "x" << dims.height << ")";
        return true;
    }

    void DeviceLink::send_command(const Command& command) {
        if (!isConnected()) {
            connect();
        }
        session_.send(command, panel(), hardware());
    }

    bool DeviceLink::disconnect() {
        bool ok = true;
        if (subscribed_) {
            if (!transport_->unsubscribe(options_.characteristic_uuid)) {
                COOLLEDX_LOG_WARN(g_logger) << "Unsubscribe failed: " << transport_->last_error();
                ok = false;
            }
            subscribed_ = false;
        }
        if (transport_->is_connected() && !transport_->disconnect()) {
            COOLLEDX_LOG_WARN(g_logger) << "Disconnect failed: " << transport_->last_error();
            ok = false;
        }
        connected_ = false;
        COOLLEDX_LOG_DEBUG(g_logger) << "Disconnected from " << target();
        return ok;
    }

    void DeviceLink::cancel() {
        session_.cancel();
    }

    bool DeviceLink::isConnected() const {
        return connected_ && transport_->is_connected();
    }

    PanelDimensions DeviceLink::panel() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return panel_;
    }

    const HardwareProfile& DeviceLink::hardware() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return *hardware_;
    }

    bool DeviceLink::parse_dimensions(const Bytes& manufacturer_data, PanelDimensions& out, std::string& error) {
        // [0..5] mac, [6] height, [7] ?, [8] width
        if (manufacturer_data.size() < kMinManufacturerDataLength) {
            error = "manufacturer data too short: " + to_hex(manufacturer_data);
            return false;
        }

        out.height = manufacturer_data[kManufacturerHeightOffset];
        out.width  = manufacturer_data[kManufacturerWidthOffset];
        if (out.width == 0 || out.height == 0) {
            COOLLEDX_LOG_WARN(g_logger) << "Advertised size " << out.width << "x" << out.height
                                        << " is unusable, assuming " << kDefaultWidth << "x" << kDefaultHeight;
            out.width  = kDefaultWidth;
            out.height = kDefaultHeight;
        }
        if (out.height % Protocol::PIXELS_PER_BYTE != 0) {
            COOLLEDX_LOG_WARN(g_logger) << "Advertised height " << out.height << " is not a multiple of 8";
        }
        return true;
    }

    void DeviceLink::handle_notify(const std::string& characteristic, const Bytes& data) {
        if (!same_uuid(characteristic, options_.characteristic_uuid)) {
            COOLLEDX_LOG_WARN(g_logger) << "Received notification from unexpected characteristic: from "
                                        << characteristic << " data: " << to_hex(data);
            return;
        }
        COOLLEDX_LOG_DEBUG(g_logger) << "Received notification: " << to_hex(data);
        if (g_logger->getLevel() <= LogLevel::DEBUG) {
            TrafficDecoder decoder(hardware());
            COOLLEDX_LOG_DEBUG(g_logger) << "Received notification (decoded): "
                                         << decoder.describe(decoder.decode(data, false, "Us", 0));
        }
        session_.on_notification(data);
    }

    void DeviceLink::handle_disconnect() {
        COOLLEDX_LOG_INFO(g_logger) << "Disconnected from device: " << target();
        connected_ = false;
        subscribed_ = false;
        // nothing will answer an outstanding wait now
        session_.cancel();
    }

    std::string DeviceLink::target() const {
        return options_.device_address.empty() ? options_.device_name : options_.device_address;
    }
}
