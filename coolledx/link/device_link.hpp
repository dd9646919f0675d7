#ifndef __COOLLEDX_DEVICE_LINK_H__
#define __COOLLEDX_DEVICE_LINK_H__

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include "transport.hpp"
#include "command_session.hpp"
#include "../config.h"
#include "../hardware_profile.hpp"

namespace coolledx {

    struct LinkOptions {
        std::string device_name = kDefaultDeviceName;
        std::string device_address;           // empty: scan by name
        std::string characteristic_uuid = kDefaultCharacteristicUuid;
        std::chrono::milliseconds connection_timeout = kDefaultConnectionTimeout;
        std::chrono::milliseconds ack_timeout = kDefaultAckTimeout;
        int connection_retries = kDefaultConnectionRetries;
        std::chrono::milliseconds retry_delay = kDefaultRetryDelay;
        // pin the generation instead of deriving it from the device name
        bool force_hardware = false;
        DeviceGeneration hardware = DeviceGeneration::CoolLEDX;
    };

    // Owns one transport connection to one sign.
    class DeviceLink {
        public:
        DeviceLink(Transport::ptr transport, const LinkOptions& options = LinkOptions());
        ~DeviceLink();

        DeviceLink(const DeviceLink&) = delete;
        DeviceLink& operator=(const DeviceLink&) = delete;

        // Throws ConnectionError once every attempt has failed.
        void connect();
        // Reconnects first if the link dropped.
        void send_command(const Command& command);
        bool disconnect();
        void cancel();

        bool isConnected() const;
        PanelDimensions panel() const;
        const HardwareProfile& hardware() const;
        CommandStatus last_status() const { return session_.status(); }
        std::uint8_t last_error_code() const { return session_.error_code(); }
        const LinkOptions& options() const { return options_; }

        // Height/width from manufacturer data; false if too short.
        static bool parse_dimensions(const Bytes& manufacturer_data, PanelDimensions& out, std::string& error);

        private:
        // Shared with the transport callbacks, which can outlive the link.
        struct CallbackGuard {
            std::mutex mutex;
            DeviceLink* link = nullptr;
        };

        bool attempt_connect(std::string& error);
        void handle_notify(const std::string& characteristic, const Bytes& data);
        void handle_disconnect();
        std::string target() const;

        Transport::ptr transport_;
        LinkOptions options_;
        CommandSession session_;

        mutable std::mutex mutex_;
        PanelDimensions panel_;
        const HardwareProfile* hardware_;
        std::atomic<bool> subscribed_;
        std::atomic<bool> connected_;
        std::shared_ptr<CallbackGuard> guard_;
    };
}

#endif
