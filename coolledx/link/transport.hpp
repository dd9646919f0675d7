#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "../protocol_data.hpp"

namespace coolledx {

struct DeviceHandle {
    std::string address;
    std::string name;
};

struct Advertisement {
    DeviceHandle handle;
    Bytes        manufacturer_data;
};

// The wireless stack underneath a DeviceLink. Calls return false on failure
// and leave the reason in last_error(). Callbacks may run on a thread owned
// by the implementation.
class Transport {
public:
    typedef std::shared_ptr<Transport> ptr;
    typedef std::function<void(const std::string& characteristic, const Bytes& data)> NotifyCallback;
    typedef std::function<void()> DisconnectCallback;

    virtual ~Transport() {}

    virtual bool scan(const std::string& name_or_address, bool by_address,
                      std::chrono::milliseconds timeout, Advertisement& out) = 0;
    virtual bool connect(const DeviceHandle& device, std::chrono::milliseconds timeout,
                         DisconnectCallback on_disconnect) = 0;
    virtual bool is_connected() const = 0;
    virtual bool write(const std::string& characteristic, const Bytes& data, bool expect_response) = 0;
    virtual bool subscribe(const std::string& characteristic, NotifyCallback on_notification) = 0;
    virtual bool unsubscribe(const std::string& characteristic) = 0;
    virtual bool disconnect() = 0;

    virtual std::string last_error() const = 0;
};

}
