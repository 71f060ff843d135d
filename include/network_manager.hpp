#ifndef NETWORK_MANAGER_HPP
#define NETWORK_MANAGER_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <sdbus-c++/sdbus-c++.h>

#include "connection_status.hpp"

// NetworkManager client over the system bus, bound to one wireless device.
// D-Bus failures are reported as sdbus::Error.
class NetworkManager : public SnapshotSource {
public:
    explicit NetworkManager(const std::string& interface);
    ~NetworkManager() override;

    // Visible access points with the active one first.
    ActiveConnectionSnapshot activeConnections() override;

    // Adds a WPA-PSK (or open, for an empty password) profile and activates
    // it. Returns true once the connection reaches the activated state,
    // false if it is deactivated or the timeout expires.
    bool connect(const std::string& ssid, const std::string& password,
                 std::chrono::seconds timeout = std::chrono::seconds(30));

private:
    sdbus::ObjectPath devicePath();
    std::string accessPointSsid(const sdbus::ObjectPath& ap);
    uint32_t activeConnectionState(const sdbus::ObjectPath& active);

    std::string interface_;
    std::unique_ptr<sdbus::IConnection> connection_;
};

#endif
