#include "network_manager.hpp"
#include <iostream>
#include <map>
#include <thread>

static const char* kNmService = "org.freedesktop.NetworkManager";
static const char* kNmPath = "/org/freedesktop/NetworkManager";
static const char* kNmInterface = "org.freedesktop.NetworkManager";
static const char* kWirelessInterface = "org.freedesktop.NetworkManager.Device.Wireless";
static const char* kAccessPointInterface = "org.freedesktop.NetworkManager.AccessPoint";
static const char* kActiveInterface = "org.freedesktop.NetworkManager.Connection.Active";

// NMActiveConnectionState
static const uint32_t kStateActivated = 2;
static const uint32_t kStateDeactivated = 4;

using Settings = std::map<std::string, std::map<std::string, sdbus::Variant>>;

NetworkManager::NetworkManager(const std::string& interface)
    : interface_(interface), connection_(sdbus::createSystemBusConnection()) {}

NetworkManager::~NetworkManager() {}

sdbus::ObjectPath NetworkManager::devicePath() {
    auto proxy = sdbus::createProxy(*connection_, kNmService, kNmPath);
    sdbus::ObjectPath device;
    proxy->callMethod("GetDeviceByIpIface")
         .onInterface(kNmInterface)
         .withArguments(interface_)
         .storeResultsTo(device);
    return device;
}

std::string NetworkManager::accessPointSsid(const sdbus::ObjectPath& ap) {
    auto proxy = sdbus::createProxy(*connection_, kNmService, ap);
    sdbus::Variant value = proxy->getProperty("Ssid").onInterface(kAccessPointInterface);
    auto bytes = value.get<std::vector<uint8_t>>();
    return std::string(bytes.begin(), bytes.end());
}

uint32_t NetworkManager::activeConnectionState(const sdbus::ObjectPath& active) {
    auto proxy = sdbus::createProxy(*connection_, kNmService, active);
    sdbus::Variant value = proxy->getProperty("State").onInterface(kActiveInterface);
    return value.get<uint32_t>();
}

ActiveConnectionSnapshot NetworkManager::activeConnections() {
    auto device = sdbus::createProxy(*connection_, kNmService, devicePath());

    std::vector<sdbus::ObjectPath> access_points;
    device->callMethod("GetAllAccessPoints")
          .onInterface(kWirelessInterface)
          .storeResultsTo(access_points);

    sdbus::Variant active_ap = device->getProperty("ActiveAccessPoint").onInterface(kWirelessInterface);
    auto active_path = active_ap.get<sdbus::ObjectPath>();

    std::vector<std::string> paths;
    std::vector<std::string> ssids;
    for (const auto& ap : access_points) {
        paths.push_back(ap);
        ssids.push_back(accessPointSsid(ap));
    }
    return orderSnapshot(paths, active_path, ssids);
}

bool NetworkManager::connect(const std::string& ssid, const std::string& password,
                             std::chrono::seconds timeout) {
    Settings settings;
    settings["connection"]["id"] = sdbus::Variant(ssid);
    settings["connection"]["type"] = sdbus::Variant(std::string("802-11-wireless"));
    settings["802-11-wireless"]["ssid"] = sdbus::Variant(std::vector<uint8_t>(ssid.begin(), ssid.end()));
    settings["802-11-wireless"]["mode"] = sdbus::Variant(std::string("infrastructure"));
    if (!password.empty()) {
        settings["802-11-wireless-security"]["key-mgmt"] = sdbus::Variant(std::string("wpa-psk"));
        settings["802-11-wireless-security"]["psk"] = sdbus::Variant(password);
    }

    auto proxy = sdbus::createProxy(*connection_, kNmService, kNmPath);
    sdbus::ObjectPath profile;
    sdbus::ObjectPath active;
    proxy->callMethod("AddAndActivateConnection")
         .onInterface(kNmInterface)
         .withArguments(settings, devicePath(), sdbus::ObjectPath("/"))
         .storeResultsTo(profile, active);

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        uint32_t state = 0;
        try {
            state = activeConnectionState(active);
        } catch (const sdbus::Error& e) {
            // NetworkManager drops the active connection object once
            // activation fails.
            if (e.getName() != "org.freedesktop.DBus.Error.UnknownObject" &&
                e.getName() != "org.freedesktop.DBus.Error.UnknownMethod") {
                throw;
            }
            std::cerr << "Activation of " << ssid << " ended: " << e.getMessage() << std::endl;
            return false;
        }
        if (state == kStateActivated) {
            return true;
        }
        if (state == kStateDeactivated) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }
    return false;
}
