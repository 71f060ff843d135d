#ifndef WIFI_SCANNER_HPP
#define WIFI_SCANNER_HPP

#include <string>
#include <vector>
#include <cstdint>

class WifiScanner {
public:
    struct NetworkInfo {
        std::string mac;
        std::string ssid;
        std::string channel;
        std::string signal_level;     // dBm, e.g. "-47.00"
        uint32_t frequency = 0;       // MHz
        std::string security = "Open";
    };

    // Empty interface selects the first wireless interface found.
    explicit WifiScanner(const std::string& interface = "");
    ~WifiScanner();

    const std::string& interface() const { return interface_; }

    // Throws std::runtime_error when nl80211 cannot be reached or the
    // scan is refused.
    std::vector<NetworkInfo> scanNetwork();

    static std::string channelFromFrequency(uint32_t frequency);
    static std::string formatSignal(int32_t signal_mbm);

    // A trigger refused because a scan is already running still leaves
    // results to dump.
    static bool triggerFailureIsFatal(int err);
    // Readable text for a negative libnl error code.
    static std::string netlinkError(int err);

private:
    std::string interface_;
};

#endif
