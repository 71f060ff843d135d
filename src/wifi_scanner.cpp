#include "wifi_scanner.hpp"
#include <linux/nl80211.h>
#include <netlink/netlink.h>
#include <netlink/genl/genl.h>
#include <netlink/genl/ctrl.h>
#include <net/if.h>
#include <sstream>
#include <iomanip>
#include <cstdio>
#include <cstring>
#include <ifaddrs.h>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>
#include <chrono>

struct ScanData {
    std::vector<WifiScanner::NetworkInfo>* networks;
};

using SocketPtr = std::unique_ptr<nl_sock, decltype(&nl_socket_free)>;
using MessagePtr = std::unique_ptr<nl_msg, decltype(&nlmsg_free)>;
using CallbackPtr = std::unique_ptr<nl_cb, decltype(&nl_cb_put)>;

static std::string find_wireless_interface() {
    struct ifaddrs *ifaddr, *ifa;
    std::string interface;

    if (getifaddrs(&ifaddr) == -1) {
        return "wlan0";
    }

    for (ifa = ifaddr; ifa != NULL; ifa = ifa->ifa_next) {
        if (ifa->ifa_name == NULL) continue;

        std::string name(ifa->ifa_name);
        if (name.find("wlan") == 0 || name.find("wlp") == 0 ||
            name.find("wlo") == 0 || name.find("wlx") == 0) {
            interface = name;
            break;
        }
    }

    freeifaddrs(ifaddr);
    return interface.empty() ? "wlan0" : interface;
}

static std::string format_mac(const uint8_t* mac) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (int i = 0; i < 6; i++) {
        if (i > 0) oss << ":";
        oss << std::setw(2) << static_cast<int>(mac[i]);
    }
    return oss.str();
}

static int scan_result_handler(struct nl_msg* msg, void* arg) {
    ScanData* data = static_cast<ScanData*>(arg);
    struct genlmsghdr* gnlh = static_cast<struct genlmsghdr*>(nlmsg_data(nlmsg_hdr(msg)));
    struct nlattr* tb[NL80211_ATTR_MAX + 1];
    struct nlattr* bss[NL80211_BSS_MAX + 1];

    nla_parse(tb, NL80211_ATTR_MAX, genlmsg_attrdata(gnlh, 0),
              genlmsg_attrlen(gnlh, 0), NULL);

    if (!tb[NL80211_ATTR_BSS]) {
        return NL_SKIP;
    }

    if (nla_parse_nested(bss, NL80211_BSS_MAX, tb[NL80211_ATTR_BSS], NULL)) {
        return NL_SKIP;
    }

    if (!bss[NL80211_BSS_BSSID]) {
        return NL_SKIP;
    }

    WifiScanner::NetworkInfo network;
    network.mac = format_mac(static_cast<uint8_t*>(nla_data(bss[NL80211_BSS_BSSID])));

    int32_t signal_mbm = 0;
    if (bss[NL80211_BSS_SIGNAL_MBM]) {
        signal_mbm = static_cast<int32_t>(nla_get_u32(bss[NL80211_BSS_SIGNAL_MBM]));
    }
    network.signal_level = WifiScanner::formatSignal(signal_mbm);

    if (bss[NL80211_BSS_FREQUENCY]) {
        network.frequency = nla_get_u32(bss[NL80211_BSS_FREQUENCY]);
    }
    network.channel = WifiScanner::channelFromFrequency(network.frequency);

    bool has_rsn = false;
    bool has_wpa = false;
    bool has_privacy = false;

    if (bss[NL80211_BSS_INFORMATION_ELEMENTS]) {
        uint8_t* ie = static_cast<uint8_t*>(nla_data(bss[NL80211_BSS_INFORMATION_ELEMENTS]));
        int ielen = nla_len(bss[NL80211_BSS_INFORMATION_ELEMENTS]);

        for (int i = 0; i < ielen; ) {
            if (i + 1 >= ielen) break;

            uint8_t id = ie[i];
            uint8_t len = ie[i + 1];

            if (i + 2 + len > ielen) break;

            if (id == 0) {
                // hidden networks advertise an empty or zero-filled SSID
                if (len > 0 && len <= 32 && ie[i + 2] != 0) {
                    network.ssid = std::string(reinterpret_cast<char*>(&ie[i + 2]), len);
                }
            }
            else if (id == 48) {
                has_rsn = true;
            }
            else if (id == 221 && len >= 4) {
                if (memcmp(&ie[i + 2], "\x00\x50\xf2\x01", 4) == 0) {
                    has_wpa = true;
                }
            }

            i += 2 + len;
        }
    }

    if (bss[NL80211_BSS_CAPABILITY]) {
        uint16_t capa = nla_get_u16(bss[NL80211_BSS_CAPABILITY]);
        has_privacy = (capa & (1 << 4)) != 0;
    }

    if (has_rsn && has_wpa) {
        network.security = "WPA/WPA2";
    } else if (has_rsn) {
        network.security = "WPA2";
    } else if (has_wpa) {
        network.security = "WPA";
    } else if (has_privacy) {
        network.security = "WEP";
    } else {
        network.security = "Open";
    }

    data->networks->push_back(network);
    return NL_SKIP;
}

static int finish_handler(struct nl_msg* msg, void* arg) {
    int* ret = static_cast<int*>(arg);
    *ret = 0;
    return NL_SKIP;
}

static int error_handler(struct sockaddr_nl* nla, struct nlmsgerr* err, void* arg) {
    int* ret = static_cast<int*>(arg);
    *ret = err->error;
    return NL_STOP;
}

static int ack_handler(struct nl_msg* msg, void* arg) {
    int* ret = static_cast<int*>(arg);
    *ret = 0;
    return NL_STOP;
}

// Sends msg and drives the callbacks until finish, ack or error.
static int send_and_wait(nl_sock* sock, nl_msg* msg, nl_cb* cb, int& err) {
    int rc = nl_send_auto(sock, msg);
    if (rc < 0) {
        err = rc;
        return rc;
    }
    while (err > 0) {
        rc = nl_recvmsgs(sock, cb);
        if (rc < 0) {
            err = rc;
            return rc;
        }
    }
    return err;
}

WifiScanner::WifiScanner(const std::string& interface)
    : interface_(interface.empty() ? find_wireless_interface() : interface) {}

WifiScanner::~WifiScanner() {}

std::string WifiScanner::channelFromFrequency(uint32_t frequency) {
    int channel = 0;
    if (frequency == 2484) {
        channel = 14;
    } else if (frequency >= 2412 && frequency <= 2472) {
        channel = (frequency - 2407) / 5;
    } else if (frequency >= 5000 && frequency <= 5895) {
        channel = (frequency - 5000) / 5;
    } else if (frequency >= 5955 && frequency <= 7115) {
        channel = (frequency - 5950) / 5;
    }
    return std::to_string(channel);
}

std::string WifiScanner::formatSignal(int32_t signal_mbm) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%.2f", signal_mbm / 100.0);
    return buf;
}

bool WifiScanner::triggerFailureIsFatal(int err) {
    return err != -NLE_BUSY;
}

std::string WifiScanner::netlinkError(int err) {
    return nl_geterror(err < 0 ? -err : err);
}

std::vector<WifiScanner::NetworkInfo> WifiScanner::scanNetwork() {
    std::vector<NetworkInfo> networks;

    SocketPtr sock(nl_socket_alloc(), nl_socket_free);
    if (!sock) {
        throw std::runtime_error("Failed to allocate netlink socket");
    }

    if (genl_connect(sock.get()) < 0) {
        throw std::runtime_error("Failed to connect to generic netlink");
    }

    int nl80211_id = genl_ctrl_resolve(sock.get(), "nl80211");
    if (nl80211_id < 0) {
        throw std::runtime_error("nl80211 not found (kernel might be too old or WiFi not available)");
    }

    std::cerr << "Using wireless interface: " << interface_ << std::endl;

    int if_index = if_nametoindex(interface_.c_str());
    if (if_index == 0) {
        throw std::runtime_error("Wireless interface " + interface_ +
                                 " not found, check available interfaces with: ip link show");
    }

    MessagePtr msg(nlmsg_alloc(), nlmsg_free);
    CallbackPtr cb(nl_cb_alloc(NL_CB_DEFAULT), nl_cb_put);
    if (!msg || !cb) {
        throw std::runtime_error("Failed to allocate netlink message");
    }

    genlmsg_put(msg.get(), 0, 0, nl80211_id, 0, 0, NL80211_CMD_TRIGGER_SCAN, 0);
    nla_put_u32(msg.get(), NL80211_ATTR_IFINDEX, if_index);

    int err = 1;
    nl_cb_err(cb.get(), NL_CB_CUSTOM, error_handler, &err);
    nl_cb_set(cb.get(), NL_CB_FINISH, NL_CB_CUSTOM, finish_handler, &err);
    nl_cb_set(cb.get(), NL_CB_ACK, NL_CB_CUSTOM, ack_handler, &err);

    if (send_and_wait(sock.get(), msg.get(), cb.get(), err) < 0) {
        if (triggerFailureIsFatal(err)) {
            throw std::runtime_error("Scan trigger failed: " + netlinkError(err));
        }
        std::cerr << "Scan already in progress, reading current results" << std::endl;
    }

    for (int attempt = 0; attempt < 10; attempt++) {
        if (attempt > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
        }

        MessagePtr dump(nlmsg_alloc(), nlmsg_free);
        CallbackPtr dump_cb(nl_cb_alloc(NL_CB_DEFAULT), nl_cb_put);
        if (!dump || !dump_cb) {
            throw std::runtime_error("Failed to allocate netlink message");
        }

        genlmsg_put(dump.get(), 0, 0, nl80211_id, 0, NLM_F_DUMP, NL80211_CMD_GET_SCAN, 0);
        nla_put_u32(dump.get(), NL80211_ATTR_IFINDEX, if_index);

        ScanData scan_data = {&networks};
        nl_cb_set(dump_cb.get(), NL_CB_VALID, NL_CB_CUSTOM, scan_result_handler, &scan_data);
        err = 1;
        nl_cb_err(dump_cb.get(), NL_CB_CUSTOM, error_handler, &err);
        nl_cb_set(dump_cb.get(), NL_CB_FINISH, NL_CB_CUSTOM, finish_handler, &err);

        if (send_and_wait(sock.get(), dump.get(), dump_cb.get(), err) < 0) {
            throw std::runtime_error("Reading scan results failed: " + netlinkError(err));
        }

        if (!networks.empty()) {
            break;
        }
    }

    return networks;
}
