#ifndef REPORT_HPP
#define REPORT_HPP

#include <string>
#include <vector>

#include "connection_status.hpp"
#include "signal_tier.hpp"
#include "wifi_scanner.hpp"

struct ReportRow {
    bool is_current = false;
    std::string mac;
    std::string ssid;
    std::string channel;
    SignalTier tier = SignalTier::Bad;
    std::string signal_level;
    float signal = 0.0f;
    std::string security;
};

// Whole-string parse; anything unparsable reads as 0.0.
float parseSignalLevel(const std::string& level);

ReportRow buildRow(const WifiScanner::NetworkInfo& network,
                   const ActiveConnectionSnapshot& snapshot);

// Captures one snapshot and builds a row per network, in input order.
std::vector<ReportRow> buildReport(const std::vector<WifiScanner::NetworkInfo>& networks,
                                   SnapshotSource& source);

#endif
