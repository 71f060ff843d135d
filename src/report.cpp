#include "report.hpp"

#include <cctype>
#include <cstdlib>

float parseSignalLevel(const std::string& level) {
    if (level.empty() || std::isspace(static_cast<unsigned char>(level[0]))) {
        return 0.0f;
    }
    // strtof also accepts hexadecimal floats
    if (level.find_first_of("xX") != std::string::npos) {
        return 0.0f;
    }
    const char* begin = level.c_str();
    char* end = nullptr;
    float value = std::strtof(begin, &end);
    if (end == begin || *end != '\0') {
        return 0.0f;
    }
    return value;
}

ReportRow buildRow(const WifiScanner::NetworkInfo& network,
                   const ActiveConnectionSnapshot& snapshot) {
    ReportRow row;
    row.signal = parseSignalLevel(network.signal_level);
    row.tier = classifySignal(row.signal);
    row.is_current = isConnected(snapshot, network.ssid);
    row.mac = network.mac;
    row.ssid = network.ssid;
    row.channel = network.channel;
    row.signal_level = network.signal_level;
    row.security = network.security;
    return row;
}

std::vector<ReportRow> buildReport(const std::vector<WifiScanner::NetworkInfo>& networks,
                                   SnapshotSource& source) {
    const ActiveConnectionSnapshot snapshot = source.activeConnections();

    std::vector<ReportRow> rows;
    rows.reserve(networks.size());
    for (const auto& network : networks) {
        rows.push_back(buildRow(network, snapshot));
    }
    return rows;
}
