#include "connection_status.hpp"

static std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return std::string();
    }
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

// nmcli escapes ':' and '\' inside terse field values.
static bool parse_record(const std::string& line, ActiveConnection& record) {
    std::string field;
    std::string active;
    bool split = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (c == '\\' && i + 1 < line.size()) {
            field += line[++i];
        } else if (c == ':' && !split) {
            active = field;
            field.clear();
            split = true;
        } else {
            field += c;
        }
    }

    if (!split) {
        return false;
    }
    record.active = (active == "yes");
    record.ssid = field;
    return true;
}

bool isConnected(const ActiveConnectionSnapshot& snapshot, const std::string& ssid) {
    if (snapshot.empty()) {
        return false;
    }
    const ActiveConnection& first = snapshot.front();
    return first.active && first.ssid == ssid;
}

ActiveConnectionSnapshot parseSnapshot(std::istream& in) {
    ActiveConnectionSnapshot snapshot;
    std::string line;

    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty()) continue;

        ActiveConnection record;
        if (parse_record(line, record)) {
            snapshot.push_back(record);
        }
    }
    return snapshot;
}

ActiveConnectionSnapshot orderSnapshot(const std::vector<std::string>& paths,
                                       const std::string& active_path,
                                       const std::vector<std::string>& ssids) {
    ActiveConnectionSnapshot snapshot;
    snapshot.reserve(paths.size());

    for (size_t i = 0; i < paths.size() && i < ssids.size(); ++i) {
        ActiveConnection entry;
        entry.active = (paths[i] == active_path);
        entry.ssid = ssids[i];

        if (entry.active) {
            snapshot.insert(snapshot.begin(), entry);
        } else {
            snapshot.push_back(entry);
        }
    }
    return snapshot;
}

ActiveConnectionSnapshot StreamSnapshotSource::activeConnections() {
    return parseSnapshot(in_);
}
