#ifndef CONNECTION_STATUS_HPP
#define CONNECTION_STATUS_HPP

#include <istream>
#include <string>
#include <vector>

struct ActiveConnection {
    bool active = false;
    std::string ssid;
};

// Network manager's view of known networks, active entry first.
using ActiveConnectionSnapshot = std::vector<ActiveConnection>;

// Only the first entry is consulted: the manager lists the active
// connection, if any, on its first line.
bool isConnected(const ActiveConnectionSnapshot& snapshot, const std::string& ssid);

// Parses terse `<active>:<ssid>` lines as printed by
// `nmcli -t -f active,ssid dev wifi`.
ActiveConnectionSnapshot parseSnapshot(std::istream& in);

// Builds a snapshot from access points listed by object path, with the
// one equal to active_path moved to the front. ssids[i] belongs to paths[i].
ActiveConnectionSnapshot orderSnapshot(const std::vector<std::string>& paths,
                                       const std::string& active_path,
                                       const std::vector<std::string>& ssids);

class SnapshotSource {
public:
    virtual ~SnapshotSource() = default;
    virtual ActiveConnectionSnapshot activeConnections() = 0;
};

class StreamSnapshotSource : public SnapshotSource {
public:
    explicit StreamSnapshotSource(std::istream& in) : in_(in) {}
    ActiveConnectionSnapshot activeConnections() override;

private:
    std::istream& in_;
};

#endif
