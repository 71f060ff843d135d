#include "network_manager.hpp"
#include "report.hpp"
#include "report_printer.hpp"
#include "wifi_scanner.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <unistd.h>

static const char* kVersion = "1.0.2";

struct Options {
    std::string command;
    std::string interface;
    std::string ssid;
    std::string password;
    std::string active_from;
    bool json = false;
    bool colour = true;
    bool has_ssid = false;
    bool has_password = false;
};

void printHelp(std::ostream& out, const char* programName) {
    out << "ifwifi " << kVersion << "\n";
    out << "A simple wrapper over NetworkManager and nl80211 scanning\n\n";
    out << "Usage: " << programName << " <command> [options]\n\n";
    out << "Commands:\n";
    out << "  scan                     Scan wireless network\n";
    out << "  connect                  Connect to an Access Point\n\n";
    out << "Scan options:\n";
    out << "  -i, --interface IFACE    Wireless interface (default: first found)\n";
    out << "  -j, --json               Output as JSON\n";
    out << "      --no-color           Disable colored output\n";
    out << "      --active-from FILE   Read `nmcli -t -f active,ssid dev wifi` output\n";
    out << "                           from FILE ('-' for stdin) instead of D-Bus\n\n";
    out << "Connect options:\n";
    out << "  -s, --ssid SSID          SSID of wireless network\n";
    out << "  -p, --password PASSWORD  Password of the wireless network\n";
    out << "  -i, --interface IFACE    Wireless interface to connect through (default: wlan0)\n\n";
    out << "  -h, --help               Show this help message\n";
    out << "  -V, --version            Show version\n";
    out << "\nNote: scan and connect require root privileges.\n";
}

static bool take_value(int argc, char* argv[], int& i, std::string& value) {
    if (i + 1 >= argc) {
        std::cerr << "Missing value for option: " << argv[i] << "\n";
        return false;
    }
    value = argv[++i];
    return true;
}

// Returns false on a usage error, after reporting it.
static bool parse_options(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "-h" || arg == "--help") {
            opts.command = "help";
            return true;
        } else if (arg == "-V" || arg == "--version") {
            opts.command = "version";
            return true;
        } else if (opts.command.empty() && (arg == "scan" || arg == "connect")) {
            opts.command = arg;
        } else if (opts.command.empty()) {
            std::cerr << "Unknown command: " << arg << "\n";
            return false;
        } else if (arg == "-i" || arg == "--interface") {
            if (!take_value(argc, argv, i, opts.interface)) return false;
        } else if (opts.command == "scan" && (arg == "-j" || arg == "--json")) {
            opts.json = true;
        } else if (opts.command == "scan" && arg == "--no-color") {
            opts.colour = false;
        } else if (opts.command == "scan" && arg == "--active-from") {
            if (!take_value(argc, argv, i, opts.active_from)) return false;
        } else if (opts.command == "connect" && (arg == "-s" || arg == "--ssid")) {
            if (!take_value(argc, argv, i, opts.ssid)) return false;
            opts.has_ssid = true;
        } else if (opts.command == "connect" && (arg == "-p" || arg == "--password")) {
            if (!take_value(argc, argv, i, opts.password)) return false;
            opts.has_password = true;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        }
    }

    if (opts.command == "connect") {
        if (!opts.has_ssid || !opts.has_password) {
            std::cerr << "connect requires --ssid and --password\n";
            return false;
        }
        if (opts.interface.empty()) {
            opts.interface = "wlan0";
        }
    }
    return true;
}

static bool has_root_privileges() {
    return geteuid() == 0;
}

static int run_scan(const Options& opts) {
    WifiScanner scanner(opts.interface);
    auto networks = scanner.scanNetwork();

    std::vector<ReportRow> rows;
    if (opts.active_from.empty()) {
        NetworkManager manager(scanner.interface());
        rows = buildReport(networks, manager);
    } else if (opts.active_from == "-") {
        StreamSnapshotSource source(std::cin);
        rows = buildReport(networks, source);
    } else {
        std::ifstream in(opts.active_from);
        if (!in) {
            throw std::runtime_error("Cannot open " + opts.active_from);
        }
        StreamSnapshotSource source(in);
        rows = buildReport(networks, source);
    }

    ReportPrinter printer(std::cout, opts.colour && !opts.json && isatty(STDOUT_FILENO));
    if (opts.json) {
        printer.printJson(rows);
    } else {
        printer.printTable(rows);
    }
    return 0;
}

static int run_connect(const Options& opts) {
    NetworkManager manager(opts.interface);
    bool connected = manager.connect(opts.ssid, opts.password);
    std::cout << "Connection Status: " << (connected ? "connected" : "failed") << "\n";
    return connected ? 0 : 1;
}

int main(int argc, char* argv[]) {
    Options opts;
    if (!parse_options(argc, argv, opts)) {
        printHelp(std::cerr, argv[0]);
        return 1;
    }

    if (opts.command.empty() || opts.command == "help") {
        printHelp(std::cout, argv[0]);
        return 0;
    }
    if (opts.command == "version") {
        std::cout << "ifwifi " << kVersion << "\n";
        return 0;
    }

    if (!has_root_privileges()) {
        std::cerr << "You must be root!\n";
        std::cerr << "Please run with: sudo " << argv[0] << "\n";
        return 2;
    }

    try {
        if (opts.command == "scan") {
            return run_scan(opts);
        }
        return run_connect(opts);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
