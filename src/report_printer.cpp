#include "report_printer.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>
#include <sstream>

static const char* kCurrent = "\033[1;5;32m";
static const char* kSsid    = "\033[1;33m";
static const char* kChannel = "\033[1;37m";
static const char* kReset   = "\033[0m";

// NaN sorts last.
static float sort_key(const ReportRow& row) {
    return std::isnan(row.signal) ? -std::numeric_limits<float>::infinity() : row.signal;
}

static void sort_by_signal(std::vector<ReportRow>& rows) {
    std::stable_sort(rows.begin(), rows.end(),
        [](const ReportRow& a, const ReportRow& b) {
            return sort_key(a) > sort_key(b);
        });
}

// Length of the well-formed UTF-8 sequence starting at s[i], 0 if invalid.
static size_t utf8_sequence_length(const std::string& s, size_t i) {
    unsigned char c = s[i];
    size_t len = 0;
    unsigned char lo = 0x80, hi = 0xbf;   // bounds for the second byte

    if (c < 0x80) return 1;
    if (c >= 0xc2 && c <= 0xdf) {
        len = 2;
    } else if (c >= 0xe0 && c <= 0xef) {
        len = 3;
        if (c == 0xe0) lo = 0xa0;          // overlong
        if (c == 0xed) hi = 0x9f;          // surrogates
    } else if (c >= 0xf0 && c <= 0xf4) {
        len = 4;
        if (c == 0xf0) lo = 0x90;          // overlong
        if (c == 0xf4) hi = 0x8f;          // above U+10FFFF
    } else {
        return 0;
    }

    if (i + len > s.size()) return 0;
    for (size_t k = 1; k < len; ++k) {
        unsigned char b = s[i + k];
        if (k == 1 ? (b < lo || b > hi) : (b < 0x80 || b > 0xbf)) {
            return 0;
        }
    }
    return len;
}

// Invalid UTF-8 bytes become U+FFFD.
static std::string json_escape(const std::string& s) {
    std::ostringstream out;
    for (size_t i = 0; i < s.size(); ) {
        unsigned char c = s[i];
        if (c >= 0x80) {
            size_t len = utf8_sequence_length(s, i);
            if (len == 0) {
                out << "\\ufffd";
                ++i;
            } else {
                out << s.substr(i, len);
                i += len;
            }
            continue;
        }
        switch (c) {
        case '"':  out << "\\\""; break;
        case '\\': out << "\\\\"; break;
        case '\n': out << "\\n";  break;
        case '\r': out << "\\r";  break;
        case '\t': out << "\\t";  break;
        default:
            if (c < 0x20 || c == 0x7f) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                out << buf;
            } else {
                out << c;
            }
        }
        ++i;
    }
    return out.str();
}

// SSIDs are raw beacon bytes; control bytes must not reach the terminal.
static std::string printable(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (c < 0x20 || c == 0x7f) {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\x%02x", c);
            out += buf;
        } else {
            out += static_cast<char>(c);
        }
    }
    return out;
}

std::string ReportPrinter::paint(const std::string& text, const char* sgr) const {
    if (!colour_) {
        return text;
    }
    return sgr + text + kReset;
}

// Padding is applied before painting so escape sequences do not count
// towards the column width.
static std::string pad(const std::string& text, size_t width) {
    if (text.size() >= width) {
        return text;
    }
    return text + std::string(width - text.size(), ' ');
}

void ReportPrinter::printTable(std::vector<ReportRow> rows) {
    if (rows.empty()) {
        out_ << "No networks found.\n";
        return;
    }

    sort_by_signal(rows);

    size_t ssid_width = 15;
    for (const auto& row : rows) {
        ssid_width = std::max(ssid_width, printable(row.ssid).size());
    }

    out_ << "  " << pad("MAC", 19)
         << pad("SSID", ssid_width + 2)
         << pad("CHANNEL", 9)
         << pad("SIGNAL", 9)
         << pad("QUALITY", 12)
         << "SECURITY" << "\n";

    for (const auto& row : rows) {
        const TierStyle& style = tierStyle(row.tier);
        out_ << (row.is_current ? paint("*", kCurrent) : std::string(" ")) << " "
             << pad(printable(row.mac), 19)
             << paint(pad(printable(row.ssid), ssid_width + 2), kSsid)
             << paint(pad(printable(row.channel), 9), kChannel)
             << pad(printable(row.signal_level), 9)
             << paint(pad(style.name, 12), style.sgr)
             << printable(row.security) << "\n";
    }

    out_ << "\nTotal networks found: " << rows.size() << "\n";
}

void ReportPrinter::printJson(std::vector<ReportRow> rows) {
    sort_by_signal(rows);

    out_ << "[";
    for (size_t i = 0; i < rows.size(); ++i) {
        const ReportRow& row = rows[i];
        out_ << "{";
        out_ << "\"current\":" << (row.is_current ? "true" : "false") << ",";
        out_ << "\"mac\":\"" << json_escape(row.mac) << "\",";
        out_ << "\"ssid\":\"" << json_escape(row.ssid) << "\",";
        out_ << "\"channel\":\"" << json_escape(row.channel) << "\",";
        out_ << "\"signal_level\":\"" << json_escape(row.signal_level) << "\",";
        out_ << "\"quality\":\"" << tierName(row.tier) << "\",";
        out_ << "\"security\":\"" << json_escape(row.security) << "\"";
        out_ << "}";
        if (i < rows.size() - 1) {
            out_ << ",";
        }
    }
    out_ << "]\n";
}
