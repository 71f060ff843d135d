#include "gtest/gtest.h"
#include "report_printer.hpp"
#include <sstream>
#include <string>
#include <vector>

static ReportRow make_row(const std::string& ssid, float signal, bool current = false)
{
    ReportRow row;
    row.is_current = current;
    row.mac = "00:11:22:33:44:55";
    row.ssid = ssid;
    row.channel = "11";
    row.signal = signal;
    row.signal_level = std::to_string(static_cast<int>(signal)) + ".00";
    row.tier = classifySignal(signal);
    row.security = "WPA2";
    return row;
}

TEST(PrintTableTests, empty_report)
{
    std::ostringstream out;
    ReportPrinter printer(out, false);
    printer.printTable({});
    EXPECT_EQ("No networks found.\n", out.str());
}

TEST(PrintTableTests, sorts_strongest_first_and_is_stable)
{
    std::ostringstream out;
    ReportPrinter printer(out, false);
    printer.printTable({ make_row("weak", -75.0f),
                         make_row("first", -40.0f),
                         make_row("strong", -20.0f),
                         make_row("second", -40.0f) });

    std::string text = out.str();
    auto strong = text.find("strong");
    auto first = text.find("first");
    auto second = text.find("second");
    auto weak = text.find("weak");
    ASSERT_NE(std::string::npos, weak);
    EXPECT_LT(strong, first);
    EXPECT_LT(first, second);
    EXPECT_LT(second, weak);
    EXPECT_NE(std::string::npos, text.find("Total networks found: 4"));
}

TEST(PrintTableTests, marks_current_network_and_names_tier)
{
    std::ostringstream out;
    ReportPrinter printer(out, false);
    printer.printTable({ make_row("home", -55.0f, true), make_row("office", -82.0f) });

    std::istringstream lines(out.str());
    std::string header, home, office;
    std::getline(lines, header);
    std::getline(lines, home);
    std::getline(lines, office);

    EXPECT_EQ(0u, home.find("* 00:11:22:33:44:55"));
    EXPECT_NE(std::string::npos, home.find("Good"));
    EXPECT_EQ(0u, office.find("  00:11:22:33:44:55"));
    EXPECT_NE(std::string::npos, office.find("Bad"));
}

TEST(PrintTableTests, colour_off_emits_no_escapes)
{
    std::ostringstream out;
    ReportPrinter printer(out, false);
    printer.printTable({ make_row("home", -55.0f, true) });
    EXPECT_EQ(std::string::npos, out.str().find('\033'));
}

TEST(PrintTableTests, colour_on_styles_tier)
{
    std::ostringstream out;
    ReportPrinter printer(out, true);
    printer.printTable({ make_row("lobby", -85.0f) });
    EXPECT_NE(std::string::npos, out.str().find(std::string(tierStyle(SignalTier::Bad).sgr) + "Bad"));
}

TEST(PrintJsonTests, emits_sorted_array_with_escaping)
{
    std::ostringstream out;
    ReportPrinter printer(out, true);
    printer.printJson({ make_row("say \"hi\"", -70.0f), make_row("home", -30.0f, true) });

    std::string expected =
        "[{\"current\":true,\"mac\":\"00:11:22:33:44:55\",\"ssid\":\"home\",\"channel\":\"11\","
        "\"signal_level\":\"-30.00\",\"quality\":\"Maximum\",\"security\":\"WPA2\"},"
        "{\"current\":false,\"mac\":\"00:11:22:33:44:55\",\"ssid\":\"say \\\"hi\\\"\",\"channel\":\"11\","
        "\"signal_level\":\"-70.00\",\"quality\":\"Weak\",\"security\":\"WPA2\"}]\n";
    EXPECT_EQ(expected, out.str());
}

TEST(PrintJsonTests, empty_report_is_empty_array)
{
    std::ostringstream out;
    ReportPrinter printer(out, false);
    printer.printJson({});
    EXPECT_EQ("[]\n", out.str());
}

TEST(PrintTableTests, control_bytes_in_ssid_are_shown_escaped)
{
    std::ostringstream out;
    ReportPrinter printer(out, false);
    printer.printTable({ make_row("evil\033[2Jnet\x07", -55.0f) });

    std::string text = out.str();
    EXPECT_EQ(std::string::npos, text.find('\033'));
    EXPECT_EQ(std::string::npos, text.find('\x07'));
    EXPECT_NE(std::string::npos, text.find("evil\\x1b[2Jnet\\x07"));
}

TEST(PrintTableTests, colour_on_only_emits_own_escapes)
{
    std::ostringstream out;
    ReportPrinter printer(out, true);
    printer.printTable({ make_row("\033]0;pwned\007", -55.0f) });
    EXPECT_EQ(std::string::npos, out.str().find("\033]0;"));
    EXPECT_NE(std::string::npos, out.str().find("\\x1b]0;pwned\\x07"));
}

TEST(PrintJsonTests, invalid_utf8_is_replaced)
{
    std::ostringstream out;
    ReportPrinter printer(out, false);
    printer.printJson({ make_row(std::string("caf\xe9 \xc3\xa9 \xed\xa0\x80 \xf0\x9f\x93\xb6"), -40.0f) });

    std::string text = out.str();
    // lone Latin-1 byte and encoded surrogate are replaced, valid sequences kept
    EXPECT_NE(std::string::npos,
              text.find("\"ssid\":\"caf\\ufffd \xc3\xa9 \\ufffd\\ufffd\\ufffd \xf0\x9f\x93\xb6\""));
}

TEST(PrintJsonTests, truncated_sequence_at_end_is_replaced)
{
    std::ostringstream out;
    ReportPrinter printer(out, false);
    printer.printJson({ make_row(std::string("net\xe2\x82"), -40.0f) });
    EXPECT_NE(std::string::npos, out.str().find("\"ssid\":\"net\\ufffd\\ufffd\""));
}
