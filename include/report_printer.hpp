#ifndef REPORT_PRINTER_HPP
#define REPORT_PRINTER_HPP

#include <ostream>
#include <string>
#include <vector>

#include "report.hpp"

class ReportPrinter {
public:
    ReportPrinter(std::ostream& out, bool colour) : out_(out), colour_(colour) {}

    // Both orderings are strongest signal first, stable for equal signals.
    void printTable(std::vector<ReportRow> rows);
    void printJson(std::vector<ReportRow> rows);

private:
    std::string paint(const std::string& text, const char* sgr) const;

    std::ostream& out_;
    bool colour_;
};

#endif
