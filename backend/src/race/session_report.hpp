#pragma once
#include <string>

#include "race_stats.hpp"

// Everything the Statistics Reporter produces for one run.
struct SessionReport {
    RaceReport races;
    DualStreamReport dual;
    bool dual_stream{false}; // at least one dual-stream endpoint was configured
};

void print_session_report(std::ostream& os, const SessionReport& r);

std::string session_report_json(const SessionReport& r);
