#ifndef REPORT_PRINTER_H
#define REPORT_PRINTER_H

#include <ostream>
#include <string>

#include "../aggregator/aggregator.h"
#include "../dispatcher/sample.h"

void print_summary(std::ostream& os, const Report& report);

// Full report: summary table, response codes (ascending), latency distribution,
// success-only metrics.
void print_report(std::ostream& os, const Report& report, const std::string& url);

// One CSV row per sample and per failure. Returns false if the file cannot be written.
bool save_results(const std::string& path, const DispatchResult& result);

#endif // REPORT_PRINTER_H
