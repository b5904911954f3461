#include "report_printer.h"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <utility>
#include <vector>

using namespace std;

namespace {

double epoch_seconds(chrono::system_clock::time_point tp) {
    return chrono::duration<double>(tp.time_since_epoch()).count();
}

string csv_field(const string& s) {
    if (s.find_first_of(",\"\n") == string::npos) return s;
    string out = "\"";
    for (char c : s) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

string status_label(int code) {
    return code == kNoResponseStatus ? "none" : to_string(code);
}

}

void print_summary(ostream& os, const Report& report) {
    os << fixed << setprecision(2);
    os << "\nLoad Test Results:\n";
    os << "Total Requests: " << report.total << "\n";
    if (report.responses != report.total) {
        os << "Responses: " << report.responses << "\n";
    }
    os << "Successful Requests: " << report.successful << "\n";
    os << "Failed Requests: " << report.failed << "\n";
    os << "Total Time: " << report.total_latency_ms << " ms\n";
    os << "Average Time per Request: " << report.average_latency_ms << " ms\n";
    os << "Median Time: " << report.p50_latency_ms << " ms\n";
    os << "Minimum Time: " << report.min_latency_ms << " ms\n";
    os << "Maximum Time: " << report.max_latency_ms << " ms\n";
}

void print_report(ostream& os, const Report& report, const string& url) {
    os << fixed << setprecision(2);

    os << "\nLoad Test Report\n";
    os << "Summary\n";
    os << "Metric\tValue\n";
    os << "Target URL\t" << url << "\n";
    if (report.issued > 0) {
        os << "Issued Requests\t" << report.issued << "\n";
    }
    os << "Total Requests\t" << report.total << "\n";
    if (report.responses != report.total) {
        os << "Responses\t" << report.responses << " (latency and throughput are per response)\n";
    }
    os << "Successful Requests\t" << report.successful << "\n";
    os << "Failed Requests\t" << report.failed << "\n";
    if (report.transport_errors > 0) {
        os << "Requests Without Response\t" << report.transport_errors << "\n";
    }
    os << "Duration\t" << report.total_latency_ms / 1000.0 << " seconds (sum of latencies)\n";
    os << "Throughput\t" << report.throughput << " req/s (sum of latencies)\n";
    if (report.wall_clock_s > 0.0) {
        os << "Wall Clock\t" << report.wall_clock_s << " seconds\n";
        os << "Wall Clock Throughput\t" << report.wall_clock_throughput << " req/s\n";
    }
    os << "Avg Latency\t" << report.average_latency_ms << " ms\n";
    os << "P95 Latency\t" << report.p95_latency_ms << " ms\n";
    os << "P99 Latency\t" << report.p99_latency_ms << " ms\n";

    vector<pair<int, StatusCount>> codes(report.status_codes.begin(), report.status_codes.end());
    sort(codes.begin(), codes.end(),
         [](const auto& a, const auto& b) { return a.first < b.first; });

    os << "\nResponse Codes\n";
    os << "Code\tCount\tPercentage\n";
    for (const auto& [code, entry] : codes) {
        os << status_label(code) << "\t" << entry.count << "\t" << entry.percentage << "%\n";
    }

    os << "\nLatency Distribution\n";
    os << "Percentile\tLatency (ms)\n";
    os << "P50\t" << report.p50_latency_ms << "\n";
    os << "P75\t" << report.p75_latency_ms << "\n";
    os << "P95\t" << report.p95_latency_ms << "\n";
    os << "P99\t" << report.p99_latency_ms << "\n";
    os << "Max\t" << report.max_latency_ms << "\n";

    os << "\nAdditional Metrics\n";
    os << "Min Successful Request Time: " << report.min_success_latency_ms << " ms\n";
    os << "Max Successful Request Time: " << report.max_success_latency_ms << " ms\n";
    os << "Avg Successful Request Time: " << report.avg_success_latency_ms << " ms\n";
}

bool save_results(const string& path, const DispatchResult& result) {
    ofstream file(path, ios::out | ios::trunc);
    if (!file) {
        cerr << "[Report] Unable to create " << path << endl;
        return false;
    }

    file << "timestamp_s,worker,status,latency_ms,error\n";
    file << fixed << setprecision(3);
    for (const auto& s : result.samples) {
        file << epoch_seconds(s.timestamp) << ","
             << s.worker << ","
             << s.status << ","
             << s.latency_ms << ",\n";
    }
    for (const auto& f : result.failures) {
        file << epoch_seconds(f.timestamp) << ","
             << f.worker << ","
             << kNoResponseStatus << ","
             << f.elapsed_ms << ","
             << csv_field(f.error) << "\n";
    }

    file.close();
    if (!file) {
        cerr << "[Report] Unable to write " << path << endl;
        return false;
    }
    cout << "Results saved to: " << path << endl;
    return true;
}
