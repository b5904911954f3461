#include "aggregator.h"

#include <algorithm>
#include <numeric>

using namespace std;

namespace {

void fill_percentages(Report& report) {
    for (auto& entry : report.status_codes) {
        entry.second.percentage = report.total == 0
            ? 0.0
            : 100.0 * static_cast<double>(entry.second.count) / static_cast<double>(report.total);
    }
}

}

size_t percentile_index(size_t n, int k) {
    if (n == 0 || k <= 0) return 0;
    size_t idx = static_cast<size_t>(k) * n / 100;
    return min(idx, n - 1);
}

double percentile(const vector<double>& sorted, int k) {
    if (sorted.empty()) return 0.0;
    return sorted[percentile_index(sorted.size(), k)];
}

Report aggregate(const vector<Sample>& samples) {
    Report report;
    report.total = samples.size();
    report.responses = samples.size();
    if (samples.empty()) {
        return report;
    }

    vector<double> latencies;
    latencies.reserve(samples.size());
    double success_sum = 0.0;

    for (const auto& s : samples) {
        latencies.push_back(s.latency_ms);
        ++report.status_codes[s.status].count;

        if (!is_success(s.status)) continue;
        if (report.successful == 0) {
            report.min_success_latency_ms = s.latency_ms;
            report.max_success_latency_ms = s.latency_ms;
        } else {
            report.min_success_latency_ms = min(report.min_success_latency_ms, s.latency_ms);
            report.max_success_latency_ms = max(report.max_success_latency_ms, s.latency_ms);
        }
        success_sum += s.latency_ms;
        ++report.successful;
    }
    report.failed = report.total - report.successful;
    if (report.successful > 0) {
        report.avg_success_latency_ms = success_sum / static_cast<double>(report.successful);
    }

    report.total_latency_ms = accumulate(latencies.begin(), latencies.end(), 0.0);
    report.average_latency_ms = report.total_latency_ms / static_cast<double>(report.responses);

    sort(latencies.begin(), latencies.end());
    report.min_latency_ms = latencies.front();
    report.max_latency_ms = latencies.back();
    report.p50_latency_ms = percentile(latencies, 50);
    report.p75_latency_ms = percentile(latencies, 75);
    report.p95_latency_ms = percentile(latencies, 95);
    report.p99_latency_ms = percentile(latencies, 99);

    const double total_latency_s = report.total_latency_ms / 1000.0;
    if (total_latency_s > 0.0) {
        report.throughput = static_cast<double>(report.responses) / total_latency_s;
    }

    fill_percentages(report);
    return report;
}

Report aggregate(const DispatchResult& result, FailurePolicy policy) {
    Report report = aggregate(result.samples);
    report.issued = result.issued;
    report.transport_errors = result.failures.size();

    if (policy == FailurePolicy::Count && !result.failures.empty()) {
        report.total += result.failures.size();
        report.failed += result.failures.size();
        report.status_codes[kNoResponseStatus].count += result.failures.size();
        fill_percentages(report);
    }

    report.wall_clock_s = result.wall_clock_s;
    if (result.wall_clock_s > 0.0) {
        report.wall_clock_throughput = static_cast<double>(report.total) / result.wall_clock_s;
    }
    return report;
}
