#ifndef AGGREGATOR_H
#define AGGREGATOR_H

#include <cstddef>
#include <unordered_map>
#include <vector>

#include "../dispatcher/sample.h"

// Histogram key for calls that never got a response (FailurePolicy::Count only).
constexpr int kNoResponseStatus = 0;

enum class FailurePolicy {
    Drop,   // failed calls leave no trace in the counts
    Count   // failed calls count toward total/failed under kNoResponseStatus
};

struct StatusCount {
    std::size_t count = 0;
    double percentage = 0.0;  // 100 * count / total
};

// All latencies in milliseconds. With no samples every latency and throughput is 0.
struct Report {
    std::size_t total = 0;
    std::size_t successful = 0;  // 2xx
    std::size_t failed = 0;

    // Calls that got a response. Latency, average and throughput are per
    // response; equal to total unless FailurePolicy::Count added failures.
    std::size_t responses = 0;

    std::size_t issued = 0;            // configured concurrency, 0 if unknown
    std::size_t transport_errors = 0;  // calls without a response

    double total_latency_ms = 0.0;
    double average_latency_ms = 0.0;
    double min_latency_ms = 0.0;
    double p50_latency_ms = 0.0;
    double p75_latency_ms = 0.0;
    double p95_latency_ms = 0.0;
    double p99_latency_ms = 0.0;
    double max_latency_ms = 0.0;

    // responses / summed latency in seconds. Not real concurrent throughput.
    double throughput = 0.0;
    // total / wall-clock span of the run, when the span is known.
    double wall_clock_s = 0.0;
    double wall_clock_throughput = 0.0;

    std::unordered_map<int, StatusCount> status_codes;

    double min_success_latency_ms = 0.0;
    double max_success_latency_ms = 0.0;
    double avg_success_latency_ms = 0.0;
};

inline bool is_success(int status) { return status >= 200 && status <= 299; }

// floor(k * n / 100) clamped to [0, n - 1]. n must be > 0.
std::size_t percentile_index(std::size_t n, int k);

// sorted must be ascending. Returns 0 for an empty sequence.
double percentile(const std::vector<double>& sorted, int k);

Report aggregate(const std::vector<Sample>& samples);
Report aggregate(const DispatchResult& result, FailurePolicy policy = FailurePolicy::Drop);

#endif // AGGREGATOR_H
