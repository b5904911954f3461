#include "gtest/gtest.h"
#include "aggregator/aggregator.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <random>
#include <vector>

// -------- helpers -----------------------------------------------------------

static Sample make_sample(int status, double latency_ms, int worker = 0) {
    return {worker, status, latency_ms, std::chrono::system_clock::now()};
}

static std::vector<Sample> make_samples(int status, const std::vector<double>& latencies) {
    std::vector<Sample> out;
    for (size_t i = 0; i < latencies.size(); ++i) {
        out.push_back(make_sample(status, latencies[i], static_cast<int>(i)));
    }
    return out;
}

static double reference_percentile(std::vector<double> v, int k) {
    std::sort(v.begin(), v.end());
    size_t idx = static_cast<size_t>(std::floor(k / 100.0 * static_cast<double>(v.size()) + 1e-9));
    if (idx > v.size() - 1) idx = v.size() - 1;
    return v[idx];
}

// -------- tests -------------------------------------------------------------

TEST(Aggregator, EmptyInputIsAllZero) {
    Report r = aggregate(std::vector<Sample>{});

    EXPECT_EQ(r.total, 0u);
    EXPECT_EQ(r.successful, 0u);
    EXPECT_EQ(r.failed, 0u);
    EXPECT_EQ(r.total_latency_ms, 0.0);
    EXPECT_EQ(r.average_latency_ms, 0.0);
    EXPECT_EQ(r.min_latency_ms, 0.0);
    EXPECT_EQ(r.p50_latency_ms, 0.0);
    EXPECT_EQ(r.p99_latency_ms, 0.0);
    EXPECT_EQ(r.max_latency_ms, 0.0);
    EXPECT_EQ(r.throughput, 0.0);
    EXPECT_TRUE(r.status_codes.empty());
    EXPECT_EQ(r.avg_success_latency_ms, 0.0);
}

TEST(Aggregator, PercentileIndexFloorsAndClamps) {
    EXPECT_EQ(percentile_index(100, 99), 99u);
    EXPECT_EQ(percentile_index(100, 50), 50u);
    EXPECT_EQ(percentile_index(200, 99), 198u);
    EXPECT_EQ(percentile_index(1, 99), 0u);
    EXPECT_EQ(percentile_index(3, 50), 1u);
    EXPECT_EQ(percentile_index(4, 75), 3u);
    EXPECT_EQ(percentile_index(100, 100), 99u);
    EXPECT_EQ(percentile(std::vector<double>{}, 95), 0.0);
}

TEST(Aggregator, PercentilesMatchClampedFloorRule) {
    std::mt19937 gen(42);
    std::uniform_real_distribution<double> dist(1.0, 500.0);

    for (size_t n : {1u, 2u, 7u, 20u, 99u, 100u, 101u, 300u}) {
        std::vector<double> lat;
        for (size_t i = 0; i < n; ++i) lat.push_back(std::round(dist(gen)));
        Report r = aggregate(make_samples(200, lat));

        EXPECT_EQ(r.p50_latency_ms, reference_percentile(lat, 50)) << "n=" << n;
        EXPECT_EQ(r.p75_latency_ms, reference_percentile(lat, 75)) << "n=" << n;
        EXPECT_EQ(r.p95_latency_ms, reference_percentile(lat, 95)) << "n=" << n;
        EXPECT_EQ(r.p99_latency_ms, reference_percentile(lat, 99)) << "n=" << n;
    }
}

TEST(Aggregator, AverageMinMaxAreConsistent) {
    std::vector<double> lat = {12.5, 3.0, 48.0, 7.25, 7.25, 100.0};
    Report r = aggregate(make_samples(200, lat));

    EXPECT_NEAR(r.average_latency_ms * r.total, r.total_latency_ms, 1e-9);
    for (double l : lat) {
        EXPECT_LE(r.min_latency_ms, l);
        EXPECT_GE(r.max_latency_ms, l);
    }
    EXPECT_EQ(r.min_latency_ms, 3.0);
    EXPECT_EQ(r.max_latency_ms, 100.0);
}

TEST(Aggregator, ThroughputUsesSummedLatency) {
    // 4 samples, 250 ms each -> 1 s summed -> 4 req/s.
    Report r = aggregate(make_samples(200, {250.0, 250.0, 250.0, 250.0}));
    EXPECT_DOUBLE_EQ(r.throughput, 4.0);

    Report zero = aggregate(make_samples(200, {0.0, 0.0}));
    EXPECT_EQ(zero.throughput, 0.0);
}

TEST(Aggregator, UniformTenMillisecondRun) {
    Report r = aggregate(make_samples(200, {10.0, 10.0, 10.0, 10.0, 10.0}));

    EXPECT_EQ(r.total, 5u);
    EXPECT_EQ(r.successful, 5u);
    EXPECT_EQ(r.failed, 0u);
    EXPECT_DOUBLE_EQ(r.min_latency_ms, 10.0);
    EXPECT_DOUBLE_EQ(r.max_latency_ms, 10.0);
    EXPECT_DOUBLE_EQ(r.average_latency_ms, 10.0);
    EXPECT_DOUBLE_EQ(r.p50_latency_ms, 10.0);
    EXPECT_DOUBLE_EQ(r.p95_latency_ms, 10.0);
    EXPECT_DOUBLE_EQ(r.p99_latency_ms, 10.0);
}

TEST(Aggregator, StatusHistogramAndSuccessSplit) {
    std::vector<Sample> s = {
        make_sample(200, 10.0), make_sample(500, 40.0),
        make_sample(200, 20.0), make_sample(500, 30.0),
    };
    Report r = aggregate(s);

    EXPECT_EQ(r.successful, 2u);
    EXPECT_EQ(r.failed, 2u);
    EXPECT_EQ(r.successful + r.failed, r.total);
    ASSERT_EQ(r.status_codes.size(), 2u);
    EXPECT_EQ(r.status_codes.at(200).count, 2u);
    EXPECT_DOUBLE_EQ(r.status_codes.at(200).percentage, 50.0);
    EXPECT_EQ(r.status_codes.at(500).count, 2u);
    EXPECT_DOUBLE_EQ(r.status_codes.at(500).percentage, 50.0);

    // Success-only metrics ignore the 500s; overall min/max do not.
    EXPECT_DOUBLE_EQ(r.min_success_latency_ms, 10.0);
    EXPECT_DOUBLE_EQ(r.max_success_latency_ms, 20.0);
    EXPECT_DOUBLE_EQ(r.avg_success_latency_ms, 15.0);
    EXPECT_DOUBLE_EQ(r.max_latency_ms, 40.0);
}

TEST(Aggregator, HistogramCountsSumToTotal) {
    std::vector<Sample> s;
    const int codes[] = {200, 201, 204, 301, 404, 500, 503};
    for (int i = 0; i < 97; ++i) {
        s.push_back(make_sample(codes[i % 7], i * 1.5));
    }
    Report r = aggregate(s);

    size_t sum = 0;
    double pct = 0.0;
    for (const auto& [code, entry] : r.status_codes) {
        sum += entry.count;
        pct += entry.percentage;
        EXPECT_DOUBLE_EQ(entry.percentage, 100.0 * entry.count / r.total) << code;
    }
    EXPECT_EQ(sum, r.total);
    EXPECT_NEAR(pct, 100.0, 1e-9);
    // 200, 201, 204 are 2xx; 3xx counts as failed.
    EXPECT_EQ(r.successful, 14u + 14u + 14u);
}

TEST(Aggregator, NoSuccessesLeavesSuccessMetricsAtZero) {
    Report r = aggregate(make_samples(503, {5.0, 6.0}));
    EXPECT_EQ(r.successful, 0u);
    EXPECT_EQ(r.failed, 2u);
    EXPECT_EQ(r.min_success_latency_ms, 0.0);
    EXPECT_EQ(r.max_success_latency_ms, 0.0);
    EXPECT_EQ(r.avg_success_latency_ms, 0.0);
}

TEST(Aggregator, DropPolicyIgnoresFailedCalls) {
    DispatchResult result;
    result.samples = make_samples(200, {10.0, 12.0, 14.0});
    result.failures.push_back({3, "Read timeout", 1000.0, std::chrono::system_clock::now()});
    result.issued = 4;
    result.wall_clock_s = 0.5;

    Report r = aggregate(result, FailurePolicy::Drop);
    EXPECT_EQ(r.total, 3u);
    EXPECT_EQ(r.failed, 0u);
    EXPECT_EQ(r.issued, 4u);
    EXPECT_EQ(r.transport_errors, 1u);
    EXPECT_EQ(r.status_codes.count(kNoResponseStatus), 0u);
    EXPECT_DOUBLE_EQ(r.wall_clock_throughput, 6.0);
}

TEST(Aggregator, CountPolicyAddsFailedCallsToTotals) {
    DispatchResult result;
    result.samples = make_samples(200, {10.0, 12.0, 14.0});
    result.failures.push_back({3, "Read timeout", 1000.0, std::chrono::system_clock::now()});
    result.issued = 4;
    result.wall_clock_s = 2.0;

    Report r = aggregate(result, FailurePolicy::Count);
    EXPECT_EQ(r.total, 4u);
    EXPECT_EQ(r.successful, 3u);
    EXPECT_EQ(r.failed, 1u);
    EXPECT_EQ(r.status_codes.at(kNoResponseStatus).count, 1u);
    EXPECT_DOUBLE_EQ(r.status_codes.at(kNoResponseStatus).percentage, 25.0);
    EXPECT_DOUBLE_EQ(r.status_codes.at(200).percentage, 75.0);
    // Latency statistics only cover responses.
    EXPECT_DOUBLE_EQ(r.max_latency_ms, 14.0);
    EXPECT_DOUBLE_EQ(r.wall_clock_throughput, 2.0);
}

TEST(Aggregator, CountPolicyKeepsLatencyRelationsPerResponse) {
    DispatchResult result;
    result.samples = make_samples(200, {10.0, 10.0, 10.0});
    result.failures.push_back({3, "Connection", 0.0, std::chrono::system_clock::now()});
    result.issued = 4;

    Report r = aggregate(result, FailurePolicy::Count);
    EXPECT_EQ(r.total, 4u);
    EXPECT_EQ(r.responses, 3u);
    EXPECT_NEAR(r.average_latency_ms * r.responses, r.total_latency_ms, 1e-9);
    EXPECT_NEAR(r.throughput, r.responses / (r.total_latency_ms / 1000.0), 1e-9);
    EXPECT_DOUBLE_EQ(r.average_latency_ms, 10.0);
    EXPECT_DOUBLE_EQ(r.throughput, 100.0);

    // Without failures the per-response figures are the per-request ones.
    Report dropped = aggregate(result, FailurePolicy::Drop);
    EXPECT_EQ(dropped.responses, dropped.total);
    EXPECT_NEAR(dropped.average_latency_ms * dropped.total, dropped.total_latency_ms, 1e-9);
}
