#ifndef SAMPLE_H
#define SAMPLE_H

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

// One completed call. Any HTTP status counts as completed.
struct Sample {
    int worker = 0;
    int status = 0;
    double latency_ms = 0.0;
    std::chrono::system_clock::time_point timestamp;
};

// A call that never produced a response (timeout, refused, DNS, TLS, ...).
struct Failure {
    int worker = 0;
    std::string error;
    double elapsed_ms = 0.0;
    std::chrono::system_clock::time_point timestamp;
};

struct DispatchResult {
    std::vector<Sample> samples;
    std::vector<Failure> failures;
    std::size_t issued = 0;
    double wall_clock_s = 0.0;
};

// Shared by reference between all workers of a run. Each append holds the
// lock only for the push_back; take() is only valid once every writer joined.
template <typename Mutex>
class BasicSampleSink {
public:
    explicit BasicSampleSink(std::size_t expected = 0) {
        samples_.reserve(expected);
    }

    BasicSampleSink(const BasicSampleSink&) = delete;
    BasicSampleSink& operator=(const BasicSampleSink&) = delete;

    void append(Sample sample) {
        std::lock_guard<Mutex> lock(mutex_);
        samples_.push_back(std::move(sample));
    }

    void append_failure(Failure failure) {
        std::lock_guard<Mutex> lock(mutex_);
        failures_.push_back(std::move(failure));
    }

    std::pair<std::vector<Sample>, std::vector<Failure>> take() {
        std::lock_guard<Mutex> lock(mutex_);
        std::pair<std::vector<Sample>, std::vector<Failure>> out{std::move(samples_), std::move(failures_)};
        samples_.clear();
        failures_.clear();
        return out;
    }

private:
    Mutex mutex_;
    std::vector<Sample> samples_;
    std::vector<Failure> failures_;
};

using SampleSink = BasicSampleSink<std::mutex>;

#endif // SAMPLE_H
