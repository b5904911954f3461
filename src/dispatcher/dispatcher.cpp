#include "dispatcher.h"

#include <chrono>
#include <exception>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <system_error>
#include <thread>
#include <tuple>
#include <utility>

using namespace std;

Dispatcher::Dispatcher(RequestSpec spec)
    : spec_(move(spec)) {
    transport_ = make_unique<HttplibTransport>(spec_);
}

Dispatcher::Dispatcher(RequestSpec spec, unique_ptr<Transport> transport)
    : spec_(move(spec)), transport_(move(transport)) {
    if (!transport_) {
        throw DispatchError("Dispatcher needs a transport");
    }
    if (spec_.timeout.count() <= 0) {
        throw DispatchError("Timeout must be positive, got " + to_string(spec_.timeout.count()) + " ms");
    }
}

void Dispatcher::worker(int id, SampleSink& sink) {
    auto start = chrono::steady_clock::now();

    TransportResult res;
    try {
        res = transport_->send(spec_);
    } catch (const exception& e) {
        res.ok = false;
        res.error = string("Exception: ") + e.what();
        res.latency_ms = chrono::duration<double, milli>(chrono::steady_clock::now() - start).count();
    } catch (...) {
        // Recorded as a Failure below; must not escape the std::thread.
        res.ok = false;
        res.error = "Exception: unknown";
        res.latency_ms = chrono::duration<double, milli>(chrono::steady_clock::now() - start).count();
    }

    auto timestamp = chrono::system_clock::now();

    if (!res.ok) {
        // One insertion per line so concurrent workers do not interleave mid-message.
        ostringstream msg;
        msg << "[Worker " << id << "] Request failed: " << res.error << "\n";
        cerr << msg.str();
        sink.append_failure({id, res.error, res.latency_ms, timestamp});
        return;
    }

    if (verbose_) {
        ostringstream msg;
        msg << "[Worker " << id << "] Status: " << res.status
            << " (" << res.latency_ms << " ms)\n";
        cout << msg.str();
    }
    sink.append({id, res.status, res.latency_ms, timestamp});
}

DispatchResult Dispatcher::run() {
    const int workers = spec_.concurrency > 0 ? spec_.concurrency : 0;
    SampleSink sink(static_cast<size_t>(workers));

    if (verbose_) {
        cout << "[Dispatcher] " << method_name(spec_.method) << " " << spec_.url
             << " with " << workers << " concurrent users" << endl;
    }

    vector<thread> threads;
    threads.reserve(workers);

    auto start_time = chrono::steady_clock::now();
    try {
        for (int i = 0; i < workers; ++i) {
            threads.emplace_back(&Dispatcher::worker, this, i, ref(sink));
        }
    } catch (const system_error& e) {
        for (auto& t : threads) {
            t.join();
        }
        throw DispatchError("Could only start " + to_string(threads.size()) + " of " +
                            to_string(workers) + " workers: " + e.what());
    }
    for (auto& t : threads) {
        t.join();
    }
    auto end_time = chrono::steady_clock::now();

    DispatchResult result;
    tie(result.samples, result.failures) = sink.take();
    result.issued = static_cast<size_t>(workers);
    result.wall_clock_s = chrono::duration<double>(end_time - start_time).count();

    if (!result.failures.empty()) {
        cerr << "[Dispatcher] " << result.failures.size() << " of " << workers
             << " requests failed without a response" << endl;
    }
    return result;
}

vector<Sample> dispatch(const RequestSpec& spec) {
    Dispatcher dispatcher(spec);
    return dispatcher.run().samples;
}
