#ifndef DISPATCHER_H
#define DISPATCHER_H

#include <memory>
#include <vector>

#include "../request/request_spec.h"
#include "../transport/transport.h"
#include "sample.h"

// Fires spec.concurrency simultaneous one-shot calls and collects what comes back.
//
// Every worker is its own std::thread, all started before the first join; there
// is no pool and no queue. A worker whose call fails logs the error and leaves a
// Failure record, never a Sample, and never retries. Only construction fails the
// run as a whole (DispatchError).
class Dispatcher {
public:
    explicit Dispatcher(RequestSpec spec);
    Dispatcher(RequestSpec spec, std::unique_ptr<Transport> transport);

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // Blocks until every worker finished or timed out.
    DispatchResult run();

    void set_verbose(bool verbose) { verbose_ = verbose; }
    const RequestSpec& spec() const { return spec_; }

private:
    RequestSpec spec_;
    std::unique_ptr<Transport> transport_;
    bool verbose_ = false;

    void worker(int id, SampleSink& sink);
};

// Samples of every call that got a response, in completion order.
std::vector<Sample> dispatch(const RequestSpec& spec);

#endif // DISPATCHER_H
