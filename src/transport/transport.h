#ifndef TRANSPORT_H
#define TRANSPORT_H

#include <stdexcept>
#include <string>

#include "../request/request_spec.h"

// The run cannot start at all: bad URL, bad timeout, client rejected by httplib.
class DispatchError : public std::runtime_error {
public:
    explicit DispatchError(const std::string& what) : std::runtime_error(what) {}
};

struct TransportResult {
    bool ok = false;          // a response arrived, whatever its status
    int status = 0;
    double latency_ms = 0.0;  // request start -> response headers parsed
    std::string error;
};

// One HTTP exchange. send() is called from every worker thread at once.
class Transport {
public:
    virtual ~Transport() = default;
    virtual TransportResult send(const RequestSpec& spec) = 0;
};

class HttplibTransport : public Transport {
public:
    static constexpr const char* kUserAgent = "loadster 1.0.0";

    // Throws DispatchError if no client could be built for spec.url.
    explicit HttplibTransport(const RequestSpec& spec);

    TransportResult send(const RequestSpec& spec) override;

    const Target& target() const { return target_; }

private:
    Target target_;
};

#endif // TRANSPORT_H
