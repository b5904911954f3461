#include "transport.h"

#include <chrono>
#include <ctime>
#include <exception>

#include <httplib.h>

using namespace std;

HttplibTransport::HttplibTransport(const RequestSpec& spec) {
    if (spec.timeout.count() <= 0) {
        throw DispatchError("Timeout must be positive, got " + to_string(spec.timeout.count()) + " ms");
    }

    try {
        target_ = split_url(spec.url);
    } catch (const invalid_argument& e) {
        throw DispatchError(e.what());
    }

    // Same check httplib itself does before every request; fail the run up front instead.
    httplib::Client probe(target_.origin);
    if (!probe.is_valid()) {
        throw DispatchError("Cannot build an HTTP client for " + target_.origin +
                            " (https needs loadster built with TLS support)");
    }
}

TransportResult HttplibTransport::send(const RequestSpec& spec) {
    // httplib::Client keeps a socket, so every call gets its own.
    httplib::Client cli(target_.origin);
    cli.set_connection_timeout(spec.timeout);
    cli.set_read_timeout(spec.timeout);
    cli.set_write_timeout(spec.timeout);
    // The three above are per phase; this one bounds the whole exchange.
    cli.set_max_timeout(static_cast<time_t>(spec.timeout.count()));

    httplib::Request req;
    req.method = method_name(spec.method);
    req.path = target_.path;
    req.headers.emplace("User-Agent", kUserAgent);
    for (const auto& h : spec.headers) {
        req.headers.emplace(h.name, h.value);
    }
    if (spec.body && carries_body(spec.method)) {
        req.body = *spec.body;
        if (!req.has_header("Content-Type")) {
            req.set_header("Content-Type", "text/plain");
        }
    }

    auto start = chrono::steady_clock::now();
    const auto deadline = start + spec.timeout;

    bool headers_seen = false;
    chrono::steady_clock::time_point headers_at;
    req.response_handler = [&](const httplib::Response&) {
        headers_at = chrono::steady_clock::now();
        headers_seen = true;
        // Headers that trickled in past the deadline abort the call.
        return headers_at <= deadline;
    };

    TransportResult result;
    auto res = cli.send(req);
    auto end = chrono::steady_clock::now();

    result.latency_ms = chrono::duration<double, milli>((headers_seen ? headers_at : end) - start).count();
    if (headers_seen && headers_at > deadline) {
        result.error = "Timeout: no response headers within " + to_string(spec.timeout.count()) + " ms";
    } else if (res) {
        result.ok = true;
        result.status = res->status;
    } else {
        result.error = httplib::to_string(res.error());
    }
    return result;
}
