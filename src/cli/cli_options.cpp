#include "cli_options.h"

#include <chrono>
#include <stdexcept>
#include <utility>

using namespace std;

const char* const kVersion = "1.0.0";

namespace {

bool parse_int(const string& s, long long& out) {
    try {
        size_t idx = 0;
        long long v = stoll(s, &idx, 10);
        if (idx != s.size()) return false;
        out = v;
        return true;
    } catch (const logic_error&) {
        return false;
    }
}

CliParseResult error(const string& msg) {
    CliParseResult r;
    r.status = CliParseResult::Error;
    r.error = msg;
    return r;
}

}

void print_usage(ostream& os, const string& program) {
    os << "Loadster is a simple load testing tool that sends concurrent HTTP requests\n"
       << "to a web application and reports latency, throughput and status codes.\n"
       << "\n"
       << "Usage:\n"
       << "  " << program << " -u <url> [options]\n"
       << "\n"
       << "Options:\n"
       << "  -u, --url <url>          Target URL for the load test (required).\n"
       << "  -m, --method <method>    GET, POST, PUT, DELETE or PATCH (default GET).\n"
       << "  -c, --users <n>          Number of concurrent users (default 10).\n"
       << "  -t, --timeout <seconds>  Timeout for each request (default 30).\n"
       << "  -H, --header <h>         Extra header \"Name: Value\", repeatable.\n"
       << "  -b, --body <body>        Request body (POST, PUT, PATCH, DELETE).\n"
       << "  -v, --verbose            Print the status of every request.\n"
       << "  -o, --output <path>      Save per-request results as CSV.\n"
       << "      --count-errors       Count requests without a response as failed.\n"
       << "  -h, --help               Print this help.\n"
       << "      --version            Print version.\n"
       << "\n"
       << "Example:\n"
       << "  " << program << " -u http://localhost:8080/ -c 50 -t 5 -H \"Accept: application/json\"\n";
}

CliParseResult parse_cli(const vector<string>& args) {
    for (const auto& a : args) {
        if (a == "-h" || a == "--help") {
            CliParseResult r;
            r.status = CliParseResult::Help;
            return r;
        }
        if (a == "--version") {
            CliParseResult r;
            r.status = CliParseResult::Version;
            return r;
        }
    }

    CliOptions opts;
    vector<string> raw_headers;

    for (size_t i = 0; i < args.size(); ++i) {
        const string& a = args[i];
        const bool has_value = i + 1 < args.size();

        if (a == "-v" || a == "--verbose") {
            opts.verbose = true;
            continue;
        }
        if (a == "--count-errors") {
            opts.failure_policy = FailurePolicy::Count;
            continue;
        }

        const bool takes_value =
            a == "-u" || a == "--url" || a == "-m" || a == "--method" ||
            a == "-c" || a == "--users" || a == "-t" || a == "--timeout" ||
            a == "-H" || a == "--header" || a == "-b" || a == "--body" ||
            a == "-o" || a == "--output";
        if (!takes_value) {
            return error("Unknown argument: " + a);
        }
        if (!has_value) {
            return error("Missing value for " + a);
        }
        const string& value = args[++i];

        if (a == "-u" || a == "--url") {
            opts.spec.url = value;
        } else if (a == "-m" || a == "--method") {
            auto method = parse_method(value);
            if (!method) {
                return error("'" + value + "' is not a valid HTTP method");
            }
            opts.spec.method = *method;
        } else if (a == "-c" || a == "--users") {
            long long v = 0;
            if (!parse_int(value, v) || v < 1 || v > 1000000) {
                return error("Invalid --users value (must be a positive integer).");
            }
            opts.spec.concurrency = static_cast<int>(v);
        } else if (a == "-t" || a == "--timeout") {
            long long v = 0;
            if (!parse_int(value, v) || v < 0 || v > 86400) {
                return error("Invalid --timeout value (seconds, non-negative integer).");
            }
            opts.spec.timeout = chrono::seconds(v);
        } else if (a == "-H" || a == "--header") {
            raw_headers.push_back(value);
        } else if (a == "-b" || a == "--body") {
            opts.spec.body = value;
        } else {
            opts.output = value;
        }
    }

    if (opts.spec.url.empty()) {
        return error("Missing --url <url>");
    }
    try {
        (void)split_url(opts.spec.url);
    } catch (const invalid_argument& e) {
        return error(e.what());
    }

    opts.spec.headers = parse_headers(raw_headers);

    CliParseResult r;
    r.status = CliParseResult::Run;
    r.options = move(opts);
    return r;
}
