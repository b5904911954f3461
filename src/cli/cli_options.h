#ifndef CLI_OPTIONS_H
#define CLI_OPTIONS_H

#include <ostream>
#include <string>
#include <vector>

#include "../aggregator/aggregator.h"
#include "../request/request_spec.h"

extern const char* const kVersion;

struct CliOptions {
    RequestSpec spec;
    bool verbose = false;
    std::string output;
    FailurePolicy failure_policy = FailurePolicy::Drop;
};

struct CliParseResult {
    enum Status { Run, Help, Version, Error };

    Status status = Error;
    CliOptions options;
    std::string error;
};

// args excludes the program name.
CliParseResult parse_cli(const std::vector<std::string>& args);

void print_usage(std::ostream& os, const std::string& program);

#endif // CLI_OPTIONS_H
