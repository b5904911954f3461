#include <iostream>
#include <string>
#include <vector>

#include "aggregator/aggregator.h"
#include "cli/cli_options.h"
#include "dispatcher/dispatcher.h"
#include "report/report_printer.h"

using namespace std;

int main(int argc, char* argv[]) {
    const string program = argc > 0 ? argv[0] : "loadster";
    vector<string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    CliParseResult parsed = parse_cli(args);
    switch (parsed.status) {
        case CliParseResult::Help:
            print_usage(cout, program);
            return 0;
        case CliParseResult::Version:
            cout << "loadster v" << kVersion << endl;
            return 0;
        case CliParseResult::Error:
            cerr << parsed.error << "\n\n";
            print_usage(cerr, program);
            return 1;
        case CliParseResult::Run:
            break;
    }

    const CliOptions& opts = parsed.options;

    DispatchResult result;
    try {
        Dispatcher dispatcher(opts.spec);
        dispatcher.set_verbose(opts.verbose);
        result = dispatcher.run();
    } catch (const DispatchError& e) {
        cerr << "[FATAL] " << e.what() << endl;
        return 1;
    }

    Report report = aggregate(result, opts.failure_policy);
    print_summary(cout, report);
    print_report(cout, report, opts.spec.url);

    if (!opts.output.empty() && !save_results(opts.output, result)) {
        return 1;
    }
    return 0;
}
