// ============================================================================
// main.cpp — Entry point for the tracefit tool
// ============================================================================

#include "tracefit/cli.hpp"

#include <iostream>
#include <stdexcept>

int main(int argc, char* argv[]) {
    try {
        tracefit::Options opts = tracefit::parse_args(argc, argv);

        if (opts.help) {
            tracefit::print_usage(argv[0]);
            return 0;
        }

        return tracefit::run(opts);

    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        tracefit::print_usage(argv[0]);
        return 1;
    }
}
