// ============================================================================
// main.cpp — Entry point for the truthtab tool
// ============================================================================
//
// Exit codes: 0 when every formula was processed (or --help / a passing
// --selftest), 1 on bad usage or when any formula line failed.
//
// ============================================================================

#include "truthtab/cli.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

int main(int argc, char* argv[]) {
    const std::string program =
        argc > 0 ? std::filesystem::path(argv[0]).filename().string() : "truthtab";

    truthtab::Options opts;
    try {
        opts = truthtab::parse_args(argc, argv);
    } catch (const std::runtime_error& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        truthtab::print_usage(std::cerr, program);
        return 1;
    }

    if (opts.help) {
        truthtab::print_usage(std::cout, program);
        return 0;
    }

    try {
        return truthtab::run(opts);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
}
