// Main entry point for the cai CLI with subcommand dispatch
//
// Usage:
//   cai count -i <cds.fa>                   Codon occurrence counts
//   cai index -i <cds.fa> [--heg ids.txt]   RCSU / NRCSU weight table
//   cai score -i <genes.fa> --weights <t>   Codon adaptation index per gene

#include "subcommand.hpp"
#include "cai/version.h"
#include <iostream>
#include <cstring>

int main(int argc, char* argv[]) {
    auto& registry = cai::cli::SubcommandRegistry::instance();

    if (argc < 2) {
        registry.print_help(argv[0]);
        return 1;
    }

    const char* first_arg = argv[1];

    if (strcmp(first_arg, "--help") == 0 || strcmp(first_arg, "-h") == 0) {
        registry.print_help(argv[0]);
        return 0;
    }

    if (strcmp(first_arg, "--version") == 0 || strcmp(first_arg, "-V") == 0) {
        std::cout << "cai " << CAI_VERSION << "\n";
        return 0;
    }

    if (registry.has_command(first_arg)) {
        return registry.run_command(first_arg, argc - 1, argv + 1);
    }

    std::cerr << "Unknown command: " << first_arg << "\n";
    std::cerr << "Run 'cai --help' for usage information.\n";
    return 1;
}
