#include "args.hpp"
#include "cai/version.h"
#include <iostream>
#include <string>

namespace cai {
namespace cli {

void print_version() {
    std::cout << "cai " << CAI_VERSION << "\n";
}

void print_usage(Command cmd, const char* program_name) {
    std::cout << "CAI v" << CAI_VERSION << "\n\n";
    switch (cmd) {
        case Command::COUNT:
            std::cout << "Usage: " << program_name << " count -i <cds.fa> [options]\n\n";
            std::cout << "Count codon occurrences (CODON<tab>GROUP<tab>COUNT).\n\n";
            break;
        case Command::INDEX:
            std::cout << "Usage: " << program_name << " index -i <cds.fa> [options]\n\n";
            std::cout << "Build an RCSU or NRCSU codon weight table (CODON<tab>WEIGHT).\n\n";
            break;
        case Command::SCORE:
            std::cout << "Usage: " << program_name
                      << " score -i <genes.fa> (--reference <cds.fa> | --weights <index.tsv>) [options]\n\n";
            std::cout << "Codon adaptation index per gene (ID<tab>CAI<tab>CODONS).\n\n";
            break;
    }
    std::cout << "Options:\n";
    std::cout << "  -i, --input <file>       Input FASTA file (or .gz)\n";
    std::cout << "  -o, --output <file>      Output TSV file (default: stdout)\n";
    if (cmd != Command::COUNT) {
        std::cout << "  --kind <rcsu|nrcsu>      Index kind (default: rcsu)\n";
    }
    std::cout << "  --heg <file>             Highly expressed gene ids, one per line\n";
    std::cout << "  --strict-length          Reject sequences whose length is not a multiple of 3\n";
    std::cout << "                           (default: drop the trailing 1-2 bases)\n";
    if (cmd == Command::SCORE) {
        std::cout << "\nScoring:\n";
        std::cout << "  --reference <file>       CDS FASTA used to build the index\n";
        std::cout << "  --weights <file>         Previously written CODON<tab>WEIGHT table\n";
        std::cout << "  --zero-floor <f>         Weight substituted for zero weights (default: 0.01)\n";
        std::cout << "  -t, --threads <int>      Number of threads (default: auto)\n";
    }
    std::cout << "\n";
    std::cout << "  -v, --verbose            Verbose output\n";
    std::cout << "  -V, --version            Show version and exit\n";
    std::cout << "  -h, --help               Show this help message\n";
}

Options parse_args(Command cmd, int argc, char* argv[]) {
    Options opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto require_value = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw ParseArgsExit(1, "Error: Missing value for " + flag);
            }
            return argv[++i];
        };

        auto parse_int = [&](const std::string& flag, const std::string& value) -> int {
            try {
                size_t idx = 0;
                int parsed = std::stoi(value, &idx);
                if (idx != value.size()) {
                    throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
                }
                return parsed;
            } catch (const ParseArgsExit&) {
                throw;
            } catch (const std::exception&) {
                throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
            }
        };

        auto parse_double = [&](const std::string& flag, const std::string& value) -> double {
            try {
                size_t idx = 0;
                double parsed = std::stod(value, &idx);
                if (idx != value.size()) {
                    throw ParseArgsExit(1, "Error: Invalid number for " + flag + ": " + value);
                }
                return parsed;
            } catch (const ParseArgsExit&) {
                throw;
            } catch (const std::exception&) {
                throw ParseArgsExit(1, "Error: Invalid number for " + flag + ": " + value);
            }
        };

        auto reject_for = [&](bool bad) {
            if (bad) {
                throw ParseArgsExit(1, "Error: " + arg + " is not valid for '" +
                                       command_name(cmd) + "'");
            }
        };

        if (arg == "-h" || arg == "--help") {
            print_usage(cmd, "cai");
            throw ParseArgsExit(0);
        } else if (arg == "-V" || arg == "--version") {
            print_version();
            throw ParseArgsExit(0);
        } else if (arg == "-i" || arg == "--input") {
            opts.input_file = require_value(arg);
        } else if (arg == "-o" || arg == "--output") {
            opts.output_file = require_value(arg);
        } else if (arg == "--heg") {
            opts.heg_file = require_value(arg);
        } else if (arg == "--strict-length") {
            opts.policy = TrailingFragmentPolicy::REJECT;
        } else if (arg == "--kind") {
            reject_for(cmd == Command::COUNT);
            std::string kind = require_value(arg);
            if (kind == "rcsu" || kind == "RCSU") {
                opts.kind = IndexKind::RCSU;
            } else if (kind == "nrcsu" || kind == "NRCSU") {
                opts.kind = IndexKind::NRCSU;
            } else {
                throw ParseArgsExit(1, "Error: Unknown index kind '" + kind + "' (use rcsu or nrcsu)");
            }
        } else if (arg == "--reference") {
            reject_for(cmd != Command::SCORE);
            opts.reference_file = require_value(arg);
        } else if (arg == "--weights") {
            reject_for(cmd != Command::SCORE);
            opts.weights_file = require_value(arg);
        } else if (arg == "--zero-floor") {
            reject_for(cmd != Command::SCORE);
            opts.zero_weight_floor = parse_double(arg, require_value(arg));
            if (!(opts.zero_weight_floor > 0.0 && opts.zero_weight_floor <= 1.0)) {
                throw ParseArgsExit(1, "Error: --zero-floor must be in (0, 1]");
            }
        } else if (arg == "-t" || arg == "--threads") {
            reject_for(cmd != Command::SCORE);
            opts.num_threads = parse_int(arg, require_value(arg));
            if (opts.num_threads < 1) {
                throw ParseArgsExit(1, "Error: --threads must be >= 1");
            }
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else {
            throw ParseArgsExit(1, "Error: Unknown option: " + arg);
        }
    }

    if (opts.input_file.empty()) {
        throw ParseArgsExit(1, "Error: No input file specified");
    }

    if (cmd == Command::SCORE) {
        if (opts.reference_file.empty() == opts.weights_file.empty()) {
            throw ParseArgsExit(1, "Error: score needs exactly one of --reference or --weights");
        }
        if (!opts.weights_file.empty() && !opts.heg_file.empty()) {
            throw ParseArgsExit(1, "Error: --heg applies to --reference, not --weights");
        }
    }

    return opts;
}

}  // namespace cli
}  // namespace cai
