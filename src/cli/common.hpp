#ifndef CAI_CLI_COMMON_HPP
#define CAI_CLI_COMMON_HPP

#include "args.hpp"
#include "cai/log_utils.hpp"
#include "cai/pipeline.hpp"

#include <chrono>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace cai {
namespace cli {

// Parse arguments for `cmd` and run `body`; maps ParseArgsExit and runtime
// errors to an exit code with the message on stderr.
inline int run_subcommand(Command cmd, int argc, char* argv[],
                          const std::function<int(const Options&)>& body) {
    Options opts;
    try {
        opts = parse_args(cmd, argc, argv);
    } catch (const ParseArgsExit& e) {
        if (!e.message().empty()) {
            std::cerr << e.message() << "\n";
            std::cerr << "Run 'cai " << command_name(cmd) << " --help' for usage.\n";
        }
        return e.exit_code();
    }

    try {
        return body(opts);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

// Output stream for -o, or stdout when no file was given
class OutputTarget {
public:
    explicit OutputTarget(const std::string& path) {
        if (!path.empty()) {
            file_ = std::make_unique<std::ofstream>(path);
            if (!*file_) {
                throw std::runtime_error("Cannot open output file: " + path);
            }
        }
    }

    std::ostream& stream() { return file_ ? *file_ : std::cout; }

    void finish() {
        stream().flush();
        if (!stream()) {
            throw std::runtime_error("Write failed");
        }
    }

private:
    std::unique_ptr<std::ofstream> file_;
};

// Counts and indices for a CDS file, restricted to --heg ids when given
inline BiasResult build_reference(const std::string& fasta, const Options& opts) {
    const auto start = std::chrono::steady_clock::now();
    FastaFileProvider sequences(fasta);

    std::unique_ptr<HegSelector> selector;
    if (opts.heg_file.empty()) {
        selector = std::make_unique<AllGenesSelector>();
    } else {
        auto list = IdListSelector::from_file(opts.heg_file);
        if (opts.verbose) {
            std::cerr << "HEG list: " << opts.heg_file << " (" << list.ids().size() << " ids)\n";
        }
        selector = std::make_unique<IdListSelector>(std::move(list));
    }

    BiasPipeline pipeline(sequences, *selector, opts.policy);
    BiasResult result = pipeline.run();

    std::cerr << "Reference: " << fasta << ": "
              << log_utils::format_count(result.records_used) << " of "
              << log_utils::format_count(result.records_total) << " records, "
              << log_utils::format_count(result.counts.total()) << " codons ("
              << log_utils::format_elapsed(start, std::chrono::steady_clock::now()) << ")\n";
    if (opts.verbose && result.records_used < result.records_total) {
        std::cerr << "  " << (result.records_total - result.records_used)
                  << " records not in the HEG list were skipped\n";
    }
    return result;
}

}  // namespace cli
}  // namespace cai

#endif  // CAI_CLI_COMMON_HPP
