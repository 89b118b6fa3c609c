#ifndef CAI_CLI_ARGS_HPP
#define CAI_CLI_ARGS_HPP

#include "cai/codon_usage.hpp"

#include <exception>
#include <string>
#include <utility>

namespace cai {
namespace cli {

enum class Command { COUNT, INDEX, SCORE };

inline const char* command_name(Command cmd) {
    switch (cmd) {
        case Command::COUNT: return "count";
        case Command::INDEX: return "index";
        default: return "score";
    }
}

struct Options {
    std::string input_file;
    std::string output_file;      // empty = stdout
    std::string heg_file;         // highly expressed gene id list (optional)
    std::string reference_file;   // score: CDS used to build the index
    std::string weights_file;     // score: previously written CODON\tWEIGHT table
    IndexKind kind = IndexKind::RCSU;
    TrailingFragmentPolicy policy = TrailingFragmentPolicy::DROP;
    double zero_weight_floor = 0.01;  // score: replaces zero weights
    int num_threads = 0;              // score: 0 = OpenMP default
    bool verbose = false;
};

// Thrown instead of calling exit(); carries the process exit code and an
// optional message for stderr
class ParseArgsExit : public std::exception {
public:
    explicit ParseArgsExit(int code, std::string message = "")
        : code_(code), message_(std::move(message)) {}

    int exit_code() const { return code_; }
    const std::string& message() const { return message_; }
    const char* what() const noexcept override { return message_.c_str(); }

private:
    int code_;
    std::string message_;
};

void print_version();

// Print usage/help for a subcommand to stdout
void print_usage(Command cmd, const char* program_name);

// Parse subcommand arguments (argv[0] is the subcommand name)
// Throws ParseArgsExit(0) for --help/--version, ParseArgsExit(1) for errors
Options parse_args(Command cmd, int argc, char* argv[]);

}  // namespace cli
}  // namespace cai

#endif  // CAI_CLI_ARGS_HPP
