#include "subcommand.hpp"
#include "cai/version.h"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace cai {
namespace cli {

SubcommandRegistry& SubcommandRegistry::instance() {
    static SubcommandRegistry registry;
    return registry;
}

void SubcommandRegistry::register_command(const std::string& name,
                                          const std::string& description,
                                          SubcommandFn fn,
                                          int order) {
    if (!handlers_.emplace(name, std::move(fn)).second) {
        throw std::logic_error("subcommand registered twice: " + name);
    }
    command_list_.push_back({name, description, order});
}

bool SubcommandRegistry::has_command(const std::string& name) const {
    return handlers_.count(name) != 0;
}

int SubcommandRegistry::run_command(const std::string& name, int argc, char* argv[]) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        std::cerr << "Unknown command: " << name << "\n";
        std::cerr << "Run 'cai --help' for usage information.\n";
        return 1;
    }
    return it->second(argc, argv);
}

void SubcommandRegistry::print_help(const char* program_name) const {
    std::cout << "CAI v" << CAI_VERSION << " - codon usage indices and codon adaptation index\n\n";
    std::cout << "Usage: " << program_name << " <command> [options]\n\n";
    std::cout << "Commands:\n";

    // Workflow order: count -> index -> score
    auto sorted = command_list_;
    std::sort(sorted.begin(), sorted.end(),
              [](const CommandEntry& a, const CommandEntry& b) {
                  return a.order < b.order;
              });

    size_t width = 0;
    for (const auto& cmd : sorted) {
        width = std::max(width, cmd.name.length());
    }
    for (const auto& cmd : sorted) {
        std::cout << "  " << cmd.name << std::string(width + 2 - cmd.name.length(), ' ')
                  << cmd.description << "\n";
    }

    std::cout << "\nExamples:\n";
    std::cout << "  " << program_name << " index -i cds.fa.gz --heg ribosomal_ids.txt -o rcsu.tsv\n";
    std::cout << "  " << program_name << " score -i genes.fa --weights rcsu.tsv -t 8\n";
    std::cout << "\nFor help on a specific command: " << program_name << " <command> --help\n";
}

}  // namespace cli
}  // namespace cai
