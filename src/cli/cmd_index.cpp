// cai index: RCSU / NRCSU codon weight table
//
// Usage: cai index -i <cds.fa> [--heg ids.txt] [--kind rcsu|nrcsu] [-o index.tsv]
//
// Output is the sorted CODON<tab>WEIGHT table (3 decimals) that
// `cai score --weights` reads back.

#include "subcommand.hpp"
#include "common.hpp"

namespace cai {
namespace cli {

int cmd_index(int argc, char* argv[]) {
    return run_subcommand(Command::INDEX, argc, argv, [](const Options& opts) {
        BiasResult result = build_reference(opts.input_file, opts);
        const CodonIndex& index = (opts.kind == IndexKind::RCSU) ? result.rcsu : result.nrcsu;

        if (opts.verbose) {
            size_t unused_groups = 0;
            for (const auto& group : synonymous_groups()) {
                uint64_t total = 0;
                for (auto codon : group.codons) total += result.counts.at(codon);
                if (total == 0) ++unused_groups;
            }
            std::cerr << "Index: " << index_kind_name(index.kind());
            if (unused_groups > 0) {
                std::cerr << " (" << unused_groups << " unused groups weighted 0)";
            }
            std::cerr << "\n";
        }

        OutputTarget out(opts.output_file);
        index.write_tsv(out.stream());
        out.finish();
        return 0;
    });
}

namespace {
    struct IndexRegistrar {
        IndexRegistrar() {
            SubcommandRegistry::instance().register_command(
                "index",
                "Build an RCSU or NRCSU codon weight table",
                cmd_index, 20);
        }
    };
    static IndexRegistrar registrar;
}

}  // namespace cli
}  // namespace cai
