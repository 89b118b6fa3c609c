// cai count: codon occurrence counts
//
// Usage: cai count -i <cds.fa> [--heg ids.txt] [-o counts.tsv]

#include "subcommand.hpp"
#include "common.hpp"
#include "cai/codon_table.hpp"

#include <ostream>

namespace cai {
namespace cli {

namespace {

void write_counts(const CodonCounts& counts, std::ostream& os) {
    for (int i = 0; i < NUM_CODONS; ++i) {
        os << codon_at(i) << '\t' << group_of(i)->label << '\t' << counts[i] << '\n';
    }
}

}  // namespace

int cmd_count(int argc, char* argv[]) {
    return run_subcommand(Command::COUNT, argc, argv, [](const Options& opts) {
        BiasResult result = build_reference(opts.input_file, opts);

        OutputTarget out(opts.output_file);
        write_counts(result.counts, out.stream());
        out.finish();
        return 0;
    });
}

namespace {
    struct CountRegistrar {
        CountRegistrar() {
            SubcommandRegistry::instance().register_command(
                "count",
                "Count codon occurrences in CDS sequences",
                cmd_count, 10);
        }
    };
    static CountRegistrar registrar;
}

}  // namespace cli
}  // namespace cai
