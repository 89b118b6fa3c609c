// cai score: codon adaptation index per gene
//
// Usage: cai score -i <genes.fa> --reference <cds.fa> [--heg ids.txt] [options]
//        cai score -i <genes.fa> --weights <index.tsv> [options]

#include "subcommand.hpp"
#include "common.hpp"
#include "cai/cai_score.hpp"

#include <chrono>
#include <cstdio>
#include <vector>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace cai {
namespace cli {

int cmd_score(int argc, char* argv[]) {
    return run_subcommand(Command::SCORE, argc, argv, [](const Options& opts) {
        const auto run_start = std::chrono::steady_clock::now();

        CodonIndex index(opts.kind);
        if (!opts.weights_file.empty()) {
            index = load_index_tsv(opts.weights_file, opts.kind);
            if (opts.verbose) {
                std::cerr << "Weights: " << opts.weights_file << "\n";
            }
        } else {
            BiasResult result = build_reference(opts.reference_file, opts);
            index = (opts.kind == IndexKind::RCSU) ? result.rcsu : result.nrcsu;
        }

        SequenceReader reader(opts.input_file);
        std::vector<SequenceRecord> genes = reader.read_all();

        int num_threads = opts.num_threads;
#ifdef _OPENMP
        if (num_threads == 0) num_threads = omp_get_max_threads();
#else
        num_threads = 1;
#endif
        if (opts.verbose) {
            std::cerr << "Scoring " << genes.size() << " genes (" << index_kind_name(opts.kind)
                      << ", " << num_threads << " threads)\n";
        }

        CaiOptions cai_opts;
        cai_opts.zero_weight_floor = opts.zero_weight_floor;
        cai_opts.policy = opts.policy;
        std::vector<GeneScore> scores = score_genes(index, genes, cai_opts, num_threads);

        OutputTarget out(opts.output_file);
        char buf[32];
        size_t unscored = 0;
        for (const auto& s : scores) {
            std::snprintf(buf, sizeof(buf), "%.4f", s.cai);
            out.stream() << s.id << '\t' << buf << '\t' << s.scored_codons << '\n';
            if (s.scored_codons == 0) ++unscored;
        }
        out.finish();

        if (unscored > 0) {
            std::cerr << "Warning: " << unscored << " genes had no scorable codons (CAI reported as 0)\n";
        }
        std::cerr << "Scored " << log_utils::format_count(scores.size()) << " genes in "
                  << log_utils::format_elapsed(run_start, std::chrono::steady_clock::now()) << "\n";
        return 0;
    });
}

namespace {
    struct ScoreRegistrar {
        ScoreRegistrar() {
            SubcommandRegistry::instance().register_command(
                "score",
                "Codon adaptation index for each gene",
                cmd_score, 30);
        }
    };
    static ScoreRegistrar registrar;
}

}  // namespace cli
}  // namespace cai
