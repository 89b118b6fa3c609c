#include "cai/cai_score.hpp"

#include <cmath>
#include <exception>
#include <fstream>
#include <sstream>
#include <stdexcept>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace cai {

bool is_scored_codon(int codon_idx) {
    const SynonymousGroup* group = group_of(codon_idx);
    if (!group) return false;
    return group->amino_acid != 'M' && group->amino_acid != 'W' && group->amino_acid != '*';
}

GeneScore cai_for_gene(const CodonIndex& index,
                       const std::string& sequence,
                       const std::string& record_id,
                       const CaiOptions& options) {
    if (!index.is_built()) {
        throw CaiError(std::string("cannot score ") + record_id + ": " +
                       index_kind_name(index.kind()) + " index is not built");
    }

    const size_t len = sequence.size();
    const size_t whole = len - len % 3;
    if (whole != len && options.policy == TrailingFragmentPolicy::REJECT) {
        throw MalformedSequenceLengthError(record_id, len);
    }

    GeneScore score;
    score.id = record_id;
    double log_sum = 0.0;

    for (size_t i = 0; i < whole; i += 3) {
        char c1 = fast_upper(sequence[i]);
        char c2 = fast_upper(sequence[i + 1]);
        char c3 = fast_upper(sequence[i + 2]);
        int idx = codon_index(c1, c2, c3);
        if (idx < 0) {
            throw InvalidCodonError(std::string{c1, c2, c3}, record_id);
        }
        if (!is_scored_codon(idx)) continue;

        double w = index.weight(idx);
        if (w <= 0.0) w = options.zero_weight_floor;
        log_sum += std::log(w);
        ++score.scored_codons;
    }

    if (score.scored_codons > 0) {
        score.cai = std::exp(log_sum / static_cast<double>(score.scored_codons));
    }
    return score;
}

std::vector<GeneScore> score_genes(const CodonIndex& index,
                                   const std::vector<SequenceRecord>& records,
                                   const CaiOptions& options,
                                   int num_threads) {
    const int n = static_cast<int>(records.size());
    std::vector<GeneScore> scores(records.size());
    std::vector<std::exception_ptr> failures(records.size());

#ifdef _OPENMP
    if (num_threads > 0) omp_set_num_threads(num_threads);
    #pragma omp parallel for schedule(dynamic, 64)
#else
    (void)num_threads;
#endif
    for (int i = 0; i < n; ++i) {
        // Exceptions must not leave the parallel region
        try {
            scores[i] = cai_for_gene(index, records[i].sequence, records[i].id, options);
        } catch (...) {
            failures[i] = std::current_exception();
        }
    }

    for (const auto& failure : failures) {
        if (failure) std::rethrow_exception(failure);
    }
    return scores;
}

CodonIndex load_index_tsv(const std::string& path, IndexKind kind) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Failed to open file: " + path);
    }

    std::array<double, NUM_CODONS> weights{};
    std::array<bool, NUM_CODONS> seen{};
    std::string line;
    size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line[0] == '#') continue;

        std::istringstream iss(line);
        std::string codon;
        std::string value;
        if (!std::getline(iss, codon, '\t') || !std::getline(iss, value, '\t')) {
            throw IndexFormatError(path, line_no, "expected CODON<tab>WEIGHT");
        }
        for (char& c : codon) c = fast_upper(c);

        int idx = codon_index(codon);
        if (idx < 0) {
            throw IndexFormatError(path, line_no, "not a codon: " + codon);
        }
        if (seen[idx]) {
            throw IndexFormatError(path, line_no, "duplicate codon: " + codon);
        }

        double w = 0.0;
        try {
            size_t pos = 0;
            w = std::stod(value, &pos);
            if (pos != value.size()) {
                throw IndexFormatError(path, line_no, "invalid weight: " + value);
            }
        } catch (const IndexFormatError&) {
            throw;
        } catch (const std::exception&) {
            throw IndexFormatError(path, line_no, "invalid weight: " + value);
        }
        if (!std::isfinite(w) || w < 0.0) {
            throw IndexFormatError(path, line_no, "weight must be finite and >= 0: " + value);
        }

        weights[idx] = w;
        seen[idx] = true;
    }

    for (int i = 0; i < NUM_CODONS; ++i) {
        if (!seen[i]) {
            throw IndexFormatError(path, line_no, "missing codon: " + std::string(codon_at(i)));
        }
    }

    CodonIndex index(kind);
    index.assign(weights);
    return index;
}

} // namespace cai
