#pragma once

#include "cai/codon_usage.hpp"
#include "cai/sequence_io.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace cai {

struct CaiOptions {
    // Substituted for a zero weight before taking the log
    double zero_weight_floor = 0.01;
    TrailingFragmentPolicy policy = TrailingFragmentPolicy::DROP;
};

struct GeneScore {
    std::string id;
    double cai = 0.0;
    size_t scored_codons = 0;
};

// MET, TRP and stop codons carry no synonymous choice and are not scored
bool is_scored_codon(int codon_idx);

/**
 * Codon adaptation index of one gene: geometric mean of the index weights
 * of its codons (Sharp & Li 1987). Throws InvalidCodonError on a non-ACGT
 * codon. A gene with no scorable codon gets cai = 0, scored_codons = 0.
 */
GeneScore cai_for_gene(const CodonIndex& index,
                       const std::string& sequence,
                       const std::string& record_id,
                       const CaiOptions& options = {});

/**
 * Score a batch of genes against a built index. Runs on `num_threads`
 * OpenMP threads when available (0 = runtime default). The first failing
 * record's exception is rethrown after the loop.
 */
std::vector<GeneScore> score_genes(const CodonIndex& index,
                                   const std::vector<SequenceRecord>& records,
                                   const CaiOptions& options = {},
                                   int num_threads = 0);

/**
 * Load a CODON\tWEIGHT table (as written by CodonIndex::write_tsv).
 * Blank lines and lines starting with '#' are ignored. Every codon must
 * appear exactly once with a finite non-negative weight; otherwise
 * IndexFormatError. Throws std::runtime_error if the file cannot be opened.
 */
CodonIndex load_index_tsv(const std::string& path, IndexKind kind);

} // namespace cai
