#pragma once

#include "cai/codon_table.hpp"
#include "cai/errors.hpp"
#include "cai/sequence_io.hpp"

#include <array>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cai {

// What to do with a final fragment shorter than one codon
enum class TrailingFragmentPolicy {
    DROP,    // ignore the 1-2 trailing bases
    REJECT   // throw MalformedSequenceLengthError
};

enum class IndexState { UNBUILT, BUILT };

/**
 * Codon -> weight table for one index kind.
 *
 * Weights are stored at full precision; formatting to 3 decimals happens
 * only when writing.
 */
class CodonIndex {
public:
    explicit CodonIndex(IndexKind kind) : kind_(kind) {}

    IndexKind kind() const { return kind_; }
    IndexState state() const { return state_; }
    bool is_built() const { return state_ == IndexState::BUILT; }

    double weight(int codon_idx) const { return weights_[codon_idx]; }

    // Throws std::out_of_range for a string that is not a codon
    double weight(std::string_view codon) const;

    // (codon, weight) pairs sorted by codon
    std::vector<std::pair<std::string, double>> entries() const;

    // Sorted CODON\tWEIGHT lines, 3 decimals
    void write_tsv(std::ostream& os) const;

    // Install a complete weight table and mark the index built.
    // Throws DuplicateIndexError if already built.
    void assign(const std::array<double, NUM_CODONS>& weights);

private:
    IndexKind kind_;
    IndexState state_ = IndexState::UNBUILT;
    std::array<double, NUM_CODONS> weights_{};
};

/**
 * Per-group usage values before max-normalization, in group member order.
 *   RCSU:  count / (total / n)
 *   NRCSU: count / total
 * All zero when the group is unused.
 */
std::vector<double> relative_usage(IndexKind kind,
                                   const CodonCounts& counts,
                                   const SynonymousGroup& group);

// Scale values so the maximum is 1.0; all-zero input stays all zero
void normalize_to_max(std::vector<double>& values);

// Weight table for every codon from a set of counts
std::array<double, NUM_CODONS> compute_weights(IndexKind kind, const CodonCounts& counts);

/**
 * Add codon occurrences of one sequence to `counts`.
 * Throws InvalidCodonError on a non-ACGT window; `counts` may then hold a
 * partial update, so callers count into a scratch table.
 */
void count_sequence_codons(const std::string& sequence,
                           const std::string& record_id,
                           TrailingFragmentPolicy policy,
                           CodonCounts& counts);

/**
 * Codon usage indexer (Sharp & Li style codon adaptation index tables).
 *
 * Single owner, single cycle: construct over a record source, count,
 * build each index once, read or write them, discard.
 */
class CodonUsageIndexer {
public:
    explicit CodonUsageIndexer(SequenceProvider& source,
                               TrailingFragmentPolicy policy = TrailingFragmentPolicy::DROP);

    CodonUsageIndexer(const CodonUsageIndexer&) = delete;
    CodonUsageIndexer& operator=(const CodonUsageIndexer&) = delete;

    /**
     * Replace the counts with a fresh count over `records`.
     * On InvalidCodonError or MalformedSequenceLengthError the previous
     * counts are left unchanged.
     */
    void count_codons(SequenceProvider& records);

    // Count over the source given at construction
    void count_codons();

    /**
     * Build the RCSU / NRCSU index from the current counts, counting the
     * configured source first if no counting cycle has run.
     * Throws DuplicateIndexError when that index is already built.
     */
    void build_rcsu_index();
    void build_nrcsu_index();

    const CodonCounts& counts() const { return counts_; }
    bool has_counts() const { return counted_; }

    // Number of records in the last counting cycle
    size_t records_counted() const { return records_counted_; }

    const CodonIndex& get_index(IndexKind kind) const;

    // False once counts have been replaced after the index was built
    bool index_is_current(IndexKind kind) const;

    // Sorted CODON\tWEIGHT lines for the given index
    void write_index(IndexKind kind, std::ostream& os) const;

private:
    void build_index(IndexKind kind);

    SequenceProvider& source_;
    TrailingFragmentPolicy policy_;
    CodonCounts counts_;
    bool counted_ = false;
    size_t records_counted_ = 0;
    uint64_t count_epoch_ = 0;
    CodonIndex rcsu_index_{IndexKind::RCSU};
    CodonIndex nrcsu_index_{IndexKind::NRCSU};
    uint64_t rcsu_epoch_ = 0;
    uint64_t nrcsu_epoch_ = 0;
};

} // namespace cai
