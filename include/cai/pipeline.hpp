#pragma once

#include "cai/codon_usage.hpp"
#include "cai/sequence_io.hpp"

#include <optional>
#include <string>
#include <unordered_set>
#include <utility>

namespace cai {

using IdSet = std::unordered_set<std::string>;

/**
 * Chooses the highly expressed genes used as the codon usage reference.
 * An empty optional means "no restriction": every record is used.
 */
class HegSelector {
public:
    virtual ~HegSelector() = default;

    virtual std::optional<IdSet> select(SequenceProvider& sequences) = 0;
};

// Uses the whole input as the reference set
class AllGenesSelector : public HegSelector {
public:
    std::optional<IdSet> select(SequenceProvider& sequences) override;
};

/**
 * Fixed list of identifiers, e.g. produced by an external homology search.
 *
 * List file format: one id per line; a leading '>' is stripped, only the
 * first whitespace-delimited token counts, blank lines and '#' lines are
 * ignored.
 */
class IdListSelector : public HegSelector {
public:
    explicit IdListSelector(IdSet ids) : ids_(std::move(ids)) {}

    // Throws std::runtime_error if the file cannot be opened
    static IdListSelector from_file(const std::string& path);

    std::optional<IdSet> select(SequenceProvider& sequences) override;

    const IdSet& ids() const { return ids_; }

private:
    IdSet ids_;
};

struct BiasResult {
    CodonCounts counts;
    CodonIndex rcsu{IndexKind::RCSU};
    CodonIndex nrcsu{IndexKind::NRCSU};
    size_t records_total = 0;  // records offered by the provider
    size_t records_used = 0;   // records that entered the counts
};

/**
 * Sequence provider + HEG selector -> codon counts and both indices.
 * Both collaborators are borrowed and must outlive the pipeline.
 */
class BiasPipeline {
public:
    BiasPipeline(SequenceProvider& sequences, HegSelector& selector,
                 TrailingFragmentPolicy policy = TrailingFragmentPolicy::DROP)
        : sequences_(sequences), selector_(selector), policy_(policy) {}

    // Throws EmptySelectionError when a selection matches no record
    BiasResult run();

private:
    SequenceProvider& sequences_;
    HegSelector& selector_;
    TrailingFragmentPolicy policy_;
};

} // namespace cai
