#include "cai/codon_usage.hpp"

#include <algorithm>
#include <cstdio>
#include <ostream>
#include <stdexcept>

namespace cai {

double CodonIndex::weight(std::string_view codon) const {
    int idx = codon_index(codon);
    if (idx < 0) {
        throw std::out_of_range("not a codon: " + std::string(codon));
    }
    return weights_[idx];
}

std::vector<std::pair<std::string, double>> CodonIndex::entries() const {
    std::vector<std::pair<std::string, double>> out;
    if (!is_built()) return out;
    out.reserve(NUM_CODONS);
    // Index order is alphabetical order
    for (int i = 0; i < NUM_CODONS; ++i) {
        out.emplace_back(std::string(codon_at(i)), weights_[i]);
    }
    return out;
}

void CodonIndex::write_tsv(std::ostream& os) const {
    char line[32];
    for (const auto& [codon, w] : entries()) {
        std::snprintf(line, sizeof(line), "%s\t%.3f\n", codon.c_str(), w);
        os << line;
    }
}

void CodonIndex::assign(const std::array<double, NUM_CODONS>& weights) {
    if (is_built()) {
        throw DuplicateIndexError(kind_);
    }
    weights_ = weights;
    state_ = IndexState::BUILT;
}

std::vector<double> relative_usage(IndexKind kind,
                                   const CodonCounts& counts,
                                   const SynonymousGroup& group) {
    // Sum in table order so the result does not depend on hashing
    double total = 0.0;
    for (auto codon : group.codons) {
        total += static_cast<double>(counts[codon_index(codon)]);
    }

    const double denominator = (kind == IndexKind::RCSU)
        ? total / static_cast<double>(group.size())
        : total;

    std::vector<double> values;
    values.reserve(group.size());
    for (auto codon : group.codons) {
        double count = static_cast<double>(counts[codon_index(codon)]);
        values.push_back(denominator > 0.0 ? count / denominator : 0.0);
    }
    return values;
}

void normalize_to_max(std::vector<double>& values) {
    if (values.empty()) return;
    double max_value = *std::max_element(values.begin(), values.end());
    if (max_value <= 0.0) {
        std::fill(values.begin(), values.end(), 0.0);
        return;
    }
    for (double& v : values) v /= max_value;
}

std::array<double, NUM_CODONS> compute_weights(IndexKind kind, const CodonCounts& counts) {
    std::array<double, NUM_CODONS> weights{};
    for (const auto& group : synonymous_groups()) {
        std::vector<double> values = relative_usage(kind, counts, group);
        normalize_to_max(values);
        for (size_t i = 0; i < group.size(); ++i) {
            weights[codon_index(group.codons[i])] = values[i];
        }
    }
    return weights;
}

void count_sequence_codons(const std::string& sequence,
                           const std::string& record_id,
                           TrailingFragmentPolicy policy,
                           CodonCounts& counts) {
    const size_t len = sequence.size();
    const size_t whole = len - len % 3;

    if (whole != len && policy == TrailingFragmentPolicy::REJECT) {
        throw MalformedSequenceLengthError(record_id, len);
    }

    for (size_t i = 0; i < whole; i += 3) {
        char c1 = fast_upper(sequence[i]);
        char c2 = fast_upper(sequence[i + 1]);
        char c3 = fast_upper(sequence[i + 2]);
        int idx = codon_index(c1, c2, c3);
        if (idx < 0) {
            throw InvalidCodonError(std::string{c1, c2, c3}, record_id);
        }
        ++counts[idx];
    }
}

CodonUsageIndexer::CodonUsageIndexer(SequenceProvider& source, TrailingFragmentPolicy policy)
    : source_(source), policy_(policy), counts_(codon_template()) {}

void CodonUsageIndexer::count_codons(SequenceProvider& records) {
    // Count into a scratch table; commit only after the whole pass succeeded
    CodonCounts fresh = codon_template();
    size_t n_records = 0;

    records.for_each_record([&](const SequenceRecord& record) {
        count_sequence_codons(record.sequence, record.id, policy_, fresh);
        ++n_records;
    });

    counts_ = fresh;
    records_counted_ = n_records;
    counted_ = true;
    ++count_epoch_;
}

void CodonUsageIndexer::count_codons() {
    count_codons(source_);
}

void CodonUsageIndexer::build_rcsu_index() {
    build_index(IndexKind::RCSU);
}

void CodonUsageIndexer::build_nrcsu_index() {
    build_index(IndexKind::NRCSU);
}

void CodonUsageIndexer::build_index(IndexKind kind) {
    CodonIndex& index = (kind == IndexKind::RCSU) ? rcsu_index_ : nrcsu_index_;
    if (index.is_built()) {
        throw DuplicateIndexError(kind);
    }

    if (!counted_) {
        count_codons();
    }

    index.assign(compute_weights(kind, counts_));
    (kind == IndexKind::RCSU ? rcsu_epoch_ : nrcsu_epoch_) = count_epoch_;
}

const CodonIndex& CodonUsageIndexer::get_index(IndexKind kind) const {
    return kind == IndexKind::RCSU ? rcsu_index_ : nrcsu_index_;
}

bool CodonUsageIndexer::index_is_current(IndexKind kind) const {
    const CodonIndex& index = get_index(kind);
    if (!index.is_built()) return false;
    return (kind == IndexKind::RCSU ? rcsu_epoch_ : nrcsu_epoch_) == count_epoch_;
}

void CodonUsageIndexer::write_index(IndexKind kind, std::ostream& os) const {
    get_index(kind).write_tsv(os);
}

} // namespace cai
