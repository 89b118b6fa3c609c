#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace cai {

constexpr int NUM_CODONS = 64;
constexpr int NUM_SYNONYMOUS_GROUPS = 21;

// Fast uppercase without locale lookups
inline char fast_upper(char c) {
    return (c >= 'a' && c <= 'z') ? (c - 32) : c;
}

// Base to index in alphabetical order: A=0, C=1, G=2, T=3
inline int fast_base_idx(char c) {
    switch (c) {
        case 'A': case 'a': return 0;
        case 'C': case 'c': return 1;
        case 'G': case 'g': return 2;
        case 'T': case 't': return 3;
        default: return -1;
    }
}

// Codon to array index (0-63), -1 if any base is not ACGT.
// Index = base1*16 + base2*4 + base3, so index order is alphabetical order.
inline int codon_index(char c1, char c2, char c3) {
    int i1 = fast_base_idx(c1);
    int i2 = fast_base_idx(c2);
    int i3 = fast_base_idx(c3);
    if (i1 < 0 || i2 < 0 || i3 < 0) return -1;
    return i1 * 16 + i2 * 4 + i3;
}

inline int codon_index(std::string_view codon) {
    if (codon.size() != 3) return -1;
    return codon_index(codon[0], codon[1], codon[2]);
}

// Uppercase codon string for an index in [0, 64)
std::string_view codon_at(int idx);

// All 64 codons, sorted
const std::array<std::string_view, NUM_CODONS>& all_codons();

/**
 * Codon occurrence counts keyed by the 64 standard codons.
 * Addressable by codon string or by dense index.
 */
class CodonCounts {
public:
    uint64_t& operator[](int idx) { return counts_[idx]; }
    uint64_t operator[](int idx) const { return counts_[idx]; }

    // Throws std::out_of_range for a string that is not a codon
    uint64_t& at(std::string_view codon);
    uint64_t at(std::string_view codon) const;

    uint64_t total() const;
    bool empty() const { return total() == 0; }

    const std::array<uint64_t, NUM_CODONS>& raw() const { return counts_; }

private:
    std::array<uint64_t, NUM_CODONS> counts_{};
};

/**
 * Codons encoding the same amino acid (or stop).
 * Member order is fixed; index computations iterate in this order.
 */
struct SynonymousGroup {
    std::string_view label;   // three-letter code, "STOP" for stops
    char amino_acid;          // one-letter code, '*' for stops
    std::vector<std::string_view> codons;

    size_t size() const { return codons.size(); }
};

// Template for a fresh counting cycle: every codon mapped to zero
CodonCounts codon_template();

// The 21 groups of the standard genetic code, in fixed order
const std::vector<SynonymousGroup>& synonymous_groups();

// Group containing a codon index; nullptr for an invalid index
const SynonymousGroup* group_of(int codon_idx);
const SynonymousGroup* group_of(std::string_view codon);

} // namespace cai
