/**
 * Standard genetic code tables
 *
 * Encoding: A=0, C=1, G=2, T=3
 * Index = base1*16 + base2*4 + base3
 */

#include "cai/codon_table.hpp"
#include <stdexcept>

namespace cai {

static const std::array<std::string_view, NUM_CODONS> CODONS = {
    "AAA", "AAC", "AAG", "AAT", "ACA", "ACC", "ACG", "ACT",
    "AGA", "AGC", "AGG", "AGT", "ATA", "ATC", "ATG", "ATT",
    "CAA", "CAC", "CAG", "CAT", "CCA", "CCC", "CCG", "CCT",
    "CGA", "CGC", "CGG", "CGT", "CTA", "CTC", "CTG", "CTT",
    "GAA", "GAC", "GAG", "GAT", "GCA", "GCC", "GCG", "GCT",
    "GGA", "GGC", "GGG", "GGT", "GTA", "GTC", "GTG", "GTT",
    "TAA", "TAC", "TAG", "TAT", "TCA", "TCC", "TCG", "TCT",
    "TGA", "TGC", "TGG", "TGT", "TTA", "TTC", "TTG", "TTT"
};

// Group order and member order follow the reference CAI tables
static const std::vector<SynonymousGroup> GROUPS = {
    {"CYS",  'C', {"TGT", "TGC"}},
    {"ASP",  'D', {"GAT", "GAC"}},
    {"SER",  'S', {"TCT", "TCG", "TCA", "TCC", "AGC", "AGT"}},
    {"GLN",  'Q', {"CAA", "CAG"}},
    {"MET",  'M', {"ATG"}},
    {"ASN",  'N', {"AAC", "AAT"}},
    {"PRO",  'P', {"CCT", "CCG", "CCA", "CCC"}},
    {"LYS",  'K', {"AAG", "AAA"}},
    {"STOP", '*', {"TAG", "TGA", "TAA"}},
    {"THR",  'T', {"ACC", "ACA", "ACG", "ACT"}},
    {"PHE",  'F', {"TTT", "TTC"}},
    {"ALA",  'A', {"GCA", "GCC", "GCG", "GCT"}},
    {"GLY",  'G', {"GGT", "GGG", "GGA", "GGC"}},
    {"ILE",  'I', {"ATC", "ATA", "ATT"}},
    {"LEU",  'L', {"TTA", "TTG", "CTC", "CTT", "CTG", "CTA"}},
    {"HIS",  'H', {"CAT", "CAC"}},
    {"ARG",  'R', {"CGA", "CGC", "CGG", "CGT", "AGG", "AGA"}},
    {"TRP",  'W', {"TGG"}},
    {"VAL",  'V', {"GTA", "GTC", "GTG", "GTT"}},
    {"GLU",  'E', {"GAG", "GAA"}},
    {"TYR",  'Y', {"TAT", "TAC"}}
};

// Reverse lookup: codon index -> position in GROUPS
static const std::array<int, NUM_CODONS> GROUP_OF_CODON = []() {
    std::array<int, NUM_CODONS> arr{};
    arr.fill(-1);
    for (size_t g = 0; g < GROUPS.size(); ++g) {
        for (auto codon : GROUPS[g].codons) {
            arr[codon_index(codon)] = static_cast<int>(g);
        }
    }
    return arr;
}();

std::string_view codon_at(int idx) {
    if (idx < 0 || idx >= NUM_CODONS) {
        throw std::out_of_range("codon index out of range: " + std::to_string(idx));
    }
    return CODONS[idx];
}

const std::array<std::string_view, NUM_CODONS>& all_codons() {
    return CODONS;
}

uint64_t& CodonCounts::at(std::string_view codon) {
    int idx = codon_index(codon);
    if (idx < 0) {
        throw std::out_of_range("not a codon: " + std::string(codon));
    }
    return counts_[idx];
}

uint64_t CodonCounts::at(std::string_view codon) const {
    int idx = codon_index(codon);
    if (idx < 0) {
        throw std::out_of_range("not a codon: " + std::string(codon));
    }
    return counts_[idx];
}

uint64_t CodonCounts::total() const {
    uint64_t sum = 0;
    for (uint64_t c : counts_) sum += c;
    return sum;
}

CodonCounts codon_template() {
    return CodonCounts{};
}

const std::vector<SynonymousGroup>& synonymous_groups() {
    return GROUPS;
}

const SynonymousGroup* group_of(int codon_idx) {
    if (codon_idx < 0 || codon_idx >= NUM_CODONS) return nullptr;
    int g = GROUP_OF_CODON[codon_idx];
    return g < 0 ? nullptr : &GROUPS[g];
}

const SynonymousGroup* group_of(std::string_view codon) {
    return group_of(codon_index(codon));
}

} // namespace cai
