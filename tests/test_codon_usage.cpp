// Unit tests for codon counting and the RCSU / NRCSU index tables

#include "cai/codon_usage.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace {

constexpr double TOL = 1e-12;

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

bool near(double a, double b) {
    return std::fabs(a - b) < TOL;
}

cai::RecordListProvider make_records(
    const std::vector<std::pair<std::string, std::string>>& id_seq) {
    std::vector<cai::SequenceRecord> records;
    for (const auto& [id, seq] : id_seq) {
        records.push_back({id, "", seq});
    }
    return cai::RecordListProvider(std::move(records));
}

// Provider that counts how many passes were made over it
class CountingProvider : public cai::SequenceProvider {
public:
    explicit CountingProvider(cai::SequenceProvider& inner) : inner_(inner) {}

    void for_each_record(const cai::RecordCallback& callback) override {
        ++passes;
        inner_.for_each_record(callback);
    }

    int passes = 0;

private:
    cai::SequenceProvider& inner_;
};

// Counts with a non-uniform, non-trivial pattern over every codon
cai::CodonCounts patterned_counts() {
    cai::CodonCounts counts = cai::codon_template();
    for (int i = 0; i < cai::NUM_CODONS; ++i) {
        counts[i] = static_cast<uint64_t>((i * 7) % 11 + 1);
    }
    return counts;
}

int test_repeated_codon_counts() {
    std::cout << "Testing repeated codon counts... ";
    int failed = 0;
    const int n = 5;
    for (int c = 0; c < cai::NUM_CODONS; ++c) {
        std::string seq;
        for (int k = 0; k < n; ++k) seq += cai::codon_at(c);
        auto records = make_records({{"rep", seq}});
        cai::CodonUsageIndexer indexer(records);
        indexer.count_codons();
        for (int i = 0; i < cai::NUM_CODONS; ++i) {
            uint64_t expected = (i == c) ? n : 0;
            if (indexer.counts()[i] != expected) {
                expect(false, "count for " + std::string(cai::codon_at(i)) +
                              " after repeating " + std::string(cai::codon_at(c)), failed);
            }
        }
    }
    std::cout << (failed ? "FAILED\n" : "PASSED\n");
    return failed;
}

int test_seq1_scenario() {
    std::cout << "Testing seq1 scenario... ";
    int failed = 0;
    auto records = make_records({{"seq1", "ATGATGTTTTTC"}});
    cai::CodonUsageIndexer indexer(records);
    indexer.build_rcsu_index();
    indexer.build_nrcsu_index();

    const auto& counts = indexer.counts();
    expect(counts.at("ATG") == 2, "ATG=2", failed);
    expect(counts.at("TTT") == 1, "TTT=1", failed);
    expect(counts.at("TTC") == 1, "TTC=1", failed);
    expect(counts.total() == 4, "4 codons in total", failed);

    const auto& rcsu = indexer.get_index(cai::IndexKind::RCSU);
    const auto& nrcsu = indexer.get_index(cai::IndexKind::NRCSU);
    expect(near(rcsu.weight("ATG"), 1.0), "RCSU(ATG)=1", failed);
    expect(near(rcsu.weight("TTT"), 1.0), "RCSU(TTT)=1", failed);
    expect(near(rcsu.weight("TTC"), 1.0), "RCSU(TTC)=1", failed);
    expect(near(nrcsu.weight("TTT"), 1.0), "NRCSU(TTT)=1", failed);
    expect(near(nrcsu.weight("TTC"), 1.0), "NRCSU(TTC)=1", failed);

    const auto* phe = cai::group_of("TTT");
    auto raw_rcsu = cai::relative_usage(cai::IndexKind::RCSU, counts, *phe);
    auto raw_nrcsu = cai::relative_usage(cai::IndexKind::NRCSU, counts, *phe);
    expect(near(raw_rcsu[0], 1.0) && near(raw_rcsu[1], 1.0), "raw RCSU PHE = 1, 1", failed);
    expect(near(raw_nrcsu[0], 0.5) && near(raw_nrcsu[1], 0.5), "raw NRCSU PHE = 0.5, 0.5", failed);

    // Unused groups are zero
    expect(rcsu.weight("GCT") == 0.0, "RCSU(GCT)=0", failed);
    expect(nrcsu.weight("TAA") == 0.0, "NRCSU(TAA)=0", failed);
    std::cout << (failed ? "FAILED\n" : "PASSED\n");
    return failed;
}

int test_rcsu_group_max_is_one() {
    std::cout << "Testing RCSU group max... ";
    int failed = 0;
    auto weights = cai::compute_weights(cai::IndexKind::RCSU, patterned_counts());
    for (const auto& g : cai::synonymous_groups()) {
        double max_w = 0.0;
        for (auto codon : g.codons) {
            double w = weights[cai::codon_index(codon)];
            expect(w >= 0.0 && w <= 1.0 + TOL, "weight in [0,1] for " + std::string(codon), failed);
            max_w = std::max(max_w, w);
        }
        expect(near(max_w, 1.0), "max weight 1.0 in " + std::string(g.label), failed);
    }
    std::cout << (failed ? "FAILED\n" : "PASSED\n");
    return failed;
}

int test_unused_groups_are_zero() {
    std::cout << "Testing unused groups... ";
    int failed = 0;
    cai::CodonCounts counts = cai::codon_template();
    counts.at("GCT") = 4;  // only ALA used

    for (auto kind : {cai::IndexKind::RCSU, cai::IndexKind::NRCSU}) {
        auto weights = cai::compute_weights(kind, counts);
        for (int i = 0; i < cai::NUM_CODONS; ++i) {
            const auto* g = cai::group_of(i);
            expect(!std::isnan(weights[i]), "no NaN weights", failed);
            if (g->label != "ALA") {
                expect(weights[i] == 0.0, std::string(cai::index_kind_name(kind)) +
                       " zero weight for unused " + std::string(cai::codon_at(i)), failed);
            }
        }
        expect(near(weights[cai::codon_index("GCT")], 1.0), "GCT weight 1", failed);
        expect(weights[cai::codon_index("GCC")] == 0.0, "GCC weight 0", failed);
    }

    // An entirely empty input gives an all-zero table
    auto records = make_records({});
    cai::CodonUsageIndexer indexer(records);
    indexer.build_rcsu_index();
    for (const auto& [codon, w] : indexer.get_index(cai::IndexKind::RCSU).entries()) {
        expect(w == 0.0, "empty input weight 0 for " + codon, failed);
    }
    std::cout << (failed ? "FAILED\n" : "PASSED\n");
    return failed;
}

int test_nrcsu_proportions() {
    std::cout << "Testing NRCSU proportions vs RCSU... ";
    int failed = 0;
    cai::CodonCounts counts = patterned_counts();
    for (const auto& g : cai::synonymous_groups()) {
        double total = 0.0;
        for (auto codon : g.codons) total += static_cast<double>(counts.at(codon));

        auto nrcsu = cai::relative_usage(cai::IndexKind::NRCSU, counts, g);
        auto rcsu = cai::relative_usage(cai::IndexKind::RCSU, counts, g);
        double sum = 0.0;
        bool uniform = true;
        for (size_t i = 0; i < g.size(); ++i) {
            double expected = static_cast<double>(counts.at(g.codons[i])) / total;
            expect(near(nrcsu[i], expected), "NRCSU is count/total for " + std::string(g.codons[i]), failed);
            expect(near(rcsu[i], expected * static_cast<double>(g.size())),
                   "RCSU is n * count/total for " + std::string(g.codons[i]), failed);
            sum += nrcsu[i];
            if (counts.at(g.codons[i]) != counts.at(g.codons[0])) uniform = false;
        }
        expect(near(sum, 1.0), "NRCSU proportions sum to 1 in " + std::string(g.label), failed);

        if (g.size() > 1 && !uniform) {
            bool differs = false;
            for (size_t i = 0; i < g.size(); ++i) {
                if (!near(rcsu[i], nrcsu[i])) differs = true;
            }
            expect(differs, "RCSU differs from NRCSU in " + std::string(g.label), failed);
        }
    }

    // Dividing by the group max cancels the 1/n factor, so the final
    // weights coincide
    auto w_rcsu = cai::compute_weights(cai::IndexKind::RCSU, counts);
    auto w_nrcsu = cai::compute_weights(cai::IndexKind::NRCSU, counts);
    for (int i = 0; i < cai::NUM_CODONS; ++i) {
        expect(near(w_rcsu[i], w_nrcsu[i]), "normalized weights agree for " +
               std::string(cai::codon_at(i)), failed);
    }
    std::cout << (failed ? "FAILED\n" : "PASSED\n");
    return failed;
}

int test_duplicate_build_rejected() {
    std::cout << "Testing duplicate index build... ";
    int failed = 0;
    auto records = make_records({{"g1", "TTTTTTTTCCTGCTA"}});
    cai::CodonUsageIndexer indexer(records);
    indexer.build_rcsu_index();
    auto before = indexer.get_index(cai::IndexKind::RCSU).entries();

    bool threw = false;
    try {
        indexer.build_rcsu_index();
    } catch (const cai::DuplicateIndexError& e) {
        threw = true;
        expect(e.kind() == cai::IndexKind::RCSU, "error names RCSU", failed);
    }
    expect(threw, "second RCSU build throws DuplicateIndexError", failed);
    expect(indexer.get_index(cai::IndexKind::RCSU).entries() == before, "first RCSU result untouched", failed);

    // NRCSU is independent and can still be built once
    indexer.build_nrcsu_index();
    threw = false;
    try {
        indexer.build_nrcsu_index();
    } catch (const cai::DuplicateIndexError& e) {
        threw = true;
        expect(e.kind() == cai::IndexKind::NRCSU, "error names NRCSU", failed);
    }
    expect(threw, "second NRCSU build throws DuplicateIndexError", failed);
    std::cout << (failed ? "FAILED\n" : "PASSED\n");
    return failed;
}

int test_invalid_codon() {
    std::cout << "Testing invalid codon... ";
    int failed = 0;

    // Fresh indexer: no counts are exposed after the failure
    auto bad = make_records({{"good", "ATGAAA"}, {"bad1", "ATGNNNAAA"}});
    cai::CodonUsageIndexer fresh(bad);
    bool threw = false;
    try {
        fresh.count_codons();
    } catch (const cai::InvalidCodonError& e) {
        threw = true;
        expect(e.codon() == "NNN", "error names NNN", failed);
        expect(e.record_id() == "bad1", "error names bad1", failed);
        expect(std::string(e.what()).find("NNN") != std::string::npos, "message mentions NNN", failed);
    }
    expect(threw, "NNN throws InvalidCodonError", failed);
    expect(!fresh.has_counts(), "no counting cycle recorded", failed);
    expect(fresh.counts().total() == 0, "no partial counts", failed);

    // Previously counted indexer keeps its earlier counts
    auto good = make_records({{"g", "TTTTTT"}});
    cai::CodonUsageIndexer indexer(good);
    indexer.count_codons();
    threw = false;
    try {
        indexer.count_codons(bad);
    } catch (const cai::InvalidCodonError&) {
        threw = true;
    }
    expect(threw, "recount over bad input throws", failed);
    expect(indexer.counts().at("TTT") == 2 && indexer.counts().total() == 2,
           "counts from the earlier cycle are unchanged", failed);

    // Building an index propagates the error and leaves the index unbuilt
    cai::CodonUsageIndexer builder(bad);
    threw = false;
    try {
        builder.build_rcsu_index();
    } catch (const cai::InvalidCodonError&) {
        threw = true;
    }
    expect(threw, "build over bad input throws", failed);
    expect(!builder.get_index(cai::IndexKind::RCSU).is_built(), "index stays unbuilt", failed);
    std::cout << (failed ? "FAILED\n" : "PASSED\n");
    return failed;
}

int test_trailing_fragment() {
    std::cout << "Testing trailing fragment policy... ";
    int failed = 0;
    auto records = make_records({{"frag1", "ATGAAAGC"}});

    cai::CodonUsageIndexer dropping(records);
    dropping.count_codons();
    expect(dropping.counts().total() == 2, "trailing GC dropped", failed);
    expect(dropping.counts().at("ATG") == 1 && dropping.counts().at("AAA") == 1,
           "whole codons counted", failed);

    cai::CodonUsageIndexer strict(records, cai::TrailingFragmentPolicy::REJECT);
    bool threw = false;
    try {
        strict.count_codons();
    } catch (const cai::MalformedSequenceLengthError& e) {
        threw = true;
        expect(e.record_id() == "frag1", "error names frag1", failed);
        expect(e.length() == 8, "error carries length 8", failed);
    }
    expect(threw, "REJECT throws MalformedSequenceLengthError", failed);
    expect(strict.counts().total() == 0, "no partial counts under REJECT", failed);
    std::cout << (failed ? "FAILED\n" : "PASSED\n");
    return failed;
}

int test_case_normalization() {
    std::cout << "Testing case normalization... ";
    int failed = 0;
    auto records = make_records({{"lower", "atgtttTtC"}});
    cai::CodonUsageIndexer indexer(records);
    indexer.count_codons();
    expect(indexer.counts().at("ATG") == 1, "atg counted as ATG", failed);
    expect(indexer.counts().at("TTT") == 1, "ttt counted as TTT", failed);
    expect(indexer.counts().at("TTC") == 1, "TtC counted as TTC", failed);
    std::cout << (failed ? "FAILED\n" : "PASSED\n");
    return failed;
}

int test_counting_cycles() {
    std::cout << "Testing counting cycles... ";
    int failed = 0;
    auto base = make_records({{"a", "AAAAAG"}, {"b", "AAA"}});
    CountingProvider source(base);
    cai::CodonUsageIndexer indexer(source);

    indexer.build_rcsu_index();
    indexer.build_nrcsu_index();
    expect(source.passes == 1, "both builds share one counting pass", failed);
    expect(indexer.records_counted() == 2, "2 records counted", failed);
    expect(indexer.index_is_current(cai::IndexKind::RCSU), "RCSU current after build", failed);

    // A recount replaces the counts rather than merging them
    auto other = make_records({{"c", "GGG"}});
    indexer.count_codons(other);
    expect(indexer.counts().at("AAA") == 0 && indexer.counts().at("GGG") == 1,
           "recount replaces counts", failed);
    expect(!indexer.index_is_current(cai::IndexKind::RCSU), "RCSU stale after recount", failed);
    expect(!indexer.index_is_current(cai::IndexKind::NRCSU), "NRCSU stale after recount", failed);
    std::cout << (failed ? "FAILED\n" : "PASSED\n");
    return failed;
}

int test_index_output() {
    std::cout << "Testing index output... ";
    int failed = 0;
    auto records = make_records({{"g", "CTGCTGCTGCTA"}});
    cai::CodonUsageIndexer indexer(records);

    expect(indexer.get_index(cai::IndexKind::RCSU).entries().empty(), "unbuilt index has no entries", failed);
    expect(indexer.get_index(cai::IndexKind::RCSU).state() == cai::IndexState::UNBUILT, "state UNBUILT", failed);

    indexer.build_rcsu_index();
    const auto& index = indexer.get_index(cai::IndexKind::RCSU);
    expect(index.state() == cai::IndexState::BUILT, "state BUILT", failed);

    auto entries = index.entries();
    expect(entries.size() == 64, "64 entries", failed);
    for (size_t i = 1; i < entries.size(); ++i) {
        expect(entries[i - 1].first < entries[i].first, "entries sorted by codon", failed);
    }
    expect(near(index.weight("CTA"), 1.0 / 3.0), "stored weight keeps full precision", failed);

    std::ostringstream oss;
    indexer.write_index(cai::IndexKind::RCSU, oss);
    std::string text = oss.str();
    expect(text.rfind("AAA\t0.000\n", 0) == 0, "first line is AAA 0.000", failed);
    expect(text.find("\nCTA\t0.333\n") != std::string::npos, "CTA printed as 0.333", failed);
    expect(text.find("\nCTG\t1.000\n") != std::string::npos, "CTG printed as 1.000", failed);

    size_t lines = 0;
    for (char c : text) lines += (c == '\n');
    expect(lines == 64, "64 output lines", failed);
    std::cout << (failed ? "FAILED\n" : "PASSED\n");
    return failed;
}

}  // namespace

int main() {
    int total = 0;
    total += test_repeated_codon_counts();
    total += test_seq1_scenario();
    total += test_rcsu_group_max_is_one();
    total += test_unused_groups_are_zero();
    total += test_nrcsu_proportions();
    total += test_duplicate_build_rejected();
    total += test_invalid_codon();
    total += test_trailing_fragment();
    total += test_case_normalization();
    total += test_counting_cycles();
    total += test_index_output();

    if (total == 0) {
        std::cout << "\nAll codon usage tests passed.\n";
        return 0;
    }
    std::cerr << "\n" << total << " check(s) FAILED.\n";
    return 1;
}
