#include "cai/pipeline.hpp"

#include <fstream>
#include <stdexcept>

namespace cai {

std::optional<IdSet> AllGenesSelector::select(SequenceProvider& /*sequences*/) {
    return std::nullopt;
}

IdListSelector IdListSelector::from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Failed to open file: " + path);
    }

    IdSet ids;
    std::string line;
    while (std::getline(in, line)) {
        size_t start = line.find_first_not_of(" \t\r");
        if (start == std::string::npos || line[start] == '#') continue;
        if (line[start] == '>') ++start;
        size_t end = line.find_first_of(" \t\r", start);
        std::string id = line.substr(start, end == std::string::npos ? std::string::npos : end - start);
        if (!id.empty()) ids.insert(std::move(id));
    }
    return IdListSelector(std::move(ids));
}

std::optional<IdSet> IdListSelector::select(SequenceProvider& /*sequences*/) {
    return ids_;
}

BiasResult BiasPipeline::run() {
    std::optional<IdSet> selection = selector_.select(sequences_);

    SequenceProvider* source = &sequences_;
    std::optional<FilteredProvider> filtered;
    if (selection) {
        filtered.emplace(sequences_, std::move(*selection));
        source = &*filtered;
    }

    CodonUsageIndexer indexer(*source, policy_);
    indexer.count_codons();
    if (filtered && filtered->records_passed() == 0) {
        throw EmptySelectionError("none of the selected gene ids matched an input record (" +
                                  std::to_string(filtered->records_seen()) + " records scanned)");
    }
    indexer.build_rcsu_index();
    indexer.build_nrcsu_index();

    BiasResult result;
    result.counts = indexer.counts();
    result.rcsu = indexer.get_index(IndexKind::RCSU);
    result.nrcsu = indexer.get_index(IndexKind::NRCSU);
    result.records_used = indexer.records_counted();
    result.records_total = filtered ? filtered->records_seen() : indexer.records_counted();
    return result;
}

} // namespace cai
