#pragma once

#include <functional>
#include <memory>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace cai {

/**
 * Sequence record from a FASTA file
 */
struct SequenceRecord {
    std::string id;
    std::string description;
    std::string sequence;
};

/**
 * FASTA file reader
 *
 * Supports:
 * - Uncompressed and gzip-compressed files (".gz" suffix, via zlib)
 * - Multi-line records, blank lines between records
 * - Iterator-based and callback-based processing
 *
 * The file is released when the reader is destroyed.
 */
class SequenceReader {
public:
    /**
     * Open a FASTA file. Throws std::runtime_error if it cannot be opened
     * or does not start with a '>' header.
     */
    explicit SequenceReader(const std::string& filename);
    ~SequenceReader();

    SequenceReader(const SequenceReader&) = delete;
    SequenceReader& operator=(const SequenceReader&) = delete;

    /**
     * Read next sequence
     * Returns false when end of file is reached
     */
    bool read_next(SequenceRecord& record);

    /**
     * Process all sequences with a callback
     */
    void for_each(const std::function<void(const SequenceRecord&)>& callback);

    /**
     * Read all sequences into memory
     */
    std::vector<SequenceRecord> read_all();

    bool is_open() const;

    const std::string& filename() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

using RecordCallback = std::function<void(const SequenceRecord&)>;

/**
 * Source of sequence records. One pass per call; implementations acquire
 * any underlying resource for the duration of the call only.
 */
class SequenceProvider {
public:
    virtual ~SequenceProvider() = default;

    virtual void for_each_record(const RecordCallback& callback) = 0;
};

// Records read from a FASTA (or FASTA.gz) file, reopened on every pass
class FastaFileProvider : public SequenceProvider {
public:
    explicit FastaFileProvider(std::string filename) : filename_(std::move(filename)) {}

    void for_each_record(const RecordCallback& callback) override;

    const std::string& filename() const { return filename_; }

private:
    std::string filename_;
};

// Records held in memory
class RecordListProvider : public SequenceProvider {
public:
    explicit RecordListProvider(std::vector<SequenceRecord> records)
        : records_(std::move(records)) {}

    void for_each_record(const RecordCallback& callback) override;

    const std::vector<SequenceRecord>& records() const { return records_; }

private:
    std::vector<SequenceRecord> records_;
};

// Restricts another provider to a set of record identifiers
class FilteredProvider : public SequenceProvider {
public:
    FilteredProvider(SequenceProvider& inner, std::unordered_set<std::string> ids)
        : inner_(inner), ids_(std::move(ids)) {}

    void for_each_record(const RecordCallback& callback) override;

    // Statistics from the most recent pass
    size_t records_seen() const { return seen_; }
    size_t records_passed() const { return passed_; }

private:
    SequenceProvider& inner_;
    std::unordered_set<std::string> ids_;
    size_t seen_ = 0;
    size_t passed_ = 0;
};

} // namespace cai
