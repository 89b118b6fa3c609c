#include "cai/sequence_io.hpp"
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <zlib.h>

namespace cai {

// Large I/O buffer for better throughput on genome-sized inputs
constexpr size_t GZBUF_SIZE = 4 * 1024 * 1024;

static bool has_gz_suffix(const std::string& filename) {
    return filename.size() > 3 &&
           filename.compare(filename.size() - 3, 3, ".gz") == 0;
}

// SequenceReader implementation
class SequenceReader::Impl {
public:
    std::string filename_;
    std::ifstream file_;
    gzFile gz_file_ = nullptr;
    bool is_gzipped_ = false;
    char buffer_[65536];  // Line buffer (separate from zlib's I/O buffer)
    std::string lookahead_line_;  // Header of the next record
    bool has_lookahead_ = false;

    bool open(const std::string& filename) {
        filename_ = filename;
        if (has_gz_suffix(filename)) {
            is_gzipped_ = true;
            gz_file_ = gzopen(filename.c_str(), "rb");
            if (!gz_file_) return false;
            gzbuffer(gz_file_, GZBUF_SIZE);
        } else {
            file_.open(filename);
            if (!file_) return false;
        }
        return true;
    }

    // Read one line without its newline. Lines longer than the buffer are
    // assembled from successive gzgets calls.
    bool getline(std::string& line) {
        if (!is_gzipped_) {
            if (!std::getline(file_, line)) return false;
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }

        line.clear();
        bool got_any = false;
        while (gzgets(gz_file_, buffer_, sizeof(buffer_))) {
            got_any = true;
            size_t len = strlen(buffer_);
            bool complete = len > 0 && buffer_[len - 1] == '\n';
            if (complete) len--;
            line.append(buffer_, len);
            if (complete) break;
        }
        if (!got_any) {
            int errnum = 0;
            const char* msg = gzerror(gz_file_, &errnum);
            if (errnum != Z_OK && errnum != Z_STREAM_END) {
                throw std::runtime_error("Decompression failed for " + filename_ + ": " + msg);
            }
            return false;
        }
        if (!line.empty() && line.back() == '\r') line.pop_back();
        return true;
    }

    bool is_open() const {
        return is_gzipped_ ? (gz_file_ != nullptr) : file_.is_open();
    }

    void close() {
        if (gz_file_) {
            gzclose(gz_file_);
            gz_file_ = nullptr;
        }
        if (file_.is_open()) {
            file_.close();
        }
    }

    ~Impl() {
        close();
    }
};

SequenceReader::SequenceReader(const std::string& filename)
    : impl_(std::make_unique<Impl>()) {
    if (!impl_->open(filename)) {
        throw std::runtime_error("Failed to open file: " + filename);
    }

    // The first non-empty line must be a FASTA header
    std::string line;
    while (impl_->getline(line)) {
        if (line.empty()) continue;
        if (line[0] != '>') {
            throw std::runtime_error("Not a FASTA file (expected '>'): " + filename);
        }
        impl_->lookahead_line_ = std::move(line);
        impl_->has_lookahead_ = true;
        break;
    }
}

SequenceReader::~SequenceReader() = default;

bool SequenceReader::read_next(SequenceRecord& record) {
    if (!impl_->has_lookahead_) {
        return false;
    }
    std::string line = std::move(impl_->lookahead_line_);
    impl_->has_lookahead_ = false;

    // Parse header: id up to first whitespace, remainder is the description
    const char* hdr = line.c_str() + 1;  // Skip '>'
    const char* space = strpbrk(hdr, " \t");
    if (space) {
        record.id.assign(hdr, space - hdr);
        record.description.assign(space + 1);
    } else {
        record.id.assign(hdr);
        record.description.clear();
    }

    // Read sequence lines until next header or EOF
    record.sequence.clear();
    while (impl_->getline(line)) {
        if (line.empty()) continue;
        if (line[0] == '>') {
            impl_->lookahead_line_ = std::move(line);
            impl_->has_lookahead_ = true;
            break;
        }
        for (char c : line) {
            if (c != ' ' && c != '\t') record.sequence.push_back(c);
        }
    }

    return true;
}

void SequenceReader::for_each(const std::function<void(const SequenceRecord&)>& callback) {
    SequenceRecord record;
    while (read_next(record)) {
        callback(record);
    }
}

std::vector<SequenceRecord> SequenceReader::read_all() {
    std::vector<SequenceRecord> records;
    SequenceRecord record;
    while (read_next(record)) {
        records.push_back(record);
    }
    return records;
}

bool SequenceReader::is_open() const {
    return impl_->is_open();
}

const std::string& SequenceReader::filename() const {
    return impl_->filename_;
}

// Providers

void FastaFileProvider::for_each_record(const RecordCallback& callback) {
    // Reader is scoped to this pass; an exception from the callback closes it
    SequenceReader reader(filename_);
    reader.for_each(callback);
}

void RecordListProvider::for_each_record(const RecordCallback& callback) {
    for (const auto& record : records_) {
        callback(record);
    }
}

void FilteredProvider::for_each_record(const RecordCallback& callback) {
    seen_ = 0;
    passed_ = 0;
    inner_.for_each_record([&](const SequenceRecord& record) {
        ++seen_;
        if (ids_.count(record.id)) {
            ++passed_;
            callback(record);
        }
    });
}

} // namespace cai
