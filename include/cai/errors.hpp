#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace cai {

enum class IndexKind { RCSU, NRCSU };

inline const char* index_kind_name(IndexKind kind) {
    return kind == IndexKind::RCSU ? "RCSU" : "NRCSU";
}

// Base for all errors raised by the codon usage engine
class CaiError : public std::runtime_error {
public:
    explicit CaiError(const std::string& what) : std::runtime_error(what) {}
};

// A 3-base window outside the 64-codon alphabet
class InvalidCodonError : public CaiError {
public:
    InvalidCodonError(std::string codon, std::string record_id)
        : CaiError("illegal codon " + codon + " in gene: " + record_id),
          codon_(std::move(codon)), record_id_(std::move(record_id)) {}

    const std::string& codon() const { return codon_; }
    const std::string& record_id() const { return record_id_; }

private:
    std::string codon_;
    std::string record_id_;
};

// Index build requested on an index that is already built
class DuplicateIndexError : public CaiError {
public:
    explicit DuplicateIndexError(IndexKind kind)
        : CaiError(std::string("an ") + index_kind_name(kind) + " index has already been set"),
          kind_(kind) {}

    IndexKind kind() const { return kind_; }

private:
    IndexKind kind_;
};

// Sequence length not a multiple of 3 (only under TrailingFragmentPolicy::REJECT)
class MalformedSequenceLengthError : public CaiError {
public:
    MalformedSequenceLengthError(std::string record_id, size_t length)
        : CaiError("sequence length " + std::to_string(length) +
                   " is not a multiple of 3 in gene: " + record_id),
          record_id_(std::move(record_id)), length_(length) {}

    const std::string& record_id() const { return record_id_; }
    size_t length() const { return length_; }

private:
    std::string record_id_;
    size_t length_;
};

// Malformed CODON\tWEIGHT table
class IndexFormatError : public CaiError {
public:
    IndexFormatError(const std::string& source, size_t line, const std::string& what)
        : CaiError(source + ":" + std::to_string(line) + ": " + what), line_(line) {}

    size_t line() const { return line_; }

private:
    size_t line_;
};

// Highly-expressed-gene selection matched no input record
class EmptySelectionError : public CaiError {
public:
    using CaiError::CaiError;
};

} // namespace cai
