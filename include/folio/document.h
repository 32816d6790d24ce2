#pragma once

#include <folio/checksum.h>
#include <folio/encoding.h>
#include <folio/line_index.h>
#include <folio/source.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>

namespace folio {

// Thrown when the source stream fails while a document is being resolved.
// The document stays failed: its stream cannot be re-read.
class SourceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct DocumentProperties {
    std::optional<std::string> file_path;
    std::optional<std::string> relative_path;
};

// A read-only snapshot of a decoded byte stream, stored as fixed-size chunks
// of UTF-16 code units. The stream is consumed lazily and only as far as the
// queries so far have required; length, checksum and lines are computed once.
//
// Safe to share between threads: advancing the chunk frontier is serialized.
class Document {
public:
    static constexpr std::size_t default_chunk_size = 40 * 1024;

    Document(std::unique_ptr<Source> source, std::size_t chunk_size,
             Encoding encoding, DocumentProperties properties = {});
    ~Document();

    // A moved-from document may only be destroyed or assigned to; any other
    // call throws std::logic_error.
    Document(Document&&) noexcept;
    Document& operator=(Document&&) noexcept;

    Document(const Document&) = delete;
    Document& operator=(const Document&) = delete;

    // Convenience: read path with the default chunk size. file_path defaults
    // to path when the properties leave it unset.
    static Document open_file(const std::filesystem::path& path,
                              Encoding encoding = Encoding::utf8,
                              DocumentProperties properties = {});

    // Total number of code units. Drains the stream on first call.
    std::size_t length() const;

    // Code unit at index. Throws std::out_of_range past the end.
    char16_t operator[](std::size_t index) const;
    char16_t at(std::size_t index) const { return (*this)[index]; }

    // Copy count code units starting at source_index into
    // destination[destination_index...]. A count of 0 does nothing.
    void copy_to(std::size_t source_index, std::span<char16_t> destination,
                 std::size_t destination_index, std::ptrdiff_t count) const;

    std::u16string substr(std::size_t start, std::size_t count) const;

    // Returns a fresh copy of the cached digest on every call.
    Checksum checksum() const;

    const LineIndex& lines() const;

    // Text of a line, terminator excluded.
    std::u16string line(std::size_t line_number) const;

    const std::optional<std::string>& file_path() const;
    const std::optional<std::string>& relative_path() const;
    const DocumentProperties& properties() const;
    Encoding encoding() const;
    std::size_t chunk_size() const;

private:
    struct Impl;

    // Throws std::logic_error on a moved-from document.
    Impl& state() const;

    std::unique_ptr<Impl> impl_;
};

} // namespace folio
