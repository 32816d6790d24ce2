#pragma once

#include <folio/encoding.h>
#include <folio/source.h>

#include "decoder.h"

#include <cstddef>
#include <memory>
#include <string_view>
#include <vector>

namespace folio::detail {

// Append-only list of fixed-size chunks filled from a decoder. Every chunk
// except the last holds exactly chunk_size code units, so an absolute index
// maps to (index / chunk_size, index % chunk_size). Chunks are never evicted:
// the stream cannot be read a second time.
class ChunkStore {
public:
    ChunkStore(std::unique_ptr<Source> source, Encoding encoding,
               std::size_t chunk_size);

    // Load chunks until index is resolved or the stream is exhausted.
    void resolve_through(std::size_t index);

    bool exhausted() const { return exhausted_; }
    std::size_t resolved_length() const { return resolved_; }
    std::size_t chunk_size() const { return chunk_size_; }
    std::size_t chunk_count() const { return chunks_.size(); }

    // index must be below resolved_length().
    char16_t at(std::size_t index) const;

    // [index, index + count) must be resolved.
    void copy(std::size_t index, char16_t* dest, std::size_t count) const;

    // Views over the filled part of each chunk, in order.
    std::vector<std::u16string_view> segments() const;

private:
    void load_chunk();

    struct Chunk {
        std::unique_ptr<char16_t[]> data;
        std::size_t filled = 0;
    };

    std::unique_ptr<Decoder> decoder_;
    std::vector<Chunk> chunks_;
    std::size_t chunk_size_;
    std::size_t resolved_ = 0;
    bool exhausted_ = false;
};

} // namespace folio::detail
