#include "chunk_store.h"

#include <algorithm>
#include <stdexcept>

namespace folio::detail {

ChunkStore::ChunkStore(std::unique_ptr<Source> source, Encoding encoding,
                       std::size_t chunk_size)
    : chunk_size_(chunk_size)
{
    if (chunk_size == 0)
        throw std::invalid_argument("chunk size must be positive");
    decoder_ = std::make_unique<Decoder>(std::move(source), encoding);
}

void ChunkStore::load_chunk() {
    Chunk chunk;
    chunk.data = std::make_unique<char16_t[]>(chunk_size_);
    chunk.filled = decoder_->read(chunk.data.get(), chunk_size_);

    if (chunk.filled > 0) {
        resolved_ += chunk.filled;
        chunks_.push_back(std::move(chunk));
    }

    if (decoder_->at_end()) {
        exhausted_ = true;
        decoder_.reset();  // closes the source
    }
}

void ChunkStore::resolve_through(std::size_t index) {
    while (!exhausted_ && resolved_ <= index) {
        load_chunk();
    }
}

char16_t ChunkStore::at(std::size_t index) const {
    const Chunk& chunk = chunks_[index / chunk_size_];
    return chunk.data[index % chunk_size_];
}

void ChunkStore::copy(std::size_t index, char16_t* dest, std::size_t count) const {
    while (count > 0) {
        const Chunk& chunk = chunks_[index / chunk_size_];
        std::size_t offset = index % chunk_size_;
        std::size_t run = std::min(count, chunk.filled - offset);

        std::copy(chunk.data.get() + offset, chunk.data.get() + offset + run, dest);
        dest += run;
        index += run;
        count -= run;
    }
}

std::vector<std::u16string_view> ChunkStore::segments() const {
    std::vector<std::u16string_view> result;
    result.reserve(chunks_.size());
    for (const auto& chunk : chunks_) {
        result.emplace_back(chunk.data.get(), chunk.filled);
    }
    return result;
}

} // namespace folio::detail
