#include <folio/document.h>

#include "checksum.h"
#include "chunk_store.h"

#include <atomic>
#include <limits>
#include <mutex>
#include <optional>

namespace folio {

struct Document::Impl {
    static constexpr std::size_t through_end = std::numeric_limits<std::size_t>::max();

    detail::ChunkStore store;
    DocumentProperties properties;
    Encoding encoding;

    // Guards store, failure, checksum and lines. Once complete is set the
    // chunks are immutable and may be read without the lock.
    std::mutex mutex;
    std::atomic<bool> complete{false};
    std::optional<std::string> failure;
    std::optional<Checksum> checksum;
    std::optional<LineIndex> lines;

    Impl(std::unique_ptr<Source> source, std::size_t chunk_size,
         Encoding enc, DocumentProperties props)
        : store(std::move(source), enc, chunk_size)
        , properties(std::move(props))
        , encoding(enc)
    {
    }

    // Caller holds mutex. Loads chunks until index is resolved or the stream
    // ends; through_end drains the stream.
    void ensure_resolved(std::size_t index) {
        if (complete.load(std::memory_order_relaxed)) return;
        if (failure) throw SourceError(*failure);

        try {
            store.resolve_through(index);
        } catch (const std::exception& e) {
            failure = e.what();
            throw SourceError(*failure);
        }

        if (store.exhausted()) {
            complete.store(true, std::memory_order_release);
        }
    }

    char16_t checked_at(std::size_t index) const {
        if (index >= store.resolved_length()) {
            throw std::out_of_range("index out of range");
        }
        return store.at(index);
    }

    void check_range(std::size_t source_index, std::size_t count) const {
        std::size_t len = store.resolved_length();
        if (source_index > len || count > len - source_index) {
            throw std::out_of_range("source range out of range");
        }
    }

    void checked_copy(std::size_t source_index, char16_t* dest, std::size_t count) const {
        check_range(source_index, count);
        store.copy(source_index, dest, count);
    }
};

Document::Document(std::unique_ptr<Source> source, std::size_t chunk_size,
                   Encoding encoding, DocumentProperties properties)
{
    if (!source) throw std::invalid_argument("Document: null source");
    impl_ = std::make_unique<Impl>(std::move(source), chunk_size, encoding,
                                   std::move(properties));
}

Document::~Document() = default;
Document::Document(Document&&) noexcept = default;
Document& Document::operator=(Document&&) noexcept = default;

Document::Impl& Document::state() const {
    if (!impl_) throw std::logic_error("Document: use of moved-from document");
    return *impl_;
}

Document Document::open_file(const std::filesystem::path& path, Encoding encoding,
                             DocumentProperties properties) {
    if (!properties.file_path) {
        properties.file_path = path.string();
    }
    return Document(make_file_source(path), default_chunk_size, encoding,
                    std::move(properties));
}

std::size_t Document::length() const {
    Impl& impl = state();
    if (!impl.complete.load(std::memory_order_acquire)) {
        std::lock_guard<std::mutex> lock(impl.mutex);
        impl.ensure_resolved(Impl::through_end);
    }
    return impl.store.resolved_length();
}

char16_t Document::operator[](std::size_t index) const {
    Impl& impl = state();
    if (impl.complete.load(std::memory_order_acquire)) {
        return impl.checked_at(index);
    }
    std::lock_guard<std::mutex> lock(impl.mutex);
    impl.ensure_resolved(index);
    return impl.checked_at(index);
}

void Document::copy_to(std::size_t source_index, std::span<char16_t> destination,
                       std::size_t destination_index, std::ptrdiff_t count) const {
    if (count < 0) {
        throw std::invalid_argument("count must not be negative");
    }
    if (count == 0) return;

    const auto n = static_cast<std::size_t>(count);
    if (destination_index > destination.size() ||
        n > destination.size() - destination_index) {
        throw std::out_of_range("destination too small");
    }
    if (source_index > Impl::through_end - n) {
        throw std::out_of_range("source range out of range");
    }

    Impl& impl = state();
    char16_t* dest = destination.data() + destination_index;
    if (impl.complete.load(std::memory_order_acquire)) {
        impl.checked_copy(source_index, dest, n);
        return;
    }
    std::lock_guard<std::mutex> lock(impl.mutex);
    impl.ensure_resolved(source_index + n - 1);
    impl.checked_copy(source_index, dest, n);
}

std::u16string Document::substr(std::size_t start, std::size_t count) const {
    if (count == 0) return {};
    Impl& impl = state();
    if (start > Impl::through_end - count) {
        throw std::out_of_range("source range out of range");
    }
    if (impl.complete.load(std::memory_order_acquire)) {
        impl.check_range(start, count);
    } else {
        std::lock_guard<std::mutex> lock(impl.mutex);
        impl.ensure_resolved(start + count - 1);
        impl.check_range(start, count);
    }

    std::u16string out(count, u'\0');
    copy_to(start, out, 0, static_cast<std::ptrdiff_t>(count));
    return out;
}

Checksum Document::checksum() const {
    Impl& impl = state();
    std::lock_guard<std::mutex> lock(impl.mutex);
    impl.ensure_resolved(Impl::through_end);
    if (!impl.checksum) {
        impl.checksum = detail::compute_checksum(impl.store.segments(), impl.encoding);
    }
    return *impl.checksum;
}

const LineIndex& Document::lines() const {
    Impl& impl = state();
    std::lock_guard<std::mutex> lock(impl.mutex);
    impl.ensure_resolved(Impl::through_end);
    if (!impl.lines) {
        LineIndex index;
        index.rebuild(impl.store.segments());
        impl.lines = std::move(index);
    }
    return *impl.lines;
}

std::u16string Document::line(std::size_t line_number) const {
    auto span = lines().line_span(line_number);
    return substr(span.offset, span.length);
}

const std::optional<std::string>& Document::file_path() const {
    return state().properties.file_path;
}

const std::optional<std::string>& Document::relative_path() const {
    return state().properties.relative_path;
}

const DocumentProperties& Document::properties() const {
    return state().properties;
}

Encoding Document::encoding() const {
    return state().encoding;
}

std::size_t Document::chunk_size() const {
    return state().store.chunk_size();
}

} // namespace folio
