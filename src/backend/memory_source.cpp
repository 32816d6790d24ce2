#include "memory_source.h"
#include "file_source.h"

#include <algorithm>

namespace folio {

namespace detail {

MemorySource::MemorySource(std::string bytes, std::string name)
    : bytes_(std::move(bytes))
    , name_(std::move(name))
{
}

std::size_t MemorySource::read(char* buf, std::size_t max) {
    std::size_t n = std::min(max, bytes_.size() - pos_);
    std::copy(bytes_.data() + pos_, bytes_.data() + pos_ + n, buf);
    pos_ += n;
    return n;
}

bool MemorySource::at_end() const {
    return pos_ >= bytes_.size();
}

SourceInfo MemorySource::info() const {
    return {name_, bytes_.size(), false};
}

} // namespace detail

std::unique_ptr<Source> make_file_source(const std::filesystem::path& path) {
    return std::make_unique<detail::FileSource>(path.string());
}

std::unique_ptr<Source> make_memory_source(std::string bytes, std::string name) {
    return std::make_unique<detail::MemorySource>(std::move(bytes), std::move(name));
}

} // namespace folio
