#include "file_source.h"

#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace folio::detail {

FileSource::FileSource(const std::string& path)
    : path_(path)
{
    file_ = std::fopen(path.c_str(), "rb");
    if (!file_) {
        throw std::runtime_error("Failed to open file: " + path +
                                 " (" + std::strerror(errno) + ")");
    }

    // Size is informational only; pipes and character devices report 0.
    if (std::fseek(file_, 0, SEEK_END) == 0) {
        long end = std::ftell(file_);
        if (end > 0) size_ = static_cast<std::size_t>(end);
        if (std::fseek(file_, 0, SEEK_SET) != 0) {
            std::fclose(file_);
            file_ = nullptr;
            throw std::runtime_error("Failed to rewind file: " + path);
        }
    }
}

FileSource::~FileSource() {
    if (file_) {
        std::fclose(file_);
    }
}

std::size_t FileSource::read(char* buf, std::size_t max) {
    if (!file_ || eof_) return 0;
    std::size_t n = std::fread(buf, 1, max, file_);
    if (std::ferror(file_)) {
        throw std::runtime_error("Failed to read file: " + path_);
    }
    if (n == 0 || std::feof(file_)) {
        eof_ = true;
    }
    return n;
}

bool FileSource::at_end() const {
    return eof_;
}

SourceInfo FileSource::info() const {
    return {path_, size_, true};
}

} // namespace folio::detail
