#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

namespace folio {

struct SourceInfo {
    std::string name;
    std::size_t size_bytes = 0;
    bool seekable = false;
};

// Forward-only byte stream. A document reads its source exactly once.
class Source {
public:
    virtual ~Source() = default;

    // Read up to max bytes into buf. Returns number of bytes actually read.
    // Throws on I/O failure.
    virtual std::size_t read(char* buf, std::size_t max) = 0;

    // Returns true when there is no more data to read.
    virtual bool at_end() const = 0;

    // Metadata about this source.
    virtual SourceInfo info() const = 0;
};

// Opens path for reading. Throws std::runtime_error if it cannot be opened.
std::unique_ptr<Source> make_file_source(const std::filesystem::path& path);

// Serves the given bytes, then reports end of stream.
std::unique_ptr<Source> make_memory_source(std::string bytes,
                                           std::string name = "memory");

} // namespace folio
