#pragma once

#include <folio/encoding.h>
#include <folio/source.h>

#include "converter.h"

#include <cstddef>
#include <memory>
#include <vector>

namespace folio::detail {

// Pulls bytes from a Source and yields UTF-16 code units. Multi-byte
// sequences split across source reads are carried in the converter. A single
// leading U+FEFF is dropped.
class Decoder {
public:
    Decoder(std::unique_ptr<Source> source, Encoding encoding);

    Decoder(const Decoder&) = delete;
    Decoder& operator=(const Decoder&) = delete;

    // Fill up to max code units. Returns fewer than max only at end of input.
    std::size_t read(char16_t* out, std::size_t max);

    bool at_end() const { return finished_; }

private:
    void refill();

    std::unique_ptr<Source> source_;
    Converter conv_;
    std::vector<char> bytes_;
    std::size_t byte_pos_ = 0;
    std::size_t byte_end_ = 0;
    bool source_done_ = false;
    bool finished_ = false;
    bool bom_checked_ = false;
};

} // namespace folio::detail
