#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

namespace folio {

struct SourceLocation {
    std::size_t absolute_index = 0;
    std::size_t line_index = 0;
    std::size_t character_index = 0;
};

class LineIndex {
public:
    LineIndex() = default;

    // Scan the segments as one contiguous text. A \r\n pair split across two
    // segments still counts as a single terminator.
    void rebuild(const std::vector<std::u16string_view>& segments);

    // Never 0 after rebuild: empty text has one empty line, and a trailing
    // terminator opens a final empty line.
    std::size_t line_count() const;

    // {offset, length} of the line, excluding \n, \r\n or \r.
    struct LineSpan {
        std::size_t offset;
        std::size_t length;
    };

    LineSpan line_span(std::size_t line_number) const;
    std::size_t line_start(std::size_t line_number) const;
    std::size_t line_length(std::size_t line_number) const;

    // Convert (line, col) to absolute offset. col may equal the line length.
    std::size_t to_offset(std::size_t line, std::size_t col) const;

    // Line and column of an absolute offset. offset may equal the text length.
    SourceLocation location(std::size_t offset) const;

    std::size_t text_length() const { return total_length_; }

private:
    std::vector<LineSpan> spans_;
    std::size_t total_length_ = 0;
};

} // namespace folio
