#include <folio/line_index.h>

#include <algorithm>
#include <stdexcept>

namespace folio {

void LineIndex::rebuild(const std::vector<std::u16string_view>& segments) {
    spans_.clear();

    // Three line ending styles are recognised:
    //   \n     (Unix)
    //   \r\n   (Windows)
    //   \r     (classic Mac) when not followed by \n
    std::size_t line_start = 0;
    std::size_t global_offset = 0;
    bool prev_cr = false;
    for (std::u16string_view segment : segments) {
        for (std::size_t i = 0; i < segment.size(); ++i) {
            char16_t c = segment[i];
            std::size_t pos = global_offset + i;
            if (c == u'\n') {
                if (!prev_cr) {
                    spans_.push_back({line_start, pos - line_start});
                }
                // After \r the line was already closed; only the start moves.
                line_start = pos + 1;
            } else if (c == u'\r') {
                spans_.push_back({line_start, pos - line_start});
                line_start = pos + 1;
            }
            prev_cr = c == u'\r';
        }
        global_offset += segment.size();
    }
    // Last line has no terminator
    spans_.push_back({line_start, global_offset - line_start});
    total_length_ = global_offset;
}

std::size_t LineIndex::line_count() const {
    return spans_.size();
}

LineIndex::LineSpan LineIndex::line_span(std::size_t line_number) const {
    if (line_number >= spans_.size()) {
        throw std::out_of_range("line number out of range");
    }
    return spans_[line_number];
}

std::size_t LineIndex::line_start(std::size_t line_number) const {
    return line_span(line_number).offset;
}

std::size_t LineIndex::line_length(std::size_t line_number) const {
    return line_span(line_number).length;
}

std::size_t LineIndex::to_offset(std::size_t line, std::size_t col) const {
    auto span = line_span(line);
    if (col > span.length) {
        throw std::out_of_range("column out of range");
    }
    return span.offset + col;
}

SourceLocation LineIndex::location(std::size_t offset) const {
    if (spans_.empty() || offset > total_length_) {
        throw std::out_of_range("offset out of range");
    }

    // Last line starting at or before offset. An offset on a terminator
    // belongs to the line the terminator ends.
    auto it = std::upper_bound(spans_.begin(), spans_.end(), offset,
                               [](std::size_t value, const LineSpan& span) {
                                   return value < span.offset;
                               });
    std::size_t line = static_cast<std::size_t>(it - spans_.begin()) - 1;
    return {offset, line, offset - spans_[line].offset};
}

} // namespace folio
