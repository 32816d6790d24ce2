#include <doctest/doctest.h>

#include <folio/line_index.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace std::string_literals;

using namespace folio;

static LineIndex make_index(const std::u16string& text) {
    LineIndex idx;
    idx.rebuild({std::u16string_view(text)});
    return idx;
}

static std::u16string span_text(const std::u16string& text, LineIndex::LineSpan span) {
    return text.substr(span.offset, span.length);
}

TEST_CASE("LineIndex: single line no newline") {
    auto idx = make_index(u"Hello");

    CHECK(idx.line_count() == 1);
    auto span = idx.line_span(0);
    CHECK(span.offset == 0);
    CHECK(span.length == 5);
}

TEST_CASE("LineIndex: single line with newline") {
    auto idx = make_index(u"Hello\n");

    CHECK(idx.line_count() == 2);
    auto span0 = idx.line_span(0);
    CHECK(span0.offset == 0);
    CHECK(span0.length == 5);

    // Second line is empty
    auto span1 = idx.line_span(1);
    CHECK(span1.offset == 6);
    CHECK(span1.length == 0);
}

TEST_CASE("LineIndex: multiple lines") {
    std::u16string text = u"abc\ndef\nghi";
    auto idx = make_index(text);

    CHECK(idx.line_count() == 3);
    CHECK(span_text(text, idx.line_span(0)) == u"abc"s);
    CHECK(span_text(text, idx.line_span(1)) == u"def"s);
    CHECK(span_text(text, idx.line_span(2)) == u"ghi"s);
}

TEST_CASE("LineIndex: empty text") {
    auto idx = make_index(u"");

    CHECK(idx.line_count() == 1);
    CHECK(idx.line_length(0) == 0);
    CHECK(idx.text_length() == 0);
}

TEST_CASE("LineIndex: no segments") {
    LineIndex idx;
    idx.rebuild({});

    CHECK(idx.line_count() == 1);
    CHECK(idx.line_start(0) == 0);
}

TEST_CASE("LineIndex: windows line endings") {
    std::u16string text = u"abc\r\ndef\r\n";
    auto idx = make_index(text);

    CHECK(idx.line_count() == 3);
    CHECK(span_text(text, idx.line_span(0)) == u"abc"s);
    CHECK(span_text(text, idx.line_span(1)) == u"def"s);
    CHECK(idx.line_start(1) == 5);
    CHECK(idx.line_length(2) == 0);
}

TEST_CASE("LineIndex: classic mac line endings") {
    std::u16string text = u"abc\rdef\rghi";
    auto idx = make_index(text);

    CHECK(idx.line_count() == 3);
    CHECK(span_text(text, idx.line_span(0)) == u"abc"s);
    CHECK(span_text(text, idx.line_span(1)) == u"def"s);
    CHECK(span_text(text, idx.line_span(2)) == u"ghi"s);
}

TEST_CASE("LineIndex: mixed endings and blank lines") {
    std::u16string text = u"a\r\rb\n\r\nc";
    auto idx = make_index(text);

    // "a", "", "b", "", "c"
    REQUIRE(idx.line_count() == 5);
    CHECK(span_text(text, idx.line_span(0)) == u"a"s);
    CHECK(idx.line_length(1) == 0);
    CHECK(span_text(text, idx.line_span(2)) == u"b"s);
    CHECK(idx.line_length(3) == 0);
    CHECK(span_text(text, idx.line_span(4)) == u"c"s);
}

TEST_CASE("LineIndex: CRLF split across segments") {
    std::u16string first = u"ab\r";
    std::u16string second = u"\ncd";
    LineIndex idx;
    idx.rebuild({first, second});

    CHECK(idx.line_count() == 2);
    CHECK(idx.line_span(0).length == 2);
    CHECK(idx.line_start(1) == 4);
    CHECK(idx.line_length(1) == 2);
    CHECK(idx.text_length() == 6);
}

TEST_CASE("LineIndex: to_offset") {
    auto idx = make_index(u"abc\ndef\nghi");

    CHECK(idx.to_offset(0, 0) == 0);
    CHECK(idx.to_offset(0, 2) == 2);
    CHECK(idx.to_offset(1, 0) == 4);
    CHECK(idx.to_offset(1, 1) == 5);
    CHECK(idx.to_offset(2, 0) == 8);
}

TEST_CASE("LineIndex: col validation") {
    auto idx = make_index(u"abc\ndef");

    CHECK(idx.to_offset(0, 3) == 3);  // col at end of line is valid
    CHECK_THROWS_AS(idx.to_offset(0, 4), std::out_of_range);
    CHECK_THROWS_AS(idx.to_offset(1, 4), std::out_of_range);
}

TEST_CASE("LineIndex: location") {
    auto idx = make_index(u"abc\r\ndef\nghi");

    auto start = idx.location(0);
    CHECK(start.line_index == 0);
    CHECK(start.character_index == 0);

    auto on_cr = idx.location(3);
    CHECK(on_cr.line_index == 0);
    CHECK(on_cr.character_index == 3);

    auto second = idx.location(6);
    CHECK(second.absolute_index == 6);
    CHECK(second.line_index == 1);
    CHECK(second.character_index == 1);

    auto end = idx.location(12);
    CHECK(end.line_index == 2);
    CHECK(end.character_index == 3);

    CHECK_THROWS_AS(idx.location(13), std::out_of_range);
}

TEST_CASE("LineIndex: out of range throws") {
    auto idx = make_index(u"abc");

    CHECK_THROWS_AS(idx.line_span(1), std::out_of_range);
    CHECK_THROWS_AS(idx.line_start(1), std::out_of_range);
    CHECK_THROWS_AS(idx.to_offset(1, 0), std::out_of_range);
}

TEST_CASE("LineIndex: rebuild replaces previous lines") {
    LineIndex idx;
    std::u16string first = u"a\nb\nc";
    std::u16string second = u"xyz";
    idx.rebuild({first});
    REQUIRE(idx.line_count() == 3);

    idx.rebuild({second});
    CHECK(idx.line_count() == 1);
    CHECK(idx.line_length(0) == 3);
}
