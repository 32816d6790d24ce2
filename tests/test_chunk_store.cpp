#include <doctest/doctest.h>

#include "../src/backend/chunk_store.h"
#include "../src/backend/decoder.h"

#include <folio/source.h>

#include <stdexcept>
#include <string>
#include <vector>

using namespace folio;
using namespace folio::detail;
using namespace std::string_literals;

static std::u16string concat(const std::vector<std::u16string_view>& segments) {
    std::u16string out;
    for (auto s : segments) out += s;
    return out;
}

TEST_CASE("ChunkStore: nothing is read before the first request") {
    ChunkStore store(make_memory_source("abcdefghij"), Encoding::utf8, 4);

    CHECK(store.resolved_length() == 0);
    CHECK(store.chunk_count() == 0);
    CHECK_FALSE(store.exhausted());
}

TEST_CASE("ChunkStore: resolves only as far as requested") {
    ChunkStore store(make_memory_source("abcdefghij"), Encoding::utf8, 4);

    store.resolve_through(0);
    CHECK(store.chunk_count() == 1);
    CHECK(store.resolved_length() == 4);

    store.resolve_through(3);
    CHECK(store.chunk_count() == 1);

    store.resolve_through(4);
    CHECK(store.chunk_count() == 2);
    CHECK(store.resolved_length() == 8);
    CHECK_FALSE(store.exhausted());
}

TEST_CASE("ChunkStore: last chunk may be short") {
    ChunkStore store(make_memory_source("abcdefghij"), Encoding::utf8, 4);

    store.resolve_through(1000);
    CHECK(store.exhausted());
    CHECK(store.chunk_count() == 3);
    CHECK(store.resolved_length() == 10);

    auto segments = store.segments();
    REQUIRE(segments.size() == 3);
    CHECK(segments[0].size() == 4);
    CHECK(segments[2].size() == 2);
    CHECK(concat(segments) == u"abcdefghij"s);
}

TEST_CASE("ChunkStore: exact multiple of chunk size adds no empty chunk") {
    ChunkStore store(make_memory_source("abcdefgh"), Encoding::utf8, 4);

    store.resolve_through(1000);
    CHECK(store.exhausted());
    CHECK(store.chunk_count() == 2);
    CHECK(store.resolved_length() == 8);
}

TEST_CASE("ChunkStore: at and copy across chunk boundaries") {
    ChunkStore store(make_memory_source("abcdefghijklmnopqrstuvwxyz"), Encoding::utf8, 10);
    store.resolve_through(25);

    CHECK(static_cast<int>(store.at(9)) == 'j');
    CHECK(static_cast<int>(store.at(10)) == 'k');

    std::u16string out(12, u'\0');
    store.copy(8, out.data(), 12);
    CHECK(out == u"ijklmnopqrst"s);
}

TEST_CASE("ChunkStore: empty source") {
    ChunkStore store(make_memory_source(""), Encoding::utf8, 4);

    store.resolve_through(0);
    CHECK(store.exhausted());
    CHECK(store.resolved_length() == 0);
    CHECK(store.segments().empty());
}

TEST_CASE("ChunkStore: zero chunk size is rejected") {
    CHECK_THROWS_AS(ChunkStore(make_memory_source("abc"), Encoding::utf8, 0),
                    std::invalid_argument);
}

TEST_CASE("Decoder: short read only at end of input") {
    Decoder decoder(make_memory_source("hello world"), Encoding::utf8);
    std::u16string buf(4, u'\0');

    CHECK(decoder.read(buf.data(), 4) == 4);
    CHECK(buf == u"hell"s);
    CHECK(decoder.read(buf.data(), 4) == 4);
    CHECK(buf == u"o wo"s);
    CHECK(decoder.read(buf.data(), 4) == 3);
    CHECK(decoder.at_end());
    CHECK(decoder.read(buf.data(), 4) == 0);
}

TEST_CASE("Decoder: utf-16 byte order mark is dropped") {
    Decoder decoder(make_memory_source(std::string("\xFE\xFF\x00h\x00i", 6)),
                    Encoding::utf16be);
    std::u16string buf(8, u'\0');

    std::size_t n = decoder.read(buf.data(), buf.size());
    CHECK(n == 2);
    CHECK(buf.substr(0, n) == u"hi"s);
}

TEST_CASE("Decoder: truncated sequence at end becomes replacement character") {
    Decoder decoder(make_memory_source("ab\xE2\x82"), Encoding::utf8);
    std::u16string buf(8, u'\0');

    std::size_t n = decoder.read(buf.data(), buf.size());
    REQUIRE(n == 3);
    CHECK(static_cast<int>(buf[2]) == 0xFFFD);
    CHECK(decoder.at_end());
}

TEST_CASE("Decoder: null source is rejected") {
    CHECK_THROWS_AS(Decoder(nullptr, Encoding::utf8), std::invalid_argument);
}
