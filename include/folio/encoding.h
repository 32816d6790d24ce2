#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace folio {

// Byte encoding of a document's source stream. The multi-byte encodings are
// endian-explicit and never write a byte-order mark when encoding.
enum class Encoding : uint8_t {
    utf8,
    ascii,
    latin1,
    utf16le,
    utf16be,
    utf32le,
    utf32be,
};

std::string_view to_string(Encoding encoding);

// Case-insensitive lookup of an encoding name or common alias.
// Bare "utf-16" and "utf-32" select the little-endian forms.
std::optional<Encoding> parse_encoding(std::string_view name);

} // namespace folio
