#include "encoding.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <utility>

namespace folio {

namespace {

constexpr std::array<std::pair<std::string_view, Encoding>, 17> aliases = {{
    {"utf-8", Encoding::utf8},
    {"utf8", Encoding::utf8},
    {"ascii", Encoding::ascii},
    {"us-ascii", Encoding::ascii},
    {"latin1", Encoding::latin1},
    {"latin-1", Encoding::latin1},
    {"iso-8859-1", Encoding::latin1},
    {"utf-16", Encoding::utf16le},
    {"utf16", Encoding::utf16le},
    {"utf-16le", Encoding::utf16le},
    {"utf-16be", Encoding::utf16be},
    {"utf-32", Encoding::utf32le},
    {"utf32", Encoding::utf32le},
    {"utf-32le", Encoding::utf32le},
    {"utf-32be", Encoding::utf32be},
    {"utf16le", Encoding::utf16le},
    {"utf32le", Encoding::utf32le},
}};

} // namespace

std::string_view to_string(Encoding encoding) {
    switch (encoding) {
    case Encoding::utf8:    return "utf-8";
    case Encoding::ascii:   return "us-ascii";
    case Encoding::latin1:  return "iso-8859-1";
    case Encoding::utf16le: return "utf-16le";
    case Encoding::utf16be: return "utf-16be";
    case Encoding::utf32le: return "utf-32le";
    case Encoding::utf32be: return "utf-32be";
    }
    return "unknown";
}

std::optional<Encoding> parse_encoding(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::replace(lower.begin(), lower.end(), '_', '-');

    for (const auto& [alias, encoding] : aliases) {
        if (alias == lower) return encoding;
    }
    return std::nullopt;
}

const char* icu_converter_name(Encoding encoding) {
    switch (encoding) {
    case Encoding::utf8:    return "UTF-8";
    case Encoding::ascii:   return "US-ASCII";
    case Encoding::latin1:  return "ISO-8859-1";
    case Encoding::utf16le: return "UTF-16LE";
    case Encoding::utf16be: return "UTF-16BE";
    case Encoding::utf32le: return "UTF-32LE";
    case Encoding::utf32be: return "UTF-32BE";
    }
    return nullptr;
}

bool is_lossy(Encoding encoding) {
    return encoding == Encoding::ascii || encoding == Encoding::latin1;
}

} // namespace folio
