#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace folio {

// SHA-256 digest of a document's encoded bytes.
using Checksum = std::array<std::uint8_t, 32>;

// Lowercase hexadecimal, 64 characters.
std::string to_hex(const Checksum& checksum);

} // namespace folio
