#pragma once

#include <folio/encoding.h>

namespace folio {

// ICU converter name for the encoding. The names are endian-explicit so the
// converter neither expects nor writes a byte-order mark.
const char* icu_converter_name(Encoding encoding);

// Single-byte encodings that cannot represent every code point.
bool is_lossy(Encoding encoding);

} // namespace folio
