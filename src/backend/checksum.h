#pragma once

#include <folio/checksum.h>
#include <folio/encoding.h>

#include <string_view>
#include <vector>

namespace folio::detail {

// SHA-256 over the segments re-encoded with encoding, as one byte stream.
Checksum compute_checksum(const std::vector<std::u16string_view>& segments,
                          Encoding encoding);

} // namespace folio::detail
