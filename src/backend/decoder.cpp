#include "decoder.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace folio::detail {

namespace {

constexpr std::size_t BUF_SIZE = 64 * 1024;
constexpr char16_t byte_order_mark = 0xFEFF;

} // namespace

Decoder::Decoder(std::unique_ptr<Source> source, Encoding encoding)
    : source_(std::move(source))
    , conv_(encoding)
    , bytes_(BUF_SIZE)
{
    if (!source_)
        throw std::invalid_argument("Decoder: null source");
}

void Decoder::refill() {
    byte_end_ = source_->read(bytes_.data(), bytes_.size());
    byte_pos_ = 0;
    // A source may return nothing without having ended; only at_end() ends it.
    source_done_ = source_->at_end();
}

std::size_t Decoder::read(char16_t* out, std::size_t max) {
    std::size_t written = 0;

    while (written < max && !finished_) {
        if (byte_pos_ == byte_end_ && !source_done_) {
            refill();
            if (byte_end_ == 0 && !source_done_) continue;
        }

        char16_t* begin = out + written;
        char16_t* target = begin;
        const char* src = bytes_.data() + byte_pos_;
        UErrorCode status = U_ZERO_ERROR;

        // flush only once the source is drained, so a trailing incomplete
        // sequence becomes U+FFFD instead of waiting for more bytes.
        ucnv_toUnicode(conv_.get(), &target, out + max,
                       &src, bytes_.data() + byte_end_,
                       nullptr, source_done_, &status);
        byte_pos_ = static_cast<std::size_t>(src - bytes_.data());

        if (!bom_checked_ && target != begin) {
            bom_checked_ = true;
            if (*begin == byte_order_mark) {
                std::copy(begin + 1, target, begin);
                --target;
            }
        }
        written += static_cast<std::size_t>(target - begin);

        if (status == U_BUFFER_OVERFLOW_ERROR) {
            // Output is full; the converter keeps the overflow for next time.
            continue;
        }
        if (U_FAILURE(status)) {
            throw std::runtime_error(std::string("decode failed: ") +
                                     u_errorName(status));
        }
        if (source_done_ && byte_pos_ == byte_end_) {
            finished_ = true;
        }
    }

    return written;
}

} // namespace folio::detail
