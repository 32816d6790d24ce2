#pragma once

#include <folio/encoding.h>

#include <unicode/ucnv.h>

namespace folio::detail {

// Owns an ICU converter for one encoding. A converter carries state between
// calls (partial byte sequences, pending surrogates), so each decode or encode
// pass needs its own.
class Converter {
public:
    explicit Converter(Encoding encoding);
    ~Converter();

    Converter(Converter&& other) noexcept;
    Converter& operator=(Converter&& other) noexcept;

    Converter(const Converter&) = delete;
    Converter& operator=(const Converter&) = delete;

    UConverter* get() const { return conv_; }
    Encoding encoding() const { return encoding_; }

private:
    void close();

    UConverter* conv_ = nullptr;
    Encoding encoding_;
};

} // namespace folio::detail
