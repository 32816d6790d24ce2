#include "converter.h"
#include "encoding.h"

#include <stdexcept>
#include <string>

namespace folio::detail {

Converter::Converter(Encoding encoding)
    : encoding_(encoding)
{
    const char* name = icu_converter_name(encoding);
    if (!name)
        throw std::invalid_argument("Converter: unknown encoding");

    UErrorCode status = U_ZERO_ERROR;
    conv_ = ucnv_open(name, &status);
    if (U_FAILURE(status)) {
        conv_ = nullptr;
        throw std::invalid_argument(std::string("Converter: cannot open ") +
                                    name + " (" + u_errorName(status) + ")");
    }

    if (is_lossy(encoding)) {
        status = U_ZERO_ERROR;
        ucnv_setSubstChars(conv_, "?", 1, &status);
        if (U_FAILURE(status)) {
            close();
            throw std::runtime_error(std::string("Converter: cannot set substitution for ") +
                                     name + " (" + u_errorName(status) + ")");
        }
    }
}

Converter::~Converter() {
    close();
}

Converter::Converter(Converter&& other) noexcept
    : conv_(other.conv_)
    , encoding_(other.encoding_)
{
    other.conv_ = nullptr;
}

Converter& Converter::operator=(Converter&& other) noexcept {
    if (this != &other) {
        close();
        conv_ = other.conv_;
        encoding_ = other.encoding_;
        other.conv_ = nullptr;
    }
    return *this;
}

void Converter::close() {
    if (conv_) {
        ucnv_close(conv_);
        conv_ = nullptr;
    }
}

} // namespace folio::detail
