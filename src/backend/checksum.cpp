#include "checksum.h"
#include "converter.h"

#include <openssl/evp.h>

#include <array>
#include <memory>
#include <stdexcept>
#include <string>

namespace folio {

std::string to_hex(const Checksum& checksum) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(checksum.size() * 2);
    for (std::uint8_t b : checksum) {
        out += digits[b >> 4];
        out += digits[b & 0x0F];
    }
    return out;
}

namespace detail {

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

void digest_update(EVP_MD_CTX* ctx, const char* data, std::size_t len) {
    if (len > 0 && EVP_DigestUpdate(ctx, data, len) != 1)
        throw std::runtime_error("checksum: EVP_DigestUpdate failed");
}

} // namespace

Checksum compute_checksum(const std::vector<std::u16string_view>& segments,
                          Encoding encoding) {
    DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
        throw std::runtime_error("checksum: cannot initialise SHA-256");

    Converter conv(encoding);
    std::array<char, 16 * 1024> buf;

    for (std::size_t i = 0; i < segments.size(); ++i) {
        const char16_t* src = segments[i].data();
        const char16_t* src_limit = src + segments[i].size();
        // A surrogate pair may straddle two chunks; only the last segment flushes.
        const bool flush = i + 1 == segments.size();

        for (;;) {
            char* target = buf.data();
            UErrorCode status = U_ZERO_ERROR;
            ucnv_fromUnicode(conv.get(), &target, buf.data() + buf.size(),
                             &src, src_limit, nullptr, flush, &status);
            digest_update(ctx.get(), buf.data(),
                          static_cast<std::size_t>(target - buf.data()));

            if (status == U_BUFFER_OVERFLOW_ERROR) continue;
            if (U_FAILURE(status))
                throw std::runtime_error(std::string("checksum: encode failed: ") +
                                         u_errorName(status));
            break;
        }
    }

    Checksum digest{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &len) != 1 || len != digest.size())
        throw std::runtime_error("checksum: EVP_DigestFinal_ex failed");
    return digest;
}

} // namespace detail

} // namespace folio
