#include <folio/document.h>
#include <folio/encoding.h>

#include <unicode/ustring.h>

#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <string_view>

namespace {

constexpr const char* kProgram = "folio-inspect";

struct Options {
    std::string path;
    folio::Encoding encoding = folio::Encoding::utf8;
    std::size_t chunk_size = folio::Document::default_chunk_size;
    bool print_line = false;
    std::size_t line = 0;
};

void print_usage() {
    std::fprintf(stderr,
                 "usage: %s [--encoding NAME] [--chunk-size N] [--line N] FILE\n",
                 kProgram);
}

std::size_t parse_count(std::string_view flag, const char* value) {
    char* end = nullptr;
    unsigned long long n = std::strtoull(value, &end, 10);
    if (!end || *end != '\0' || *value == '\0' || *value == '-') {
        throw std::invalid_argument(std::string(flag) + " expects a number, got '" +
                                    value + "'");
    }
    return static_cast<std::size_t>(n);
}

Options parse_args(int argc, char* argv[]) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        bool has_value = i + 1 < argc;
        if (arg == "--encoding" && has_value) {
            auto enc = folio::parse_encoding(argv[++i]);
            if (!enc) {
                throw std::invalid_argument(std::string("unknown encoding '") +
                                            argv[i] + "'");
            }
            opts.encoding = *enc;
        } else if (arg == "--chunk-size" && has_value) {
            opts.chunk_size = parse_count(arg, argv[++i]);
        } else if (arg == "--line" && has_value) {
            opts.line = parse_count(arg, argv[++i]);
            opts.print_line = true;
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::invalid_argument("unrecognised option '" + std::string(arg) + "'");
        } else if (opts.path.empty()) {
            opts.path = arg;
        } else {
            throw std::invalid_argument("more than one FILE given");
        }
    }
    if (opts.path.empty()) {
        throw std::invalid_argument("no FILE given");
    }
    return opts;
}

std::string to_utf8(const std::u16string& text) {
    UErrorCode status = U_ZERO_ERROR;
    int32_t len = 0;
    u_strToUTF8WithSub(nullptr, 0, &len, text.data(), static_cast<int32_t>(text.size()),
                       0xFFFD, nullptr, &status);
    if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) {
        throw std::runtime_error(std::string("cannot convert line: ") + u_errorName(status));
    }

    std::string out(static_cast<std::size_t>(len), '\0');
    status = U_ZERO_ERROR;
    u_strToUTF8WithSub(out.data(), len, nullptr, text.data(),
                       static_cast<int32_t>(text.size()), 0xFFFD, nullptr, &status);
    if (U_FAILURE(status)) {
        throw std::runtime_error(std::string("cannot convert line: ") + u_errorName(status));
    }
    return out;
}

} // namespace

int main(int argc, char* argv[]) {
    Options opts;
    try {
        opts = parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::fprintf(stderr, "%s: %s\n", kProgram, e.what());
        print_usage();
        return 2;
    }

    try {
        folio::DocumentProperties props;
        props.file_path = opts.path;
        folio::Document doc(folio::make_file_source(opts.path), opts.chunk_size,
                            opts.encoding, props);

        const auto& lines = doc.lines();
        std::printf("path: %s\n", doc.file_path()->c_str());
        std::printf("encoding: %s\n", std::string(folio::to_string(doc.encoding())).c_str());
        std::printf("length: %zu\n", doc.length());
        std::printf("lines: %zu\n", lines.line_count());
        std::printf("sha256: %s\n", folio::to_hex(doc.checksum()).c_str());

        if (opts.print_line) {
            std::printf("%s\n", to_utf8(doc.line(opts.line)).c_str());
        }
    } catch (const std::exception& e) {
        std::fprintf(stderr, "%s: cannot inspect '%s': %s\n",
                     kProgram, opts.path.c_str(), e.what());
        return 1;
    }

    return 0;
}
