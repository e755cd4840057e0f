// ==============================================================================
// encoding.cpp - Определение кодировки и потоковые декодеры
// ==============================================================================

#include "guidscan/encoding.hpp"

#include <cctype>

namespace guidscan::io {

namespace {

std::string to_lower(std::string_view s) {
    std::string result;
    result.reserve(s.size());
    for (char c : s) {
        result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return result;
}

bool is_surrogate(char32_t cp) {
    return cp >= 0xD800 && cp <= 0xDFFF;
}

bool is_high_surrogate(char32_t cp) {
    return cp >= 0xD800 && cp <= 0xDBFF;
}

bool is_low_surrogate(char32_t cp) {
    return cp >= 0xDC00 && cp <= 0xDFFF;
}

char32_t combine_surrogates(char32_t high, char32_t low) {
    return 0x10000 + ((high - 0xD800) << 10) + (low - 0xDC00);
}

// ============================================================================
// AsciiDecoder
// ============================================================================

class AsciiDecoder : public Decoder {
public:
    void decode(const std::uint8_t* data, std::size_t len, std::u32string& out) override {
        out.reserve(out.size() + len);
        for (std::size_t i = 0; i < len; ++i) {
            out.push_back(data[i] < 0x80 ? static_cast<char32_t>(data[i]) : REPLACEMENT_CHAR);
        }
    }

    void finish(std::u32string& /*out*/) override {}

    Encoding encoding() const override { return Encoding::Ascii; }
};

// ============================================================================
// Utf8Decoder
// ============================================================================
//
// Допустимые диапазоны второго байта исключают overlong-формы и суррогаты:
//   E0: A0..BF, ED: 80..9F, F0: 90..BF, F4: 80..8F
//

class Utf8Decoder : public Decoder {
public:
    void decode(const std::uint8_t* data, std::size_t len, std::u32string& out) override {
        out.reserve(out.size() + len);
        std::size_t i = 0;
        while (i < len) {
            std::uint8_t b = data[i];

            if (need_ == 0) {
                ++i;
                if (b < 0x80) {
                    out.push_back(b);
                } else if (b >= 0xC2 && b <= 0xDF) {
                    start(b & 0x1F, 1, 0x80, 0xBF);
                } else if (b >= 0xE0 && b <= 0xEF) {
                    start(b & 0x0F, 2, b == 0xE0 ? 0xA0 : 0x80, b == 0xED ? 0x9F : 0xBF);
                } else if (b >= 0xF0 && b <= 0xF4) {
                    start(b & 0x07, 3, b == 0xF0 ? 0x90 : 0x80, b == 0xF4 ? 0x8F : 0xBF);
                } else {
                    out.push_back(REPLACEMENT_CHAR);
                }
                continue;
            }

            if (b < lower_ || b > upper_) {
                // Оборванная последовательность; байт обрабатывается заново
                out.push_back(REPLACEMENT_CHAR);
                need_ = 0;
                continue;
            }

            ++i;
            lower_ = 0x80;
            upper_ = 0xBF;
            cp_ = (cp_ << 6) | (b & 0x3F);
            if (--need_ == 0) {
                out.push_back(cp_);
            }
        }
    }

    void finish(std::u32string& out) override {
        if (need_ > 0) {
            out.push_back(REPLACEMENT_CHAR);
            need_ = 0;
        }
    }

    Encoding encoding() const override { return Encoding::Utf8; }

private:
    void start(char32_t bits, int need, std::uint8_t lower, std::uint8_t upper) {
        cp_ = bits;
        need_ = need;
        lower_ = lower;
        upper_ = upper;
    }

    char32_t cp_ = 0;
    int need_ = 0;
    std::uint8_t lower_ = 0x80;
    std::uint8_t upper_ = 0xBF;
};

// ============================================================================
// Utf16Decoder
// ============================================================================

class Utf16Decoder : public Decoder {
public:
    explicit Utf16Decoder(bool big_endian) : big_endian_(big_endian) {}

    void decode(const std::uint8_t* data, std::size_t len, std::u32string& out) override {
        out.reserve(out.size() + len / 2);
        for (std::size_t i = 0; i < len; ++i) {
            if (!has_byte_) {
                byte_ = data[i];
                has_byte_ = true;
                continue;
            }
            has_byte_ = false;
            char32_t unit = big_endian_ ? (static_cast<char32_t>(byte_) << 8) | data[i]
                                        : (static_cast<char32_t>(data[i]) << 8) | byte_;
            push_unit(unit, out);
        }
    }

    void finish(std::u32string& out) override {
        if (high_ != 0 || has_byte_) {
            out.push_back(REPLACEMENT_CHAR);
        }
        high_ = 0;
        has_byte_ = false;
    }

    Encoding encoding() const override {
        return big_endian_ ? Encoding::BigEndianUnicode : Encoding::Unicode;
    }

private:
    void push_unit(char32_t unit, std::u32string& out) {
        if (high_ != 0) {
            if (is_low_surrogate(unit)) {
                out.push_back(combine_surrogates(high_, unit));
                high_ = 0;
                return;
            }
            out.push_back(REPLACEMENT_CHAR);
            high_ = 0;
        }
        if (is_high_surrogate(unit)) {
            high_ = unit;
        } else if (is_low_surrogate(unit)) {
            out.push_back(REPLACEMENT_CHAR);
        } else {
            out.push_back(unit);
        }
    }

    bool big_endian_;
    bool has_byte_ = false;
    std::uint8_t byte_ = 0;
    char32_t high_ = 0;
};

// ============================================================================
// Utf32Decoder
// ============================================================================

class Utf32Decoder : public Decoder {
public:
    explicit Utf32Decoder(bool big_endian) : big_endian_(big_endian) {}

    void decode(const std::uint8_t* data, std::size_t len, std::u32string& out) override {
        out.reserve(out.size() + len / 4);
        for (std::size_t i = 0; i < len; ++i) {
            bytes_[count_++] = data[i];
            if (count_ < 4) {
                continue;
            }
            count_ = 0;

            char32_t cp = 0;
            if (big_endian_) {
                cp = (static_cast<char32_t>(bytes_[0]) << 24) |
                     (static_cast<char32_t>(bytes_[1]) << 16) |
                     (static_cast<char32_t>(bytes_[2]) << 8) | bytes_[3];
            } else {
                cp = (static_cast<char32_t>(bytes_[3]) << 24) |
                     (static_cast<char32_t>(bytes_[2]) << 16) |
                     (static_cast<char32_t>(bytes_[1]) << 8) | bytes_[0];
            }
            out.push_back(cp > 0x10FFFF || is_surrogate(cp) ? REPLACEMENT_CHAR : cp);
        }
    }

    void finish(std::u32string& out) override {
        if (count_ > 0) {
            out.push_back(REPLACEMENT_CHAR);
            count_ = 0;
        }
    }

    Encoding encoding() const override {
        return big_endian_ ? Encoding::Utf32BigEndian : Encoding::Utf32;
    }

private:
    bool big_endian_;
    std::uint8_t bytes_[4] = {0, 0, 0, 0};
    std::size_t count_ = 0;
};

// ============================================================================
// Utf7Decoder (RFC 2152)
// ============================================================================
//
// '+' открывает base64-секцию UTF-16 кодовых единиц, любой не-base64 символ
// её закрывает; закрывающий '-' поглощается. "+-" декодируется в '+'.
// Неполные биты в конце секции отбрасываются.
//

class Utf7Decoder : public Decoder {
public:
    void decode(const std::uint8_t* data, std::size_t len, std::u32string& out) override {
        out.reserve(out.size() + len);
        for (std::size_t i = 0; i < len; ++i) {
            std::uint8_t b = data[i];

            if (!in_base64_) {
                if (b == '+') {
                    in_base64_ = true;
                    first_ = true;
                    bits_ = 0;
                    bit_count_ = 0;
                } else {
                    out.push_back(b < 0x80 ? static_cast<char32_t>(b) : REPLACEMENT_CHAR);
                }
                continue;
            }

            int v = base64_value(b);
            if (v >= 0) {
                first_ = false;
                bits_ = (bits_ << 6) | static_cast<std::uint32_t>(v);
                bit_count_ += 6;
                if (bit_count_ >= 16) {
                    bit_count_ -= 16;
                    push_unit(static_cast<char32_t>((bits_ >> bit_count_) & 0xFFFF), out);
                    bits_ &= (1u << bit_count_) - 1;
                }
                continue;
            }

            // Конец base64-секции
            bool literal_plus = first_ && b == '-';
            close_section(out);
            if (literal_plus) {
                out.push_back(U'+');
            } else if (b != '-') {
                out.push_back(b < 0x80 ? static_cast<char32_t>(b) : REPLACEMENT_CHAR);
            }
        }
    }

    void finish(std::u32string& out) override {
        if (in_base64_) {
            close_section(out);
        }
    }

    Encoding encoding() const override { return Encoding::Utf7; }

private:
    static int base64_value(std::uint8_t b) {
        if (b >= 'A' && b <= 'Z')
            return b - 'A';
        if (b >= 'a' && b <= 'z')
            return b - 'a' + 26;
        if (b >= '0' && b <= '9')
            return b - '0' + 52;
        if (b == '+')
            return 62;
        if (b == '/')
            return 63;
        return -1;
    }

    void push_unit(char32_t unit, std::u32string& out) {
        if (high_ != 0) {
            if (is_low_surrogate(unit)) {
                out.push_back(combine_surrogates(high_, unit));
                high_ = 0;
                return;
            }
            out.push_back(REPLACEMENT_CHAR);
            high_ = 0;
        }
        if (is_high_surrogate(unit)) {
            high_ = unit;
        } else if (is_low_surrogate(unit)) {
            out.push_back(REPLACEMENT_CHAR);
        } else {
            out.push_back(unit);
        }
    }

    void close_section(std::u32string& out) {
        if (high_ != 0) {
            out.push_back(REPLACEMENT_CHAR);
            high_ = 0;
        }
        in_base64_ = false;
        first_ = false;
        bits_ = 0;
        bit_count_ = 0;
    }

    bool in_base64_ = false;
    bool first_ = false;
    std::uint32_t bits_ = 0;
    int bit_count_ = 0;
    char32_t high_ = 0;
};

}  // anonymous namespace

// ============================================================================
// Encoding names
// ============================================================================

const char* encoding_to_string(Encoding encoding) {
    switch (encoding) {
    case Encoding::AutoDetect:
        return "AutoDetect";
    case Encoding::Ascii:
        return "ASCII";
    case Encoding::Unicode:
        return "Unicode";
    case Encoding::BigEndianUnicode:
        return "BigEndianUnicode";
    case Encoding::Utf32:
        return "UTF32";
    case Encoding::Utf32BigEndian:
        return "UTF32BE";
    case Encoding::Utf7:
        return "UTF7";
    case Encoding::Utf8:
        return "UTF8";
    }
    return "unknown";
}

std::optional<Encoding> encoding_from_string(std::string_view name) {
    std::string lower = to_lower(name);

    if (lower == "autodetect" || lower == "auto") {
        return Encoding::AutoDetect;
    }
    if (lower == "ascii") {
        return Encoding::Ascii;
    }
    if (lower == "unicode" || lower == "utf16" || lower == "utf-16" || lower == "utf-16le") {
        return Encoding::Unicode;
    }
    if (lower == "bigendianunicode" || lower == "utf-16be") {
        return Encoding::BigEndianUnicode;
    }
    if (lower == "utf32" || lower == "utf-32" || lower == "utf-32le") {
        return Encoding::Utf32;
    }
    if (lower == "utf32be" || lower == "utf-32be") {
        return Encoding::Utf32BigEndian;
    }
    if (lower == "utf7" || lower == "utf-7") {
        return Encoding::Utf7;
    }
    if (lower == "utf8" || lower == "utf-8") {
        return Encoding::Utf8;
    }
    return std::nullopt;
}

// ============================================================================
// BOM detection
// ============================================================================

std::optional<Encoding> detect_bom(const std::uint8_t* data, std::size_t len) {
    if (len >= 4 && data[0] == 0xFF && data[1] == 0xFE && data[2] == 0x00 && data[3] == 0x00) {
        return Encoding::Utf32;
    }
    if (len >= 4 && data[0] == 0x00 && data[1] == 0x00 && data[2] == 0xFE && data[3] == 0xFF) {
        return Encoding::Utf32BigEndian;
    }
    if (len >= 3 && data[0] == 0xEF && data[1] == 0xBB && data[2] == 0xBF) {
        return Encoding::Utf8;
    }
    if (len >= 2 && data[0] == 0xFF && data[1] == 0xFE) {
        return Encoding::Unicode;
    }
    if (len >= 2 && data[0] == 0xFE && data[1] == 0xFF) {
        return Encoding::BigEndianUnicode;
    }
    // UTF-7: "+/v" + один из '8', '9', '+', '/'
    if (len >= 4 && data[0] == 0x2B && data[1] == 0x2F && data[2] == 0x76 &&
        (data[3] == 0x38 || data[3] == 0x39 || data[3] == 0x2B || data[3] == 0x2F)) {
        return Encoding::Utf7;
    }
    return std::nullopt;
}

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<Decoder> create_decoder(Encoding encoding) {
    switch (encoding) {
    case Encoding::Ascii:
        return std::make_unique<AsciiDecoder>();
    case Encoding::Unicode:
        return std::make_unique<Utf16Decoder>(false);
    case Encoding::BigEndianUnicode:
        return std::make_unique<Utf16Decoder>(true);
    case Encoding::Utf32:
        return std::make_unique<Utf32Decoder>(false);
    case Encoding::Utf32BigEndian:
        return std::make_unique<Utf32Decoder>(true);
    case Encoding::Utf7:
        return std::make_unique<Utf7Decoder>();
    case Encoding::AutoDetect:
    case Encoding::Utf8:
        return std::make_unique<Utf8Decoder>();
    }
    return std::make_unique<Utf8Decoder>();
}

std::u32string decode_all(Encoding encoding, std::string_view bytes) {
    auto decoder = create_decoder(encoding);
    std::u32string out;
    decoder->decode(reinterpret_cast<const std::uint8_t*>(bytes.data()), bytes.size(), out);
    decoder->finish(out);
    return out;
}

}  // namespace guidscan::io
