// ==============================================================================
// matcher.cpp - Поиск GUID-литералов в очищенном буфере
// ==============================================================================

#include "guidscan/matcher.hpp"

namespace guidscan::scan {

namespace {

bool is_hex(char32_t c) {
    return (c >= U'0' && c <= U'9') || (c >= U'a' && c <= U'f') || (c >= U'A' && c <= U'F');
}

bool is_separator(char32_t c) {
    return c == U',' || c == U'-';
}

/// Курсор по буферу при сопоставлении одного кандидата
class Cursor {
public:
    Cursor(std::u32string_view buffer, std::size_t pos) : buffer_(buffer), pos_(pos) {}

    std::size_t pos() const { return pos_; }

    bool at(char32_t c) const { return pos_ < buffer_.size() && buffer_[pos_] == c; }

    bool consume(char32_t c) {
        if (at(c)) {
            ++pos_;
            return true;
        }
        return false;
    }

    void skip_separator() {
        if (pos_ < buffer_.size() && is_separator(buffer_[pos_])) {
            ++pos_;
        }
    }

    /// hexN: ровно width цифр, либо 0x и 1..width цифр
    bool read_field(std::size_t width, std::string& out) {
        out.clear();
        std::size_t p = pos_;
        bool prefixed = false;
        if (p + 1 < buffer_.size() && buffer_[p] == U'0' &&
            (buffer_[p + 1] == U'x' || buffer_[p + 1] == U'X')) {
            prefixed = true;
            p += 2;
        }

        std::size_t digits = 0;
        while (digits < width && p + digits < buffer_.size() && is_hex(buffer_[p + digits])) {
            ++digits;
        }
        if (digits == 0 || (!prefixed && digits != width)) {
            return false;
        }

        for (std::size_t i = 0; i < digits; ++i) {
            out.push_back(static_cast<char>(buffer_[p + i]));
        }
        pos_ = p + digits;
        return true;
    }

private:
    std::u32string_view buffer_;
    std::size_t pos_;
};

}  // anonymous namespace

// ============================================================================
// Matcher
// ============================================================================

Matcher::Matcher(std::u32string_view buffer, std::size_t start) : buffer_(buffer), pos_(start) {}

bool Matcher::match_at(std::size_t start, Match& out) const {
    Cursor cur(buffer_, start);

    if (!cur.read_field(8, out.time_low)) {
        return false;
    }
    for (auto& field : out.time_fields) {
        cur.skip_separator();
        if (!cur.read_field(4, field)) {
            return false;
        }
    }

    cur.skip_separator();
    bool brace = cur.consume(U'{');
    if (!cur.read_field(2, out.clock_seq[0])) {
        return false;
    }
    cur.skip_separator();
    if (!cur.read_field(2, out.clock_seq[1])) {
        return false;
    }
    for (auto& octet : out.node) {
        cur.skip_separator();
        if (!cur.read_field(2, octet)) {
            return false;
        }
    }
    if (brace) {
        cur.consume(U'}');
    }

    out.offset = start;
    out.length = cur.pos() - start;
    out.text.clear();
    out.text.reserve(out.length);
    for (std::size_t i = start; i < cur.pos(); ++i) {
        out.text.push_back(static_cast<char>(buffer_[i]));
    }
    return true;
}

bool Matcher::next(Match& out) {
    while (pos_ < buffer_.size()) {
        if (is_hex(buffer_[pos_]) && match_at(pos_, out)) {
            pos_ = out.end();
            return true;
        }
        ++pos_;
    }
    return false;
}

std::vector<Match> Matcher::find_all() {
    std::vector<Match> matches;
    Match m;
    while (next(m)) {
        matches.push_back(m);
    }
    return matches;
}

// ============================================================================
// Canonicalization
// ============================================================================

std::string reconstruct_canonical(const Match& match) {
    std::string s;
    s.reserve(GUID_STRING_LENGTH);
    s += match.time_low;
    s += '-';
    s += match.time_fields[0];
    s += '-';
    s += match.time_fields[1];
    s += '-';
    s += match.clock_seq[0];
    s += match.clock_seq[1];
    s += '-';
    for (const auto& octet : match.node) {
        s += octet;
    }
    return s;
}

CanonicalizeResult canonicalize(const Match& match) {
    CanonicalizeResult result;

    // 1. Каноническая форма как есть
    result.candidate = match.text;
    result.status = parse_guid(match.text, result.guid);
    if (result.status == GuidParseResult::Ok) {
        result.ok = true;
        return result;
    }

    // 2. Сборка из захваченных полей
    result.candidate = reconstruct_canonical(match);
    result.status = parse_guid(result.candidate, result.guid);
    result.ok = result.status == GuidParseResult::Ok;
    return result;
}

}  // namespace guidscan::scan
