// ==============================================================================
// whitespace.cpp - Удаление пробельных символов
// ==============================================================================

#include "guidscan/whitespace.hpp"

namespace guidscan::scan {

bool is_whitespace(char32_t c) {
    if (c == 0x20 || (c >= 0x09 && c <= 0x0D)) {
        return true;
    }
    if (c < 0x85) {
        return false;
    }
    switch (c) {
    case 0x0085:
    case 0x00A0:
    case 0x1680:
    case 0x2028:
    case 0x2029:
    case 0x202F:
    case 0x205F:
    case 0x3000:
        return true;
    default:
        return c >= 0x2000 && c <= 0x200A;
    }
}

std::u32string strip_whitespace(std::u32string_view text) {
    std::u32string result;
    append_stripped(text, result);
    return result;
}

std::size_t append_stripped(std::u32string_view text, std::u32string& out) {
    std::size_t before = out.size();
    out.reserve(before + text.size());
    for (char32_t c : text) {
        if (!is_whitespace(c)) {
            out.push_back(c);
        }
    }
    return out.size() - before;
}

std::size_t append_stripped(std::u32string_view text, std::uint64_t base_offset,
                            std::u32string& out, std::vector<std::uint64_t>& offsets) {
    std::size_t before = out.size();
    out.reserve(before + text.size());
    offsets.reserve(offsets.size() + text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (!is_whitespace(text[i])) {
            out.push_back(text[i]);
            offsets.push_back(base_offset + i);
        }
    }
    return out.size() - before;
}

}  // namespace guidscan::scan
