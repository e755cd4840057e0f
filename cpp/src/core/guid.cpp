// ==============================================================================
// guid.cpp - Guid: разбор, форматирование, сравнение
// ==============================================================================

#include "guidscan/guid.hpp"

#include <cstdio>

namespace guidscan {

namespace {

/// Позиции дефисов в канонической строке
constexpr std::size_t HYPHEN_POSITIONS[] = {8, 13, 18, 23};

/// Значение hex-цифры или -1
int hex_value(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

/// Прочитать count hex-цифр начиная с pos
bool read_hex(std::string_view str, std::size_t pos, std::size_t count, std::uint64_t& out) {
    out = 0;
    for (std::size_t i = 0; i < count; ++i) {
        int v = hex_value(str[pos + i]);
        if (v < 0)
            return false;
        out = (out << 4) | static_cast<std::uint64_t>(v);
    }
    return true;
}

}  // anonymous namespace

const char* guid_parse_result_to_string(GuidParseResult result) {
    switch (result) {
    case GuidParseResult::Ok:
        return "ok";
    case GuidParseResult::BadSize:
        return "unexpected length";
    case GuidParseResult::BadHyphens:
        return "misplaced hyphens";
    case GuidParseResult::BadHex:
        return "invalid hex digit";
    }
    return "unknown";
}

GuidParseResult parse_guid(std::string_view str, Guid& out) {
    if (str.size() != GUID_STRING_LENGTH) {
        return GuidParseResult::BadSize;
    }

    for (std::size_t pos : HYPHEN_POSITIONS) {
        if (str[pos] != '-') {
            return GuidParseResult::BadHyphens;
        }
    }

    std::uint64_t time_low = 0;
    std::uint64_t time_mid = 0;
    std::uint64_t time_hi = 0;
    std::uint64_t clock_hi = 0;
    std::uint64_t clock_low = 0;
    if (!read_hex(str, 0, 8, time_low) || !read_hex(str, 9, 4, time_mid) ||
        !read_hex(str, 14, 4, time_hi) || !read_hex(str, 19, 2, clock_hi) ||
        !read_hex(str, 21, 2, clock_low)) {
        return GuidParseResult::BadHex;
    }

    Guid guid;
    guid.time_low = static_cast<std::uint32_t>(time_low);
    guid.time_mid = static_cast<std::uint16_t>(time_mid);
    guid.time_hi_and_version = static_cast<std::uint16_t>(time_hi);
    guid.clock_seq_hi_and_reserved = static_cast<std::uint8_t>(clock_hi);
    guid.clock_seq_low = static_cast<std::uint8_t>(clock_low);

    for (std::size_t i = 0; i < guid.node.size(); ++i) {
        std::uint64_t octet = 0;
        if (!read_hex(str, 24 + i * 2, 2, octet)) {
            return GuidParseResult::BadHex;
        }
        guid.node[i] = static_cast<std::uint8_t>(octet);
    }

    out = guid;
    return GuidParseResult::Ok;
}

std::optional<Guid> Guid::parse(std::string_view str) {
    Guid guid;
    if (parse_guid(str, guid) != GuidParseResult::Ok) {
        return std::nullopt;
    }
    return guid;
}

std::string Guid::to_string() const {
    char buf[GUID_STRING_LENGTH + 1];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%02x%02x-%02x%02x%02x%02x%02x%02x",
                  static_cast<unsigned>(time_low), static_cast<unsigned>(time_mid),
                  static_cast<unsigned>(time_hi_and_version),
                  static_cast<unsigned>(clock_seq_hi_and_reserved),
                  static_cast<unsigned>(clock_seq_low), static_cast<unsigned>(node[0]),
                  static_cast<unsigned>(node[1]), static_cast<unsigned>(node[2]),
                  static_cast<unsigned>(node[3]), static_cast<unsigned>(node[4]),
                  static_cast<unsigned>(node[5]));
    return std::string(buf, GUID_STRING_LENGTH);
}

std::uint64_t Guid::high() const {
    return (static_cast<std::uint64_t>(time_low) << 32) |
           (static_cast<std::uint64_t>(time_mid) << 16) |
           static_cast<std::uint64_t>(time_hi_and_version);
}

std::uint64_t Guid::low() const {
    std::uint64_t value = (static_cast<std::uint64_t>(clock_seq_hi_and_reserved) << 56) |
                          (static_cast<std::uint64_t>(clock_seq_low) << 48);
    for (std::size_t i = 0; i < node.size(); ++i) {
        value |= static_cast<std::uint64_t>(node[i]) << (40 - i * 8);
    }
    return value;
}

bool Guid::operator==(const Guid& other) const {
    return high() == other.high() && low() == other.low();
}

bool Guid::operator<(const Guid& other) const {
    if (high() != other.high())
        return high() < other.high();
    return low() < other.low();
}

std::size_t GuidHash::operator()(const Guid& guid) const {
    // Смешивание двух половин (boost::hash_combine)
    std::size_t seed = std::hash<std::uint64_t>{}(guid.high());
    constexpr auto GOLDEN = static_cast<std::size_t>(0x9e3779b97f4a7c15ULL);
    seed ^= std::hash<std::uint64_t>{}(guid.low()) + GOLDEN + (seed << 6) + (seed >> 2);
    return seed;
}

}  // namespace guidscan
