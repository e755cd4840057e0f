// ==============================================================================
// guidscan/guid.hpp - 128-битный идентификатор GUID/UUID
// ==============================================================================
//
// Назначение:
// - Guid: значение в стандартной раскладке полей UUID
// - Строгий разбор канонической формы 8-4-4-4-12
// - Каноническое форматирование (нижний регистр)
// - Хеширование для unordered-контейнеров
//
// Раскладка полей:
//   time_low:32  time_mid:16  time_hi_and_version:16
//   clock_seq_hi_and_reserved:8  clock_seq_low:8  node:48
//
// ==============================================================================

#ifndef GUIDSCAN_GUID_HPP
#define GUIDSCAN_GUID_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace guidscan {

/// Длина канонической строки "xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx"
constexpr std::size_t GUID_STRING_LENGTH = 36;

// ----------------------------------------------------------------------------
// GuidParseResult - результат строгого разбора
// ----------------------------------------------------------------------------

enum class GuidParseResult {
    Ok,
    BadSize,     // длина != 36
    BadHyphens,  // дефисы не на позициях 8, 13, 18, 23
    BadHex       // не-hex символ в одном из полей
};

/// Текстовое описание результата разбора (для диагностики)
const char* guid_parse_result_to_string(GuidParseResult result);

// ----------------------------------------------------------------------------
// Guid
// ----------------------------------------------------------------------------

struct Guid {
    std::uint32_t time_low = 0;
    std::uint16_t time_mid = 0;
    std::uint16_t time_hi_and_version = 0;
    std::uint8_t clock_seq_hi_and_reserved = 0;
    std::uint8_t clock_seq_low = 0;
    std::array<std::uint8_t, 6> node{};

    /// Разобрать каноническую строку (hex в любом регистре)
    static std::optional<Guid> parse(std::string_view str);

    /// Каноническая строка в нижнем регистре
    std::string to_string() const;

    /// Старшие и младшие 64 бита (big-endian порядок полей)
    std::uint64_t high() const;
    std::uint64_t low() const;

    bool operator==(const Guid& other) const;
    bool operator!=(const Guid& other) const { return !(*this == other); }

    /// Порядок по 128-битному значению
    bool operator<(const Guid& other) const;
};

/// Разобрать строку в Guid с указанием причины отказа
/// @param str Кандидат в канонической форме
/// @param out[out] Заполняется только при GuidParseResult::Ok
GuidParseResult parse_guid(std::string_view str, Guid& out);

// ----------------------------------------------------------------------------
// GuidHash
// ----------------------------------------------------------------------------

struct GuidHash {
    std::size_t operator()(const Guid& guid) const;
};

}  // namespace guidscan

namespace std {

template <>
struct hash<guidscan::Guid> {
    std::size_t operator()(const guidscan::Guid& guid) const { return guidscan::GuidHash{}(guid); }
};

}  // namespace std

#endif  // GUIDSCAN_GUID_HPP
