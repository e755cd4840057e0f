// ==============================================================================
// guidscan/matcher.hpp - Поиск GUID-литералов в очищенном буфере
// ==============================================================================
//
// Назначение:
// - Match: найденный кандидат (span + захваченные поля)
// - Matcher: ленивый перебор непересекающихся совпадений слева направо
// - canonicalize: Match -> Guid
//
// Грамматика (hex без учёта регистра, буфер без пробельных символов):
//
//   hex8 [sep] hex4 [sep] hex4 [sep] ['{'] hex2 [sep] hex2
//        ([sep] hex2){6} ['}']
//
//   sep   = ',' | '-'
//   hexN  = N hex-цифр | '0x' 1..N hex-цифр
//
// Покрывает три формы:
//   A864F394-C94E-4727-8EEB-89223E3096AF
//   0xa864f394,0xc94e,0x4727,0x8e,0xeb,0x89,0x22,0x3e,0x30,0x96,0xaf
//   0xa864f394,0xc94e,0x4727,{0x8e,0xeb,0x89,0x22,0x3e,0x30,0x96,0xaf}
//
// ==============================================================================

#ifndef GUIDSCAN_MATCHER_HPP
#define GUIDSCAN_MATCHER_HPP

#include <guidscan/guid.hpp>

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace guidscan::scan {

// ----------------------------------------------------------------------------
// Match
// ----------------------------------------------------------------------------

/// Найденный кандидат
///
/// Поля хранятся без префикса 0x, в исходном регистре.
struct Match {
    std::size_t offset = 0;  // позиция в очищенном буфере
    std::size_t length = 0;  // длина совпадения (символов)
    std::string text;        // совпавший текст

    std::string time_low;                    // поле 1 (до 8 hex)
    std::array<std::string, 2> time_fields;  // time_mid, time_hi_and_version
    std::array<std::string, 2> clock_seq;    // clock_seq_hi_and_reserved, clock_seq_low
    std::array<std::string, 6> node;         // октеты node

    std::size_t end() const { return offset + length; }
};

// ----------------------------------------------------------------------------
// Matcher
// ----------------------------------------------------------------------------

/// Ленивый перебор совпадений
///
/// Использование:
/// @code
///   Matcher matcher(clean);
///   Match m;
///   while (matcher.next(m)) {
///       // m.offset, m.text ...
///   }
/// @endcode
///
/// Буфер не копируется: он должен жить дольше Matcher.
class Matcher {
public:
    explicit Matcher(std::u32string_view buffer, std::size_t start = 0);

    /// Найти следующее совпадение начиная с текущей позиции
    /// @return false если совпадений больше нет
    bool next(Match& out);

    /// Текущая позиция (конец последнего совпадения)
    std::size_t position() const { return pos_; }

    /// Все оставшиеся совпадения
    std::vector<Match> find_all();

private:
    /// Попытаться сопоставить грамматику ровно с позиции start
    bool match_at(std::size_t start, Match& out) const;

    std::u32string_view buffer_;
    std::size_t pos_;
};

// ----------------------------------------------------------------------------
// Canonicalization
// ----------------------------------------------------------------------------

struct CanonicalizeResult {
    bool ok = false;
    Guid guid;
    std::string candidate;  // строка, переданная строгому разбору последней
    GuidParseResult status = GuidParseResult::BadSize;

    explicit operator bool() const { return ok; }
};

/// Собрать каноническую строку из захваченных полей:
/// f1 '-' f2[0] '-' f2[1] '-' f3[0]f3[1] '-' f4[0..5]
std::string reconstruct_canonical(const Match& match);

/// Преобразовать совпадение в Guid
///
/// Сначала текст совпадения разбирается как каноническая строка,
/// затем как строка из reconstruct_canonical().
CanonicalizeResult canonicalize(const Match& match);

}  // namespace guidscan::scan

#endif  // GUIDSCAN_MATCHER_HPP
