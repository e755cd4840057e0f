// ==============================================================================
// guidscan/whitespace.hpp - Удаление пробельных символов
// ==============================================================================
//
// GUID-литералы часто переносятся по строкам или выравниваются пробелами,
// поэтому сопоставление работает только по тексту без пробельных символов.
//
// Пробельные символы: U+0009..U+000D, U+0020, U+0085, U+00A0, U+1680,
// U+2000..U+200A, U+2028, U+2029, U+202F, U+205F, U+3000.
//
// ==============================================================================

#ifndef GUIDSCAN_WHITESPACE_HPP
#define GUIDSCAN_WHITESPACE_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace guidscan::scan {

/// Является ли code point пробельным символом Unicode
bool is_whitespace(char32_t c);

/// Вернуть копию text без пробельных символов
std::u32string strip_whitespace(std::u32string_view text);

/// Дописать в out символы text без пробельных
/// @return Количество дописанных символов
std::size_t append_stripped(std::u32string_view text, std::u32string& out);

/// Дописать в out символы text без пробельных, сохраняя карту смещений
///
/// Для каждого сохранённого символа в offsets дописывается его исходное
/// смещение: base_offset + индекс в text. Так позиция в очищенном буфере
/// переводится обратно в смещение декодированного символа в файле.
///
/// @return Количество дописанных символов
std::size_t append_stripped(std::u32string_view text, std::uint64_t base_offset,
                            std::u32string& out, std::vector<std::uint64_t>& offsets);

}  // namespace guidscan::scan

#endif  // GUIDSCAN_WHITESPACE_HPP
