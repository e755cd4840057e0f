// ==============================================================================
// guidscan/encoding.hpp - Текстовые кодировки и потоковые декодеры
// ==============================================================================
//
// Назначение:
// - Encoding enum (селектор кодировки из CLI/конфигурации)
// - Определение кодировки по byte-order-mark
// - Потоковые декодеры байт -> code points (char32_t)
//
// Декодеры потоковые: многобайтовая последовательность, разрезанная
// границей чтения, достраивается при следующем вызове decode().
// Невалидные последовательности заменяются на U+FFFD.
//
// ==============================================================================

#ifndef GUIDSCAN_ENCODING_HPP
#define GUIDSCAN_ENCODING_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace guidscan::io {

// ----------------------------------------------------------------------------
// Encoding
// ----------------------------------------------------------------------------

enum class Encoding {
    AutoDetect,        // по BOM, без BOM: UTF-8
    Ascii,             // ASCII (байты > 0x7F -> U+FFFD)
    Unicode,           // UTF-16LE
    BigEndianUnicode,  // UTF-16BE (только через BOM)
    Utf32,             // UTF-32LE
    Utf32BigEndian,    // UTF-32BE (только через BOM)
    Utf7,              // UTF-7 (RFC 2152)
    Utf8               // UTF-8
};

/// Имя кодировки для вывода ("UTF8", "Unicode", ...)
const char* encoding_to_string(Encoding encoding);

/// Разобрать имя кодировки (case-insensitive)
/// Принимает AutoDetect|ASCII|Unicode|UTF32|UTF7|UTF8 и алиасы
/// UTF16, UTF-16, UTF-16LE, UTF-32, UTF-32LE, UTF-7, UTF-8
std::optional<Encoding> encoding_from_string(std::string_view name);

/// Символ замены для невалидных последовательностей
constexpr char32_t REPLACEMENT_CHAR = 0xFFFD;

/// Byte-order-mark как code point
constexpr char32_t BYTE_ORDER_MARK = 0xFEFF;

// ----------------------------------------------------------------------------
// BOM detection
// ----------------------------------------------------------------------------

/// Определить кодировку по первым байтам файла
/// @param data Начало файла
/// @param len Количество доступных байт (достаточно 4)
/// @return Кодировка или nullopt, если BOM не распознан
///
/// Порядок проверок: UTF-32LE (FF FE 00 00) проверяется раньше UTF-16LE (FF FE).
std::optional<Encoding> detect_bom(const std::uint8_t* data, std::size_t len);

// ----------------------------------------------------------------------------
// Decoder
// ----------------------------------------------------------------------------

class Decoder {
public:
    virtual ~Decoder() = default;

    /// Декодировать очередную порцию байт, дописывая символы в out
    virtual void decode(const std::uint8_t* data, std::size_t len, std::u32string& out) = 0;

    /// Конец потока: незавершённая последовательность -> U+FFFD
    virtual void finish(std::u32string& out) = 0;

    /// Кодировка декодера
    virtual Encoding encoding() const = 0;

protected:
    Decoder() = default;
};

/// Создать декодер для конкретной кодировки
/// Encoding::AutoDetect трактуется как UTF-8 (кодировка по умолчанию без BOM)
std::unique_ptr<Decoder> create_decoder(Encoding encoding);

/// Декодировать буфер целиком (decode + finish)
std::u32string decode_all(Encoding encoding, std::string_view bytes);

}  // namespace guidscan::io

#endif  // GUIDSCAN_ENCODING_HPP
