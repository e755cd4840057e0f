// ==============================================================================
// guidscan/text_reader.hpp - Чтение файла блоками декодированных символов
// ==============================================================================
//
// Назначение:
// - Валидация пути (существует, обычный файл, доступен на чтение)
// - Выбор декодера (явная кодировка или определение по BOM)
// - Чтение не более N декодированных символов за вызов
//
// Размер блока измеряется в символах, а не в байтах: сырые байты читаются
// порциями RAW_READ_BYTES и декодируются во внутренний буфер, откуда
// выдаются ровно запрошенные N символов.
//
// Файловый поток принадлежит TextReader и закрывается в деструкторе,
// в том числе при раннем выходе вызывающего кода.
//
// ==============================================================================

#ifndef GUIDSCAN_TEXT_READER_HPP
#define GUIDSCAN_TEXT_READER_HPP

#include <guidscan/encoding.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace guidscan::io {

/// Размер одного сырого чтения из файла
constexpr std::size_t RAW_READ_BYTES = 64 * 1024;

// ----------------------------------------------------------------------------
// ReaderError - ошибки открытия и чтения
// ----------------------------------------------------------------------------

enum class ReaderErrorKind {
    PathNotFound,  // путь не существует
    AccessDenied,  // нет прав на чтение
    NotAFile,      // директория или специальный файл
    IoError        // ошибка ввода-вывода при чтении
};

const char* reader_error_kind_to_string(ReaderErrorKind kind);

struct ReaderError {
    ReaderErrorKind kind = ReaderErrorKind::IoError;
    std::string message;
    std::string path;

    /// "failed to scan file '<path>' - <message>"
    std::string format() const;
};

// ----------------------------------------------------------------------------
// TextReader
// ----------------------------------------------------------------------------

struct TextReaderResult {
    bool ok = false;
    std::unique_ptr<class TextReader> reader;
    ReaderError error;

    explicit operator bool() const { return ok; }
};

/// Использование:
/// @code
///   auto result = TextReader::open(path, Encoding::AutoDetect);
///   if (!result) {
///       writer.error(result.error.format());
///       return;
///   }
///   std::u32string block;
///   while (result.reader->read(block, 65536) > 0) {
///       // обработка block
///       block.clear();
///   }
/// @endcode
class TextReader {
public:
    /// Открыть файл
    /// @param path Путь к обычному файлу
    /// @param encoding Явная кодировка или AutoDetect
    static TextReaderResult open(const std::filesystem::path& path, Encoding encoding);

    /// Дописать в out не более max_chars декодированных символов
    /// @return Количество прочитанных символов; 0 означает конец потока
    std::size_t read(std::u32string& out, std::size_t max_chars);

    /// Поток исчерпан (следующий read() вернёт 0)
    bool at_end();

    /// Фактическая кодировка (после определения по BOM)
    Encoding encoding() const { return encoding_; }

    /// Количество выданных символов
    std::uint64_t chars_read() const { return chars_read_; }

    /// Количество прочитанных байт
    std::uint64_t bytes_read() const { return bytes_read_; }

    const std::filesystem::path& path() const { return path_; }

    /// Ошибка чтения, прервавшая поток
    const std::optional<ReaderError>& last_error() const { return error_; }

private:
    TextReader(std::filesystem::path path, Encoding encoding);

    /// Прочитать очередную порцию байт и декодировать её в pending_
    void fill();

    /// Доступно декодированных символов
    std::size_t available() const { return pending_.size() - pending_pos_; }

    std::filesystem::path path_;
    std::ifstream file_;
    Encoding encoding_;
    std::unique_ptr<Decoder> decoder_;

    std::vector<char> raw_;
    std::u32string pending_;
    std::size_t pending_pos_ = 0;

    bool eof_ = false;
    bool bom_checked_ = false;
    std::uint64_t chars_read_ = 0;
    std::uint64_t bytes_read_ = 0;
    std::optional<ReaderError> error_;
};

}  // namespace guidscan::io

#endif  // GUIDSCAN_TEXT_READER_HPP
