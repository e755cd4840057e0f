// ==============================================================================
// guidscan/output.hpp - Пользовательский вывод
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Диагностика с префиксами [+] [!] [x] [*] [~]
// - Результаты сканирования: таблица / JSON / JSONL / CSV
// - Цветной вывод (ANSI escape codes) при TTY
// - Вывод результатов в файл (--output)
//
// Результаты пишутся в stdout (или файл), диагностика только в stderr.
//
// ==============================================================================

#ifndef GUIDSCAN_OUTPUT_HPP
#define GUIDSCAN_OUTPUT_HPP

#include <guidscan/config.hpp>
#include <guidscan/scanner.hpp>

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Forward declarations для JSON
namespace rapidjson {
class CrtAllocator;
template <typename BaseAllocator>
class MemoryPoolAllocator;
template <typename Encoding, typename Allocator>
class GenericValue;
template <typename CharType>
struct UTF8;
using Value = GenericValue<UTF8<char>, MemoryPoolAllocator<CrtAllocator>>;
}  // namespace rapidjson

namespace guidscan::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// ANSI цвета для терминала
// ----------------------------------------------------------------------------

enum class Color {
    Default,
    Green,   // Успех, информация
    Yellow,  // Предупреждения
    Red,     // Ошибки
    Cyan,    // Отладка
    Magenta  // Трассировка
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;      // -q: подавить [+] и [!]
    int verbose = 0;         // -v: уровень подробности (0..2+)
    bool no_banner = false;  // --no-banner: скрыть баннер

    // Путь для вывода результатов (--output)
    std::optional<std::filesystem::path> output_path;
};

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    // Базовый вывод
    // -------------------------------------------------------------------------

    /// Записать байты в поток (Stdout -> файл вывода, если открыт)
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    // Сообщения с префиксами
    // -------------------------------------------------------------------------

    /// "[+] <message>" в stderr (если не quiet)
    void info(std::string_view message);

    /// "[!] <message>" в stderr (если не quiet)
    void warn(std::string_view message);

    void warning(std::string_view message) { warn(message); }

    /// "[x] <message>" в stderr (всегда)
    void error(std::string_view message);

    /// "[*] <message>" в stderr (только при verbose > 0)
    void debug(std::string_view message);

    /// "[~] <message>" в stderr (только при verbose > 1)
    void trace(std::string_view message);

    /// Зелёная строка в stdout (без цвета при выводе в файл)
    void green_line(std::string_view message);

    // JSON вывод
    // -------------------------------------------------------------------------

    /// Записать JSON значение (компактно)
    void write_json(const rapidjson::Value& value);

    /// Записать JSON значение + newline (JSONL)
    void write_json_line(const rapidjson::Value& value);

    // Управление
    // -------------------------------------------------------------------------

    void flush();

    const OutputConfig& config() const { return config_; }

    /// Открыть файл для вывода (при заданном output_path)
    bool open_output_file();

    void close_output_file();

    bool has_output_file() const { return output_file_ != nullptr; }

private:
    void write_impl(Stream s, std::string_view bytes);

    /// Префикс сообщения с цветом при TTY
    void write_prefix(std::string_view prefix, Color color);

    void write_colored(Stream s, std::string_view message, Color color);

    FILE* get_file(Stream s) const;

    OutputConfig config_;
    FILE* output_file_ = nullptr;
};

// ----------------------------------------------------------------------------
// Table - таблица с Unicode box-drawing
// ----------------------------------------------------------------------------

class Table {
public:
    Table();

    void set_headers(const std::vector<std::string>& headers);

    void add_row(const std::vector<std::string>& cells);

    /// Вывести таблицу через Writer в stdout
    void print(Writer& w);

    std::string to_string() const;

    size_t row_count() const { return rows_.size(); }

private:
    /// Горизонтальная линия: 'T' верх, 'M' разделитель, 'B' низ
    std::string format_line(char kind) const;

    std::string format_row(const std::vector<std::string>& cells) const;

    void calculate_widths();

    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
    std::vector<size_t> col_widths_;
    bool widths_calculated_ = false;
};

// ----------------------------------------------------------------------------
// ResultPrinter - вывод результатов сканирования
// ----------------------------------------------------------------------------

/// Использование:
/// @code
///   ResultPrinter printer(writer, config::OutputFormat::Json, offsets);
///   printer.begin();
///   for (const auto& result : results) {
///       printer.add(result);
///   }
///   printer.end();
/// @endcode
///
/// Записи каждого файла выводятся отсортированными по значению GUID.
class ResultPrinter {
public:
    ResultPrinter(Writer& writer, config::OutputFormat format, bool offsets);
    ~ResultPrinter();

    /// CSV: строка заголовка
    void begin();

    /// Вывести записи одного успешно просканированного файла
    void add(const scan::ScanResult& result);

    /// JSON: весь массив целиком
    void end();

    /// Количество выведенных записей
    std::uint64_t records() const { return records_; }

private:
    void add_table(const scan::ScanResult& result, const std::vector<scan::GuidRecord>& records);

    Writer& writer_;
    config::OutputFormat format_;
    bool offsets_;
    std::uint64_t records_ = 0;

    struct JsonState;
    std::unique_ptr<JsonState> json_;  // накопленный массив для Json
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Записи, отсортированные по значению GUID
std::vector<scan::GuidRecord> sorted_records(std::vector<scan::GuidRecord> records);

/// Экранировать поле CSV (кавычки при , " \r \n)
std::string csv_escape(std::string_view field);

/// ANSI escape code для цвета
std::string ansi_color_code(Color color);

std::string ansi_reset_code();

/// Поддерживает ли поток цвета (TTY)
bool supports_color(Stream s);

}  // namespace guidscan::output

#endif  // GUIDSCAN_OUTPUT_HPP
