// ==============================================================================
// guidscan/scanner.hpp - Потоковое сканирование файла на GUID-литералы
// ==============================================================================
//
// Назначение:
// - ScannerBuilder: builder pattern для создания Scanner
// - Scanner: цикл чтения блоками с переносом хвоста (carry-over)
// - ScanResult: записи аккумулятора + предупреждения + ошибка
//
// Цикл чтения:
//   1. Прочитать до block_size декодированных символов (0 -> конец)
//   2. Дописать к carry-over без пробельных символов
//   3. Найти совпадения; каждое канонизировать и учесть
//   4. Хвост после последнего совпадения -> carry-over,
//      не длиннее carry_over последних символов
//
// Совпадение, которое заканчивается ровно на конце буфера, пока поток
// не исчерпан, откладывается до следующего блока: поле с префиксом 0x
// может продолжиться в новых символах.
//
// Хвост, оставшийся после последнего блока, больше не сканируется.
//
// ==============================================================================

#ifndef GUIDSCAN_SCANNER_HPP
#define GUIDSCAN_SCANNER_HPP

#include <guidscan/accumulator.hpp>
#include <guidscan/config.hpp>
#include <guidscan/encoding.hpp>
#include <guidscan/text_reader.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace guidscan::scan {

// ============================================================================
// ScanWarning - кандидат, не прошедший строгий разбор
// ============================================================================

struct ScanWarning {
    std::uint64_t position = 0;           // позиция в очищенном потоке
    std::optional<std::uint64_t> offset;  // смещение в декодированном тексте (если отслеживается)
    std::string candidate;                // текст совпадения
    std::string reason;

    /// "malformed GUID candidate '<text>' at position N - <reason>"
    std::string format() const;
};

using WarningSink = std::function<void(const ScanWarning&)>;

// ============================================================================
// ScanResult
// ============================================================================

struct ScanResult {
    bool ok = false;
    std::filesystem::path path;
    io::Encoding encoding = io::Encoding::AutoDetect;  // фактическая кодировка
    std::vector<GuidRecord> records;                   // пусто при ошибке
    std::vector<ScanWarning> warnings;
    std::optional<io::ReaderError> error;
    std::uint64_t chars_read = 0;
    std::uint64_t blocks = 0;

    explicit operator bool() const { return ok; }

    std::uint64_t total_count() const;
};

// ============================================================================
// ScannerBuilder
// ============================================================================

class Scanner;

/// Builder для создания Scanner
///
/// Использование:
/// @code
///   auto result = ScannerBuilder::create()
///       .block_size(65536)
///       .encoding(io::Encoding::AutoDetect)
///       .build();
///   if (result.ok) {
///       auto scan = result.scanner->scan(path);
///   }
/// @endcode
class ScannerBuilder {
public:
    static ScannerBuilder create();

    /// Запрошенный размер блока; ограничивается диапазоном limits
    ScannerBuilder& block_size(std::size_t size);

    /// Максимальная длина carry-over; ограничивается block_size - 1
    ScannerBuilder& carry_over(std::size_t chars);

    ScannerBuilder& encoding(io::Encoding encoding);

    ScannerBuilder& limits(config::BlockSizeLimits limits);

    /// Сохранять смещение первого вхождения каждого GUID
    ScannerBuilder& track_offsets(bool track);

    /// Получать предупреждения сразу, по мере сканирования
    ScannerBuilder& on_warning(WarningSink sink);

    struct BuildResult {
        bool ok = false;
        std::unique_ptr<Scanner> scanner;
        std::string error;
    };
    BuildResult build();

private:
    ScannerBuilder() = default;

    std::size_t block_size_ = config::DEFAULT_BLOCK_SIZE;
    std::size_t carry_over_ = config::DEFAULT_CARRY_OVER;
    io::Encoding encoding_ = io::Encoding::AutoDetect;
    config::BlockSizeLimits limits_;
    bool track_offsets_ = false;
    WarningSink on_warning_;
};

// ============================================================================
// Scanner
// ============================================================================

/// Сканер не хранит состояния между вызовами scan(): у каждого файла
/// собственный поток, буферы и аккумулятор.
class Scanner {
public:
    static ScannerBuilder builder() { return ScannerBuilder::create(); }

    /// Просканировать файл
    /// Ошибка открытия или чтения -> ok=false, error заполнен, records пуст
    ScanResult scan(const std::filesystem::path& path) const;

    /// Эффективный размер блока (после ограничения)
    std::size_t block_size() const { return block_size_; }

    /// Запрошенный размер блока
    std::size_t requested_block_size() const { return requested_block_size_; }

    /// Размер блока был ограничен диапазоном
    bool block_size_clamped() const { return block_size_ != requested_block_size_; }

    /// Эффективный carry-over
    std::size_t carry_over() const { return carry_over_; }

    io::Encoding encoding() const { return encoding_; }
    bool track_offsets() const { return track_offsets_; }

private:
    friend class ScannerBuilder;
    Scanner() = default;

    std::size_t block_size_ = config::DEFAULT_BLOCK_SIZE;
    std::size_t requested_block_size_ = config::DEFAULT_BLOCK_SIZE;
    std::size_t carry_over_ = config::DEFAULT_CARRY_OVER;
    io::Encoding encoding_ = io::Encoding::AutoDetect;
    bool track_offsets_ = false;
    WarningSink on_warning_;
};

}  // namespace guidscan::scan

#endif  // GUIDSCAN_SCANNER_HPP
