// ==============================================================================
// guidscan/config.hpp - Параметры сканирования и YAML-конфигурация
// ==============================================================================
//
// Назначение:
// - Значения по умолчанию и допустимые диапазоны
// - Ограничение размера блока (clamping) и carry-over
// - Загрузка YAML-файла конфигурации (yaml-cpp)
//
// Приоритет источников: значения по умолчанию < файл конфигурации < CLI.
// Слияние с CLI выполняет приложение; здесь только первые два уровня.
//
// Формат файла:
//   scan:
//     block_size: 65536
//     carry_over: 64
//     encoding: AutoDetect
//     offsets: false
//   limits:
//     min_block_size: 4096
//     max_block_size: 1073741824
//   output:
//     format: table
//     skip_errors: false
//     recursive: false
//     extensions: [txt, log]
//
// ==============================================================================

#ifndef GUIDSCAN_CONFIG_HPP
#define GUIDSCAN_CONFIG_HPP

#include <guidscan/encoding.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace guidscan::config {

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

/// Размер блока по умолчанию (декодированных символов)
constexpr std::size_t DEFAULT_BLOCK_SIZE = 65536;

/// Диапазон размера блока по умолчанию: [4 KiB, 1 GiB]
constexpr std::size_t MIN_BLOCK_SIZE = 4096;
constexpr std::size_t MAX_BLOCK_SIZE = 1073741824;

/// Нижняя граница, ниже которой min_block_size задать нельзя
constexpr std::size_t MIN_BLOCK_SIZE_FLOOR = 64;

/// Максимальная длина carry-over по умолчанию
constexpr std::size_t DEFAULT_CARRY_OVER = 64;

// ----------------------------------------------------------------------------
// Block size
// ----------------------------------------------------------------------------

struct BlockSizeLimits {
    std::size_t min = MIN_BLOCK_SIZE;
    std::size_t max = MAX_BLOCK_SIZE;
};

/// Проверить диапазон: min >= 64, min <= max
/// @return Сообщение об ошибке или nullopt
std::optional<std::string> validate_limits(const BlockSizeLimits& limits);

struct ClampResult {
    std::size_t value = 0;
    bool clamped = false;  // значение было вне диапазона
};

/// Ограничить размер блока диапазоном limits
ClampResult clamp_block_size(std::size_t requested, const BlockSizeLimits& limits);

/// Разобрать размер блока из десятичной строки со знаком
///
/// Значения <= 0 дают 0, слишком большие дают SIZE_MAX: clamp_block_size
/// затем приводит их к limits.min и limits.max.
///
/// @return nullopt, если строка не является целым числом
std::optional<std::size_t> parse_block_size(std::string_view text);

/// Эффективный carry-over: min(requested, block_size - 1)
std::size_t effective_carry_over(std::size_t requested, std::size_t block_size);

// ----------------------------------------------------------------------------
// OutputFormat
// ----------------------------------------------------------------------------

enum class OutputFormat {
    Table,  // таблица на файл
    Json,   // один JSON-массив
    Jsonl,  // JSON-объект на строку
    Csv     // CSV с заголовком
};

const char* output_format_to_string(OutputFormat format);

/// "table" | "json" | "jsonl" | "csv" (case-insensitive)
std::optional<OutputFormat> output_format_from_string(std::string_view name);

// ----------------------------------------------------------------------------
// Config
// ----------------------------------------------------------------------------

struct ScanConfig {
    std::size_t block_size = DEFAULT_BLOCK_SIZE;
    std::size_t carry_over = DEFAULT_CARRY_OVER;
    io::Encoding encoding = io::Encoding::AutoDetect;
    bool offsets = false;
};

struct OutputSettings {
    OutputFormat format = OutputFormat::Table;
    bool skip_errors = false;
    bool recursive = false;
    std::vector<std::string> extensions;
};

struct Config {
    ScanConfig scan;
    BlockSizeLimits limits;
    OutputSettings output;
};

struct ConfigError {
    std::string message;
    std::string path;

    /// "config error [<path>]: <message>"
    std::string format() const;
};

struct ConfigResult {
    bool ok = false;
    Config config;
    ConfigError error;

    explicit operator bool() const { return ok; }
};

/// Загрузить конфигурацию из YAML-файла
ConfigResult load_file(const std::filesystem::path& path);

/// Загрузить конфигурацию из YAML-строки
ConfigResult load_string(const std::string& yaml);

}  // namespace guidscan::config

#endif  // GUIDSCAN_CONFIG_HPP
