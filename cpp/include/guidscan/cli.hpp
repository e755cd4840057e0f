// ==============================================================================
// guidscan/cli.hpp - CLI парсинг и команды
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2)
//
// ==============================================================================

#ifndef GUIDSCAN_CLI_HPP
#define GUIDSCAN_CLI_HPP

#include <guidscan/encoding.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace guidscan::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    bool no_banner = false;  // --no-banner
    int verbose = 0;         // -v (repeatable)
    bool quiet = false;      // -q
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

/// scan - поиск GUID в файлах
///
/// Незаданные опции берутся из --config, затем из значений по умолчанию.
struct ScanCommand {
    std::vector<std::filesystem::path> paths;
    std::optional<std::size_t> block_size;        // -b, --block-size
    std::optional<std::size_t> carry_over;        // --carry-over
    std::optional<io::Encoding> encoding;         // -e, --encoding
    bool offsets = false;                         // --offsets
    bool recursive = false;                       // -r, --recursive
    std::vector<std::string> extensions;          // --extension (repeatable)
    std::optional<std::filesystem::path> config;  // --config
    bool json = false;                            // -j, --json
    bool jsonl = false;                           // --jsonl
    bool csv = false;                             // --csv
    std::optional<std::filesystem::path> output;  // -o, --output
    bool skip_errors = false;                     // --skip-errors
};

/// help - показать справку
struct HelpCommand {
    std::optional<std::string> command;  // опциональная подкоманда для справки
};

/// version - показать версию
struct VersionCommand {};

using Command = std::variant<ScanCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 1;
    std::string stderr_message;
};

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Текст --help (для конкретной команды или общий)
std::string render_help(const std::optional<std::string>& command = std::nullopt);

/// Текст --version
std::string render_version();

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

constexpr const char* VERSION = "1.0.0";

constexpr const char* ABOUT = "Find and count GUID literals in large text files";

}  // namespace guidscan::cli

#endif  // GUIDSCAN_CLI_HPP
