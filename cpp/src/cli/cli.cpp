// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================
//
// Формат ошибок: "error: ..." + Usage + подсказка "--help".
//
// ==============================================================================

#include "guidscan/cli.hpp"

#include "guidscan/config.hpp"
#include "guidscan/platform.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace guidscan::cli {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

namespace {

constexpr const char* SCAN_USAGE = "Usage: guidscan scan [OPTIONS] <PATH>...";

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

/// Опция со значением: "-b N", "--block-size N" или "--block-size=N"
///
/// @return true если arg является этой опцией; value = nullptr, если значения нет
bool take_value(int argc, char** argv, int& i, const char* short_name, const char* long_name,
                const char*& value) {
    const char* arg = argv[i];
    std::size_t long_len = std::strlen(long_name);

    if (starts_with(arg, long_name) && arg[long_len] == '=') {
        value = arg + long_len + 1;
        return true;
    }
    if (str_eq(arg, long_name) || (short_name != nullptr && str_eq(arg, short_name))) {
        value = (i + 1 < argc) ? argv[++i] : nullptr;
        return true;
    }
    return false;
}

/// Десятичное беззнаковое число без знака и мусора
bool parse_size(const char* str, std::size_t& out) {
    if (str == nullptr || *str == '\0' || *str == '-' || *str == '+') {
        return false;
    }
    errno = 0;
    char* end = nullptr;
    unsigned long long value = std::strtoull(str, &end, 10);
    if (errno != 0 || end == nullptr || *end != '\0') {
        return false;
    }
    out = static_cast<std::size_t>(value);
    return true;
}

std::string render_usage_error(const std::string& error_msg, const char* usage) {
    return error_msg + "\n\n" + usage + "\n\nFor more information, try '--help'.\n";
}

std::string missing_value(const char* option) {
    return render_usage_error(
        std::string("error: a value is required for '") + option + "' but none was supplied",
        SCAN_USAGE);
}

std::string invalid_value(const char* value, const char* option, const char* reason) {
    return render_usage_error(std::string("error: invalid value '") + value + "' for '" + option +
                                  "': " + reason,
                              SCAN_USAGE);
}

/// Глобальные флаги, допустимые в любой позиции
bool parse_global_flag(const char* arg, GlobalOptions& global) {
    if (str_eq(arg, "--no-banner")) {
        global.no_banner = true;
    } else if (str_eq(arg, "-q") || str_eq(arg, "--quiet")) {
        global.quiet = true;
    } else if (arg[0] == '-' && arg[1] == 'v' && arg[std::strspn(arg + 1, "v") + 1] == '\0') {
        // -v, -vv, -vvv
        global.verbose += static_cast<int>(std::strlen(arg) - 1);
    } else {
        return false;
    }
    return true;
}

/// Разобрать аргументы подкоманды scan
/// @return false при ошибке (diagnostic заполнен)
bool parse_scan(int argc, char** argv, int first, ParseResult& result) {
    ScanCommand scan_cmd;
    const char* value = nullptr;

    for (int i = first; i < argc; ++i) {
        const char* arg = argv[i];

        if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.command = HelpCommand{"scan"};
            return true;
        } else if (parse_global_flag(arg, result.global)) {
            continue;
        } else if (take_value(argc, argv, i, "-b", "--block-size", value)) {
            if (value == nullptr) {
                result.diagnostic.stderr_message = missing_value("--block-size <N>");
                return false;
            }
            // Вне диапазона: ограничивается при сборке сканера
            auto size = config::parse_block_size(value);
            if (!size) {
                result.diagnostic.stderr_message =
                    invalid_value(value, "--block-size <N>", "invalid digit found in string");
                return false;
            }
            scan_cmd.block_size = *size;
        } else if (take_value(argc, argv, i, nullptr, "--carry-over", value)) {
            std::size_t size = 0;
            if (value == nullptr) {
                result.diagnostic.stderr_message = missing_value("--carry-over <N>");
                return false;
            }
            if (!parse_size(value, size) || size == 0) {
                result.diagnostic.stderr_message =
                    invalid_value(value, "--carry-over <N>", "expected a positive integer");
                return false;
            }
            scan_cmd.carry_over = size;
        } else if (take_value(argc, argv, i, "-e", "--encoding", value)) {
            if (value == nullptr) {
                result.diagnostic.stderr_message = missing_value("--encoding <ENC>");
                return false;
            }
            auto encoding = io::encoding_from_string(value);
            if (!encoding) {
                result.diagnostic.stderr_message =
                    invalid_value(value, "--encoding <ENC>",
                                  "must be one of AutoDetect, ASCII, Unicode, UTF32, UTF7, UTF8");
                return false;
            }
            scan_cmd.encoding = *encoding;
        } else if (take_value(argc, argv, i, nullptr, "--extension", value)) {
            if (value == nullptr) {
                result.diagnostic.stderr_message = missing_value("--extension <EXT>");
                return false;
            }
            std::string ext = value;
            if (!ext.empty() && ext[0] == '.') {
                ext.erase(0, 1);
            }
            scan_cmd.extensions.push_back(ext);
        } else if (take_value(argc, argv, i, nullptr, "--config", value)) {
            if (value == nullptr) {
                result.diagnostic.stderr_message = missing_value("--config <FILE>");
                return false;
            }
            scan_cmd.config = platform::path_from_utf8(value);
        } else if (take_value(argc, argv, i, "-o", "--output", value)) {
            if (value == nullptr) {
                result.diagnostic.stderr_message = missing_value("--output <FILE>");
                return false;
            }
            scan_cmd.output = platform::path_from_utf8(value);
        } else if (str_eq(arg, "--offsets")) {
            scan_cmd.offsets = true;
        } else if (str_eq(arg, "-r") || str_eq(arg, "--recursive")) {
            scan_cmd.recursive = true;
        } else if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
            scan_cmd.json = true;
        } else if (str_eq(arg, "--jsonl")) {
            scan_cmd.jsonl = true;
        } else if (str_eq(arg, "--csv")) {
            scan_cmd.csv = true;
        } else if (str_eq(arg, "--skip-errors")) {
            scan_cmd.skip_errors = true;
        } else if (str_eq(arg, "--")) {
            for (++i; i < argc; ++i) {
                scan_cmd.paths.push_back(platform::path_from_utf8(argv[i]));
            }
        } else if (arg[0] == '-' && arg[1] != '\0') {
            result.diagnostic.stderr_message = render_usage_error(
                std::string("error: unexpected argument '") + arg + "' found", SCAN_USAGE);
            return false;
        } else {
            scan_cmd.paths.push_back(platform::path_from_utf8(arg));
        }
    }

    int formats = (scan_cmd.json ? 1 : 0) + (scan_cmd.jsonl ? 1 : 0) + (scan_cmd.csv ? 1 : 0);
    if (formats > 1) {
        result.diagnostic.stderr_message = render_usage_error(
            "error: the arguments '--json', '--jsonl' and '--csv' cannot be used together",
            SCAN_USAGE);
        return false;
    }

    if (scan_cmd.paths.empty()) {
        result.diagnostic.stderr_message =
            render_usage_error("error: the following required arguments were not provided:\n"
                               "  <PATH>...",
                               SCAN_USAGE);
        return false;
    }

    result.command = std::move(scan_cmd);
    return true;
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("guidscan ") + VERSION + "\n";
}

std::string render_help(const std::optional<std::string>& command) {
    if (!command.has_value()) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: guidscan [OPTIONS] <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  scan  Scan files for GUID literals and count occurrences\n"
               "  help  Print this message or the help of the given subcommand(s)\n"
               "\n"
               "Options:\n"
               "      --no-banner  Hide guidscan's banner\n"
               "  -q               Suppress informational output\n"
               "  -v...            Print verbose output\n"
               "  -h, --help       Print help\n"
               "  -V, --version    Print version\n"
               "\n"
               "Examples:\n"
               "\n"
               "    Scan a single file:\n"
               "        ./guidscan scan registry_export.txt\n"
               "\n"
               "    Scan a directory of headers as UTF-16 and output JSON:\n"
               "        ./guidscan scan -r --extension h -e Unicode include/ --json\n";
    } else if (*command == "scan") {
        return "Scan files for GUID literals and count occurrences\n"
               "\n"
               "Usage: guidscan scan [OPTIONS] <PATH>...\n"
               "\n"
               "Arguments:\n"
               "  <PATH>...  Files (or directories with --recursive) to scan\n"
               "\n"
               "Options:\n"
               "  -b, --block-size <N>   Decoded characters per read block [default: 65536]\n"
               "      --carry-over <N>   Characters kept across block boundaries [default: 64]\n"
               "  -e, --encoding <ENC>   AutoDetect, ASCII, Unicode, UTF32, UTF7 or UTF8 "
               "[default: AutoDetect]\n"
               "      --offsets          Record the offset of the first occurrence\n"
               "  -r, --recursive        Descend into directories\n"
               "      --extension <EXT>  Only scan files with this extension (recursive mode)\n"
               "      --config <FILE>    Load settings from a YAML file\n"
               "  -j, --json             Output as JSON\n"
               "      --jsonl            Output as JSON lines\n"
               "      --csv              Output as CSV\n"
               "  -o, --output <FILE>    Save output to a file\n"
               "      --skip-errors      Skip errors and continue processing\n"
               "  -h, --help             Print help\n";
    } else if (*command == "help") {
        return "Print this message or the help of the given subcommand(s)\n"
               "\n"
               "Usage: guidscan help [COMMAND]\n";
    } else {
        return "error: unrecognized subcommand '" + *command + "'\n";
    }
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.command = HelpCommand{};
    result.diagnostic.exit_code = 2;

    if (argc < 2) {
        // Без аргументов: справка в stderr, exit code 2
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    // Глобальные опции до подкоманды
    int cmd_idx = argc;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (parse_global_flag(arg, result.global)) {
            continue;
        } else if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (arg[0] != '-') {
            cmd_idx = i;
            break;
        } else {
            result.diagnostic.stderr_message = render_usage_error(
                std::string("error: unexpected argument '") + arg + "' found",
                "Usage: guidscan [OPTIONS] <COMMAND>");
            return result;
        }
    }

    if (cmd_idx >= argc) {
        result.ok = true;
        result.command = HelpCommand{};
        return result;
    }

    const char* cmd = argv[cmd_idx];

    if (str_eq(cmd, "scan")) {
        result.ok = parse_scan(argc, argv, cmd_idx + 1, result);
    } else if (str_eq(cmd, "help")) {
        result.ok = true;
        if (cmd_idx + 1 < argc) {
            result.command = HelpCommand{argv[cmd_idx + 1]};
        } else {
            result.command = HelpCommand{};
        }
    } else {
        result.diagnostic.stderr_message =
            render_usage_error(std::string("error: unrecognized subcommand '") + cmd + "'",
                               "Usage: guidscan [OPTIONS] <COMMAND>");
    }

    return result;
}

}  // namespace guidscan::cli
