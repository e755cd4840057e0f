// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// 1. Парсинг argv (cli)
// 2. Создание Writer (output)
// 3. Dispatch команды
// 4. Возврат exit code: 0 успех, 1 ошибка выполнения, 2 ошибка CLI
//
// Исключения перехватываются только здесь, на границе приложения.
//
// ==============================================================================

#include "guidscan/cli.hpp"
#include "guidscan/config.hpp"
#include "guidscan/discovery.hpp"
#include "guidscan/output.hpp"
#include "guidscan/platform.hpp"
#include "guidscan/scanner.hpp"

#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_set>
#include <variant>

namespace {

// ----------------------------------------------------------------------------
// Banner (--no-banner)
// ----------------------------------------------------------------------------

constexpr const char* BANNER = R"(
   ┌─┐┬ ┬┬┌┬┐┌─┐┌─┐┌─┐┌┐┌
   │ ┬│ │││ ││└─┐│  ├─┤│││
   └─┘└─┘┴─┴┘└─┘└─┘┴ ┴┘└┘
)";

void print_banner(guidscan::output::Writer& writer, bool no_banner, bool quiet) {
    if (no_banner || quiet) {
        return;
    }
    writer.write(guidscan::output::Stream::Stderr, BANNER);
    writer.write_line(guidscan::output::Stream::Stderr, "");
}

// ----------------------------------------------------------------------------
// scan
// ----------------------------------------------------------------------------

/// Слить файл конфигурации и флаги CLI (CLI имеет приоритет)
guidscan::config::Config merge_options(guidscan::config::Config cfg,
                                       const guidscan::cli::ScanCommand& cmd) {
    using namespace guidscan;

    if (cmd.block_size) {
        cfg.scan.block_size = *cmd.block_size;
    }
    if (cmd.carry_over) {
        cfg.scan.carry_over = *cmd.carry_over;
    }
    if (cmd.encoding) {
        cfg.scan.encoding = *cmd.encoding;
    }
    cfg.scan.offsets = cfg.scan.offsets || cmd.offsets;
    cfg.output.recursive = cfg.output.recursive || cmd.recursive;
    cfg.output.skip_errors = cfg.output.skip_errors || cmd.skip_errors;
    if (!cmd.extensions.empty()) {
        cfg.output.extensions = cmd.extensions;
    }

    if (cmd.json) {
        cfg.output.format = config::OutputFormat::Json;
    } else if (cmd.jsonl) {
        cfg.output.format = config::OutputFormat::Jsonl;
    } else if (cmd.csv) {
        cfg.output.format = config::OutputFormat::Csv;
    }
    return cfg;
}

int run_scan(const guidscan::cli::ScanCommand& cmd, guidscan::output::Writer& writer) {
    using namespace guidscan;

    // 1. Конфигурация: значения по умолчанию < --config < флаги CLI
    config::Config cfg;
    if (cmd.config) {
        auto loaded = config::load_file(*cmd.config);
        if (!loaded) {
            writer.error(loaded.error.format());
            return 1;
        }
        cfg = loaded.config;
        writer.debug("loaded configuration from " + platform::path_to_utf8(*cmd.config));
    }
    cfg = merge_options(std::move(cfg), cmd);

    // 2. Scanner
    auto build_result = scan::ScannerBuilder::create()
                            .block_size(cfg.scan.block_size)
                            .carry_over(cfg.scan.carry_over)
                            .encoding(cfg.scan.encoding)
                            .limits(cfg.limits)
                            .track_offsets(cfg.scan.offsets)
                            .on_warning([&writer](const scan::ScanWarning& warning) {
                                writer.warn(warning.format());
                            })
                            .build();
    if (!build_result.ok) {
        writer.error(build_result.error);
        return 1;
    }
    const auto& scanner = *build_result.scanner;

    if (scanner.block_size_clamped()) {
        writer.debug("block size " + std::to_string(scanner.requested_block_size()) +
                     " clamped to " + std::to_string(scanner.block_size()));
    }
    if (scanner.carry_over() != cfg.scan.carry_over) {
        writer.debug("carry-over " + std::to_string(cfg.scan.carry_over) + " reduced to " +
                     std::to_string(scanner.carry_over()));
    }

    // 3. Входные файлы
    io::DiscoveryOptions disc_opt;
    disc_opt.skip_errors = cfg.output.skip_errors;
    disc_opt.recursive = cfg.output.recursive;
    if (!cfg.output.extensions.empty()) {
        disc_opt.extensions = std::unordered_set<std::string>(cfg.output.extensions.begin(),
                                                              cfg.output.extensions.end());
    }

    io::DiscoveryResult discovered;
    try {
        discovered = io::discover_files(cmd.paths, disc_opt);
    } catch (const std::runtime_error& e) {
        writer.error(e.what());
        return 1;
    }
    for (const auto& warning : discovered.warnings) {
        writer.warn(warning);
    }
    if (discovered.files.empty()) {
        writer.error("No compatible files were found in the provided paths");
        return 1;
    }

    // 4. Результаты: stdout или --output
    std::unique_ptr<output::Writer> file_writer;
    output::Writer* out = &writer;
    if (cmd.output) {
        output::OutputConfig out_cfg = writer.config();
        out_cfg.output_path = cmd.output;
        file_writer = std::make_unique<output::Writer>(out_cfg);
        if (!file_writer->has_output_file()) {
            writer.error("failed to open output file - " + platform::path_to_utf8(*cmd.output));
            return 1;
        }
        out = file_writer.get();
    }

    writer.info("Scanning " + std::to_string(discovered.files.size()) + " file(s) (block size " +
                std::to_string(scanner.block_size()) + ", encoding " +
                io::encoding_to_string(scanner.encoding()) + ")");

    output::ResultPrinter printer(*out, cfg.output.format, cfg.scan.offsets);
    printer.begin();

    std::unordered_set<Guid, GuidHash> unique;
    std::uint64_t occurrences = 0;
    std::size_t scanned = 0;

    for (const auto& file : discovered.files) {
        writer.trace("scanning " + platform::path_to_utf8(file));

        scan::ScanResult result = scanner.scan(file);
        if (!result) {
            const io::ReaderError& error = *result.error;
            if (cfg.output.skip_errors) {
                writer.warn(error.format());
                continue;
            }
            writer.error(error.format());
            printer.end();
            return 1;
        }

        ++scanned;
        occurrences += result.total_count();
        for (const auto& rec : result.records) {
            unique.insert(rec.guid);
        }
        writer.debug(platform::path_to_utf8(file) + ": " + std::to_string(result.records.size()) +
                     " unique, " + std::to_string(result.total_count()) + " occurrences, " +
                     std::to_string(result.warnings.size()) + " warnings, encoding " +
                     io::encoding_to_string(result.encoding) + ", " +
                     std::to_string(result.blocks) + " blocks");

        printer.add(result);
    }

    printer.end();

    writer.info("Found " + std::to_string(unique.size()) + " unique GUIDs (" +
                std::to_string(occurrences) + " occurrences) in " + std::to_string(scanned) +
                " files");
    return 0;
}

// ----------------------------------------------------------------------------
// Главная функция выполнения (run)
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    using namespace guidscan;

    // 1. Парсинг argv
    cli::ParseResult parse_result = cli::parse(argc, argv);

    // 2. Создание Writer
    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    out_cfg.no_banner = parse_result.global.no_banner;
    output::Writer writer(out_cfg);

    // 3. Ошибки парсинга: сообщение без префикса [x], напрямую в stderr
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    // 4. Dispatch команды
    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                // help не выводит баннер
                std::string help_text = cli::render_help(cmd.command);
                if (help_text.rfind("error:", 0) == 0) {
                    writer.write(output::Stream::Stderr, help_text);
                    return 2;
                }
                writer.write(output::Stream::Stdout, help_text);
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::ScanCommand>) {
                print_banner(writer, out_cfg.no_banner, out_cfg.quiet);
                return run_scan(cmd, writer);
            } else {
                // Unreachable
                return 1;
            }
        },
        parse_result.command);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        // Формат ошибки "[x] <err>"
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    }
}
