// ==============================================================================
// output.cpp - Пользовательский вывод
// ==============================================================================

#include "guidscan/output.hpp"

#include "guidscan/platform.hpp"

#include <algorithm>
#include <cstdio>
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace guidscan::output {

// ----------------------------------------------------------------------------
// ANSI Escape Codes
// ----------------------------------------------------------------------------

namespace {

constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";
constexpr const char* ANSI_MAGENTA = "\x1b[35m";

// Unicode box-drawing characters (UTF-8)
constexpr const char* BOX_V = "\xe2\x94\x82";      // │ U+2502
constexpr const char* BOX_H = "\xe2\x94\x80";      // ─ U+2500
constexpr const char* BOX_TL = "\xe2\x94\x8c";     // ┌ U+250C
constexpr const char* BOX_TR = "\xe2\x94\x90";     // ┐ U+2510
constexpr const char* BOX_BL = "\xe2\x94\x94";     // └ U+2514
constexpr const char* BOX_BR = "\xe2\x94\x98";     // ┘ U+2518
constexpr const char* BOX_LT = "\xe2\x94\x9c";     // ├ U+251C
constexpr const char* BOX_RT = "\xe2\x94\xa4";     // ┤ U+2524
constexpr const char* BOX_TT = "\xe2\x94\xac";     // ┬ U+252C
constexpr const char* BOX_BT = "\xe2\x94\xb4";     // ┴ U+2534
constexpr const char* BOX_CROSS = "\xe2\x94\xbc";  // ┼ U+253C

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {
    if (config_.output_path.has_value()) {
        open_output_file();
    }
}

Writer::~Writer() {
    close_output_file();
    flush();
}

void Writer::write(Stream s, std::string_view bytes) {
    write_impl(s, bytes);
}

void Writer::write_line(Stream s, std::string_view bytes) {
    write(s, bytes);
    write(s, "\n");
}

void Writer::write_impl(Stream s, std::string_view bytes) {
    FILE* f = (s == Stream::Stdout && output_file_ != nullptr) ? output_file_ : get_file(s);
    if (f != nullptr) {
        std::fwrite(bytes.data(), 1, bytes.size(), f);
    }
}

FILE* Writer::get_file(Stream s) const {
    return (s == Stream::Stdout) ? stdout : stderr;
}

void Writer::write_prefix(std::string_view prefix, Color color) {
    if (supports_color(Stream::Stderr)) {
        write(Stream::Stderr, ansi_color_code(color));
        write(Stream::Stderr, prefix);
        write(Stream::Stderr, ANSI_RESET);
    } else {
        write(Stream::Stderr, prefix);
    }
}

void Writer::info(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefix("[+] ", Color::Green);
    write_line(Stream::Stderr, message);
}

void Writer::warn(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefix("[!] ", Color::Yellow);
    write_line(Stream::Stderr, message);
}

void Writer::error(std::string_view message) {
    // Ошибки печатаются и при --quiet
    write_prefix("[x] ", Color::Red);
    write_line(Stream::Stderr, message);
}

void Writer::debug(std::string_view message) {
    if (config_.verbose <= 0) {
        return;
    }
    write_prefix("[*] ", Color::Cyan);
    write_line(Stream::Stderr, message);
}

void Writer::trace(std::string_view message) {
    if (config_.verbose <= 1) {
        return;
    }
    write_prefix("[~] ", Color::Magenta);
    write_line(Stream::Stderr, message);
}

void Writer::green_line(std::string_view message) {
    write_colored(Stream::Stdout, message, Color::Green);
    write(Stream::Stdout, "\n");
}

void Writer::write_colored(Stream s, std::string_view message, Color color) {
    // В файл вывода ANSI codes не пишутся
    bool use_color = (s == Stream::Stdout && output_file_ == nullptr && supports_color(s)) ||
                     (s == Stream::Stderr && supports_color(s));

    if (use_color) {
        write(s, ansi_color_code(color));
        write(s, message);
        write(s, ANSI_RESET);
    } else {
        write(s, message);
    }
}

void Writer::write_json(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);

    write(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
    flush();
}

void Writer::write_json_line(const rapidjson::Value& value) {
    write_json(value);
    write(Stream::Stdout, "\n");
}

void Writer::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
    if (output_file_ != nullptr) {
        std::fflush(output_file_);
    }
}

bool Writer::open_output_file() {
    if (!config_.output_path.has_value()) {
        return false;
    }

    const auto& path = config_.output_path.value();

#ifdef _WIN32
    output_file_ = _wfopen(path.c_str(), L"wb");
#else
    output_file_ = std::fopen(platform::path_to_utf8(path).c_str(), "wb");
#endif

    return output_file_ != nullptr;
}

void Writer::close_output_file() {
    if (output_file_ != nullptr) {
        std::fflush(output_file_);
        std::fclose(output_file_);
        output_file_ = nullptr;
    }
}

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

Table::Table() = default;

void Table::set_headers(const std::vector<std::string>& headers) {
    headers_ = headers;
    widths_calculated_ = false;
}

void Table::add_row(const std::vector<std::string>& cells) {
    rows_.push_back(cells);
    widths_calculated_ = false;
}

void Table::calculate_widths() {
    if (widths_calculated_) {
        return;
    }

    size_t num_cols = headers_.size();
    for (const auto& row : rows_) {
        num_cols = std::max(num_cols, row.size());
    }
    col_widths_.assign(num_cols, 0);

    for (size_t i = 0; i < headers_.size(); ++i) {
        col_widths_[i] = std::max(col_widths_[i], headers_[i].size());
    }
    for (const auto& row : rows_) {
        for (size_t i = 0; i < row.size(); ++i) {
            col_widths_[i] = std::max(col_widths_[i], row[i].size());
        }
    }

    widths_calculated_ = true;
}

std::string Table::format_line(char kind) const {
    const char* left = kind == 'T' ? BOX_TL : (kind == 'M' ? BOX_LT : BOX_BL);
    const char* middle = kind == 'T' ? BOX_TT : (kind == 'M' ? BOX_CROSS : BOX_BT);
    const char* right = kind == 'T' ? BOX_TR : (kind == 'M' ? BOX_RT : BOX_BR);

    std::string line = left;
    for (size_t i = 0; i < col_widths_.size(); ++i) {
        // 1 пробел отступа с каждой стороны
        for (size_t j = 0; j < col_widths_[i] + 2; ++j) {
            line += BOX_H;
        }
        if (i + 1 < col_widths_.size()) {
            line += middle;
        }
    }
    line += right;
    return line;
}

std::string Table::format_row(const std::vector<std::string>& cells) const {
    std::string line = BOX_V;

    for (size_t i = 0; i < col_widths_.size(); ++i) {
        line += ' ';
        std::string cell = (i < cells.size()) ? cells[i] : "";
        line += cell;
        if (cell.size() < col_widths_[i]) {
            line.append(col_widths_[i] - cell.size(), ' ');
        }
        line += ' ';
        line += BOX_V;
    }

    return line;
}

std::string Table::to_string() const {
    // Ленивое вычисление ширин
    const_cast<Table*>(this)->calculate_widths();

    std::string result;
    result += format_line('T');
    result += '\n';

    if (!headers_.empty()) {
        result += format_row(headers_);
        result += '\n';
        result += format_line('M');
        result += '\n';
    }

    for (const auto& row : rows_) {
        result += format_row(row);
        result += '\n';
    }

    result += format_line('B');
    result += '\n';
    return result;
}

void Table::print(Writer& w) {
    w.write(Stream::Stdout, to_string());
}

// ----------------------------------------------------------------------------
// ResultPrinter
// ----------------------------------------------------------------------------

struct ResultPrinter::JsonState {
    rapidjson::Document doc;

    JsonState() { doc.SetArray(); }
};

ResultPrinter::ResultPrinter(Writer& writer, config::OutputFormat format, bool offsets)
    : writer_(writer), format_(format), offsets_(offsets) {}

ResultPrinter::~ResultPrinter() = default;

void ResultPrinter::begin() {
    switch (format_) {
    case config::OutputFormat::Csv:
        writer_.write_line(Stream::Stdout, offsets_ ? "path,guid,count,offset" : "path,guid,count");
        break;
    case config::OutputFormat::Json:
        json_ = std::make_unique<JsonState>();
        break;
    case config::OutputFormat::Table:
    case config::OutputFormat::Jsonl:
        break;
    }
}

void ResultPrinter::add(const scan::ScanResult& result) {
    std::vector<scan::GuidRecord> records = sorted_records(result.records);
    records_ += records.size();
    std::string path = platform::path_to_utf8(result.path);

    switch (format_) {
    case config::OutputFormat::Table:
        add_table(result, records);
        break;

    case config::OutputFormat::Csv:
        for (const auto& rec : records) {
            std::string line = csv_escape(path);
            line += ',';
            line += rec.guid.to_string();
            line += ',';
            line += std::to_string(rec.count);
            if (offsets_) {
                line += ',';
                if (rec.first_offset) {
                    line += std::to_string(*rec.first_offset);
                }
            }
            writer_.write_line(Stream::Stdout, line);
        }
        break;

    case config::OutputFormat::Json:
    case config::OutputFormat::Jsonl: {
        if (format_ == config::OutputFormat::Json && !json_) {
            json_ = std::make_unique<JsonState>();
        }
        rapidjson::Document scratch;
        rapidjson::Document::AllocatorType& alloc =
            json_ ? json_->doc.GetAllocator() : scratch.GetAllocator();

        for (const auto& rec : records) {
            rapidjson::Value obj(rapidjson::kObjectType);
            std::string guid = rec.guid.to_string();
            obj.AddMember("path",
                          rapidjson::Value(path.c_str(),
                                           static_cast<rapidjson::SizeType>(path.size()), alloc),
                          alloc);
            obj.AddMember("guid",
                          rapidjson::Value(guid.c_str(),
                                           static_cast<rapidjson::SizeType>(guid.size()), alloc),
                          alloc);
            obj.AddMember("count", rapidjson::Value(static_cast<std::uint64_t>(rec.count)), alloc);
            if (offsets_ && rec.first_offset) {
                obj.AddMember("offset",
                              rapidjson::Value(static_cast<std::uint64_t>(*rec.first_offset)), alloc);
            }

            if (json_) {
                json_->doc.PushBack(obj, alloc);
            } else {
                writer_.write_json_line(obj);
            }
        }
        break;
    }
    }
}

void ResultPrinter::add_table(const scan::ScanResult& result,
                              const std::vector<scan::GuidRecord>& records) {
    writer_.green_line(platform::path_to_utf8(result.path));

    if (records.empty()) {
        writer_.write_line(Stream::Stdout, "No GUIDs found");
        writer_.write(Stream::Stdout, "\n");
        return;
    }

    Table table;
    if (offsets_) {
        table.set_headers({"GUID", "Count", "Offset"});
    } else {
        table.set_headers({"GUID", "Count"});
    }
    for (const auto& rec : records) {
        std::vector<std::string> row{rec.guid.to_string(), std::to_string(rec.count)};
        if (offsets_) {
            row.push_back(rec.first_offset ? std::to_string(*rec.first_offset) : "-");
        }
        table.add_row(row);
    }
    table.print(writer_);
    writer_.write(Stream::Stdout, "\n");
}

void ResultPrinter::end() {
    if (format_ == config::OutputFormat::Json) {
        if (!json_) {
            json_ = std::make_unique<JsonState>();
        }
        writer_.write_json_line(json_->doc);
    }
    writer_.flush();
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::vector<scan::GuidRecord> sorted_records(std::vector<scan::GuidRecord> records) {
    std::sort(records.begin(), records.end(),
              [](const scan::GuidRecord& a, const scan::GuidRecord& b) { return a.guid < b.guid; });
    return records;
}

std::string csv_escape(std::string_view field) {
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string(field);
    }

    std::string result = "\"";
    for (char c : field) {
        if (c == '"') {
            result += '"';
        }
        result += c;
    }
    result += '"';
    return result;
}

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return ANSI_GREEN;
    case Color::Yellow:
        return ANSI_YELLOW;
    case Color::Red:
        return ANSI_RED;
    case Color::Cyan:
        return ANSI_CYAN;
    case Color::Magenta:
        return ANSI_MAGENTA;
    case Color::Default:
    default:
        return "";
    }
}

std::string ansi_reset_code() {
    return ANSI_RESET;
}

bool supports_color(Stream s) {
    if (s == Stream::Stdout) {
        return platform::is_tty_stdout();
    }
    return platform::is_tty_stderr();
}

}  // namespace guidscan::output
