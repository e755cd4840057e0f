// ==============================================================================
// config.cpp - Параметры сканирования и YAML-конфигурация
// ==============================================================================

#include "guidscan/config.hpp"

#include "guidscan/platform.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace guidscan::config {

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string key_name(const char* section, const char* key) {
    return std::string(section) + "." + key;
}

/// Прочитать скаляр section.key; отсутствующий ключ -> fallback
template <typename T>
T read_scalar(const YAML::Node& section, const char* section_name, const char* key, T fallback) {
    const YAML::Node node = section[key];
    if (!node || node.IsNull()) {
        return fallback;
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        throw std::runtime_error("invalid value for '" + key_name(section_name, key) + "'");
    }
}

/// Секция верхнего уровня: отсутствует -> undefined node, не mapping -> ошибка
YAML::Node section_of(const YAML::Node& root, const char* name) {
    YAML::Node node = root[name];
    if (node && !node.IsNull() && !node.IsMap()) {
        throw std::runtime_error("'" + std::string(name) + "' must be a mapping");
    }
    return node;
}

void apply_scan(const YAML::Node& scan, ScanConfig& cfg) {
    // block_size вне диапазона ограничивается сканером, а не отклоняется
    std::string block_size = read_scalar<std::string>(scan, "scan", "block_size", "");
    if (!block_size.empty()) {
        auto parsed = parse_block_size(block_size);
        if (!parsed) {
            throw std::runtime_error("invalid value for 'scan.block_size'");
        }
        cfg.block_size = *parsed;
    }
    cfg.carry_over = read_scalar<std::size_t>(scan, "scan", "carry_over", cfg.carry_over);
    if (cfg.carry_over == 0) {
        throw std::runtime_error("'scan.carry_over' must be greater than zero");
    }

    std::string encoding = read_scalar<std::string>(scan, "scan", "encoding", "");
    if (!encoding.empty()) {
        auto parsed = io::encoding_from_string(encoding);
        if (!parsed) {
            throw std::runtime_error("invalid value for 'scan.encoding': " + encoding);
        }
        cfg.encoding = *parsed;
    }

    cfg.offsets = read_scalar<bool>(scan, "scan", "offsets", cfg.offsets);
}

void apply_limits(const YAML::Node& limits, BlockSizeLimits& cfg) {
    cfg.min = read_scalar<std::size_t>(limits, "limits", "min_block_size", cfg.min);
    cfg.max = read_scalar<std::size_t>(limits, "limits", "max_block_size", cfg.max);
}

void apply_output(const YAML::Node& output, OutputSettings& cfg) {
    std::string format = read_scalar<std::string>(output, "output", "format", "");
    if (!format.empty()) {
        auto parsed = output_format_from_string(format);
        if (!parsed) {
            throw std::runtime_error("invalid value for 'output.format': " + format);
        }
        cfg.format = *parsed;
    }

    cfg.skip_errors = read_scalar<bool>(output, "output", "skip_errors", cfg.skip_errors);
    cfg.recursive = read_scalar<bool>(output, "output", "recursive", cfg.recursive);

    const YAML::Node extensions = output["extensions"];
    if (extensions && !extensions.IsNull()) {
        cfg.extensions.clear();
        try {
            if (extensions.IsSequence()) {
                for (const auto& ext : extensions) {
                    cfg.extensions.push_back(ext.as<std::string>());
                }
            } else {
                cfg.extensions.push_back(extensions.as<std::string>());
            }
        } catch (const YAML::Exception&) {
            throw std::runtime_error("invalid value for 'output.extensions'");
        }
    }
}

void apply(const YAML::Node& root, Config& cfg) {
    // Пустой документ: остаются значения по умолчанию
    if (!root || root.IsNull()) {
        return;
    }
    if (!root.IsMap()) {
        throw std::runtime_error("configuration root must be a mapping");
    }

    if (YAML::Node scan = section_of(root, "scan"); scan && scan.IsMap()) {
        apply_scan(scan, cfg.scan);
    }
    if (YAML::Node limits = section_of(root, "limits"); limits && limits.IsMap()) {
        apply_limits(limits, cfg.limits);
    }
    if (auto error = validate_limits(cfg.limits)) {
        throw std::runtime_error(*error);
    }
    if (YAML::Node output = section_of(root, "output"); output && output.IsMap()) {
        apply_output(output, cfg.output);
    }
}

}  // anonymous namespace

// ============================================================================
// Block size
// ============================================================================

std::optional<std::string> validate_limits(const BlockSizeLimits& limits) {
    if (limits.min < MIN_BLOCK_SIZE_FLOOR) {
        return "min_block_size must be at least " + std::to_string(MIN_BLOCK_SIZE_FLOOR);
    }
    if (limits.min > limits.max) {
        return "min_block_size (" + std::to_string(limits.min) +
               ") is greater than max_block_size (" + std::to_string(limits.max) + ")";
    }
    return std::nullopt;
}

ClampResult clamp_block_size(std::size_t requested, const BlockSizeLimits& limits) {
    ClampResult result;
    result.value = std::clamp(requested, limits.min, limits.max);
    result.clamped = result.value != requested;
    return result;
}

std::optional<std::size_t> parse_block_size(std::string_view text) {
    std::string str(text);
    std::size_t digits = (!str.empty() && (str[0] == '-' || str[0] == '+')) ? 1 : 0;
    if (digits >= str.size() || !std::isdigit(static_cast<unsigned char>(str[digits]))) {
        return std::nullopt;
    }

    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(str.c_str(), &end, 10);
    if (end == nullptr || *end != '\0') {
        return std::nullopt;
    }
    // ERANGE: strtoll насыщает до LLONG_MIN / LLONG_MAX
    if (value <= 0) {
        return std::size_t{0};
    }
    if (errno == ERANGE ||
        static_cast<unsigned long long>(value) > std::numeric_limits<std::size_t>::max()) {
        return std::numeric_limits<std::size_t>::max();
    }
    return static_cast<std::size_t>(value);
}

std::size_t effective_carry_over(std::size_t requested, std::size_t block_size) {
    if (block_size == 0) {
        return 0;
    }
    return std::min(requested, block_size - 1);
}

// ============================================================================
// OutputFormat
// ============================================================================

const char* output_format_to_string(OutputFormat format) {
    switch (format) {
    case OutputFormat::Table:
        return "table";
    case OutputFormat::Json:
        return "json";
    case OutputFormat::Jsonl:
        return "jsonl";
    case OutputFormat::Csv:
        return "csv";
    }
    return "table";
}

std::optional<OutputFormat> output_format_from_string(std::string_view name) {
    std::string s = to_lower(name);
    if (s == "table")
        return OutputFormat::Table;
    if (s == "json")
        return OutputFormat::Json;
    if (s == "jsonl")
        return OutputFormat::Jsonl;
    if (s == "csv")
        return OutputFormat::Csv;
    return std::nullopt;
}

// ============================================================================
// Loading
// ============================================================================

std::string ConfigError::format() const {
    std::ostringstream oss;
    oss << "config error";
    if (!path.empty()) {
        oss << " [" << path << "]";
    }
    oss << ": " << message;
    return oss.str();
}

ConfigResult load_file(const std::filesystem::path& path) {
    ConfigResult result;
    std::string path_str = platform::path_to_utf8(path);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        result.error = ConfigError{"file does not exist or is not a regular file", path_str};
        return result;
    }

    try {
        YAML::Node root = YAML::LoadFile(path_str);
        apply(root, result.config);
        result.ok = true;
    } catch (const YAML::Exception& e) {
        result.error = ConfigError{e.what(), path_str};
    } catch (const std::exception& e) {
        result.error = ConfigError{e.what(), path_str};
    }
    return result;
}

ConfigResult load_string(const std::string& yaml) {
    ConfigResult result;
    try {
        YAML::Node root = YAML::Load(yaml);
        apply(root, result.config);
        result.ok = true;
    } catch (const YAML::Exception& e) {
        result.error = ConfigError{e.what(), ""};
    } catch (const std::exception& e) {
        result.error = ConfigError{e.what(), ""};
    }
    return result;
}

}  // namespace guidscan::config
