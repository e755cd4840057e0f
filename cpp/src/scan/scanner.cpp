// ==============================================================================
// scanner.cpp - Потоковое сканирование файла на GUID-литералы
// ==============================================================================

#include "guidscan/scanner.hpp"

#include "guidscan/matcher.hpp"
#include "guidscan/whitespace.hpp"

#include <sstream>

namespace guidscan::scan {

// ============================================================================
// ScanWarning / ScanResult
// ============================================================================

std::string ScanWarning::format() const {
    std::ostringstream oss;
    oss << "malformed GUID candidate '" << candidate << "' at position " << position;
    if (offset) {
        oss << " (offset " << *offset << ")";
    }
    oss << " - " << reason;
    return oss.str();
}

std::uint64_t ScanResult::total_count() const {
    std::uint64_t total = 0;
    for (const auto& rec : records) {
        total += rec.count;
    }
    return total;
}

// ============================================================================
// ScannerBuilder
// ============================================================================

ScannerBuilder ScannerBuilder::create() {
    return ScannerBuilder();
}

ScannerBuilder& ScannerBuilder::block_size(std::size_t size) {
    block_size_ = size;
    return *this;
}

ScannerBuilder& ScannerBuilder::carry_over(std::size_t chars) {
    carry_over_ = chars;
    return *this;
}

ScannerBuilder& ScannerBuilder::encoding(io::Encoding encoding) {
    encoding_ = encoding;
    return *this;
}

ScannerBuilder& ScannerBuilder::limits(config::BlockSizeLimits limits) {
    limits_ = limits;
    return *this;
}

ScannerBuilder& ScannerBuilder::track_offsets(bool track) {
    track_offsets_ = track;
    return *this;
}

ScannerBuilder& ScannerBuilder::on_warning(WarningSink sink) {
    on_warning_ = std::move(sink);
    return *this;
}

ScannerBuilder::BuildResult ScannerBuilder::build() {
    BuildResult result;

    if (auto error = config::validate_limits(limits_)) {
        result.error = "invalid block size limits: " + *error;
        return result;
    }
    if (carry_over_ == 0) {
        result.error = "carry-over must be greater than zero";
        return result;
    }

    auto scanner = std::unique_ptr<Scanner>(new Scanner());

    // Размер блока вне диапазона не ошибка: он ограничивается
    auto clamped = config::clamp_block_size(block_size_, limits_);
    scanner->requested_block_size_ = block_size_;
    scanner->block_size_ = clamped.value;
    scanner->carry_over_ = config::effective_carry_over(carry_over_, clamped.value);
    scanner->encoding_ = encoding_;
    scanner->track_offsets_ = track_offsets_;
    scanner->on_warning_ = on_warning_;

    result.ok = true;
    result.scanner = std::move(scanner);
    return result;
}

// ============================================================================
// Scanner
// ============================================================================

ScanResult Scanner::scan(const std::filesystem::path& path) const {
    ScanResult result;
    result.path = path;
    result.encoding = encoding_;

    auto opened = io::TextReader::open(path, encoding_);
    if (!opened) {
        result.error = opened.error;
        return result;
    }
    io::TextReader& reader = *opened.reader;

    GuidAccumulator accumulator;

    std::u32string raw;
    std::u32string clean;            // carry-over + текущий блок без пробелов
    std::vector<std::uint64_t> map;  // смещения символов clean (при track_offsets_)
    std::uint64_t clean_base = 0;    // позиция clean[0] в очищенном потоке
    std::uint64_t decoded = 0;       // символов прочитано до текущего блока

    while (true) {
        raw.clear();
        std::size_t n = reader.read(raw, block_size_);
        if (n == 0) {
            break;
        }
        ++result.blocks;

        if (track_offsets_) {
            append_stripped(raw, decoded, clean, map);
        } else {
            append_stripped(raw, clean);
        }
        decoded += n;

        bool last = reader.at_end();

        std::size_t resume = 0;
        std::optional<std::size_t> deferred;
        Matcher matcher(clean);
        Match match;
        while (matcher.next(match)) {
            if (!last && match.end() == clean.size()) {
                deferred = match.offset;
                break;
            }
            resume = match.end();

            std::optional<std::uint64_t> offset;
            if (track_offsets_) {
                offset = map[match.offset];
            }

            auto canonical = canonicalize(match);
            if (canonical) {
                accumulator.record(canonical.guid, offset);
                continue;
            }

            ScanWarning warning;
            warning.position = clean_base + match.offset;
            warning.offset = offset;
            warning.candidate = match.text;
            warning.reason = guid_parse_result_to_string(canonical.status);
            if (on_warning_) {
                on_warning_(warning);
            }
            result.warnings.push_back(std::move(warning));
        }

        // Хвост последнего блока больше не сканируется
        if (last) {
            break;
        }

        // Carry-over: не длиннее carry_over_ символов, но отложенное
        // совпадение сохраняется целиком, пока умещается в блок
        std::size_t keep_from = resume;
        if (clean.size() - keep_from > carry_over_) {
            keep_from = clean.size() - carry_over_;
        }
        if (deferred && *deferred < keep_from && clean.size() - *deferred < block_size_) {
            keep_from = *deferred;
        }

        clean.erase(0, keep_from);
        if (track_offsets_) {
            map.erase(map.begin(), map.begin() + static_cast<std::ptrdiff_t>(keep_from));
        }
        clean_base += keep_from;
    }

    result.encoding = reader.encoding();
    result.chars_read = reader.chars_read();

    // Ошибка чтения: частичные результаты не выдаются
    if (reader.last_error()) {
        result.error = *reader.last_error();
        return result;
    }

    result.records = accumulator.results();
    result.ok = true;
    return result;
}

}  // namespace guidscan::scan
