// ==============================================================================
// text_reader.cpp - Чтение файла блоками декодированных символов
// ==============================================================================

#include "guidscan/text_reader.hpp"

#include "guidscan/platform.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>

namespace guidscan::io {

// ============================================================================
// ReaderError
// ============================================================================

const char* reader_error_kind_to_string(ReaderErrorKind kind) {
    switch (kind) {
    case ReaderErrorKind::PathNotFound:
        return "PathNotFound";
    case ReaderErrorKind::AccessDenied:
        return "AccessDenied";
    case ReaderErrorKind::NotAFile:
        return "NotAFile";
    case ReaderErrorKind::IoError:
        return "IoError";
    }
    return "IoError";
}

std::string ReaderError::format() const {
    return "failed to scan file '" + path + "' - " + message;
}

// ============================================================================
// TextReader
// ============================================================================

TextReader::TextReader(std::filesystem::path path, Encoding encoding)
    : path_(std::move(path)), encoding_(encoding) {}

TextReaderResult TextReader::open(const std::filesystem::path& path, Encoding encoding) {
    TextReaderResult result;
    std::string path_str = platform::path_to_utf8(path);

    // 1. Существование и тип файла
    std::error_code ec;
    std::filesystem::file_status status = std::filesystem::status(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        ReaderErrorKind kind = ec == std::errc::permission_denied ? ReaderErrorKind::AccessDenied
                                                                   : ReaderErrorKind::IoError;
        result.error = ReaderError{kind, ec.message(), path_str};
        return result;
    }
    if (!std::filesystem::exists(status)) {
        result.error = ReaderError{ReaderErrorKind::PathNotFound, "path does not exist", path_str};
        return result;
    }
    if (!std::filesystem::is_regular_file(status)) {
        result.error = ReaderError{ReaderErrorKind::NotAFile, "path is not a file", path_str};
        return result;
    }

    // 2. Открытие потока
    auto reader = std::unique_ptr<TextReader>(new TextReader(path, encoding));
    errno = 0;
    reader->file_.open(path, std::ios::binary);
    if (!reader->file_.is_open()) {
        int err = errno;
        if (err == EACCES || err == EPERM) {
            result.error = ReaderError{ReaderErrorKind::AccessDenied, "permission denied", path_str};
        } else {
            result.error = ReaderError{ReaderErrorKind::IoError,
                                       err != 0 ? std::strerror(err) : "could not open file",
                                       path_str};
        }
        return result;
    }

    reader->raw_.resize(RAW_READ_BYTES);

    // Явная кодировка: декодер создаётся сразу; AutoDetect ждёт первых байт
    if (encoding != Encoding::AutoDetect) {
        reader->decoder_ = create_decoder(encoding);
    }

    result.ok = true;
    result.reader = std::move(reader);
    return result;
}

void TextReader::fill() {
    if (eof_) {
        return;
    }

    file_.read(raw_.data(), static_cast<std::streamsize>(raw_.size()));
    std::size_t got = static_cast<std::size_t>(file_.gcount());

    if (file_.bad()) {
        error_ = ReaderError{ReaderErrorKind::IoError, "read error", platform::path_to_utf8(path_)};
        eof_ = true;
        return;
    }

    const auto* bytes = reinterpret_cast<const std::uint8_t*>(raw_.data());

    if (!decoder_) {
        // AutoDetect: первая порция байт определяет кодировку
        auto detected = detect_bom(bytes, got);
        encoding_ = detected.value_or(Encoding::Utf8);
        decoder_ = create_decoder(encoding_);
    }

    // Компактизация уже выданной части буфера
    if (pending_pos_ > 0) {
        pending_.erase(0, pending_pos_);
        pending_pos_ = 0;
    }

    std::size_t before = pending_.size();
    if (got > 0) {
        bytes_read_ += got;
        decoder_->decode(bytes, got, pending_);
    }
    if (got == 0 || file_.eof()) {
        decoder_->finish(pending_);
        eof_ = true;
    }

    // BOM не является частью текста: U+FEFF в самом начале потока отбрасывается
    if (!bom_checked_ && pending_.size() > before) {
        bom_checked_ = true;
        if (encoding_ != Encoding::Ascii && pending_[0] == BYTE_ORDER_MARK) {
            pending_.erase(0, 1);
        }
    }
}

std::size_t TextReader::read(std::u32string& out, std::size_t max_chars) {
    while (available() < max_chars && !eof_) {
        fill();
    }

    std::size_t n = std::min(max_chars, available());
    out.append(pending_, pending_pos_, n);
    pending_pos_ += n;
    chars_read_ += n;

    if (pending_pos_ == pending_.size()) {
        pending_.clear();
        pending_pos_ = 0;
    }
    return n;
}

bool TextReader::at_end() {
    while (available() == 0 && !eof_) {
        fill();
    }
    return available() == 0;
}

}  // namespace guidscan::io
