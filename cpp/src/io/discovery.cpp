// ==============================================================================
// discovery.cpp - Поиск входных файлов
// ==============================================================================

#include "guidscan/discovery.hpp"

#include "guidscan/platform.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

namespace guidscan::io {

namespace {

/// Ошибка обхода: предупреждение при skip_errors, иначе исключение
void report(const std::string& message, bool skip_errors, DiscoveryResult& out) {
    if (skip_errors) {
        out.warnings.push_back(message);
        return;
    }
    throw std::runtime_error(message);
}

/// Рекурсивно собрать файлы директории (depth-first)
void collect_files_recursive(const std::filesystem::path& path, const DiscoveryOptions& opt,
                             std::vector<std::filesystem::path>& files, DiscoveryResult& out) {
    std::error_code ec;
    std::filesystem::file_status status = std::filesystem::status(path, ec);
    if (ec) {
        report("failed to get metadata for '" + platform::path_to_utf8(path) + "' - " +
                   ec.message(),
               opt.skip_errors, out);
        return;
    }

    if (std::filesystem::is_directory(status)) {
        std::filesystem::directory_iterator dir_iter(path, ec);
        if (ec) {
            report("failed to read directory '" + platform::path_to_utf8(path) + "' - " +
                       ec.message(),
                   opt.skip_errors, out);
            return;
        }

        for (auto it = dir_iter; it != std::filesystem::directory_iterator(); it.increment(ec)) {
            collect_files_recursive(it->path(), opt, files, out);
        }
        if (ec) {
            report("failed to enter directory '" + platform::path_to_utf8(path) + "' - " +
                       ec.message(),
                   opt.skip_errors, out);
        }
    } else if (std::filesystem::is_regular_file(status)) {
        if (matches_extensions(path, opt.extensions)) {
            files.push_back(path);
        }
    }
    // Symlink на несуществующий путь, сокеты и т.п. игнорируются
}

}  // anonymous namespace

bool matches_extensions(const std::filesystem::path& file_path,
                        const std::optional<std::unordered_set<std::string>>& extensions) {
    if (!extensions.has_value()) {
        return true;
    }
    if (!file_path.has_extension()) {
        return false;
    }

    std::string ext = platform::path_to_utf8(file_path.extension());
    if (!ext.empty() && ext[0] == '.') {
        ext = ext.substr(1);
    }
    return extensions->count(ext) > 0;
}

DiscoveryResult discover_files(const std::vector<std::filesystem::path>& inputs,
                               const DiscoveryOptions& opt) {
    DiscoveryResult result;

    for (const auto& input : inputs) {
        std::error_code ec;
        if (!opt.recursive || !std::filesystem::is_directory(input, ec)) {
            result.files.push_back(input);
            continue;
        }

        std::vector<std::filesystem::path> files;
        collect_files_recursive(input, opt, files, result);

        // Порядок directory_iterator зависит от ОС
        std::sort(files.begin(), files.end());
        result.files.insert(result.files.end(), files.begin(), files.end());
    }

    return result;
}

}  // namespace guidscan::io
