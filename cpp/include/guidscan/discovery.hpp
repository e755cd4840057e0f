// ==============================================================================
// guidscan/discovery.hpp - Поиск входных файлов
// ==============================================================================
//
// Назначение:
// - Разворачивание директорий в список файлов (режим recursive)
// - Фильтрация по расширениям внутри директорий
// - Детерминированный порядок (сортировка файлов каждой директории)
//
// Явно указанные пути передаются как есть, даже если их нет: об ошибке
// открытия сообщает сканер (PathNotFound / NotAFile).
//
// ==============================================================================

#ifndef GUIDSCAN_DISCOVERY_HPP
#define GUIDSCAN_DISCOVERY_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace guidscan::io {

struct DiscoveryOptions {
    /// Допустимые расширения без точки ("txt", не ".txt"), case-sensitive
    /// nullopt означает все файлы
    std::optional<std::unordered_set<std::string>> extensions;

    /// Ошибки обхода превращаются в предупреждения
    bool skip_errors = false;

    /// Разворачивать директории рекурсивно
    bool recursive = false;
};

struct DiscoveryResult {
    std::vector<std::filesystem::path> files;
    std::vector<std::string> warnings;  // только при skip_errors
};

/// Собрать список файлов для сканирования
///
/// - Файл или несуществующий путь: добавляется без изменений
/// - Директория без recursive: добавляется без изменений
/// - Директория с recursive: все обычные файлы поддерева с подходящим
///   расширением, отсортированные по пути
///
/// @throws std::runtime_error при ошибке обхода (если skip_errors=false)
DiscoveryResult discover_files(const std::vector<std::filesystem::path>& inputs,
                               const DiscoveryOptions& opt);

/// Проверить расширение файла по набору (без точки)
bool matches_extensions(const std::filesystem::path& file_path,
                        const std::optional<std::unordered_set<std::string>>& extensions);

}  // namespace guidscan::io

#endif  // GUIDSCAN_DISCOVERY_HPP
