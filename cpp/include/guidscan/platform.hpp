// ==============================================================================
// guidscan/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Преобразования std::filesystem::path <-> UTF-8
// - Определение TTY для цветного вывода
//
// Платформенная специфика изолирована здесь, остальные модули
// работают только с UTF-8 строками и std::filesystem::path.
//
// ==============================================================================

#ifndef GUIDSCAN_PLATFORM_HPP
#define GUIDSCAN_PLATFORM_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace guidscan::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

/// Построить path из UTF-8 строки (argv, YAML)
std::filesystem::path path_from_utf8(std::string_view u8str);

/// Получить UTF-8 представление пути для вывода
std::string path_to_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

}  // namespace guidscan::platform

#endif  // GUIDSCAN_PLATFORM_HPP
