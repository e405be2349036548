// ==============================================================================
// mitigator/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Преобразования std::filesystem::path <-> UTF-8
// - Определение TTY для цветного вывода
// - Локальное время (localtime_r / localtime_s)
// - Платформозависимые символы вывода
//
// Вся платформенная специфика изолирована в этом модуле.
//
// ==============================================================================

#ifndef MITIGATOR_PLATFORM_HPP
#define MITIGATOR_PLATFORM_HPP

#include <ctime>
#include <filesystem>
#include <string>
#include <string_view>

namespace mitigator::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

/// Создать путь из UTF-8 строки
std::filesystem::path path_from_utf8(std::string_view u8str);

/// Получить UTF-8 представление пути
std::string path_to_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Время
// ----------------------------------------------------------------------------

/// Потокобезопасное преобразование в локальное время
std::tm local_time(std::time_t t);

// ----------------------------------------------------------------------------
// Символы вывода
// ----------------------------------------------------------------------------

/// Маркер пункта списка рекомендаций ("‣" на Unix, "+" на Windows)
const char* list_prefix();

/// Имя ОС: "Windows", "macOS", "Linux" или "Unknown"
std::string os_name();

}  // namespace mitigator::platform

#endif  // MITIGATOR_PLATFORM_HPP
