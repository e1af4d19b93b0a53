// ==============================================================================
// reghive/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Преобразования std::filesystem::path <-> UTF-8
// - Чтение файлов целиком в память
// - Определение TTY для цветного вывода
// - Временные файлы (для тестов и CLI)
//
// Платформенная специфика изолирована здесь.
//
// ==============================================================================

#ifndef REGHIVE_PLATFORM_HPP
#define REGHIVE_PLATFORM_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace reghive::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

/// Построить path из UTF-8 строки
std::filesystem::path path_from_utf8(std::string_view u8str);

/// Получить UTF-8 представление path
std::string path_to_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// Файлы
// ----------------------------------------------------------------------------

/// Прочитать файл целиком
/// @return содержимое файла или nullopt, если файл не удалось открыть
std::optional<std::vector<std::uint8_t>> read_file_bytes(const std::filesystem::path& path);

/// Записать байты в файл (перезаписывает)
bool write_file_bytes(const std::filesystem::path& path, const std::vector<std::uint8_t>& bytes);

/// Создать пустой временный файл и вернуть его путь
/// @throws std::runtime_error если файл не удалось создать
std::filesystem::path make_temp_file(std::string_view prefix);

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

/// Имя операционной системы ("Linux", "Windows", "macOS")
std::string os_name();

}  // namespace reghive::platform

#endif  // REGHIVE_PLATFORM_HPP
