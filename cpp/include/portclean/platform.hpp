// ==============================================================================
// portclean/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Определение семейства ОС хоста (один раз, на старте)
// - TTY detection для цветного вывода
// - Платформенные константы (маркеры успеха/ошибки, null device)
// - Запуск внешних утилит (CommandRunner)
//
// Вся платформенная специфика (#ifdef _WIN32 и т.п.) изолирована здесь и в
// platform.cpp / subprocess.cpp.
//
// ==============================================================================

#ifndef PORTCLEAN_PLATFORM_HPP
#define PORTCLEAN_PLATFORM_HPP

#include <stdexcept>
#include <string>

namespace portclean::platform {

// ----------------------------------------------------------------------------
// Семейство ОС
// ----------------------------------------------------------------------------

/// Семейства ОС, для которых существует стратегия поиска процессов
enum class OsFamily {
    Darwin,      // POSIX-A: netstat без колонки PID, fallback невозможен
    Linux,       // POSIX-B: netstat -anp отдаёт PID/Program name
    Windows,     // netstat -ano + tasklist
    Unsupported  // любая другая ОС
};

/// Ошибка: для ОС нет ни одной стратегии поиска процессов (фатальная)
class UnsupportedPlatformError : public std::runtime_error {
public:
    explicit UnsupportedPlatformError(const std::string& os)
        : std::runtime_error("Unsupported platform: " + os) {}
};

/// Семейство ОС, под которое собран бинарник
OsFamily host_os_family();

/// Человекочитаемое имя семейства: "macOS", "Linux", "Windows", "Unknown"
std::string os_family_name(OsFamily family);

/// Имя ОС хоста (для диагностики)
std::string os_name();

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Платформенные константы
// ----------------------------------------------------------------------------

/// Маркер успешного завершения процесса ("✓", на Windows "+")
const char* success_mark();

/// Маркер неудачи ("✗", на Windows "x")
const char* failure_mark();

/// Путь к null device для подавления stderr дочерних процессов
const char* null_device();

}  // namespace portclean::platform

#endif  // PORTCLEAN_PLATFORM_HPP
