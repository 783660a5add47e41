// ==============================================================================
// portclean/output.hpp - Пользовательский вывод
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Диагностика с префиксами [+] [!] [x] [*] [~]
// - Цветной вывод (ANSI escape codes) только на TTY
// - JSON вывод (RapidJSON)
//
// Правило: только этот модуль пишет в stdout/stderr.
//
// ==============================================================================

#ifndef PORTCLEAN_OUTPUT_HPP
#define PORTCLEAN_OUTPUT_HPP

#include <cstdio>
#include <string>
#include <string_view>

// Forward declarations для RapidJSON
namespace rapidjson {
class CrtAllocator;
template <typename BaseAllocator>
class MemoryPoolAllocator;
template <typename Encoding, typename Allocator>
class GenericValue;
template <typename CharType>
struct UTF8;
using Value = GenericValue<UTF8<char>, MemoryPoolAllocator<CrtAllocator>>;
}  // namespace rapidjson

namespace portclean::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// ANSI цвета для терминала
// ----------------------------------------------------------------------------

enum class Color {
    Default,
    Green,   // Успех
    Yellow,  // Предупреждения, "ничего не найдено"
    Red,     // Ошибки
    Cyan,    // Заголовки отчёта
    Magenta  // Трассировка
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;  // -q: подавить informational stderr
    int verbose = 0;     // --verbose: уровень подробности (0..2+)
    bool json = false;   // --json: stdout занят JSON-отчётом
};

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    // Базовый вывод
    // -------------------------------------------------------------------------

    /// Записать байты в поток
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    /// Поток для человекочитаемого отчёта: stdout, а в JSON режиме stderr
    Stream report_stream() const { return config_.json ? Stream::Stderr : Stream::Stdout; }

    // Сообщения с префиксами
    // -------------------------------------------------------------------------

    /// "[+] <message>" в stderr (если не quiet)
    void info(std::string_view message);

    /// "[!] <message>" в stderr (если не quiet)
    void warn(std::string_view message);

    /// "[x] <message>" в stderr (всегда)
    void error(std::string_view message);

    /// "[*] <message>" в stderr (только при verbose > 0)
    void debug(std::string_view message);

    /// "[~] <message>" в stderr (только при verbose > 1)
    void trace(std::string_view message);

    // Цветной вывод
    // -------------------------------------------------------------------------

    /// Зелёная строка в поток отчёта
    void green_line(std::string_view message);

    /// Жёлтая строка в поток отчёта
    void yellow_line(std::string_view message);

    /// Голубая строка в поток отчёта
    void cyan_line(std::string_view message);

    /// Красная строка в stderr (всегда)
    void red_line(std::string_view message);

    // JSON вывод
    // -------------------------------------------------------------------------

    /// Записать pretty JSON (с отступами) + newline
    void write_json_pretty(const rapidjson::Value& value);

    // Управление
    // -------------------------------------------------------------------------

    /// Сбросить буферы
    void flush();

    /// Получить текущую конфигурацию
    const OutputConfig& config() const { return config_; }

private:
    /// Записать строку заданным цветом (цвет только на TTY)
    void colored_line(Stream s, std::string_view message, Color color);

    /// Записать с цветом
    void write_colored(Stream s, std::string_view message, Color color);

    /// Записать строку с цветным префиксом
    void write_prefixed(std::string_view prefix, Color color, std::string_view message);

    /// Получить FILE* для потока
    FILE* get_file(Stream s) const;

    OutputConfig config_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Форматирует сообщение об ошибке: "[x] <message>\n"
std::string format_error(std::string_view message);

/// Получить ANSI escape code для цвета
std::string ansi_color_code(Color color);

/// Проверить, поддерживает ли поток цвета (TTY check)
bool supports_color(Stream s);

}  // namespace portclean::output

#endif  // PORTCLEAN_OUTPUT_HPP
