// ==============================================================================
// portclean/cli.hpp - CLI парсинг
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 1)
//
// Слой CLI собственный: без сторонней библиотеки разбора аргументов.
//
// ==============================================================================

#ifndef PORTCLEAN_CLI_HPP
#define PORTCLEAN_CLI_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace portclean::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    bool quiet = false;                           // -q, --quiet
    int verbose = 0;                              // --verbose (repeatable)
    bool json = false;                            // --json
    std::optional<std::filesystem::path> config;  // --config <PATH>
};

// ----------------------------------------------------------------------------
// Команды
// ----------------------------------------------------------------------------

/// Основная команда: найти и завершить процессы на портах
struct KillCommand {
    std::vector<std::string> ports;  // позиционные токены "<n>" / "<n>-<m>"
    bool force = false;              // -f, --force
    bool all = false;                // -a, --all
};

/// --help
struct HelpCommand {};

/// --version
struct VersionCommand {};

using Command = std::variant<KillCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 1;
    std::string stderr_message;
};

// ----------------------------------------------------------------------------
// Результат парсинга
// ----------------------------------------------------------------------------

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Парсить аргументы командной строки
///
/// - "--" завершает разбор опций
/// - токен вида "-<digit>..." считается портом, а не опцией
/// - короткие флаги можно объединять: "-fa"
ParseResult parse(int argc, char** argv);

/// Текст --help
std::string render_help();

/// Текст --version: "portclean v1.0.0\n"
std::string render_version();

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

constexpr const char* PROGRAM = "portclean";
constexpr const char* VERSION = "1.0.0";
constexpr const char* ABOUT = "Kill processes using specific ports";

}  // namespace portclean::cli

#endif  // PORTCLEAN_CLI_HPP
