// ==============================================================================
// portclean/parsers.hpp - Разбор вывода системных утилит
// ==============================================================================
//
// Назначение:
// - Каждый формат вывода (lsof, netstat POSIX/Windows, ps, tasklist)
//   разбирается отдельной чистой функцией: текст -> записи
// - Функции не запускают процессы и тестируются на фиксированном тексте
// - Некорректные строки пропускаются, исключения не бросаются
//
// ==============================================================================

#ifndef PORTCLEAN_PARSERS_HPP
#define PORTCLEAN_PARSERS_HPP

#include "portclean/ports.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace portclean::discovery {

// ----------------------------------------------------------------------------
// ProcessEntry
// ----------------------------------------------------------------------------

/// Имя команды, если его не удалось определить
constexpr const char* UNKNOWN_COMMAND = "unknown";

/// Процесс, занимающий порт. PID уникален в пределах результата для одного порта.
struct ProcessEntry {
    int pid = 0;
    std::string command;

    bool operator==(const ProcessEntry& other) const {
        return pid == other.pid && command == other.command;
    }
    bool operator!=(const ProcessEntry& other) const { return !(*this == other); }
};

// ----------------------------------------------------------------------------
// Текстовые примитивы
// ----------------------------------------------------------------------------

/// Разбить текст на строки по '\n' (пустые строки сохраняются, '\r' срезается)
std::vector<std::string> split_lines(std::string_view text);

/// Разбить строку по пробельным символам (пустые поля отбрасываются)
std::vector<std::string> split_whitespace(std::string_view line);

/// PID из поля утилиты: только десятичные цифры, положительное значение,
/// помещающееся в int. Переполнение и любой посторонний символ - nullopt.
std::optional<int> parse_pid(std::string_view field);

/// Порт из адреса: текст после последнего ':' ("0.0.0.0:3000", "[::]:3000")
std::optional<long> port_of_address(std::string_view address);

// ----------------------------------------------------------------------------
// Форматы утилит
// ----------------------------------------------------------------------------

/// lsof -i :<port> -n -P
///
/// Первая строка - заголовок; далее колонка 0 - COMMAND, колонка 1 - PID.
/// Строки с неположительным/нечисловым PID пропускаются, дубликаты PID
/// схлопываются (побеждает первое вхождение).
std::vector<ProcessEntry> parse_lsof_output(std::string_view output);

/// netstat -anp (Linux)
///
/// Первая строка пропускается. Строка подходит, если в ней >= 7 полей,
/// поле 5 == "LISTEN", поле 6 вида "<digits>/<name>", а порт в поле 3 равен
/// port. Возвращает PID без дубликатов в порядке появления.
std::vector<int> parse_netstat_posix(std::string_view output, ports::Port port);

/// netstat -ano (Windows)
///
/// Первые 4 строки (пустая, "Active Connections", пустая, заголовок)
/// пропускаются. Строка подходит, если в ней >= 5 полей, поле 3 ==
/// "LISTENING", порт в поле 1 равен port; PID берётся из поля 4.
std::vector<int> parse_netstat_windows(std::string_view output, ports::Port port);

/// ps -p <pid> -o comm=: имя команды или nullopt при пустом выводе
std::optional<std::string> parse_ps_comm(std::string_view output);

/// tasklist /FI "PID eq <pid>" /FO CSV
///
/// Вторая непустая строка (первая - заголовок), первое CSV-поле без кавычек.
/// nullopt, если строки нет (например "INFO: No tasks are running ...").
std::optional<std::string> parse_tasklist_image(std::string_view output);

}  // namespace portclean::discovery

#endif  // PORTCLEAN_PARSERS_HPP
