// ==============================================================================
// portclean/ports.hpp - Разбор спецификаций портов
// ==============================================================================
//
// Назначение:
// - Токены "<n>" и "<n>-<m>" -> каноническое множество портов [1, 65535]
// - По одной ошибке на каждый отвергнутый токен, порядок токенов сохраняется
// - Чистая функция, без I/O, никогда не бросает исключений
//
// ==============================================================================

#ifndef PORTCLEAN_PORTS_HPP
#define PORTCLEAN_PORTS_HPP

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace portclean::ports {

using Port = std::uint16_t;

constexpr long MIN_PORT = 1;
constexpr long MAX_PORT = 65535;

// ----------------------------------------------------------------------------
// Результат разбора
// ----------------------------------------------------------------------------

struct PortParseResult {
    /// Без дубликатов, по возрастанию
    std::set<Port> ports;

    /// "Error: Invalid port <token>" / "Error: Invalid port range <token>"
    std::vector<std::string> errors;
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Нестрогий разбор целого числа
///
/// Пропускает ведущие пробелы, принимает необязательный знак, требует хотя бы
/// одну десятичную цифру и игнорирует всё после серии цифр:
/// "3000.5" -> 3000, " 0042" -> 42, "abc" -> nullopt, "" -> nullopt.
/// Все цифры учитываются; значения больше 100000000 насыщаются до него
/// (и затем отвергаются проверкой диапазона). Для PID не используется,
/// см. discovery::parse_pid.
std::optional<long> parse_int_loose(std::string_view text);

/// Проверка диапазона [1, 65535]
bool is_valid_port(long value);

/// Разобрать токены в каноническое множество портов
///
/// @param tokens Сырые токены командной строки
/// @return Множество портов и список ошибок (по одной на отвергнутый токен)
PortParseResult parse_ports(const std::vector<std::string>& tokens);

}  // namespace portclean::ports

#endif  // PORTCLEAN_PORTS_HPP
