// ==============================================================================
// portclean/config.hpp - YAML конфигурация
// ==============================================================================
//
// Назначение:
// - Необязательный YAML-файл со значениями по умолчанию для флагов CLI
// - Путь: --config <path>, иначе переменная окружения PORTCLEAN_CONFIG
// - Флаги командной строки накладываются поверх значений файла
//
// Пример:
//
//   force: false
//   all: true
//   default_answer: "yes"   # (Y/n)
//   verbose: 1
//
// ==============================================================================

#ifndef PORTCLEAN_CONFIG_HPP
#define PORTCLEAN_CONFIG_HPP

#include "portclean/prompt.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace portclean::config {

/// Имя переменной окружения с путём к файлу конфигурации
constexpr const char* CONFIG_ENV_VAR = "PORTCLEAN_CONFIG";

struct Config {
    bool force = false;
    bool all = false;
    confirm::ConfirmPolicy default_answer = confirm::ConfirmPolicy::DefaultNo;
    bool quiet = false;
    int verbose = 0;
    bool json = false;

    /// Ключи, которые не распознаны (для предупреждений)
    std::vector<std::string> unknown_keys;
};

/// Ошибка загрузки конфигурации
struct Error {
    std::string message;
    std::string path;

    /// "failed to load config '<path>' - <message>"
    std::string format() const;
};

struct ConfigResult {
    bool ok = false;
    Config config;
    Error error;

    explicit operator bool() const { return ok; }
};

/// Разобрать YAML из строки (path используется только в сообщениях об ошибке)
ConfigResult parse_config(const std::string& yaml, const std::string& path = "<string>");

/// Загрузить YAML-файл
ConfigResult load_config(const std::filesystem::path& path);

/// Путь из --config или PORTCLEAN_CONFIG; nullopt если не задан ни один
std::optional<std::filesystem::path> resolve_config_path(
    const std::optional<std::filesystem::path>& cli_path);

}  // namespace portclean::config

#endif  // PORTCLEAN_CONFIG_HPP
