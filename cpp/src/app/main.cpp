// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// 1. Парсинг argv (cli)
// 2. Загрузка YAML конфигурации (config), флаги CLI поверх файла
// 3. Создание Writer (output)
// 4. Разбор портов, выбор стратегии поиска и завершения по ОС
// 5. Обработка портов по возрастанию (controller)
// 6. Возврат exit code
//
// Исключения перехватываются только здесь, на границе приложения.
//
// ==============================================================================

#include "portclean/cli.hpp"
#include "portclean/config.hpp"
#include "portclean/controller.hpp"
#include "portclean/discovery.hpp"
#include "portclean/killer.hpp"
#include "portclean/output.hpp"
#include "portclean/platform.hpp"
#include "portclean/ports.hpp"
#include "portclean/prompt.hpp"
#include "portclean/subprocess.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <memory>
#include <rapidjson/document.h>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace {

// ----------------------------------------------------------------------------
// Основная команда
// ----------------------------------------------------------------------------

int run_kill(const portclean::cli::KillCommand& cmd, const portclean::config::Config& cfg,
             portclean::output::Writer& writer) {
    using namespace portclean;

    // Ошибочные токены не прерывают разбор остальных
    ports::PortParseResult parsed = ports::parse_ports(cmd.ports);
    for (const auto& error : parsed.errors) {
        writer.red_line(error);
    }
    if (parsed.ports.empty()) {
        return 1;
    }

    // Семейство ОС определяется один раз; неподдерживаемая ОС - фатальная ошибка
    platform::OsFamily family = platform::host_os_family();
    writer.debug("Platform: " + platform::os_name());

    platform::ShellRunner runner(&writer);
    discovery::Discoverer discoverer(discovery::make_backend(family, runner, writer), writer);
    std::unique_ptr<terminate::ProcessKiller> killer =
        terminate::make_killer(family, runner, writer);
    confirm::ConsolePrompter prompter(std::cin, writer, cfg.default_answer);

    controller::RunOptions options;
    options.force = cmd.force || cfg.force;
    options.all = cmd.all || cfg.all;

    writer.info("Checking " + std::to_string(parsed.ports.size()) + " port(s)");

    controller::PortController port_controller(discoverer, prompter, *killer, writer, options);
    std::vector<controller::PortReport> reports = port_controller.run(parsed.ports);

    if (writer.config().json) {
        rapidjson::Document doc;
        controller::build_json_report(doc, parsed.errors, reports);
        writer.write_json_pretty(doc);
    }

    return 0;
}

// ----------------------------------------------------------------------------
// Главная функция выполнения (run)
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    using namespace portclean;

    // 1. Парсинг argv
    cli::ParseResult parse_result = cli::parse(argc, argv);

    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    out_cfg.json = parse_result.global.json;

    // 2. Ошибки парсинга: сообщение без префикса [x], напрямую в stderr
    if (!parse_result.ok) {
        output::Writer writer(out_cfg);
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    if (std::holds_alternative<cli::HelpCommand>(parse_result.command)) {
        output::Writer writer(out_cfg);
        writer.write(output::Stream::Stdout, cli::render_help());
        return 0;
    }
    if (std::holds_alternative<cli::VersionCommand>(parse_result.command)) {
        output::Writer writer(out_cfg);
        writer.write(output::Stream::Stdout, cli::render_version());
        return 0;
    }

    // 3. Конфигурация
    config::Config cfg;
    if (auto path = config::resolve_config_path(parse_result.global.config)) {
        config::ConfigResult loaded = config::load_config(*path);
        if (!loaded.ok) {
            output::Writer writer(out_cfg);
            writer.error(loaded.error.format());
            return 1;
        }
        cfg = std::move(loaded.config);
    }

    out_cfg.quiet = out_cfg.quiet || cfg.quiet;
    out_cfg.verbose = std::max(out_cfg.verbose, cfg.verbose);
    out_cfg.json = out_cfg.json || cfg.json;
    output::Writer writer(out_cfg);

    for (const auto& key : cfg.unknown_keys) {
        writer.warn("ignoring unknown config key '" + key + "'");
    }

    // 4. Основная команда: help/version обработаны выше
    return run_kill(std::get<cli::KillCommand>(parse_result.command), cfg, writer);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        // Фатальные ошибки (например, неподдерживаемая платформа): "[x] <err>"
        std::cerr << portclean::output::format_error(e.what());
        return 1;
    } catch (...) {
        std::cerr << "[x] Unknown error occurred\n";
        return 1;
    }
}
