// ==============================================================================
// portclean/controller.hpp - Подтверждение и завершение процессов по портам
// ==============================================================================
//
// Назначение:
// - Машина состояний на порт: Discover -> Report -> {NoneFound | Confirm* ->
//   Act} -> Done
// - Режимы подтверждения: force (без вопросов), all (один вопрос на порт),
//   по умолчанию (вопрос на каждый процесс)
// - Исключение при обработке порта перехватывается на границе порта и не
//   прерывает обработку остальных портов
// - JSON-отчёт о прогоне (RapidJSON)
//
// ==============================================================================

#ifndef PORTCLEAN_CONTROLLER_HPP
#define PORTCLEAN_CONTROLLER_HPP

#include "portclean/discovery.hpp"
#include "portclean/killer.hpp"
#include "portclean/ports.hpp"
#include "portclean/prompt.hpp"

#include <optional>
#include <rapidjson/fwd.h>
#include <set>
#include <string>
#include <vector>

namespace portclean::output {
class Writer;
}  // namespace portclean::output

namespace portclean::controller {

// ----------------------------------------------------------------------------
// Опции прогона (только чтение на всё время прогона)
// ----------------------------------------------------------------------------

struct RunOptions {
    bool force = false;  // -f: без подтверждений
    bool all = false;    // -a: одно подтверждение на порт
};

// ----------------------------------------------------------------------------
// Отчёт
// ----------------------------------------------------------------------------

enum class Outcome { Killed, Failed, Declined };

/// "killed" / "failed" / "declined"
const char* outcome_name(Outcome outcome);

struct ProcessReport {
    discovery::ProcessEntry process;
    Outcome outcome = Outcome::Declined;
    std::string detail;  // только для Failed
};

struct PortReport {
    ports::Port port = 0;
    std::vector<ProcessReport> processes;
    std::optional<std::string> error;  // обработка порта завершилась исключением
};

// ----------------------------------------------------------------------------
// PortController
// ----------------------------------------------------------------------------

class PortController {
public:
    PortController(discovery::Discoverer& discoverer, confirm::Prompter& prompter,
                   terminate::ProcessKiller& killer, output::Writer& writer,
                   RunOptions options);

    /// Обработать один порт. Не бросает: сбой фиксируется в PortReport::error.
    PortReport handle_port(ports::Port port);

    /// Обработать порты последовательно, по возрастанию
    std::vector<PortReport> run(const std::set<ports::Port>& ports);

private:
    void process_port(ports::Port port, PortReport& report);
    void print_processes(ports::Port port, const std::vector<discovery::ProcessEntry>& processes);
    ProcessReport terminate_process(const discovery::ProcessEntry& process);
    static ProcessReport declined(const discovery::ProcessEntry& process);

    discovery::Discoverer& discoverer_;
    confirm::Prompter& prompter_;
    terminate::ProcessKiller& killer_;
    output::Writer& writer_;
    RunOptions options_;
};

// ----------------------------------------------------------------------------
// JSON отчёт
// ----------------------------------------------------------------------------

/// Заполнить doc объектом {"errors": [...], "ports": [...]}
void build_json_report(rapidjson::Document& doc, const std::vector<std::string>& errors,
                       const std::vector<PortReport>& reports);

}  // namespace portclean::controller

#endif  // PORTCLEAN_CONTROLLER_HPP
