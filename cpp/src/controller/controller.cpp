// ==============================================================================
// controller.cpp - Подтверждение и завершение процессов по портам
// ==============================================================================

#include "portclean/controller.hpp"

#include "portclean/output.hpp"
#include "portclean/platform.hpp"

#include <exception>
#include <rapidjson/document.h>

namespace portclean::controller {

const char* outcome_name(Outcome outcome) {
    switch (outcome) {
    case Outcome::Killed:
        return "killed";
    case Outcome::Failed:
        return "failed";
    case Outcome::Declined:
    default:
        return "declined";
    }
}

// ----------------------------------------------------------------------------
// PortController
// ----------------------------------------------------------------------------

PortController::PortController(discovery::Discoverer& discoverer, confirm::Prompter& prompter,
                               terminate::ProcessKiller& killer, output::Writer& writer,
                               RunOptions options)
    : discoverer_(discoverer),
      prompter_(prompter),
      killer_(killer),
      writer_(writer),
      options_(options) {}

std::vector<PortReport> PortController::run(const std::set<ports::Port>& ports) {
    std::vector<PortReport> reports;
    reports.reserve(ports.size());
    for (ports::Port port : ports) {
        reports.push_back(handle_port(port));
    }
    return reports;
}

PortReport PortController::handle_port(ports::Port port) {
    PortReport report;
    report.port = port;

    try {
        process_port(port, report);
    } catch (const std::exception& e) {
        writer_.error("Failed to handle port " + std::to_string(port) + ": " + e.what());
        report.error = e.what();
    }

    return report;
}

void PortController::process_port(ports::Port port, PortReport& report) {
    writer_.debug("Looking up processes on port " + std::to_string(port) + " (" +
                  discoverer_.backend().name() + ")");

    std::vector<discovery::ProcessEntry> processes = discoverer_.discover(port);

    if (processes.empty()) {
        writer_.yellow_line("No process found on port " + std::to_string(port));
        return;
    }

    print_processes(port, processes);

    if (options_.force) {
        for (const auto& process : processes) {
            report.processes.push_back(terminate_process(process));
        }
        return;
    }

    if (options_.all) {
        std::string question = "Kill all " + std::to_string(processes.size()) +
                               " process(es) on port " + std::to_string(port) + "?";
        bool confirmed = prompter_.confirm(question);
        for (const auto& process : processes) {
            report.processes.push_back(confirmed ? terminate_process(process) : declined(process));
        }
        return;
    }

    // По умолчанию: отдельный вопрос на каждый процесс, отказ не блокирует следующие
    for (const auto& process : processes) {
        std::string question = "Process " + std::to_string(process.pid) + " (" +
                               process.command + ") is using port " + std::to_string(port) +
                               ". Kill it?";
        if (prompter_.confirm(question)) {
            report.processes.push_back(terminate_process(process));
        } else {
            report.processes.push_back(declined(process));
        }
    }
}

void PortController::print_processes(ports::Port port,
                                     const std::vector<discovery::ProcessEntry>& processes) {
    output::Stream s = writer_.report_stream();
    writer_.write_line(s, "");
    writer_.cyan_line("Processes on port " + std::to_string(port) + ":");
    for (std::size_t i = 0; i < processes.size(); ++i) {
        writer_.write_line(s, "  " + std::to_string(i + 1) + ". PID " +
                                  std::to_string(processes[i].pid) + " (" +
                                  processes[i].command + ")");
    }
}

ProcessReport PortController::terminate_process(const discovery::ProcessEntry& process) {
    ProcessReport report;
    report.process = process;

    terminate::KillResult result = killer_.kill_process(process.pid);
    if (result.success) {
        report.outcome = Outcome::Killed;
        writer_.green_line(std::string(platform::success_mark()) + " Killed process " +
                           std::to_string(process.pid) + " (" + process.command + ")");
    } else {
        report.outcome = Outcome::Failed;
        report.detail = result.error_message;
        writer_.red_line(std::string(platform::failure_mark()) + " Failed to kill process " +
                         std::to_string(process.pid) + ": " + result.error_message);
    }
    return report;
}

ProcessReport PortController::declined(const discovery::ProcessEntry& process) {
    ProcessReport report;
    report.process = process;
    report.outcome = Outcome::Declined;
    return report;
}

// ----------------------------------------------------------------------------
// JSON отчёт
// ----------------------------------------------------------------------------

void build_json_report(rapidjson::Document& doc, const std::vector<std::string>& errors,
                       const std::vector<PortReport>& reports) {
    doc.SetObject();
    auto& alloc = doc.GetAllocator();

    rapidjson::Value errors_json(rapidjson::kArrayType);
    for (const auto& error : errors) {
        errors_json.PushBack(rapidjson::Value(error.c_str(), alloc), alloc);
    }
    doc.AddMember("errors", errors_json, alloc);

    rapidjson::Value ports_json(rapidjson::kArrayType);
    for (const auto& report : reports) {
        rapidjson::Value port_json(rapidjson::kObjectType);
        port_json.AddMember("port", static_cast<unsigned>(report.port), alloc);
        if (report.error.has_value()) {
            port_json.AddMember("error", rapidjson::Value(report.error->c_str(), alloc), alloc);
        }

        rapidjson::Value processes_json(rapidjson::kArrayType);
        for (const auto& process : report.processes) {
            rapidjson::Value process_json(rapidjson::kObjectType);
            process_json.AddMember("pid", process.process.pid, alloc);
            process_json.AddMember("command",
                                   rapidjson::Value(process.process.command.c_str(), alloc),
                                   alloc);
            process_json.AddMember("outcome", rapidjson::StringRef(outcome_name(process.outcome)),
                                   alloc);
            if (process.outcome == Outcome::Failed) {
                process_json.AddMember("detail", rapidjson::Value(process.detail.c_str(), alloc),
                                       alloc);
            }
            processes_json.PushBack(process_json, alloc);
        }
        port_json.AddMember("processes", processes_json, alloc);

        ports_json.PushBack(port_json, alloc);
    }
    doc.AddMember("ports", ports_json, alloc);
}

}  // namespace portclean::controller
