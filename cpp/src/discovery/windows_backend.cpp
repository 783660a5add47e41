// ==============================================================================
// windows_backend.cpp - Поиск процессов на Windows
// ==============================================================================
//
// netstat -ano -> PID слушающих сокетов, tasklist -> имя образа.
// Fallback нет: сбой netstat сообщается пользователю явно.
//
// ==============================================================================

#include "portclean/discovery.hpp"

#include "portclean/output.hpp"

namespace portclean::discovery {

std::string tasklist_command(int pid) {
    return "tasklist /FI \"PID eq " + std::to_string(pid) + "\" /FO CSV";
}

WindowsBackend::WindowsBackend(platform::CommandRunner& runner, output::Writer& writer)
    : runner_(runner), writer_(writer) {}

std::string WindowsBackend::name() const {
    return "netstat/tasklist";
}

std::vector<ProcessEntry> WindowsBackend::find_processes(ports::Port port) {
    platform::CommandResult netstat = runner_.run(NETSTAT_WINDOWS_COMMAND);

    if (!netstat.succeeded()) {
        std::string detail = netstat.launched
                                 ? "netstat exited with code " + std::to_string(netstat.exit_code)
                                 : std::string("netstat could not be started");
        writer_.error("Failed to get processes on port " + std::to_string(port) + ": " + detail);
        return {};
    }

    std::vector<ProcessEntry> processes;
    for (int pid : parse_netstat_windows(netstat.output, port)) {
        processes.push_back(ProcessEntry{pid, resolve_image(pid)});
    }
    return processes;
}

std::string WindowsBackend::resolve_image(int pid) {
    platform::CommandResult tasklist = runner_.run(tasklist_command(pid));
    if (!tasklist.succeeded()) {
        return UNKNOWN_COMMAND;
    }
    return parse_tasklist_image(tasklist.output).value_or(UNKNOWN_COMMAND);
}

}  // namespace portclean::discovery
