// ==============================================================================
// posix_backend.cpp - Поиск процессов на macOS / Linux
// ==============================================================================
//
// Порядок стратегий:
// 1. lsof -i :<port> -n -P (stderr подавлен)
// 2. только если lsof недоступен и только на Linux: netstat -anp + ps
//
// На macOS netstat не показывает PID, поэтому fallback не запускается вовсе.
//
// ==============================================================================

#include "portclean/discovery.hpp"

#include "portclean/output.hpp"

namespace portclean::discovery {

std::string lsof_command(ports::Port port) {
    return "lsof -i :" + std::to_string(port) + " -n -P";
}

std::string ps_command(int pid) {
    return "ps -p " + std::to_string(pid) + " -o comm=";
}

PosixBackend::PosixBackend(platform::OsFamily family, platform::CommandRunner& runner,
                           output::Writer& writer)
    : family_(family), runner_(runner), writer_(writer) {}

std::string PosixBackend::name() const {
    return fallback_enabled() ? "lsof/netstat" : "lsof";
}

std::vector<ProcessEntry> PosixBackend::find_processes(ports::Port port) {
    platform::CommandResult lsof = runner_.run(lsof_command(port));

    if (!platform::tool_missing(lsof)) {
        // lsof завершается с кодом 1, когда совпадений нет: это не сбой
        if (lsof.exit_code != 0) {
            writer_.debug("lsof exited with code " + std::to_string(lsof.exit_code) +
                          " for port " + std::to_string(port));
        }
        return parse_lsof_output(lsof.output);
    }

    writer_.debug("lsof is not available");

    if (!fallback_enabled()) {
        return {};
    }

    return find_with_netstat(port);
}

std::vector<ProcessEntry> PosixBackend::find_with_netstat(ports::Port port) {
    writer_.debug("falling back to netstat for port " + std::to_string(port));

    platform::CommandResult netstat = runner_.run(NETSTAT_POSIX_COMMAND);
    if (!netstat.succeeded()) {
        writer_.debug("netstat exited with code " + std::to_string(netstat.exit_code));
        return {};
    }

    std::vector<ProcessEntry> processes;
    for (int pid : parse_netstat_posix(netstat.output, port)) {
        processes.push_back(ProcessEntry{pid, resolve_command(pid)});
    }
    return processes;
}

std::string PosixBackend::resolve_command(int pid) {
    platform::CommandResult ps = runner_.run(ps_command(pid));
    if (!ps.succeeded()) {
        return UNKNOWN_COMMAND;
    }
    return parse_ps_comm(ps.output).value_or(UNKNOWN_COMMAND);
}

}  // namespace portclean::discovery
