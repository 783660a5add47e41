// ==============================================================================
// killer.cpp - Принудительное завершение процесса
// ==============================================================================

#include "portclean/killer.hpp"

#include "portclean/output.hpp"

#include <cerrno>
#include <cstring>

#ifndef _WIN32
#include <csignal>
#include <sys/types.h>
#endif

namespace portclean::terminate {

namespace {

KillResult invalid_pid() {
    KillResult result;
    result.error_message = "Invalid PID";
    return result;
}

}  // namespace

std::string kill_command(int pid) {
    return "kill -9 " + std::to_string(pid);
}

std::string taskkill_command(int pid) {
    return "taskkill /PID " + std::to_string(pid) + " /F";
}

std::string kill_error_message(int err) {
    switch (err) {
    case EPERM:
        return "Permission denied";
    case ESRCH:
        return "No such process";
    case EINVAL:
        return "Invalid signal";
    default:
        return std::string(std::strerror(err)) + " (errno " + std::to_string(err) + ")";
    }
}

// ----------------------------------------------------------------------------
// PosixKiller
// ----------------------------------------------------------------------------

PosixKiller::PosixKiller(platform::CommandRunner& runner, output::Writer& writer)
    : runner_(runner), writer_(writer) {}

KillResult PosixKiller::kill_process(int pid) {
    if (pid <= 0) {
        return invalid_pid();
    }

    KillResult result;
    std::string direct_error;

#ifndef _WIN32
    if (::kill(static_cast<pid_t>(pid), SIGKILL) == 0) {
        result.success = true;
        return result;
    }
    direct_error = kill_error_message(errno);
#else
    direct_error = "signals are not available";
#endif

    writer_.debug("kill(" + std::to_string(pid) + ", SIGKILL) failed: " + direct_error +
                  ", falling back to kill -9");

    platform::CommandResult fallback = runner_.run(kill_command(pid));
    if (fallback.succeeded()) {
        result.success = true;
        return result;
    }

    result.error_message = direct_error;
    if (fallback.launched) {
        result.error_message += "; kill -9 exited with code " + std::to_string(fallback.exit_code);
    } else {
        result.error_message += "; kill -9 could not be started";
    }
    return result;
}

// ----------------------------------------------------------------------------
// WindowsKiller
// ----------------------------------------------------------------------------

WindowsKiller::WindowsKiller(platform::CommandRunner& runner) : runner_(runner) {}

KillResult WindowsKiller::kill_process(int pid) {
    if (pid <= 0) {
        return invalid_pid();
    }

    KillResult result;
    platform::CommandResult taskkill = runner_.run(taskkill_command(pid));
    if (taskkill.succeeded()) {
        result.success = true;
    } else if (taskkill.launched) {
        result.error_message = "taskkill exited with code " + std::to_string(taskkill.exit_code);
    } else {
        result.error_message = "taskkill could not be started";
    }
    return result;
}

// ----------------------------------------------------------------------------
// Фабрика
// ----------------------------------------------------------------------------

std::unique_ptr<ProcessKiller> make_killer(platform::OsFamily family,
                                           platform::CommandRunner& runner,
                                           output::Writer& writer) {
    switch (family) {
    case platform::OsFamily::Darwin:
    case platform::OsFamily::Linux:
        return std::make_unique<PosixKiller>(runner, writer);
    case platform::OsFamily::Windows:
        return std::make_unique<WindowsKiller>(runner);
    case platform::OsFamily::Unsupported:
    default:
        throw platform::UnsupportedPlatformError(platform::os_name());
    }
}

}  // namespace portclean::terminate
