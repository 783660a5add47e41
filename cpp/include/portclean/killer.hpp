// ==============================================================================
// portclean/killer.hpp - Принудительное завершение процесса
// ==============================================================================
//
// Назначение:
// - ProcessKiller: "убить PID", результат сообщается, но никогда не фатален
//   - PosixKiller: kill(pid, SIGKILL), при неудаче fallback `kill -9 <pid>`
//   - WindowsKiller: `taskkill /PID <pid> /F`, fallback нет
// - Убивается только найденный PID, без дерева потомков
//
// ==============================================================================

#ifndef PORTCLEAN_KILLER_HPP
#define PORTCLEAN_KILLER_HPP

#include "portclean/platform.hpp"
#include "portclean/subprocess.hpp"

#include <memory>
#include <string>

namespace portclean::output {
class Writer;
}  // namespace portclean::output

namespace portclean::terminate {

struct KillResult {
    bool success = false;
    std::string error_message;
};

class ProcessKiller {
public:
    virtual ~ProcessKiller() = default;

    virtual KillResult kill_process(int pid) = 0;
};

class PosixKiller : public ProcessKiller {
public:
    PosixKiller(platform::CommandRunner& runner, output::Writer& writer);

    KillResult kill_process(int pid) override;

private:
    platform::CommandRunner& runner_;
    output::Writer& writer_;
};

class WindowsKiller : public ProcessKiller {
public:
    explicit WindowsKiller(platform::CommandRunner& runner);

    KillResult kill_process(int pid) override;

private:
    platform::CommandRunner& runner_;
};

/// "kill -9 <pid>"
std::string kill_command(int pid);

/// "taskkill /PID <pid> /F"
std::string taskkill_command(int pid);

/// Текст ошибки для errno сигнала
std::string kill_error_message(int err);

/// @throws platform::UnsupportedPlatformError для OsFamily::Unsupported
std::unique_ptr<ProcessKiller> make_killer(platform::OsFamily family,
                                           platform::CommandRunner& runner,
                                           output::Writer& writer);

}  // namespace portclean::terminate

#endif  // PORTCLEAN_KILLER_HPP
