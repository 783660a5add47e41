// ==============================================================================
// portclean/subprocess.hpp - Запуск внешних утилит
// ==============================================================================
//
// Назначение:
// - Узкий интерфейс "выполнить командную строку, вернуть статус и stdout"
// - stderr дочернего процесса всегда подавляется (перенаправляется в null
//   device), чтобы диагностика утилит не попадала к пользователю
// - Тесты подставляют свою реализацию CommandRunner вместо реального shell
//
// ==============================================================================

#ifndef PORTCLEAN_SUBPROCESS_HPP
#define PORTCLEAN_SUBPROCESS_HPP

#include <string>

namespace portclean::output {
class Writer;
}  // namespace portclean::output

namespace portclean::platform {

// ----------------------------------------------------------------------------
// CommandResult
// ----------------------------------------------------------------------------

/// Результат одного запуска внешней утилиты
struct CommandResult {
    bool launched = false;  // false: shell/процесс не удалось запустить
    int exit_code = -1;     // код возврата (128 + N при завершении сигналом N)
    std::string output;     // stdout целиком

    /// Код возврата 0
    bool succeeded() const { return launched && exit_code == 0; }
};

/// Утилита отсутствует (или не исполняема): процесс не запустился, либо
/// shell вернул 127/126 (POSIX) или 9009 (cmd.exe)
bool tool_missing(const CommandResult& result);

// ----------------------------------------------------------------------------
// CommandRunner
// ----------------------------------------------------------------------------

class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    /// Выполнить команду синхронно, без таймаута
    virtual CommandResult run(const std::string& command) = 0;
};

/// Реализация через popen()/_popen() системного shell
class ShellRunner : public CommandRunner {
public:
    /// writer опционален: при наличии каждая команда пишется в trace
    explicit ShellRunner(output::Writer* writer = nullptr);

    CommandResult run(const std::string& command) override;

private:
    output::Writer* writer_;
};

}  // namespace portclean::platform

#endif  // PORTCLEAN_SUBPROCESS_HPP
