// ==============================================================================
// subprocess.cpp - Запуск внешних утилит через popen
// ==============================================================================

#include "portclean/subprocess.hpp"

#include "portclean/output.hpp"
#include "portclean/platform.hpp"

#include <array>
#include <cstdio>
#include <memory>

#ifndef _WIN32
#include <sys/wait.h>
#endif

namespace portclean::platform {

namespace {

#ifdef _WIN32
FILE* open_pipe(const char* command) {
    return _popen(command, "r");
}

int close_pipe(FILE* pipe) {
    return _pclose(pipe);
}
#else
FILE* open_pipe(const char* command) {
    return popen(command, "r");
}

int close_pipe(FILE* pipe) {
    return pclose(pipe);
}
#endif

/// Статус pclose -> код возврата
int decode_status(int status) {
#ifdef _WIN32
    // _pclose возвращает код возврата напрямую
    return status;
#else
    if (status == -1) {
        return -1;
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
#endif
}

struct PipeCloser {
    int* status;
    void operator()(FILE* pipe) const { *status = close_pipe(pipe); }
};

}  // namespace

bool tool_missing(const CommandResult& result) {
    if (!result.launched) {
        return true;
    }
    return result.exit_code == 127 || result.exit_code == 126 || result.exit_code == 9009;
}

ShellRunner::ShellRunner(output::Writer* writer) : writer_(writer) {}

CommandResult ShellRunner::run(const std::string& command) {
    CommandResult result;

    // stderr утилиты -> null device
    std::string full_command = command + " 2>" + null_device();

    if (writer_ != nullptr) {
        writer_->trace("exec: " + full_command);
    }

    // Пользовательский вывод должен уйти раньше, чем дочерний процесс
    std::fflush(nullptr);

    int status = -1;
    {
        std::unique_ptr<FILE, PipeCloser> pipe(open_pipe(full_command.c_str()),
                                               PipeCloser{&status});
        if (!pipe) {
            return result;
        }

        std::array<char, 256> buffer;
        while (std::fgets(buffer.data(), static_cast<int>(buffer.size()), pipe.get()) !=
               nullptr) {
            result.output += buffer.data();
        }
    }

    result.exit_code = decode_status(status);
    result.launched = result.exit_code != -1;

    if (writer_ != nullptr) {
        writer_->trace("exit: " + std::to_string(result.exit_code) + " (" +
                       std::to_string(result.output.size()) + " bytes)");
    }

    return result;
}

}  // namespace portclean::platform
