// ==============================================================================
// test_killer_gtest.cpp - Тесты завершения процессов (GoogleTest)
// ==============================================================================

#include "portclean/killer.hpp"
#include "portclean/output.hpp"
#include "portclean/platform.hpp"

#include <cerrno>
#include <gtest/gtest.h>
#include <string>
#include <vector>

#ifndef _WIN32
#include <csignal>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace portclean::terminate::test {

namespace {

/// Отвечает одним и тем же результатом на любую команду
class ScriptedRunner : public platform::CommandRunner {
public:
    explicit ScriptedRunner(platform::CommandResult result) : result_(result) {}

    platform::CommandResult run(const std::string& command) override {
        calls.push_back(command);
        return result_;
    }

    std::vector<std::string> calls;

private:
    platform::CommandResult result_;
};

platform::CommandResult exited(int code) {
    platform::CommandResult result;
    result.launched = true;
    result.exit_code = code;
    return result;
}

#ifndef _WIN32
// PID, которого заведомо нет (больше pid_max на Linux и macOS)
constexpr int ABSENT_PID = 2147480000;
#endif

}  // namespace

// ==============================================================================
// Командные строки и сообщения
// ==============================================================================

TEST(KillerTest, CommandLines) {
    EXPECT_EQ(kill_command(1234), "kill -9 1234");
    EXPECT_EQ(taskkill_command(1234), "taskkill /PID 1234 /F");
}

TEST(KillerTest, ErrorMessages) {
    EXPECT_EQ(kill_error_message(EPERM), "Permission denied");
    EXPECT_EQ(kill_error_message(ESRCH), "No such process");
    EXPECT_EQ(kill_error_message(EINVAL), "Invalid signal");
}

// ==============================================================================
// WindowsKiller
// ==============================================================================

TEST(KillerTest, Windows_TaskkillSuccess) {
    // Arrange
    ScriptedRunner runner(exited(0));
    WindowsKiller killer(runner);

    // Act
    KillResult result = killer.kill_process(4242);

    // Assert
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.error_message.empty());
    EXPECT_EQ(runner.calls, (std::vector<std::string>{"taskkill /PID 4242 /F"}));
}

TEST(KillerTest, Windows_TaskkillFailure) {
    ScriptedRunner runner(exited(128));
    WindowsKiller killer(runner);

    KillResult result = killer.kill_process(4242);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_message, "taskkill exited with code 128");
}

TEST(KillerTest, Windows_TaskkillNotStarted) {
    ScriptedRunner runner(platform::CommandResult{});
    WindowsKiller killer(runner);

    KillResult result = killer.kill_process(4242);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_message, "taskkill could not be started");
}

// ==============================================================================
// Некорректный PID
// ==============================================================================

TEST(KillerTest, InvalidPid_IsRejectedWithoutRunningAnything) {
    ScriptedRunner runner(exited(0));
    output::Writer writer(output::OutputConfig{});
    PosixKiller posix(runner, writer);
    WindowsKiller windows(runner);

    KillResult posix_result = posix.kill_process(0);
    KillResult windows_result = windows.kill_process(-5);

    EXPECT_FALSE(posix_result.success);
    EXPECT_EQ(posix_result.error_message, "Invalid PID");
    EXPECT_FALSE(windows_result.success);
    EXPECT_EQ(windows_result.error_message, "Invalid PID");
    EXPECT_TRUE(runner.calls.empty());
}

// ==============================================================================
// PosixKiller
// ==============================================================================

#ifndef _WIN32

TEST(KillerTest, Posix_AbsentPid_FallbackFailureReportsBoth) {
    // Arrange
    ScriptedRunner runner(exited(1));
    output::Writer writer(output::OutputConfig{});
    PosixKiller killer(runner, writer);

    // Act
    KillResult result = killer.kill_process(ABSENT_PID);

    // Assert
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_message, "No such process; kill -9 exited with code 1");
    EXPECT_EQ(runner.calls, (std::vector<std::string>{kill_command(ABSENT_PID)}));
}

TEST(KillerTest, Posix_FallbackSuccess) {
    ScriptedRunner runner(exited(0));
    output::Writer writer(output::OutputConfig{});
    PosixKiller killer(runner, writer);

    KillResult result = killer.kill_process(ABSENT_PID);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(runner.calls.size(), 1u);
}

TEST(KillerTest, Posix_FallbackNotStarted) {
    ScriptedRunner runner(platform::CommandResult{});
    output::Writer writer(output::OutputConfig{});
    PosixKiller killer(runner, writer);

    KillResult result = killer.kill_process(ABSENT_PID);

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_message, "No such process; kill -9 could not be started");
}

TEST(KillerTest, Posix_KillsRealChildProcess) {
    // Arrange: дочерний процесс, который ждёт сигнала
    pid_t child = fork();
    ASSERT_NE(child, -1);
    if (child == 0) {
        for (;;) {
            pause();
        }
    }

    ScriptedRunner runner(exited(1));
    output::Writer writer(output::OutputConfig{});
    PosixKiller killer(runner, writer);

    // Act
    KillResult result = killer.kill_process(static_cast<int>(child));

    // Assert
    int status = 0;
    ASSERT_EQ(waitpid(child, &status, 0), child);
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(runner.calls.empty());
    EXPECT_TRUE(WIFSIGNALED(status));
    EXPECT_EQ(WTERMSIG(status), SIGKILL);
}

#endif  // _WIN32

// ==============================================================================
// make_killer
// ==============================================================================

TEST(KillerTest, MakeKiller_UnsupportedThrows) {
    ScriptedRunner runner(exited(0));
    output::Writer writer(output::OutputConfig{});

    EXPECT_THROW(make_killer(platform::OsFamily::Unsupported, runner, writer),
                 platform::UnsupportedPlatformError);
}

TEST(KillerTest, MakeKiller_WindowsUsesTaskkill) {
    ScriptedRunner runner(exited(0));
    output::Writer writer(output::OutputConfig{});

    auto killer = make_killer(platform::OsFamily::Windows, runner, writer);
    KillResult result = killer->kill_process(7);

    EXPECT_TRUE(result.success);
    EXPECT_EQ(runner.calls, (std::vector<std::string>{"taskkill /PID 7 /F"}));
}

}  // namespace portclean::terminate::test
