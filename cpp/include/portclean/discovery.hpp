// ==============================================================================
// portclean/discovery.hpp - Поиск процессов, занимающих порт
// ==============================================================================
//
// Назначение:
// - DiscoveryBackend: платформенная стратегия "порт -> процессы"
//   - PosixBackend: lsof, fallback netstat -anp + ps (только Linux)
//   - WindowsBackend: netstat -ano + tasklist
// - make_backend(): выбор стратегии по OsFamily, один раз на старте
// - Discoverer: оркестратор, превращает любые сбои поиска в пустой результат
//
// Пустой результат - не ошибка: отсутствие процесса и неудачная проба для
// вызывающего неразличимы, пакетная обработка портов не прерывается.
//
// ==============================================================================

#ifndef PORTCLEAN_DISCOVERY_HPP
#define PORTCLEAN_DISCOVERY_HPP

#include "portclean/parsers.hpp"
#include "portclean/platform.hpp"
#include "portclean/ports.hpp"
#include "portclean/subprocess.hpp"

#include <memory>
#include <string>
#include <vector>

namespace portclean::output {
class Writer;
}  // namespace portclean::output

namespace portclean::discovery {

// ----------------------------------------------------------------------------
// Командные строки утилит
// ----------------------------------------------------------------------------

constexpr const char* NETSTAT_POSIX_COMMAND = "netstat -anp";
constexpr const char* NETSTAT_WINDOWS_COMMAND = "netstat -ano";

/// "lsof -i :<port> -n -P"
std::string lsof_command(ports::Port port);

/// "ps -p <pid> -o comm="
std::string ps_command(int pid);

/// "tasklist /FI \"PID eq <pid>\" /FO CSV"
std::string tasklist_command(int pid);

// ----------------------------------------------------------------------------
// DiscoveryBackend
// ----------------------------------------------------------------------------

class DiscoveryBackend {
public:
    virtual ~DiscoveryBackend() = default;

    /// Имя стратегии для диагностики
    virtual std::string name() const = 0;

    /// Процессы, занимающие порт (без дубликатов PID)
    /// Реализации могут бросать исключения: их перехватывает Discoverer.
    virtual std::vector<ProcessEntry> find_processes(ports::Port port) = 0;
};

/// macOS (POSIX-A) и Linux (POSIX-B)
class PosixBackend : public DiscoveryBackend {
public:
    /// family: OsFamily::Darwin или OsFamily::Linux
    PosixBackend(platform::OsFamily family, platform::CommandRunner& runner,
                 output::Writer& writer);

    std::string name() const override;
    std::vector<ProcessEntry> find_processes(ports::Port port) override;

    /// Разрешён ли fallback на netstat (только если netstat отдаёт PID)
    bool fallback_enabled() const { return family_ == platform::OsFamily::Linux; }

private:
    std::vector<ProcessEntry> find_with_netstat(ports::Port port);
    std::string resolve_command(int pid);

    platform::OsFamily family_;
    platform::CommandRunner& runner_;
    output::Writer& writer_;
};

class WindowsBackend : public DiscoveryBackend {
public:
    WindowsBackend(platform::CommandRunner& runner, output::Writer& writer);

    std::string name() const override;
    std::vector<ProcessEntry> find_processes(ports::Port port) override;

private:
    std::string resolve_image(int pid);

    platform::CommandRunner& runner_;
    output::Writer& writer_;
};

/// Создать стратегию для семейства ОС
///
/// @throws platform::UnsupportedPlatformError для OsFamily::Unsupported
std::unique_ptr<DiscoveryBackend> make_backend(platform::OsFamily family,
                                               platform::CommandRunner& runner,
                                               output::Writer& writer);

// ----------------------------------------------------------------------------
// Discoverer - оркестратор
// ----------------------------------------------------------------------------

class Discoverer {
public:
    Discoverer(std::unique_ptr<DiscoveryBackend> backend, output::Writer& writer);

    /// Процессы на порту; при любом сбое стратегии - пустой список + warning
    std::vector<ProcessEntry> discover(ports::Port port);

    const DiscoveryBackend& backend() const { return *backend_; }

private:
    std::unique_ptr<DiscoveryBackend> backend_;
    output::Writer& writer_;
};

}  // namespace portclean::discovery

#endif  // PORTCLEAN_DISCOVERY_HPP
