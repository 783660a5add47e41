// ==============================================================================
// discovery.cpp - Выбор стратегии и оркестратор поиска
// ==============================================================================

#include "portclean/discovery.hpp"

#include "portclean/output.hpp"

#include <exception>
#include <utility>

namespace portclean::discovery {

std::unique_ptr<DiscoveryBackend> make_backend(platform::OsFamily family,
                                               platform::CommandRunner& runner,
                                               output::Writer& writer) {
    switch (family) {
    case platform::OsFamily::Darwin:
    case platform::OsFamily::Linux:
        return std::make_unique<PosixBackend>(family, runner, writer);
    case platform::OsFamily::Windows:
        return std::make_unique<WindowsBackend>(runner, writer);
    case platform::OsFamily::Unsupported:
    default:
        throw platform::UnsupportedPlatformError(platform::os_name());
    }
}

Discoverer::Discoverer(std::unique_ptr<DiscoveryBackend> backend, output::Writer& writer)
    : backend_(std::move(backend)), writer_(writer) {}

std::vector<ProcessEntry> Discoverer::discover(ports::Port port) {
    try {
        return backend_->find_processes(port);
    } catch (const std::exception& e) {
        writer_.warn("Failed to get processes on port " + std::to_string(port) + ": " +
                     e.what());
        return {};
    }
}

}  // namespace portclean::discovery
