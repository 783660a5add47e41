// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================
//
// Платформенная специфика изолирована здесь: остальной код получает
// OsFamily как значение и не проверяет макросы ОС сам.
//
// ==============================================================================

#include "portclean/platform.hpp"

#include <cstdio>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace portclean::platform {

// ----------------------------------------------------------------------------
// Семейство ОС
// ----------------------------------------------------------------------------

OsFamily host_os_family() {
#ifdef _WIN32
    return OsFamily::Windows;
#elif defined(__APPLE__)
    return OsFamily::Darwin;
#elif defined(__linux__)
    return OsFamily::Linux;
#else
    return OsFamily::Unsupported;
#endif
}

std::string os_family_name(OsFamily family) {
    switch (family) {
    case OsFamily::Darwin:
        return "macOS";
    case OsFamily::Linux:
        return "Linux";
    case OsFamily::Windows:
        return "Windows";
    case OsFamily::Unsupported:
    default:
        return "Unknown";
    }
}

std::string os_name() {
#if defined(_WIN32) || defined(__APPLE__) || defined(__linux__)
    return os_family_name(host_os_family());
#elif defined(__FreeBSD__)
    return "FreeBSD";
#elif defined(__OpenBSD__)
    return "OpenBSD";
#elif defined(__NetBSD__)
    return "NetBSD";
#elif defined(__sun)
    return "Solaris";
#else
    return "Unknown";
#endif
}

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout() {
#ifdef _WIN32
    return _isatty(_fileno(stdout)) != 0;
#else
    return isatty(fileno(stdout)) != 0;
#endif
}

bool is_tty_stderr() {
#ifdef _WIN32
    return _isatty(_fileno(stderr)) != 0;
#else
    return isatty(fileno(stderr)) != 0;
#endif
}

// ----------------------------------------------------------------------------
// Платформенные константы
// ----------------------------------------------------------------------------

const char* success_mark() {
#ifdef _WIN32
    // cmd.exe: ASCII fallback
    return "+";
#else
    return "\xe2\x9c\x93";  // ✓ U+2713
#endif
}

const char* failure_mark() {
#ifdef _WIN32
    return "x";
#else
    return "\xe2\x9c\x97";  // ✗ U+2717
#endif
}

const char* null_device() {
#ifdef _WIN32
    return "NUL";
#else
    return "/dev/null";
#endif
}

}  // namespace portclean::platform
