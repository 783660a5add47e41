// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================

#include "portclean/cli.hpp"

#include <cctype>
#include <cstring>
#include <utility>

namespace portclean::cli {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

/// "-3000", "-1-5": отрицательные числа - это токены портов, не опции
bool looks_like_negative_number(const char* arg) {
    return arg[0] == '-' && std::isdigit(static_cast<unsigned char>(arg[1])) != 0;
}

std::string render_usage_error(const std::string& error_msg) {
    return error_msg +
           "\n\n"
           "Usage: portclean [ports...] [options]\n\n"
           "For more information, try '--help'.\n";
}

ParseResult fail(ParseResult result, const std::string& message) {
    result.ok = false;
    result.diagnostic.exit_code = 1;
    result.diagnostic.stderr_message = message;
    return result;
}

ParseResult unexpected_argument(ParseResult result, const std::string& arg) {
    return fail(std::move(result),
                render_usage_error("error: unexpected argument '" + arg + "' found"));
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string(PROGRAM) + " v" + VERSION + "\n";
}

std::string render_help() {
    return "\n"
           "portclean - Kill processes using specific ports\n"
           "\n"
           "Usage:\n"
           "  portclean [ports...] [options]\n"
           "\n"
           "Arguments:\n"
           "  ports             Port number(s) or ranges (e.g. 3000 8000-8010)\n"
           "\n"
           "Options:\n"
           "  --force, -f       Skip confirmation prompt\n"
           "  --all, -a         Kill all processes using each port\n"
           "  --quiet, -q       Hide informational messages\n"
           "  --verbose         Print verbose output (repeat for more)\n"
           "  --json            Print a JSON report on stdout\n"
           "  --config <PATH>   Read defaults from a YAML file\n"
           "                    (default: $PORTCLEAN_CONFIG)\n"
           "  --help, -h        Show this help message\n"
           "  --version, -v     Show version number\n"
           "\n"
           "Examples:\n"
           "  portclean 3000                    Kill process on port 3000\n"
           "  portclean 3000 8080               Kill processes on ports 3000 and 8080\n"
           "  portclean 3000-3005               Kill processes on ports 3000 to 3005\n"
           "  portclean 3000 --force            Kill port 3000 without confirmation\n"
           "  portclean 3000 --all              Kill all processes using port 3000\n"
           "  portclean 3000 8080 --force --all Kill all processes on both ports without "
           "confirmation\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    KillCommand kill_cmd;
    bool options_done = false;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (options_done || arg[0] != '-' || arg[1] == '\0' || looks_like_negative_number(arg)) {
            kill_cmd.ports.emplace_back(arg);
            continue;
        }

        if (str_eq(arg, "--")) {
            options_done = true;
        } else if (str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (str_eq(arg, "--force")) {
            kill_cmd.force = true;
        } else if (str_eq(arg, "--all")) {
            kill_cmd.all = true;
        } else if (str_eq(arg, "--quiet")) {
            result.global.quiet = true;
        } else if (str_eq(arg, "--verbose")) {
            result.global.verbose++;
        } else if (str_eq(arg, "--json")) {
            result.global.json = true;
        } else if (str_eq(arg, "--config")) {
            if (i + 1 >= argc) {
                return fail(std::move(result),
                            render_usage_error("error: a value is required for '--config <PATH>' "
                                               "but none was supplied"));
            }
            ++i;
            result.global.config = std::filesystem::u8path(argv[i]);
        } else if (starts_with(arg, "--config=")) {
            result.global.config = std::filesystem::u8path(arg + std::strlen("--config="));
        } else if (arg[1] == '-') {
            return unexpected_argument(std::move(result), arg);
        } else {
            // Кластер коротких флагов: -f, -a, -fa, -qfa ...
            for (const char* c = arg + 1; *c != '\0'; ++c) {
                switch (*c) {
                case 'f':
                    kill_cmd.force = true;
                    break;
                case 'a':
                    kill_cmd.all = true;
                    break;
                case 'q':
                    result.global.quiet = true;
                    break;
                case 'h':
                    result.ok = true;
                    result.command = HelpCommand{};
                    return result;
                case 'v':
                    result.ok = true;
                    result.command = VersionCommand{};
                    return result;
                default:
                    return unexpected_argument(std::move(result), std::string("-") + *c);
                }
            }
        }
    }

    if (kill_cmd.ports.empty()) {
        return fail(std::move(result), "Error: No ports specified\n");
    }

    result.ok = true;
    result.command = std::move(kill_cmd);
    return result;
}

}  // namespace portclean::cli
