// ==============================================================================
// parsers.cpp - Разбор вывода системных утилит
// ==============================================================================

#include "portclean/parsers.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <system_error>

namespace portclean::discovery {

namespace {

constexpr const char* POSIX_LISTEN_STATE = "LISTEN";
constexpr const char* WINDOWS_LISTEN_STATE = "LISTENING";
constexpr std::size_t WINDOWS_NETSTAT_HEADER_LINES = 4;

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trim(std::string_view text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && is_space(text[begin])) {
        ++begin;
    }
    while (end > begin && is_space(text[end - 1])) {
        --end;
    }
    return std::string(text.substr(begin, end - begin));
}

/// Строки без ведущих пустых строк (аналог trim всего вывода)
std::vector<std::string> content_lines(std::string_view text) {
    std::vector<std::string> lines = split_lines(text);
    auto first = std::find_if(lines.begin(), lines.end(),
                              [](const std::string& l) { return !trim(l).empty(); });
    lines.erase(lines.begin(), first);
    return lines;
}

/// PID-поле netstat -anp: "<digits>/<anything>"
std::optional<int> pid_of_program_field(std::string_view field) {
    std::size_t slash = field.find('/');
    if (slash == std::string_view::npos || slash == 0) {
        return std::nullopt;
    }
    return parse_pid(field.substr(0, slash));
}

void push_unique(std::vector<int>& pids, int pid) {
    if (std::find(pids.begin(), pids.end(), pid) == pids.end()) {
        pids.push_back(pid);
    }
}

}  // namespace

// ----------------------------------------------------------------------------
// Текстовые примитивы
// ----------------------------------------------------------------------------

std::vector<std::string> split_lines(std::string_view text) {
    std::vector<std::string> lines;
    if (text.empty()) {
        return lines;
    }

    std::size_t start = 0;
    while (start <= text.size()) {
        std::size_t nl = text.find('\n', start);
        std::size_t end = (nl == std::string_view::npos) ? text.size() : nl;
        std::string_view line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.emplace_back(line);
        if (nl == std::string_view::npos) {
            break;
        }
        start = nl + 1;
    }

    // Завершающий '\n' не порождает лишнюю пустую строку
    if (!lines.empty() && lines.back().empty() && text.back() == '\n') {
        lines.pop_back();
    }
    return lines;
}

std::vector<std::string> split_whitespace(std::string_view line) {
    std::vector<std::string> fields;
    std::size_t i = 0;
    while (i < line.size()) {
        while (i < line.size() && is_space(line[i])) {
            ++i;
        }
        std::size_t begin = i;
        while (i < line.size() && !is_space(line[i])) {
            ++i;
        }
        if (i > begin) {
            fields.emplace_back(line.substr(begin, i - begin));
        }
    }
    return fields;
}

std::optional<int> parse_pid(std::string_view field) {
    if (field.empty() || std::isdigit(static_cast<unsigned char>(field.front())) == 0) {
        return std::nullopt;
    }

    int pid = 0;
    const char* end = field.data() + field.size();
    auto [ptr, ec] = std::from_chars(field.data(), end, pid);
    if (ec != std::errc() || ptr != end || pid <= 0) {
        return std::nullopt;
    }
    return pid;
}

std::optional<long> port_of_address(std::string_view address) {
    std::size_t colon = address.rfind(':');
    if (colon == std::string_view::npos) {
        return std::nullopt;
    }
    return ports::parse_int_loose(address.substr(colon + 1));
}

// ----------------------------------------------------------------------------
// lsof
// ----------------------------------------------------------------------------

std::vector<ProcessEntry> parse_lsof_output(std::string_view output) {
    std::vector<ProcessEntry> processes;
    std::vector<std::string> lines = content_lines(output);

    // lines[0] - заголовок COMMAND PID USER ...
    for (std::size_t i = 1; i < lines.size(); ++i) {
        auto fields = split_whitespace(lines[i]);
        if (fields.size() < 2) {
            continue;
        }

        auto pid = parse_pid(fields[1]);
        if (!pid) {
            continue;
        }

        int pid_value = *pid;
        bool seen = std::any_of(processes.begin(), processes.end(),
                                [pid_value](const ProcessEntry& p) { return p.pid == pid_value; });
        if (!seen) {
            processes.push_back(ProcessEntry{pid_value, fields[0]});
        }
    }

    return processes;
}

// ----------------------------------------------------------------------------
// netstat
// ----------------------------------------------------------------------------

std::vector<int> parse_netstat_posix(std::string_view output, ports::Port port) {
    std::vector<int> pids;
    std::vector<std::string> lines = content_lines(output);

    for (std::size_t i = 1; i < lines.size(); ++i) {
        auto fields = split_whitespace(lines[i]);
        if (fields.size() < 7) {
            continue;
        }
        if (fields[5] != POSIX_LISTEN_STATE) {
            continue;
        }

        auto pid = pid_of_program_field(fields[6]);
        if (!pid) {
            continue;
        }

        auto local_port = port_of_address(fields[3]);
        if (!local_port || *local_port != port) {
            continue;
        }

        push_unique(pids, *pid);
    }

    return pids;
}

std::vector<int> parse_netstat_windows(std::string_view output, ports::Port port) {
    std::vector<int> pids;
    std::vector<std::string> lines = split_lines(output);

    for (std::size_t i = WINDOWS_NETSTAT_HEADER_LINES; i < lines.size(); ++i) {
        auto fields = split_whitespace(lines[i]);
        if (fields.size() < 5) {
            continue;
        }
        if (fields[3] != WINDOWS_LISTEN_STATE) {
            continue;
        }

        auto local_port = port_of_address(fields[1]);
        if (!local_port || *local_port != port) {
            continue;
        }

        auto pid = parse_pid(fields[4]);
        if (!pid) {
            continue;
        }

        push_unique(pids, *pid);
    }

    return pids;
}

// ----------------------------------------------------------------------------
// ps / tasklist
// ----------------------------------------------------------------------------

std::optional<std::string> parse_ps_comm(std::string_view output) {
    std::string name = trim(output);
    if (name.empty()) {
        return std::nullopt;
    }
    return name;
}

std::optional<std::string> parse_tasklist_image(std::string_view output) {
    std::vector<std::string> lines;
    for (const auto& line : split_lines(output)) {
        if (!trim(line).empty()) {
            lines.push_back(trim(line));
        }
    }
    if (lines.size() < 2) {
        return std::nullopt;
    }

    const std::string& row = lines[1];
    std::string image;
    if (row.front() == '"') {
        std::size_t close = row.find('"', 1);
        if (close == std::string::npos) {
            return std::nullopt;
        }
        image = row.substr(1, close - 1);
    } else {
        image = row.substr(0, row.find(','));
    }

    image = trim(image);
    if (image.empty()) {
        return std::nullopt;
    }
    return image;
}

}  // namespace portclean::discovery
