// ==============================================================================
// ports.cpp - Разбор спецификаций портов
// ==============================================================================

#include "portclean/ports.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace portclean::ports {

namespace {

// Потолок насыщения: заведомо вне диапазона портов, value * 10 + 9 помещается в 32-битный long
constexpr long SATURATION_LIMIT = 100000000;

/// Разобрать "<start>-<end>"; nullopt если токен не является валидным диапазоном
std::optional<std::pair<long, long>> parse_range(std::string_view token, std::size_t dash) {
    auto start = parse_int_loose(token.substr(0, dash));
    auto end = parse_int_loose(token.substr(dash + 1));

    if (!start || !end) {
        return std::nullopt;
    }
    if (!is_valid_port(*start) || !is_valid_port(*end) || *start > *end) {
        return std::nullopt;
    }
    return std::make_pair(*start, *end);
}

}  // namespace

std::optional<long> parse_int_loose(std::string_view text) {
    std::size_t i = 0;

    while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i])) != 0) {
        ++i;
    }

    bool negative = false;
    if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
        negative = text[i] == '-';
        ++i;
    }

    std::size_t digits_begin = i;
    long value = 0;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i])) != 0) {
        value = std::min(value * 10 + (text[i] - '0'), SATURATION_LIMIT);
        ++i;
    }

    if (i == digits_begin) {
        return std::nullopt;
    }

    return negative ? -value : value;
}

bool is_valid_port(long value) {
    return value >= MIN_PORT && value <= MAX_PORT;
}

PortParseResult parse_ports(const std::vector<std::string>& tokens) {
    PortParseResult result;

    for (const auto& token : tokens) {
        std::size_t dash = token.find('-');

        if (dash != std::string::npos) {
            // Диапазон: либо добавляется целиком, либо не добавляется вовсе
            auto range = parse_range(token, dash);
            if (!range) {
                result.errors.push_back("Error: Invalid port range " + token);
                continue;
            }
            for (long p = range->first; p <= range->second; ++p) {
                result.ports.insert(static_cast<Port>(p));
            }
            continue;
        }

        auto value = parse_int_loose(token);
        if (!value || !is_valid_port(*value)) {
            result.errors.push_back("Error: Invalid port " + token);
            continue;
        }
        result.ports.insert(static_cast<Port>(*value));
    }

    return result;
}

}  // namespace portclean::ports
