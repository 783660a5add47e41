// ==============================================================================
// prompt.cpp - Подтверждение yes/no
// ==============================================================================

#include "portclean/prompt.hpp"

#include "portclean/output.hpp"

#include <algorithm>
#include <cctype>
#include <istream>
#include <string>

namespace portclean::confirm {

namespace {

std::string to_lower(std::string_view text) {
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

}  // namespace

const char* prompt_suffix(ConfirmPolicy policy) {
    return policy == ConfirmPolicy::DefaultYes ? "(Y/n)" : "(y/N)";
}

bool is_affirmative(std::string_view answer, ConfirmPolicy policy) {
    while (!answer.empty() && (answer.back() == '\n' || answer.back() == '\r')) {
        answer.remove_suffix(1);
    }

    if (answer.empty()) {
        return policy == ConfirmPolicy::DefaultYes;
    }

    std::string lowered = to_lower(answer);
    return lowered == "y" || lowered == "yes";
}

std::optional<ConfirmPolicy> parse_policy(std::string_view text) {
    std::string lowered = to_lower(text);
    if (lowered == "yes" || lowered == "y" || lowered == "true") {
        return ConfirmPolicy::DefaultYes;
    }
    if (lowered == "no" || lowered == "n" || lowered == "false") {
        return ConfirmPolicy::DefaultNo;
    }
    return std::nullopt;
}

ConsolePrompter::ConsolePrompter(std::istream& in, output::Writer& writer, ConfirmPolicy policy)
    : in_(in), writer_(writer), policy_(policy) {}

bool ConsolePrompter::confirm(const std::string& question) {
    writer_.write(writer_.report_stream(), question + " " + prompt_suffix(policy_) + " ");
    writer_.flush();

    std::string answer;
    if (!std::getline(in_, answer)) {
        // Конец ввода: перевод строки за пользователя
        writer_.write(writer_.report_stream(), "\n");
        return false;
    }
    return is_affirmative(answer, policy_);
}

}  // namespace portclean::confirm
