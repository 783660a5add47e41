// ==============================================================================
// portclean/prompt.hpp - Подтверждение yes/no
// ==============================================================================
//
// Назначение:
// - Prompter: узкий интерфейс "задать вопрос, получить да/нет"
// - ConsolePrompter: вопрос в поток отчёта Writer, ответ - строка из istream
// - Политика ответа по умолчанию для пустого ввода
//
// ==============================================================================

#ifndef PORTCLEAN_PROMPT_HPP
#define PORTCLEAN_PROMPT_HPP

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace portclean::output {
class Writer;
}  // namespace portclean::output

namespace portclean::confirm {

/// Что означает пустой ответ
enum class ConfirmPolicy {
    DefaultNo,  // "(y/N)": пустой ответ = нет
    DefaultYes  // "(Y/n)": пустой ответ = да
};

/// "(y/N)" или "(Y/n)"
const char* prompt_suffix(ConfirmPolicy policy);

/// Ответ пользователя -> да/нет
///
/// "y" / "yes" в любом регистре - да; пустая строка - по политике;
/// всё остальное - нет. Завершающие '\r' / '\n' отбрасываются.
bool is_affirmative(std::string_view answer, ConfirmPolicy policy);

/// "yes"/"y"/"true" -> DefaultYes, "no"/"n"/"false" -> DefaultNo
std::optional<ConfirmPolicy> parse_policy(std::string_view text);

class Prompter {
public:
    virtual ~Prompter() = default;

    /// Задать вопрос (без суффикса политики), вернуть решение
    virtual bool confirm(const std::string& question) = 0;
};

class ConsolePrompter : public Prompter {
public:
    ConsolePrompter(std::istream& in, output::Writer& writer, ConfirmPolicy policy);

    /// Конец ввода считается отрицательным ответом
    bool confirm(const std::string& question) override;

private:
    std::istream& in_;
    output::Writer& writer_;
    ConfirmPolicy policy_;
};

}  // namespace portclean::confirm

#endif  // PORTCLEAN_PROMPT_HPP
