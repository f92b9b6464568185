#ifndef AUDIOBATCH_CONSOLE_DELEGATE_HPP
#define AUDIOBATCH_CONSOLE_DELEGATE_HPP

#include "cli_parser.hpp"
#include "console_prompts.hpp"
#include "../../../libaudiobatch/include/session.hpp"
#include <optional>

/**
 * @brief Answers the session's questions from the command line, falling
 * back to console prompts for whatever was not given.
 */
class ConsoleSessionDelegate final : public audiobatch::SessionDelegate {
public:
    ConsoleSessionDelegate(ConsolePrompter& prompter, const Settings& settings, std::ostream& out);

    bool confirm_resume(const audiobatch::Checkpoint& checkpoint) override;
    audiobatch::RunConfig request_config() override;
    bool confirm_start(const audiobatch::RunSummary& summary) override;

    /// Quality percentage chosen for the fresh run, if any.
    [[nodiscard]] std::optional<int> quality_percent() const { return quality_percent_; }

private:
    ConsolePrompter& prompter_;
    const Settings& settings_;
    std::ostream& out_;
    std::optional<int> quality_percent_;
};

#endif // AUDIOBATCH_CONSOLE_DELEGATE_HPP
