#ifndef AUDIOBATCH_CONSOLE_PROMPTS_HPP
#define AUDIOBATCH_CONSOLE_PROMPTS_HPP

#include <filesystem>
#include <iosfwd>
#include <string>
#include <vector>

/**
 * @brief Line-based interactive questions on a pair of streams.
 *
 * Invalid answers are reported and the question is asked again. End of
 * input throws audiobatch::ConfigurationError, since no answer will come.
 */
class ConsolePrompter {
public:
    ConsolePrompter(std::istream& in, std::ostream& out);

    /// @return A non-empty answer, trimmed, with surrounding quotes removed.
    std::string ask_string(const std::string& question);

    /// @return An existing directory if @p must_exist, otherwise any non-empty path.
    std::filesystem::path ask_directory(const std::string& question, bool must_exist);

    /// @return An integer in [min, max]; an empty answer picks @p default_value.
    int ask_int(const std::string& question, int default_value, int min, int max);

    /// @return The answer to a y/n question; an empty answer picks @p default_value.
    bool confirm(const std::string& question, bool default_value = true);

    /// @return One of @p choices, picked by number or by value.
    std::string select(const std::string& title, const std::vector<std::string>& choices);

private:
    std::string read_line();

    std::istream& in_;
    std::ostream& out_;
};

#endif // AUDIOBATCH_CONSOLE_PROMPTS_HPP
