#include "console_prompts.hpp"
#include "../utils/color.hpp"
#include "../../../libaudiobatch/include/errors.hpp"
#include "../../../libaudiobatch/include/file_utils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <istream>
#include <ostream>

namespace fs = std::filesystem;

namespace {

std::string unquote(std::string s) {
    if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
        s = s.substr(1, s.size() - 2);
    }
    return s;
}

std::string lowercase(std::string s) {
    std::ranges::transform(s, s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

ConsolePrompter::ConsolePrompter(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

std::string ConsolePrompter::read_line() {
    std::string line;
    if (!std::getline(in_, line)) {
        out_ << "\n";
        throw audiobatch::ConfigurationError("no input available to answer the prompt");
    }
    return audiobatch::trim_copy(line);
}

std::string ConsolePrompter::ask_string(const std::string& question) {
    for (;;) {
        out_ << BOLD << question << RESET << " " << std::flush;
        auto answer = audiobatch::trim_copy(unquote(read_line()));
        if (!answer.empty()) return answer;
    }
}

fs::path ConsolePrompter::ask_directory(const std::string& question, const bool must_exist) {
    for (;;) {
        fs::path dir = ask_string(question);
        std::error_code ec;
        if (!must_exist || fs::is_directory(dir, ec)) return dir;
        out_ << RED << "Directory not found: " << dir.string() << RESET << "\n";
    }
}

int ConsolePrompter::ask_int(const std::string& question, const int default_value, const int min, const int max) {
    for (;;) {
        out_ << BOLD << question << RESET << " (" << default_value << "): " << std::flush;
        const auto answer = read_line();
        if (answer.empty()) return default_value;

        int value = 0;
        const auto [ptr, ec] = std::from_chars(answer.data(), answer.data() + answer.size(), value);
        if (ec == std::errc() && ptr == answer.data() + answer.size() && value >= min && value <= max) {
            return value;
        }
        out_ << RED << "Choose between " << min << " and " << max << RESET << "\n";
    }
}

bool ConsolePrompter::confirm(const std::string& question, const bool default_value) {
    for (;;) {
        out_ << BOLD << question << RESET << (default_value ? " [Y/n] " : " [y/N] ") << std::flush;
        const auto answer = lowercase(read_line());
        if (answer.empty()) return default_value;
        if (answer == "y" || answer == "yes") return true;
        if (answer == "n" || answer == "no") return false;
        out_ << RED << "Please answer y or n" << RESET << "\n";
    }
}

std::string ConsolePrompter::select(const std::string& title, const std::vector<std::string>& choices) {
    if (choices.empty()) {
        throw audiobatch::ConfigurationError("nothing to choose for: " + title);
    }
    for (;;) {
        out_ << BOLD << title << RESET << "\n";
        for (std::size_t i = 0; i < choices.size(); ++i) {
            out_ << "  " << (i + 1) << ") " << choices[i] << "\n";
        }
        out_ << "> " << std::flush;
        const auto answer = read_line();

        std::size_t index = 0;
        const auto [ptr, ec] = std::from_chars(answer.data(), answer.data() + answer.size(), index);
        if (ec == std::errc() && ptr == answer.data() + answer.size() && index >= 1 && index <= choices.size()) {
            return choices[index - 1];
        }
        const auto wanted = lowercase(answer);
        for (const auto& choice : choices) {
            if (lowercase(choice) == wanted) return choice;
        }
        out_ << RED << "Invalid choice" << RESET << "\n";
    }
}
