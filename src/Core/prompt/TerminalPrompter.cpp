#include "ReproVM/Core/prompt/TerminalPrompter.hpp"
#include <charconv>
#include <istream>
#include <ostream>
#include <string>

namespace ReproVM {

namespace {
constexpr const char* kCyan = "\033[1;36m";
constexpr const char* kYellow = "\033[1;33m";
constexpr const char* kReset = "\033[0m";

std::string trim(std::string s) {
    const auto first = s.find_first_not_of(" \t\r");
    if (first == std::string::npos) return {};
    const auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}
} // namespace

TerminalPrompter::TerminalPrompter(std::istream& in, std::ostream& out, bool colour)
    : in_(in), out_(out), colour_(colour) {}

std::string TerminalPrompter::readLine() {
    std::string line;
    // EOF behaves like an empty reply
    if (!std::getline(in_, line)) return {};
    return trim(std::move(line));
}

void TerminalPrompter::printQuestion(std::string_view question, bool warning) {
    if (colour_) out_ << (warning ? kYellow : kCyan);
    out_ << "? " << question;
    if (colour_) out_ << kReset;
}

bool TerminalPrompter::confirm(std::string_view question, bool defaultYes) {
    printQuestion(question, !defaultYes);
    out_ << (defaultYes ? " [Y/n] " : " [y/N] ") << std::flush;
    const std::string reply = readLine();
    if (reply.empty()) return defaultYes;
    return reply.front() == 'y' || reply.front() == 'Y';
}

std::size_t TerminalPrompter::choose(std::string_view question,
                                     const std::vector<std::string>& options,
                                     std::size_t defaultIndex) {
    if (options.empty()) return defaultIndex;
    if (defaultIndex >= options.size()) defaultIndex = 0;

    printQuestion(question, false);
    out_ << '\n';
    for (std::size_t i = 0; i < options.size(); ++i) {
        out_ << "  " << (i + 1) << ") " << options[i] << '\n';
    }
    out_ << "  Enter number [" << (defaultIndex + 1) << "]: " << std::flush;

    const std::string reply = readLine();
    if (reply.empty()) return defaultIndex;

    std::size_t number = 0;
    const auto [ptr, ec] = std::from_chars(reply.data(), reply.data() + reply.size(), number);
    if (ec != std::errc{} || ptr != reply.data() + reply.size()) return defaultIndex;
    if (number < 1 || number > options.size()) return defaultIndex;
    return number - 1;
}

std::string TerminalPrompter::ask(std::string_view question, std::string_view defaultValue) {
    printQuestion(question, false);
    if (!defaultValue.empty()) out_ << " [" << defaultValue << "]";
    out_ << ": " << std::flush;
    std::string reply = readLine();
    if (reply.empty()) return std::string(defaultValue);
    return reply;
}

} // namespace ReproVM
