#include "ReproVM/System/Console.hpp"
#include <ostream>

namespace ReproVM {

namespace {
constexpr std::string_view kRule = "===============================================================";

const char* toneCode(Console::Tone tone) {
    switch (tone) {
        case Console::Tone::Good:   return "\033[1;32m";
        case Console::Tone::Warn:   return "\033[1;33m";
        case Console::Tone::Bad:    return "\033[1;31m";
        case Console::Tone::Dim:    return "\033[2m";
        case Console::Tone::Accent: return "\033[1;36m";
        default:                    return "";
    }
}
} // namespace

Console::Console(std::ostream& out, bool colour) : out_(out), colour_(colour) {}

std::string Console::paint(std::string_view text, Tone tone) const {
    if (!colour_ || tone == Tone::Plain) return std::string(text);
    return std::string(toneCode(tone)) + std::string(text) + "\033[0m";
}

std::string Console::bold(std::string_view text) const {
    if (!colour_) return std::string(text);
    return "\033[1m" + std::string(text) + "\033[0m";
}

void Console::rule() { out_ << paint(kRule, Tone::Accent) << '\n'; }

void Console::heading(std::string_view title) {
    out_ << '\n';
    rule();
    out_ << paint("  " + std::string(title), Tone::Accent) << '\n';
    rule();
}

void Console::line(std::string_view text) { out_ << text << '\n'; }

void Console::field(std::string_view label, std::string_view value, Tone tone) {
    std::string padded = "  " + std::string(label) + ":";
    if (padded.size() < 12) padded.resize(12, ' ');
    out_ << padded << ' ' << paint(value, tone) << '\n';
}

} // namespace ReproVM
