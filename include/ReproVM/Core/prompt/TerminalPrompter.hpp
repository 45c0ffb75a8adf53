#pragma once

#include "ReproVM/Core/interfaces/IPrompter.hpp"
#include <iosfwd>

namespace ReproVM {

// Reads answers line by line from a stream, normally std::cin.
class TerminalPrompter : public IPrompter {
public:
    TerminalPrompter(std::istream& in, std::ostream& out, bool colour);

    [[nodiscard]] bool confirm(std::string_view question, bool defaultYes = true) override;
    [[nodiscard]] std::size_t choose(std::string_view question,
                                     const std::vector<std::string>& options,
                                     std::size_t defaultIndex = 0) override;
    [[nodiscard]] std::string ask(std::string_view question, std::string_view defaultValue = {}) override;
    [[nodiscard]] bool interactive() const noexcept override { return true; }

private:
    std::istream& in_;
    std::ostream& out_;
    bool colour_;

    std::string readLine();
    void printQuestion(std::string_view question, bool warning);
};

} // namespace ReproVM
