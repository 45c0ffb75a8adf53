#pragma once

#include "ReproVM/Core/interfaces/IPrompter.hpp"

namespace ReproVM {

/**
 * @brief Non-interactive prompter used with --yes / AUTO_YES=1
 *
 * Every confirmation is answered affirmatively, selections take the default
 * index and free-form questions take their default value.
 */
class AutoConfirmPrompter : public IPrompter {
public:
    AutoConfirmPrompter() = default;

    [[nodiscard]] bool confirm(std::string_view question, bool defaultYes = true) override;
    [[nodiscard]] std::size_t choose(std::string_view question,
                                     const std::vector<std::string>& options,
                                     std::size_t defaultIndex = 0) override;
    [[nodiscard]] std::string ask(std::string_view question, std::string_view defaultValue = {}) override;
    [[nodiscard]] bool interactive() const noexcept override { return false; }
};

} // namespace ReproVM
