#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace ReproVM {

/**
 * @brief Capability interface for operator interaction
 *
 * The provisioner and the lifecycle manager never talk to the terminal
 * directly; they receive an IPrompter so that scripted runs can swap in a
 * non-interactive implementation.
 */
class IPrompter {
public:
    virtual ~IPrompter() = default;

    /**
     * @brief Asks a yes/no question
     * @param question Question text without the [Y/n] suffix
     * @param defaultYes Answer assumed on an empty reply
     */
    [[nodiscard]] virtual bool confirm(std::string_view question, bool defaultYes = true) = 0;

    /**
     * @brief Presents a numbered list and returns the chosen index
     * @param options Non-empty list of labels
     * @param defaultIndex Index returned on an empty or invalid reply
     */
    [[nodiscard]] virtual std::size_t choose(std::string_view question,
                                             const std::vector<std::string>& options,
                                             std::size_t defaultIndex = 0) = 0;

    /**
     * @brief Asks for a free-form value
     * @return The reply, or defaultValue when the reply is empty
     */
    [[nodiscard]] virtual std::string ask(std::string_view question, std::string_view defaultValue = {}) = 0;

    [[nodiscard]] virtual bool interactive() const noexcept = 0;
};

} // namespace ReproVM
