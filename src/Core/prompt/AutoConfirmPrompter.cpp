#include "ReproVM/Core/prompt/AutoConfirmPrompter.hpp"
#include "ReproVM/Utils/Logger.hpp"

namespace ReproVM {

bool AutoConfirmPrompter::confirm(std::string_view question, bool /*defaultYes*/) {
    BoostLogger::Debug("auto-confirm: " + std::string(question) + " -> yes");
    return true;
}

std::size_t AutoConfirmPrompter::choose(std::string_view question,
                                        const std::vector<std::string>& options,
                                        std::size_t defaultIndex) {
    if (defaultIndex >= options.size()) defaultIndex = 0;
    if (!options.empty()) {
        BoostLogger::Debug("auto-confirm: " + std::string(question) + " -> " + options[defaultIndex]);
    }
    return defaultIndex;
}

std::string AutoConfirmPrompter::ask(std::string_view question, std::string_view defaultValue) {
    BoostLogger::Debug("auto-confirm: " + std::string(question) + " -> '" + std::string(defaultValue) + "'");
    return std::string(defaultValue);
}

} // namespace ReproVM
