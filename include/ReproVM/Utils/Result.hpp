#pragma once
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace ReproVM {

/**
 * @brief Failure families reported by every component.
 *
 * Callers act on the category and the exit status only; there is no
 * deeper hierarchy.
 */
enum class ErrorCategory {
  Fatal,       ///< required host software absent or an unrecoverable I/O failure
  Contention,  ///< another live process owns the instance
  Recoverable, ///< stale state that needs operator confirmation to heal
  Degraded,    ///< missing optional host capability
  UserInput,   ///< operator did not supply a strictly required input
  Cancelled    ///< operator declined a confirmation
};

struct Error {
  ErrorCategory category{ErrorCategory::Fatal};
  std::string message;
  std::string remedy;
};

template <typename T>
using Result = std::expected<T, Error>;

[[nodiscard]] inline std::unexpected<Error> makeError(ErrorCategory category, std::string message,
                                                     std::string remedy = {}) {
  return std::unexpected<Error>(Error{category, std::move(message), std::move(remedy)});
}

[[nodiscard]] inline std::unexpected<Error> fatal(std::string message, std::string remedy = {}) {
  return makeError(ErrorCategory::Fatal, std::move(message), std::move(remedy));
}

[[nodiscard]] constexpr std::string_view toString(ErrorCategory category) noexcept {
  switch (category) {
    case ErrorCategory::Fatal:       return "fatal";
    case ErrorCategory::Contention:  return "contention";
    case ErrorCategory::Recoverable: return "recoverable";
    case ErrorCategory::Degraded:    return "degraded";
    case ErrorCategory::UserInput:   return "user-input";
    case ErrorCategory::Cancelled:   return "cancelled";
  }
  return "unknown";
}

} // namespace ReproVM
