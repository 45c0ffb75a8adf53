#pragma once
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include "ReproVM/Utils/Result.hpp"

namespace ReproVM {

class VmException : public std::runtime_error {
public:
    VmException(ErrorCategory category, const std::string& msg, std::string remedy = {})
        : std::runtime_error(msg), category_(category), remedy_(std::move(remedy)) {}

    explicit VmException(const Error& err)
        : VmException(err.category, err.message, err.remedy) {}

    [[nodiscard]] ErrorCategory category() const noexcept { return category_; }
    [[nodiscard]] const std::string& remedy() const noexcept { return remedy_; }

    // Throws the subclass matching the category of err.
    [[noreturn]] static void raise(const Error& err);

private:
    ErrorCategory category_;
    std::string remedy_;
};

class FatalException : public VmException {
public:
    explicit FatalException(const std::string& msg, std::string remedy = {})
        : VmException(ErrorCategory::Fatal, msg, std::move(remedy)) {}
};

class ContentionException : public VmException {
public:
    explicit ContentionException(const std::string& msg, std::string remedy = {})
        : VmException(ErrorCategory::Contention, msg, std::move(remedy)) {}
};

class UserInputException : public VmException {
public:
    explicit UserInputException(const std::string& msg, std::string remedy = {})
        : VmException(ErrorCategory::UserInput, msg, std::move(remedy)) {}
};

class CancelledException : public VmException {
public:
    explicit CancelledException(const std::string& msg, std::string remedy = {})
        : VmException(ErrorCategory::Cancelled, msg, std::move(remedy)) {}
};

inline void VmException::raise(const Error& err) {
    switch (err.category) {
        case ErrorCategory::Fatal:      throw FatalException(err.message, err.remedy);
        case ErrorCategory::Contention: throw ContentionException(err.message, err.remedy);
        case ErrorCategory::UserInput:  throw UserInputException(err.message, err.remedy);
        case ErrorCategory::Cancelled:  throw CancelledException(err.message, err.remedy);
        default:                        throw VmException(err);
    }
}

// Unwraps r or throws the matching VmException.
template <typename T>
T valueOrThrow(Result<T>&& r) {
    if (!r) VmException::raise(r.error());
    if constexpr (!std::is_void_v<T>) {
        return std::move(*r);
    }
}

} // namespace ReproVM
