#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ReproVM {

/**
 * @brief Abstract base class for building subprocess argument lists
 *
 * Provides the common build/reset cycle. Derived classes implement the
 * specific argument layout.
 */
class ICommandBuilderBase {
protected:
    std::vector<std::string> args;  ///< Arguments collected by the current build

    /**
     * @brief Appends the arguments of the concrete command
     *
     * Pure virtual function that derived classes implement to define the
     * argument order.
     */
    virtual void buildArguments() = 0;

    void add(std::string_view flag) { args.emplace_back(flag); }
    void add(std::string_view flag, std::string value) {
        args.emplace_back(flag);
        args.push_back(std::move(value));
    }
    void addAll(const std::vector<std::string>& more) { args.insert(args.end(), more.begin(), more.end()); }

public:
    ICommandBuilderBase() = default;

    // Non-copyable
    ICommandBuilderBase(const ICommandBuilderBase&) = delete;
    ICommandBuilderBase& operator=(const ICommandBuilderBase&) = delete;

    // Movable
    ICommandBuilderBase(ICommandBuilderBase&&) noexcept = default;
    ICommandBuilderBase& operator=(ICommandBuilderBase&&) noexcept = default;

    /**
     * @brief Builds and returns the argument list
     *
     * Every call starts from an empty list, so repeated builds of the same
     * builder state yield identical results.
     */
    [[nodiscard]] std::vector<std::string> build() {
        args.clear();
        buildArguments();
        return args;
    }

    /**
     * @brief Drops collected arguments
     */
    void reset() noexcept { args.clear(); }

    virtual ~ICommandBuilderBase() = default;
};

} // namespace ReproVM
