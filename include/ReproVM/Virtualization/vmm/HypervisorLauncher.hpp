#pragma once

#include "ReproVM/Core/interfaces/IHostEnvironment.hpp"
#include "ReproVM/Core/interfaces/IHypervisorLauncher.hpp"
#include <memory>
#include <string>

namespace ReproVM {

class QemuLauncher : public IHypervisorLauncher {
public:
    QemuLauncher(std::shared_ptr<IHostEnvironment> host, std::string binary = "qemu-system-x86_64");

    [[nodiscard]] Result<std::filesystem::path> locate() override;
    [[nodiscard]] Result<int> launch(const std::vector<std::string>& argv, const LaunchSession& session) override;

    // First "N.N[.N]" in the output of `<binary> --version`.
    [[nodiscard]] std::optional<std::string> version() const;

private:
    std::shared_ptr<IHostEnvironment> host;
    std::string binary;
    std::filesystem::path resolved;

    [[nodiscard]] Result<int> replace(const std::vector<std::string>& argv, const LaunchSession& session);
    [[nodiscard]] Result<int> supervise(const std::vector<std::string>& argv, const LaunchSession& session);
};

// Extracts the first dotted version number from tool output.
[[nodiscard]] std::optional<std::string> parseVersion(std::string_view text);

} // namespace ReproVM
