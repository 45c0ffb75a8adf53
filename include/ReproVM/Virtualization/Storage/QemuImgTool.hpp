#pragma once

#include "ReproVM/Core/interfaces/IDiskImageTool.hpp"
#include "ReproVM/Core/interfaces/IHostEnvironment.hpp"
#include <memory>
#include <string>
#include <vector>

namespace ReproVM {

class QemuImgTool : public IDiskImageTool {
public:
    QemuImgTool(std::shared_ptr<IHostEnvironment> host, std::string binary = "qemu-img");

    [[nodiscard]] Result<void> createImage(const std::filesystem::path& image, std::string_view size) override;
    [[nodiscard]] Result<void> createOverlay(const std::filesystem::path& overlay,
                                             const std::filesystem::path& backing) override;

private:
    std::shared_ptr<IHostEnvironment> host;
    std::string binary;

    [[nodiscard]] Result<std::filesystem::path> locate() const;
    [[nodiscard]] Result<void> run(std::vector<std::string> args, const std::string& action);
};

} // namespace ReproVM
