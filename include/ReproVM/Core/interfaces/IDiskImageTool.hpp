#pragma once

#include <filesystem>
#include <string_view>
#include "ReproVM/Utils/Result.hpp"

namespace ReproVM {

/**
 * @brief Creates disk images
 *
 * Inspection is done natively (see inspectDiskImage); only creation is
 * delegated to an external image tool.
 */
class IDiskImageTool {
public:
    virtual ~IDiskImageTool() = default;

    /// Creates an empty qcow2 image with the given virtual size ("40G")
    [[nodiscard]] virtual Result<void> createImage(const std::filesystem::path& image, std::string_view size) = 0;

    /// Creates a qcow2 copy-on-write child whose backing reference is backing
    [[nodiscard]] virtual Result<void> createOverlay(const std::filesystem::path& overlay,
                                                     const std::filesystem::path& backing) = 0;
};

} // namespace ReproVM
