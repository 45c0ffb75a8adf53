#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include "ReproVM/Utils/Result.hpp"

namespace ReproVM {

// Metadata of a disk image as read from its header.
struct VirtualMachineDisk {
    std::filesystem::path path;
    std::string format;                  // qcow2, raw
    std::uint32_t formatVersion{0};
    std::uint64_t virtualSize{0};        // guest-visible bytes
    std::uint64_t actualSize{0};         // bytes allocated on the host
    std::optional<std::string> backingReference;     // as recorded in the header
    std::optional<std::filesystem::path> backingFile; // resolved against the image directory

    [[nodiscard]] bool hasBacking() const noexcept { return backingReference.has_value(); }

    // True when a backing file is recorded and resolves to a readable file.
    [[nodiscard]] bool backingResolves() const;
};

/**
 * @brief Reads qcow2 headers directly instead of parsing tool output
 *
 * Files without the qcow2 magic are reported as raw images whose virtual
 * size is the file size.
 */
[[nodiscard]] Result<VirtualMachineDisk> inspectDiskImage(const std::filesystem::path& path);

} // namespace ReproVM
