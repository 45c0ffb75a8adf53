#ifndef REPROVM_VMCONFIG_H
#define REPROVM_VMCONFIG_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "ReproVM/Utils/Result.hpp"

namespace ReproVM {

namespace fs = std::filesystem;

// Every on-disk location of one instance plus the shared artifacts.
struct InstanceLayout {
    fs::path instanceRoot;
    fs::path sharedDir;

    fs::path baseDisk;
    fs::path overlayDisk;

    fs::path firmwareDir;
    fs::path firmwareCode;
    fs::path firmwareHash;
    fs::path varsTemplate;
    fs::path varsStore;

    fs::path lockFile;
    fs::path pidFile;
    fs::path logDir;
    fs::path logFile;
};

struct VmConfig {
    // Instance
    std::string name{"arch-repro"};
    std::string ram{"4G"};
    unsigned int cpus{4};
    std::string diskSize{"40G"};
    int sshPort{2222};
    std::string macAddress{"52:54:00:12:34:56"};

    // Locations
    fs::path home;
    fs::path sharedRoot;
    fs::path instanceRoot;
    bool instanceRootOverridden{false};
    fs::path tempDir{"/tmp"};

    // Behaviour
    fs::path installMedium;
    bool autoConfirm{false};
    bool supervise{false};
    bool verbose{false};

    // Host integration
    std::string hypervisorBinary{"qemu-system-x86_64"};
    std::string imageTool{"qemu-img"};
    std::vector<fs::path> searchPath{"/usr/local/bin", "/usr/bin", "/bin"};
    std::vector<fs::path> firmwareSearchDirs{
        "/usr/share/edk2/x64",
        "/usr/share/ovmf/x64",
        "/usr/share/OVMF",
        "/usr/share/qemu",
        "/usr/share/edk2-ovmf/x64",
    };
    std::vector<fs::path> mediaSearchDirs;
    int mediaSearchDepth{2};
    std::size_t mediaResultsPerDir{10};
    fs::path packageCacheDir{"/var/cache/pacman/pkg"};

    // Policies
    std::uint64_t emptyDiskThreshold{100'000'000};
    int stopAttempts{10};
    std::chrono::milliseconds stopInterval{1000};
    int sshPortRangeFirst{2222};
    int sshPortRangeLast{2250};

    using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

    // The only place the process environment is consulted.
    [[nodiscard]] static Result<VmConfig> fromEnvironment(const EnvLookup& env);
    [[nodiscard]] static EnvLookup processEnvironment();

    // Changes the instance name; the instance root follows unless VM_ROOT pinned it.
    void setName(std::string newName);

    [[nodiscard]] Result<void> validate() const;
    [[nodiscard]] InstanceLayout layout() const;
};

// "40G" -> bytes. Accepts an optional K/M/G/T suffix (binary multiples).
[[nodiscard]] Result<std::uint64_t> parseSize(std::string_view text);

// Bytes rendered the way du -h does ("1.5G", "512K").
[[nodiscard]] std::string humanSize(std::uint64_t bytes);

} // namespace ReproVM

#endif // REPROVM_VMCONFIG_H
