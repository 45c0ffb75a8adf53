#pragma once

#include <filesystem>
#include <optional>
#include <sys/types.h>
#include "ReproVM/Utils/Result.hpp"

namespace ReproVM {

struct LockStatus {
    bool present{false};
    std::optional<pid_t> owner;
    bool ownerAlive{false};

    [[nodiscard]] bool stale() const noexcept { return present && !ownerAlive; }
};

/**
 * @brief At-most-one live process per instance
 *
 * The lock file holds the owner's PID. A lock whose owner is dead is stale
 * and is reclaimed on the next acquire. The file is published with link(2)
 * so a reader never observes an empty lock.
 */
class InstanceLock {
public:
    explicit InstanceLock(std::filesystem::path lockFile);
    ~InstanceLock();

    InstanceLock(const InstanceLock&) = delete;
    InstanceLock& operator=(const InstanceLock&) = delete;
    InstanceLock(InstanceLock&& other) noexcept;
    InstanceLock& operator=(InstanceLock&& other) noexcept;

    // Contention when a live process other than this one owns the instance.
    [[nodiscard]] Result<void> acquire();

    // Removes the lock file if this object holds it.
    void release() noexcept;

    [[nodiscard]] bool held() const noexcept { return held_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return lockFile_; }

    [[nodiscard]] static LockStatus inspect(const std::filesystem::path& lockFile);

    // Removes the held lock file when SIGINT/SIGTERM/SIGHUP arrive before launch.
    static void installSignalCleanup();

private:
    std::filesystem::path lockFile_;
    bool held_{false};

    [[nodiscard]] Result<bool> tryPublish();
};

} // namespace ReproVM
