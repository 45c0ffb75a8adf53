#include "ReproVM/Virtualization/vmm/InstanceLock.hpp"
#include "ReproVM/System/Process.hpp"
#include "ReproVM/Utils/Logger.hpp"
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace ReproVM {

namespace {

constexpr int kMaxAttempts = 5;

// Path of the lock held by this process, readable from a signal handler.
std::array<char, 4096> g_heldLockPath{};

void rememberHeld(const std::filesystem::path& p) noexcept {
    const auto& s = p.native();
    if (s.size() >= g_heldLockPath.size()) return;
    std::memcpy(g_heldLockPath.data(), s.c_str(), s.size() + 1);
}

void forgetHeld() noexcept { g_heldLockPath[0] = '\0'; }

extern "C" void cleanupOnSignal(int signo) {
    if (g_heldLockPath[0] != '\0') ::unlink(g_heldLockPath.data());
    ::signal(signo, SIG_DFL);
    ::raise(signo);
}

} // namespace

InstanceLock::InstanceLock(std::filesystem::path lockFile) : lockFile_(std::move(lockFile)) {}

InstanceLock::~InstanceLock() { release(); }

InstanceLock::InstanceLock(InstanceLock&& other) noexcept
    : lockFile_(std::move(other.lockFile_)), held_(other.held_) {
    other.held_ = false;
}

InstanceLock& InstanceLock::operator=(InstanceLock&& other) noexcept {
    if (this == &other) return *this;
    release();
    lockFile_ = std::move(other.lockFile_);
    held_ = other.held_;
    other.held_ = false;
    return *this;
}

LockStatus InstanceLock::inspect(const std::filesystem::path& lockFile) {
    LockStatus status;
    std::error_code ec;
    status.present = std::filesystem::exists(lockFile, ec);
    if (!status.present) return status;
    status.owner = readPidFile(lockFile);
    status.ownerAlive = status.owner && isProcessAlive(*status.owner);
    return status;
}

Result<bool> InstanceLock::tryPublish() {
    const auto staging = lockFile_.parent_path() /
                         (lockFile_.filename().string() + "." + std::to_string(::getpid()));
    if (auto w = writePidFile(staging, ::getpid()); !w) return std::unexpected(w.error());

    const int rc = ::link(staging.c_str(), lockFile_.c_str());
    const int err = errno;
    std::error_code ec;
    std::filesystem::remove(staging, ec);

    if (rc == 0) return true;
    if (err == EEXIST) return false;
    return fatal("cannot create lock " + lockFile_.string() + ": " + std::strerror(err));
}

Result<void> InstanceLock::acquire() {
    if (held_) return {};

    std::error_code ec;
    std::filesystem::create_directories(lockFile_.parent_path(), ec);
    if (ec) return fatal("cannot create " + lockFile_.parent_path().string() + ": " + ec.message());

    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        auto published = tryPublish();
        if (!published) return std::unexpected(published.error());
        if (*published) {
            held_ = true;
            rememberHeld(lockFile_);
            BoostLogger::Debug("lock acquired: " + lockFile_.string());
            return {};
        }

        const auto status = inspect(lockFile_);
        if (status.ownerAlive && status.owner && *status.owner != ::getpid()) {
            return makeError(ErrorCategory::Contention,
                             "VM already running (PID: " + std::to_string(*status.owner) + ")",
                             "Use 'reprovm ssh' to connect or 'reprovm stop' to stop it");
        }
        if (status.owner && *status.owner == ::getpid()) {
            BoostLogger::Debug("lock already owned by this process, republishing");
        } else {
            BoostLogger::Warn("Stale lockfile (cleaning up)");
        }
        std::filesystem::remove(lockFile_, ec);
        if (ec) return fatal("cannot remove stale lock " + lockFile_.string() + ": " + ec.message());
    }
    return makeError(ErrorCategory::Contention, "could not acquire " + lockFile_.string() + " (lock keeps changing)",
                     "Another invocation is racing for this instance; retry with 'reprovm status'");
}

void InstanceLock::release() noexcept {
    if (!held_) return;
    std::error_code ec;
    std::filesystem::remove(lockFile_, ec);
    held_ = false;
    forgetHeld();
}

void InstanceLock::installSignalCleanup() {
    struct sigaction sa {};
    sa.sa_handler = cleanupOnSignal;
    sigemptyset(&sa.sa_mask);
    for (int signo : {SIGINT, SIGTERM, SIGHUP}) {
        ::sigaction(signo, &sa, nullptr);
    }
}

} // namespace ReproVM
