#include "ReproVM/Virtualization/vm/VirtualMachine.hpp"
#include "ReproVM/System/Process.hpp"
#include "ReproVM/Utils/Logger.hpp"
#include <csignal>
#include <thread>

namespace ReproVM {

VirtualMachine::VirtualMachine(std::string_view vmName, std::filesystem::path pid, std::filesystem::path lock)
    : name(vmName), pidFile(std::move(pid)), lockFile(std::move(lock)) {}

const std::string& VirtualMachine::getName() const noexcept { return name; }

std::optional<pid_t> VirtualMachine::pid() const { return readPidFile(pidFile); }

VirtualMachine::VmState VirtualMachine::getState() const {
    auto p = pid();
    if (!p) return VmState::Stopped;
    return isProcessAlive(*p) ? VmState::Running : VmState::Stale;
}

bool VirtualMachine::isActive() const { return getState() == VmState::Running; }

bool VirtualMachine::shutdown() const {
    auto p = pid();
    return p && sendSignal(*p, SIGTERM);
}

bool VirtualMachine::destroy() const {
    auto p = pid();
    return p && sendSignal(*p, SIGKILL);
}

bool VirtualMachine::waitForExit(pid_t p, int attempts, std::chrono::milliseconds interval) const {
    for (int i = 0; i < attempts; ++i) {
        if (!isProcessAlive(p)) return true;
        std::this_thread::sleep_for(interval);
    }
    return !isProcessAlive(p);
}

Result<VirtualMachine::StopOutcome> VirtualMachine::stop(int attempts, std::chrono::milliseconds interval) {
    auto p = pid();
    if (!p) {
        clearRecords();
        return StopOutcome::NotRunning;
    }
    if (!isProcessAlive(*p)) {
        BoostLogger::Debug("PID " + std::to_string(*p) + " is not alive");
        clearRecords();
        return StopOutcome::StaleRecord;
    }

    BoostLogger::Info("Stopping VM (PID " + std::to_string(*p) + ")...");
    if (!sendSignal(*p, SIGTERM) && isProcessAlive(*p)) {
        const std::string owner = describeProcess(*p);
        BoostLogger::Warn("Cannot signal " + owner + "; leaving " + pidFile.string() + " and " +
                          lockFile.string() + " in place");
        return fatal("cannot signal " + owner,
                     "Stop it as its owner; reset refuses while " + owner + " holds the instance");
    }

    StopOutcome outcome = StopOutcome::Graceful;
    if (!waitForExit(*p, attempts, interval)) {
        BoostLogger::Warn("Graceful shutdown timed out; sending SIGKILL");
        if (!sendSignal(*p, SIGKILL)) BoostLogger::Debug("SIGKILL: PID " + std::to_string(*p) + " already gone");
        outcome = StopOutcome::Forced;
        if (!waitForExit(*p, attempts, interval / 10)) {
            BoostLogger::Warn("PID " + std::to_string(*p) + " still present after SIGKILL");
        }
    }
    clearRecords();
    return outcome;
}

void VirtualMachine::clearRecords() const noexcept {
    std::error_code ec;
    std::filesystem::remove(pidFile, ec);
    std::filesystem::remove(lockFile, ec);
}

std::string_view toString(VirtualMachine::VmState state) noexcept {
    switch (state) {
        case VirtualMachine::VmState::Running: return "running";
        case VirtualMachine::VmState::Stale:   return "stale";
        case VirtualMachine::VmState::Stopped: return "stopped";
    }
    return "unknown";
}

} // namespace ReproVM
