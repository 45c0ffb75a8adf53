#include "ReproVM/Virtualization/vmm/VirtualMachineManager.hpp"
#include "ReproVM/System/Process.hpp"
#include "ReproVM/System/Sha256.hpp"
#include "ReproVM/Utils/Logger.hpp"
#include "ReproVM/Virtualization/Utils/VmException.hpp"
#include "ReproVM/Virtualization/vm/VirtualMachine.hpp"
#include "ReproVM/Virtualization/vm/VirtualMachineDisk.hpp"
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <utility>

namespace ReproVM {

namespace fs = std::filesystem;

namespace {

bool exists(const fs::path& p) {
    std::error_code ec;
    return fs::exists(p, ec);
}

std::string joinArgs(const std::vector<std::string>& argv) {
    std::string out;
    for (const auto& a : argv) {
        if (!out.empty()) out += ' ';
        out += a;
    }
    return out;
}

} // namespace

VirtualMachineManager::VirtualMachineManager(VmConfig& c,
                                             std::shared_ptr<IPrompter> p,
                                             std::shared_ptr<IHostEnvironment> h,
                                             std::shared_ptr<IDiskImageTool> i,
                                             std::shared_ptr<IHypervisorLauncher> l,
                                             Console con)
    : cfg(c),
      paths(c.layout()),
      prompter(std::move(p)),
      host(std::move(h)),
      images(std::move(i)),
      launcher(std::move(l)),
      console(con),
      provisioner(cfg, paths, *prompter, *images)
{
    BoostLogger::Debug("instance " + cfg.name + " rooted at " + paths.instanceRoot.string());
}

// ---------------------------------------------------------------- prerequisites

VirtualMachineManager::Prerequisites VirtualMachineManager::checkPrerequisites() {
    Prerequisites pre;
    pre.hypervisor = valueOrThrow(launcher->locate());
    BoostLogger::Success("QEMU: " + pre.hypervisor.string());
    pre.acceleration = checkAcceleration();
    checkPort();
    return pre;
}

bool VirtualMachineManager::checkAcceleration() {
    switch (host->probeAcceleration()) {
        case Acceleration::Usable:
            BoostLogger::Success("KVM: enabled");
            return true;
        case Acceleration::Missing:
            BoostLogger::Warn("KVM not available (VM will be SLOW)");
            BoostLogger::Info("Enable with: sudo modprobe kvm-intel (Intel) or sudo modprobe kvm-amd (AMD)");
            if (!prompter->confirm("Continue without KVM?")) {
                throw CancelledException("KVM required for reasonable performance");
            }
            return false;
        case Acceleration::NoPermission:
            BoostLogger::Warn("No KVM permissions");
            BoostLogger::Info("Fix with: sudo usermod -aG kvm $USER && newgrp kvm");
            if (!prompter->confirm("Continue without KVM?")) {
                throw CancelledException("KVM permissions required");
            }
            return false;
    }
    return false;
}

void VirtualMachineManager::checkPort() {
    if (!host->isPortFree(cfg.sshPort)) {
        BoostLogger::Warn("Port " + std::to_string(cfg.sshPort) + " already in use!");
        bool moved = false;
        for (int port = cfg.sshPortRangeFirst; port <= cfg.sshPortRangeLast; ++port) {
            if (port == cfg.sshPort || !host->isPortFree(port)) continue;
            if (prompter->confirm("Use port " + std::to_string(port) + " instead?")) {
                cfg.sshPort = port;
                moved = true;
                break;
            }
        }
        if (!moved) BoostLogger::Warn("Keeping port " + std::to_string(cfg.sshPort) + "; QEMU may refuse to start");
    }
    BoostLogger::Success("SSH port: " + std::to_string(cfg.sshPort));
}

// ---------------------------------------------------------------- launch paths

int VirtualMachineManager::run() {
    BoostLogger::Info("Starting VM: " + cfg.name);
    const InstanceLock lock = acquireLock();
    const auto pre = checkPrerequisites();

    const fs::path code = valueOrThrow(provisioner.ensureFirmware());
    const BaseDiskState base = valueOrThrow(provisioner.ensureBaseDisk());

    if (base.created || provisioner.baseLooksEmpty(base.disk)) {
        BoostLogger::Warn("Base disk appears to be empty!");
        if (prompter->confirm("Install an OS from ISO first?")) {
            return installSession(pre, code);
        }
        if (base.created) console.line("  Run later with: " + console.bold("reprovm install"));
    }

    const fs::path overlay = valueOrThrow(provisioner.ensureOverlayDisk());
    const fs::path vars = valueOrThrow(provisioner.ensureVariableStore());

    LaunchResources resources;
    resources.hypervisor = pre.hypervisor;
    resources.firmwareCode = code;
    resources.variableStore = vars;
    resources.disk = overlay;
    resources.pidFile = paths.pidFile;
    return launch(RunMode::Run, resources, pre.acceleration, std::nullopt);
}

int VirtualMachineManager::install() {
    BoostLogger::Info("Install mode");
    const InstanceLock lock = acquireLock();
    const auto pre = checkPrerequisites();
    const fs::path code = valueOrThrow(provisioner.ensureFirmware());
    (void)valueOrThrow(provisioner.ensureBaseDisk());
    return installSession(pre, code);
}

int VirtualMachineManager::installSession(const Prerequisites& pre, const fs::path& firmwareCode) {
    const fs::path medium = valueOrThrow(provisioner.resolveInstallMedium());

    BoostLogger::Warn("This will install directly to: " + paths.baseDisk.string());
    if (!prompter->confirm("Continue with installation?")) {
        throw CancelledException("Installation cancelled");
    }

    const fs::path scratch = scratchVariablePath();
    valueOrThrow(provisioner.copyVariableTemplate(scratch));
    BoostLogger::Debug("install variable store: " + scratch.string());

    LaunchResources resources;
    resources.hypervisor = pre.hypervisor;
    resources.firmwareCode = firmwareCode;
    resources.variableStore = scratch;
    resources.disk = paths.baseDisk;
    resources.installMedium = medium;
    resources.pidFile = paths.pidFile;
    return launch(RunMode::Install, resources, pre.acceleration, scratch);
}

int VirtualMachineManager::snapshot() {
    BoostLogger::Info("Snapshot mode (changes discarded)");
    const InstanceLock lock = acquireLock();
    const auto pre = checkPrerequisites();

    const fs::path code = valueOrThrow(provisioner.ensureFirmware());
    (void)valueOrThrow(provisioner.ensureBaseDisk());
    const fs::path overlay = valueOrThrow(provisioner.ensureOverlayDisk());
    const fs::path vars = valueOrThrow(provisioner.ensureVariableStore());

    BoostLogger::Warn("Every disk and UEFI variable change made in this session is discarded when the VM exits");

    LaunchResources resources;
    resources.hypervisor = pre.hypervisor;
    resources.firmwareCode = code;
    resources.variableStore = vars;
    resources.disk = overlay;
    resources.pidFile = paths.pidFile;
    return launch(RunMode::Snapshot, resources, pre.acceleration, std::nullopt);
}

InstanceLock VirtualMachineManager::acquireLock() {
    InstanceLock lock(paths.lockFile);
    valueOrThrow(lock.acquire());
    return lock;
}

fs::path VirtualMachineManager::scratchVariablePath() const {
    const std::string id = boost::uuids::to_string(boost::uuids::random_generator()());
    return cfg.tempDir / ("reprovm-install-vars-" + id + ".fd");
}

void VirtualMachineManager::openLogFile() {
    std::error_code ec;
    fs::create_directories(paths.logDir, ec);
    if (ec) {
        BoostLogger::Warn("cannot create log directory " + paths.logDir.string() + ": " + ec.message());
        return;
    }
    BoostLogger::AttachFile(paths.logFile);
}

int VirtualMachineManager::launch(RunMode mode, const LaunchResources& resources, bool acceleration,
                                  std::optional<fs::path> scratchVars) {
    const auto discardScratch = [&] {
        if (!scratchVars) return;
        std::error_code ec;
        fs::remove(*scratchVars, ec);
    };

    openLogFile();

    HostCapabilities caps;
    caps.acceleration = acceleration;
    caps.audio = host->audioAvailable();
    if (mode == RunMode::Install) caps.packageCache = host->packageCacheDir();

    const auto argv = buildHypervisorCommand(mode, resources, cfg, caps);
    BoostLogger::Debug("launching (" + std::string(toString(mode)) + "): " + joinArgs(argv));

    printBanner(mode, resources.installMedium);
    if (mode == RunMode::Install && caps.packageCache) {
        console.line("  " + console.paint("Tip: Mount host pacman cache in VM:", Console::Tone::Dim));
        console.line("    " + console.bold("mount -t 9p pacman-cache /var/cache/pacman/pkg"));
        console.line();
    }

    LaunchSession session;
    session.pidFile = paths.pidFile;
    session.scratchVars = scratchVars;
    session.supervise = cfg.supervise;

    auto status = launcher->launch(argv, session);
    if (!status) {
        discardScratch();
        VmException::raise(status.error());
    }
    return *status;
}

void VirtualMachineManager::printBanner(RunMode mode, const fs::path& medium) {
    console.line();
    console.rule();
    console.line(console.paint("  " + cfg.name, Console::Tone::Accent));
    console.rule();
    console.line("  RAM: " + cfg.ram + "  |  CPUs: " + std::to_string(cfg.cpus) +
                 "  |  SSH: " + console.bold("ssh -p " + std::to_string(cfg.sshPort) + " root@localhost"));
    switch (mode) {
        case RunMode::Install:
            console.line("  Mode: " + console.paint("INSTALL", Console::Tone::Warn) + " (writing to base disk)");
            console.line("  ISO:  " + medium.string());
            break;
        case RunMode::Snapshot:
            console.line("  Mode: " + console.paint("SNAPSHOT", Console::Tone::Warn) + " (changes discarded on exit)");
            break;
        case RunMode::Run:
            console.line("  Mode: " + console.paint("NORMAL", Console::Tone::Good) + " (overlay protects base)");
            break;
    }
    console.rule();
    console.line();
}

// ---------------------------------------------------------------- maintenance

int VirtualMachineManager::reset() {
    BoostLogger::Info("Resetting VM: " + cfg.name);

    VirtualMachine vm(cfg.name, paths.pidFile, paths.lockFile);
    if (auto pid = vm.pid(); pid && vm.isActive()) {
        throw ContentionException("VM is running (PID: " + std::to_string(*pid) + ")", "Stop it first: reprovm stop");
    }
    if (const auto lock = InstanceLock::inspect(paths.lockFile); lock.ownerAlive) {
        throw ContentionException("Instance is locked by PID " + std::to_string(lock.owner.value_or(0)),
                                  "Wait for it to finish or run 'reprovm stop'");
    }

    console.line();
    console.line("  This will delete:");
    if (ReproVM::exists(paths.overlayDisk)) console.line("    - Overlay disk: " + paths.overlayDisk.string());
    if (ReproVM::exists(paths.varsStore)) console.line("    - UEFI vars: " + paths.varsStore.string());
    if (ReproVM::exists(paths.logDir)) console.line("    - Logs: " + paths.logDir.string());
    if (ReproVM::exists(paths.pidFile) || ReproVM::exists(paths.lockFile)) console.line("    - Stale PID/lock records");
    console.line();
    console.line("  " + console.paint("Base disk preserved:", Console::Tone::Good) + " " + paths.baseDisk.string());
    console.line("  " + console.paint("Firmware preserved:", Console::Tone::Good) + " " + paths.firmwareDir.string());
    console.line();

    if (!prompter->confirm("Really reset?", false)) {
        BoostLogger::Info("Reset cancelled");
        return 0;
    }

    for (const auto& p : {paths.overlayDisk, paths.varsStore, paths.pidFile, paths.lockFile}) {
        std::error_code ec;
        fs::remove(p, ec);
        if (ec) throw FatalException("cannot remove " + p.string() + ": " + ec.message());
    }
    std::error_code ec;
    fs::remove_all(paths.logDir, ec);
    if (ec) throw FatalException("cannot remove " + paths.logDir.string() + ": " + ec.message());

    BoostLogger::Success("VM reset complete");
    return 0;
}

int VirtualMachineManager::status() {
    VirtualMachine vm(cfg.name, paths.pidFile, paths.lockFile);

    console.heading("Status: " + cfg.name);

    const auto pid = vm.pid();
    switch (vm.getState()) {
        case VirtualMachine::VmState::Running:
            console.field("State", "RUNNING (PID: " + std::to_string(pid.value_or(0)) + ")", Console::Tone::Good);
            console.field("SSH", "ssh -p " + std::to_string(cfg.sshPort) + " root@localhost");
            break;
        case VirtualMachine::VmState::Stale:
            console.field("State", "STALE (PID " + std::to_string(pid.value_or(0)) + " not alive)", Console::Tone::Warn);
            break;
        case VirtualMachine::VmState::Stopped:
            console.field("State", "stopped", Console::Tone::Dim);
            break;
    }

    const auto lock = InstanceLock::inspect(paths.lockFile);
    if (!lock.present) {
        console.field("Lock", "free", Console::Tone::Dim);
    } else if (lock.ownerAlive) {
        console.field("Lock", "held by PID " + std::to_string(*lock.owner), Console::Tone::Good);
    } else {
        console.field("Lock", "stale", Console::Tone::Warn);
    }

    console.line();
    console.line("  " + console.bold("Resources:"));

    if (ReproVM::exists(paths.firmwareCode)) {
        std::string state = "present (no hash)";
        Console::Tone tone = Console::Tone::Good;
        if (ReproVM::exists(paths.firmwareHash)) {
            auto verified = verifyHashRecord(paths.firmwareHash, paths.firmwareCode);
            if (!verified) {
                state = "unreadable: " + verified.error().message;
                tone = Console::Tone::Bad;
            } else if (*verified) {
                state = "verified";
            } else {
                state = "HASH MISMATCH";
                tone = Console::Tone::Bad;
            }
        }
        console.field("Firmware", console.paint("✓", Console::Tone::Good) + " " + paths.firmwareDir.string() +
                                      " (" + console.paint(state, tone) + ")");
    } else {
        console.field("Firmware", console.paint("✗", Console::Tone::Bad) + " not found");
    }

    if (auto base = inspectDiskImage(paths.baseDisk); ReproVM::exists(paths.baseDisk) && base) {
        console.field("Base", console.paint("✓", Console::Tone::Good) + " " + paths.baseDisk.string() + " (" +
                                  humanSize(base->virtualSize) + " virtual, " + humanSize(base->actualSize) +
                                  " allocated)");
    } else if (ReproVM::exists(paths.baseDisk)) {
        console.field("Base", console.paint("✗", Console::Tone::Bad) + " " + base.error().message);
    } else {
        console.field("Base", console.paint("✗", Console::Tone::Bad) + " not found");
    }

    if (auto overlay = provisioner.validateOverlay(); overlay && overlay->present) {
        const auto disk = inspectDiskImage(paths.overlayDisk);
        const std::string size = disk ? humanSize(disk->actualSize) : std::string("?");
        console.field("Overlay", console.paint("✓", Console::Tone::Good) + " " + paths.overlayDisk.string() +
                                     " (" + size + ")");
        if (overlay->backingReference) {
            console.field("Backing", *overlay->backingReference + " " +
                                         (overlay->valid ? console.paint("(ok)", Console::Tone::Good)
                                                         : console.paint("(MISSING)", Console::Tone::Bad)));
        }
    } else if (!overlay) {
        console.field("Overlay", console.paint("✗", Console::Tone::Bad) + " " + overlay.error().message);
    } else {
        console.field("Overlay", console.paint("-", Console::Tone::Dim) + " not created");
    }

    if (ReproVM::exists(paths.varsStore)) {
        console.field("UEFI vars", console.paint("✓", Console::Tone::Good) + " " + paths.varsStore.string());
    } else {
        console.field("UEFI vars", console.paint("-", Console::Tone::Dim) + " not created");
    }

    console.line();
    console.rule();
    console.line();
    return 0;
}

int VirtualMachineManager::stop() {
    VirtualMachine vm(cfg.name, paths.pidFile, paths.lockFile);
    switch (valueOrThrow(vm.stop(cfg.stopAttempts, cfg.stopInterval))) {
        case VirtualMachine::StopOutcome::NotRunning:
            throw FatalException("VM not running (no PID file)");
        case VirtualMachine::StopOutcome::StaleRecord:
            throw FatalException("VM not running (stale PID)");
        case VirtualMachine::StopOutcome::Forced:
            BoostLogger::Warn("VM was force killed");
            break;
        case VirtualMachine::StopOutcome::Graceful:
            break;
    }
    BoostLogger::Success("VM stopped");
    return 0;
}

int VirtualMachineManager::ssh(const std::vector<std::string>& extra) {
    auto client = host->findExecutable("ssh");
    if (!client) {
        throw FatalException("SSH client not installed",
                             "sudo pacman -S openssh (Arch), sudo apt install openssh-client (Debian/Ubuntu)");
    }
    BoostLogger::Info("Connecting to VM on port " + std::to_string(cfg.sshPort) + "...");
    VmException::raise(execReplace(buildSshCommand(*client, cfg.sshPort, extra)));
}

} // namespace ReproVM
