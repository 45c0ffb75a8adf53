#include "ReproVM/Virtualization/Storage/ResourceProvisioner.hpp"
#include "ReproVM/System/Process.hpp"
#include "ReproVM/System/Sha256.hpp"
#include "ReproVM/Utils/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <set>

namespace ReproVM {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kManualEntry = "Enter path manually...";

bool isFile(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec);
}

Result<void> makeDirs(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) return fatal("cannot create " + dir.string() + ": " + ec.message());
    return {};
}

std::string trim(std::string s) {
    const auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    return s;
}

// OVMF_CODE.4m.fd -> OVMF_VARS.4m.fd
fs::path varsSibling(const fs::path& code) {
    std::string name = code.filename().string();
    if (auto pos = name.find("CODE"); pos != std::string::npos) name.replace(pos, 4, "VARS");
    return code.parent_path() / name;
}

} // namespace

ResourceProvisioner::ResourceProvisioner(const VmConfig& c, InstanceLayout l, IPrompter& p, IDiskImageTool& i)
    : cfg(c), paths(std::move(l)), prompter(p), images(i) {}

Result<fs::path> ResourceProvisioner::ensure(ResourceKind kind) {
    switch (kind) {
        case ResourceKind::Firmware:
            return ensureFirmware();
        case ResourceKind::BaseDisk: {
            auto base = ensureBaseDisk();
            if (!base) return std::unexpected(base.error());
            return base->disk.path;
        }
        case ResourceKind::OverlayDisk:
            return ensureOverlayDisk();
        case ResourceKind::VariableStore:
            return ensureVariableStore();
        case ResourceKind::InstallMedium:
            return resolveInstallMedium();
    }
    return fatal("unknown resource kind");
}

// ---------------------------------------------------------------- firmware

std::optional<fs::path> ResourceProvisioner::findHostFirmware() const {
    for (const auto& dir : cfg.firmwareSearchDirs) {
        for (const char* name : {"OVMF_CODE.4m.fd", "OVMF_CODE.fd"}) {
            fs::path candidate = dir / name;
            if (isFile(candidate)) return candidate;
        }
    }
    return std::nullopt;
}

Result<void> ResourceProvisioner::installFirmware(const fs::path& hostCode) {
    const fs::path hostVars = varsSibling(hostCode);
    if (!isFile(hostVars)) {
        return fatal("OVMF_VARS not found: " + hostVars.string(), "Reinstall the host OVMF/edk2 package");
    }
    if (auto r = makeDirs(paths.firmwareDir); !r) return r;

    if (auto r = copyFileAtomic(hostCode, paths.firmwareCode); !r) return r;
    BoostLogger::Success("Copied " + paths.firmwareCode.filename().string());

    if (auto r = copyFileAtomic(hostVars, paths.varsTemplate); !r) return r;
    BoostLogger::Success("Copied OVMF_VARS template");

    if (auto r = writeHashRecord(paths.firmwareHash, paths.firmwareCode); !r) return r;
    BoostLogger::Debug("Recorded firmware digest in " + paths.firmwareHash.string());
    return {};
}

Result<fs::path> ResourceProvisioner::ensureFirmware() {
    if (isFile(paths.firmwareCode) && isFile(paths.varsTemplate)) {
        if (!isFile(paths.firmwareHash)) {
            BoostLogger::Success("Firmware: found (no hash)");
            return paths.firmwareCode;
        }
        auto verified = verifyHashRecord(paths.firmwareHash, paths.firmwareCode);
        if (!verified) return std::unexpected(verified.error());
        if (*verified) {
            BoostLogger::Success("Firmware: verified");
            return paths.firmwareCode;
        }

        BoostLogger::Warn("Firmware hash mismatch!");
        if (!prompter.confirm("Re-copy firmware from system?")) {
            return makeError(ErrorCategory::Cancelled, "Cannot proceed with corrupted firmware");
        }
        std::error_code ec;
        for (const auto& p : {paths.firmwareCode, paths.varsTemplate, paths.firmwareHash}) {
            fs::remove(p, ec);
            if (ec) return fatal("cannot remove " + p.string() + ": " + ec.message());
        }
    }

    auto hostCode = findHostFirmware();
    if (!hostCode) {
        BoostLogger::Warn("OVMF firmware not found on system!");
        return fatal("Install OVMF and try again",
                     "sudo pacman -S edk2-ovmf (Arch), sudo apt install ovmf (Debian/Ubuntu), "
                     "sudo dnf install edk2-ovmf (Fedora)");
    }
    BoostLogger::Success("Found system OVMF: " + hostCode->string());

    if (auto r = installFirmware(*hostCode); !r) return std::unexpected(r.error());
    return paths.firmwareCode;
}

// ---------------------------------------------------------------- disks

Result<BaseDiskState> ResourceProvisioner::ensureBaseDisk() {
    if (isFile(paths.baseDisk)) {
        auto disk = inspectDiskImage(paths.baseDisk);
        if (!disk) return std::unexpected(disk.error());
        BoostLogger::Success("Base disk: " + paths.baseDisk.string() + " (" + humanSize(disk->virtualSize) + ")");
        return BaseDiskState{std::move(*disk), false};
    }

    BoostLogger::Info("Base disk not found: " + paths.baseDisk.string());
    if (!prompter.confirm("Create new base disk (" + cfg.diskSize + ")?")) {
        return makeError(ErrorCategory::Cancelled, "Cannot run without base disk", "Run 'reprovm install' to create it");
    }
    if (auto r = makeDirs(paths.baseDisk.parent_path()); !r) return std::unexpected(r.error());
    if (auto r = images.createImage(paths.baseDisk, cfg.diskSize); !r) {
        return fatal("Failed to create disk: " + r.error().message, r.error().remedy);
    }
    BoostLogger::Success("Created base disk: " + paths.baseDisk.string());

    auto disk = inspectDiskImage(paths.baseDisk);
    if (!disk) return std::unexpected(disk.error());
    return BaseDiskState{std::move(*disk), true};
}

bool ResourceProvisioner::baseLooksEmpty(const VirtualMachineDisk& base) const noexcept {
    return base.actualSize < cfg.emptyDiskThreshold;
}

Result<OverlayCheck> ResourceProvisioner::validateOverlay() const {
    OverlayCheck check;
    if (!isFile(paths.overlayDisk)) return check;
    check.present = true;

    auto disk = inspectDiskImage(paths.overlayDisk);
    if (!disk) return std::unexpected(disk.error());
    check.backingReference = disk->backingReference;
    check.valid = !disk->hasBacking() || disk->backingResolves();
    return check;
}

Result<fs::path> ResourceProvisioner::ensureOverlayDisk() {
    auto check = validateOverlay();
    if (!check) return std::unexpected(check.error());

    if (check->present) {
        if (check->valid) {
            BoostLogger::Success("Overlay disk: ready");
            return paths.overlayDisk;
        }
        BoostLogger::Warn("Overlay's backing file missing: " + check->backingReference.value_or("?"));
        if (!prompter.confirm("Recreate overlay from current base?")) {
            return makeError(ErrorCategory::Cancelled, "Backing file required");
        }
        std::error_code ec;
        fs::remove(paths.overlayDisk, ec);
        if (ec) return fatal("cannot remove " + paths.overlayDisk.string() + ": " + ec.message());
    }

    if (!isFile(paths.baseDisk)) {
        return fatal("Base disk missing: " + paths.baseDisk.string(), "Run 'reprovm install' first");
    }

    BoostLogger::Info("Creating overlay disk...");
    if (auto r = makeDirs(paths.overlayDisk.parent_path()); !r) return std::unexpected(r.error());
    if (auto r = images.createOverlay(paths.overlayDisk, paths.baseDisk); !r) {
        return fatal("Failed to create overlay: " + r.error().message, r.error().remedy);
    }
    BoostLogger::Success("Created overlay disk");
    return paths.overlayDisk;
}

// ---------------------------------------------------------------- variables

Result<void> ResourceProvisioner::copyVariableTemplate(const fs::path& destination) const {
    if (!isFile(paths.varsTemplate)) {
        return fatal("UEFI variable template missing: " + paths.varsTemplate.string(),
                     "Remove " + paths.firmwareDir.string() + " and run again to re-provision firmware");
    }
    if (auto r = makeDirs(destination.parent_path()); !r) return r;
    if (auto r = copyFileAtomic(paths.varsTemplate, destination); !r) {
        return fatal("Failed to copy UEFI vars: " + r.error().message);
    }
    return {};
}

Result<fs::path> ResourceProvisioner::ensureVariableStore() {
    if (isFile(paths.varsStore)) {
        BoostLogger::Success("UEFI vars: ready");
        return paths.varsStore;
    }
    BoostLogger::Info("Creating per-VM UEFI vars...");
    if (auto r = copyVariableTemplate(paths.varsStore); !r) return std::unexpected(r.error());
    BoostLogger::Success("Created UEFI vars");
    return paths.varsStore;
}

// ---------------------------------------------------------------- install medium

std::vector<fs::path> ResourceProvisioner::findInstallMedia() const {
    std::vector<fs::path> found;
    std::set<fs::path> seen;

    for (const auto& root : cfg.mediaSearchDirs) {
        std::error_code ec;
        if (!fs::is_directory(root, ec)) continue;

        std::vector<fs::path> local;
        fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
        for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            const auto& entry = *it;
            std::error_code sec;
            if (entry.is_directory(sec)) {
                if (it.depth() + 1 >= cfg.mediaSearchDepth) it.disable_recursion_pending();
                continue;
            }
            if (entry.path().extension() == ".iso" && entry.is_regular_file(sec)) {
                local.push_back(entry.path());
            }
        }

        std::sort(local.begin(), local.end());
        std::size_t taken = 0;
        for (auto& p : local) {
            if (taken == cfg.mediaResultsPerDir) break;
            std::error_code cec;
            fs::path key = fs::weakly_canonical(p, cec);
            if (cec) key = p;
            if (!seen.insert(key).second) continue;
            found.push_back(std::move(p));
            ++taken;
        }
    }
    return found;
}

fs::path ResourceProvisioner::expandHome(const std::string& text) const {
    if (text == "~") return cfg.home;
    if (text.rfind("~/", 0) == 0) return cfg.home / text.substr(2);
    return fs::path(text);
}

Result<fs::path> ResourceProvisioner::askMediumPath() {
    const std::string reply = trim(prompter.ask("Enter ISO path"));
    if (reply.empty()) {
        return makeError(ErrorCategory::UserInput, "ISO required for installation",
                         "Pass one with --iso PATH or set ISO_PATH");
    }
    fs::path p = expandHome(reply);
    if (!isFile(p)) {
        return makeError(ErrorCategory::UserInput, "File not found: " + p.string());
    }
    return p;
}

Result<fs::path> ResourceProvisioner::resolveInstallMedium() {
    if (!cfg.installMedium.empty()) {
        const fs::path explicitMedium = expandHome(cfg.installMedium.string());
        if (isFile(explicitMedium)) {
            BoostLogger::Success("ISO: " + explicitMedium.string());
            return explicitMedium;
        }
        BoostLogger::Warn("ISO not found: " + explicitMedium.string());
    }

    BoostLogger::Info("Looking for ISO files...");
    const auto found = findInstallMedia();

    Result<fs::path> chosen = fs::path{};
    if (found.empty()) {
        BoostLogger::Warn("No ISO files found!");
        BoostLogger::Info("Download an Arch ISO from https://archlinux.org/download/");
        chosen = askMediumPath();
    } else if (found.size() == 1) {
        if (prompter.confirm("Use " + found.front().string() + "?")) {
            chosen = found.front();
        } else {
            chosen = askMediumPath();
        }
    } else {
        std::vector<std::string> options;
        options.reserve(found.size() + 1);
        for (const auto& p : found) options.push_back(p.string());
        options.emplace_back(kManualEntry);

        const std::size_t index = prompter.choose("Select an ISO:", options, 0);
        if (index < found.size()) {
            chosen = found[index];
        } else {
            chosen = askMediumPath();
        }
    }

    if (chosen) BoostLogger::Success("Using ISO: " + chosen->string());
    return chosen;
}

std::string_view toString(ResourceKind kind) noexcept {
    switch (kind) {
        case ResourceKind::Firmware:      return "firmware";
        case ResourceKind::BaseDisk:      return "base disk";
        case ResourceKind::OverlayDisk:   return "overlay disk";
        case ResourceKind::VariableStore: return "variable store";
        case ResourceKind::InstallMedium: return "installation medium";
    }
    return "resource";
}

} // namespace ReproVM
