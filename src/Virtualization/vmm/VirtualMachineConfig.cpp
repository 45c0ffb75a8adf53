#include "ReproVM/Virtualization/vmm/VirtualMachineConfig.hpp"
#include "ReproVM/Virtualization/vm/VirtualMachineNic.hpp"
#include <cctype>
#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <limits>

namespace ReproVM {

namespace {

template <typename Int>
Result<Int> parseInteger(std::string_view key, std::string_view text) {
    Int value{};
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return fatal(std::string(key) + " is not a number: '" + std::string(text) + "'");
    }
    return value;
}

bool isFlagSet(const std::optional<std::string>& v) {
    return v && (*v == "1" || *v == "true" || *v == "yes");
}

} // namespace

Result<VmConfig> VmConfig::fromEnvironment(const EnvLookup& env) {
    VmConfig cfg;

    auto home = env("HOME");
    if (!home || home->empty()) {
        return fatal("HOME is not set", "Export HOME or set both VM_ROOT and BASE_DIR");
    }
    cfg.home = *home;

    if (auto v = env("VM_NAME"); v && !v->empty()) cfg.name = *v;
    if (auto v = env("VM_RAM"); v && !v->empty()) cfg.ram = *v;
    if (auto v = env("DISK_SIZE"); v && !v->empty()) cfg.diskSize = *v;
    if (auto v = env("MAC_ADDRESS"); v && !v->empty()) cfg.macAddress = *v;
    if (auto v = env("ISO_PATH"); v && !v->empty()) cfg.installMedium = *v;
    if (auto v = env("TMPDIR"); v && !v->empty()) cfg.tempDir = *v;

    if (auto v = env("VM_CPUS"); v && !v->empty()) {
        auto cpus = parseInteger<unsigned int>("VM_CPUS", *v);
        if (!cpus) return std::unexpected(cpus.error());
        cfg.cpus = *cpus;
    }
    if (auto v = env("SSH_FWD_PORT"); v && !v->empty()) {
        auto port = parseInteger<int>("SSH_FWD_PORT", *v);
        if (!port) return std::unexpected(port.error());
        cfg.sshPort = *port;
    }

    if (auto v = env("PATH"); v && !v->empty()) {
        cfg.searchPath.clear();
        std::string_view rest = *v;
        while (!rest.empty()) {
            const auto colon = rest.find(':');
            const auto entry = rest.substr(0, colon);
            if (!entry.empty()) cfg.searchPath.emplace_back(entry);
            if (colon == std::string_view::npos) break;
            rest.remove_prefix(colon + 1);
        }
    }

    cfg.autoConfirm = isFlagSet(env("AUTO_YES"));
    cfg.supervise = isFlagSet(env("VM_SUPERVISE"));

    if (auto v = env("BASE_DIR"); v && !v->empty()) {
        cfg.sharedRoot = *v;
    } else {
        cfg.sharedRoot = cfg.home / "qemu-repro";
    }

    if (auto v = env("VM_ROOT"); v && !v->empty()) {
        cfg.instanceRoot = *v;
        cfg.instanceRootOverridden = true;
    } else {
        cfg.instanceRoot = cfg.home / "qemu-repro" / cfg.name;
    }

    cfg.mediaSearchDirs = {cfg.home, cfg.home / "Downloads", cfg.home / "ISOs", cfg.tempDir};
    return cfg;
}

VmConfig::EnvLookup VmConfig::processEnvironment() {
    return [](std::string_view key) -> std::optional<std::string> {
        const char* value = std::getenv(std::string(key).c_str());
        if (!value) return std::nullopt;
        return std::string(value);
    };
}

void VmConfig::setName(std::string newName) {
    name = std::move(newName);
    if (!instanceRootOverridden && !home.empty()) {
        instanceRoot = home / "qemu-repro" / name;
    }
}

Result<void> VmConfig::validate() const {
    if (name.empty() || name == "." || name == ".." || name.find('/') != std::string::npos) {
        return fatal("invalid instance name: '" + name + "'");
    }
    if (cpus == 0) return fatal("CPU count must be at least 1");
    if (auto r = parseSize(ram); !r || *r == 0) return fatal("invalid RAM size: '" + ram + "'", "Use e.g. 4G or 8192M");
    if (auto r = parseSize(diskSize); !r || *r == 0) return fatal("invalid disk size: '" + diskSize + "'", "Use e.g. 40G");
    if (sshPort < 1 || sshPort > 65535) return fatal("SSH port out of range: " + std::to_string(sshPort));
    if (!VirtualMachineNic::isValidMac(macAddress)) {
        return fatal("invalid MAC address: '" + macAddress + "'", "Use a unicast address such as 52:54:00:12:34:56");
    }
    if (instanceRoot.empty() || sharedRoot.empty()) return fatal("instance and shared roots must be set");
    if (stopAttempts < 1) return fatal("stop attempts must be positive");
    return {};
}

InstanceLayout VmConfig::layout() const {
    InstanceLayout l;
    l.instanceRoot = instanceRoot;
    l.sharedDir = sharedRoot / "qemu";

    l.baseDisk = l.sharedDir / "base.qcow2";
    l.overlayDisk = instanceRoot / "disk.qcow2";

    l.firmwareDir = l.sharedDir / "firmware";
    l.firmwareCode = l.firmwareDir / "OVMF_CODE.fd";
    l.firmwareHash = l.firmwareDir / "OVMF_CODE.fd.sha256";
    l.varsTemplate = l.firmwareDir / "OVMF_VARS.template.fd";
    l.varsStore = instanceRoot / "OVMF_VARS.fd";

    l.lockFile = instanceRoot / ".qemu.lock";
    l.pidFile = instanceRoot / ".qemu.pid";
    l.logDir = instanceRoot / "logs";
    l.logFile = l.logDir / "reprovm.log";
    return l;
}

Result<std::uint64_t> parseSize(std::string_view text) {
    if (text.empty()) return fatal("empty size");

    std::uint64_t multiplier = 1;
    std::string_view digits = text;
    const char suffix = static_cast<char>(std::toupper(static_cast<unsigned char>(text.back())));
    if (!std::isdigit(static_cast<unsigned char>(suffix))) {
        switch (suffix) {
            case 'K': multiplier = 1ULL << 10; break;
            case 'M': multiplier = 1ULL << 20; break;
            case 'G': multiplier = 1ULL << 30; break;
            case 'T': multiplier = 1ULL << 40; break;
            default: return fatal("unknown size suffix in '" + std::string(text) + "'");
        }
        digits.remove_suffix(1);
    }

    auto value = parseInteger<std::uint64_t>("size", digits);
    if (!value) return std::unexpected(value.error());
    if (*value > std::numeric_limits<std::uint64_t>::max() / multiplier) {
        return fatal("size too large: '" + std::string(text) + "'");
    }
    return *value * multiplier;
}

std::string humanSize(std::uint64_t bytes) {
    static constexpr const char* units[] = {"", "K", "M", "G", "T"};
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(units)) {
        value /= 1024.0;
        ++unit;
    }
    char buf[32];
    if (unit == 0 || value >= 10.0) {
        std::snprintf(buf, sizeof(buf), "%.0f%s", value, units[unit]);
    } else {
        std::snprintf(buf, sizeof(buf), "%.1f%s", value, units[unit]);
    }
    return buf;
}

} // namespace ReproVM
