#include "ReproVM/Virtualization/builder/VirtualMachineBuilder.hpp"
#include "ReproVM/Virtualization/builder/VirtualMachineNicBuilder.hpp"
#include <stdexcept>

namespace ReproVM {

std::string_view toString(RunMode mode) noexcept {
    switch (mode) {
        case RunMode::Install:  return "install";
        case RunMode::Run:      return "run";
        case RunMode::Snapshot: return "snapshot";
    }
    return "run";
}

void VirtualMachineBuilder::buildArguments() {
    if (emulator.empty()) throw std::logic_error("VirtualMachineBuilder: emulator not set");
    if (diskPath.empty()) throw std::logic_error("VirtualMachineBuilder: disk not set");
    if (firmwareCode.empty() || variableStore.empty()) throw std::logic_error("VirtualMachineBuilder: firmware not set");
    if (mode == RunMode::Install && installMedium.empty()) {
        throw std::logic_error("VirtualMachineBuilder: install mode needs a medium");
    }

    add(emulator.string());
    add("-nodefaults");
    add("-no-user-config");
    if (!name.empty()) add("-name", name);

    buildMachineSection();
    buildFirmwareSection();
    buildDevicesSection();
    buildDiskSection();
    buildAudioSection();
    buildShareSection();

    if (!pidFile.empty()) add("-pidfile", pidFile.string());
}

void VirtualMachineBuilder::buildMachineSection() {
    if (acceleration) {
        add("-machine", "q35,accel=kvm");
        add("-cpu", "host");
    } else {
        add("-machine", "q35");
        add("-cpu", "max");
    }
    add("-m", memory);
    add("-smp", std::to_string(vcpuCount));
    if (acceleration) add("-enable-kvm");
}

void VirtualMachineBuilder::buildFirmwareSection() {
    add("-drive", "if=pflash,format=raw,readonly=on,file=" + firmwareCode.string());
    std::string vars = "if=pflash,format=raw,file=" + variableStore.string();
    // variable writes made during a snapshot session are dropped with the disk writes
    if (mode == RunMode::Snapshot) vars += ",snapshot=on";
    add("-drive", vars);
    add("-rtc", "base=utc,clock=vm");
}

void VirtualMachineBuilder::buildDevicesSection() {
    if (nic) {
        VirtualMachineNicBuilder nicBuilder;
        addAll(nicBuilder.setNic(*nic).build());
    }

    add("-device", "usb-ehci");
    add("-device", "usb-tablet");

    add("-object", "rng-random,filename=/dev/urandom,id=rng0");
    add("-device", "virtio-rng-pci,rng=rng0");

    add("-display", "gtk,gl=on");
    add("-device", "virtio-vga-gl");
}

void VirtualMachineBuilder::buildDiskSection() {
    const std::string drive = "file=" + diskPath.string() + ",format=qcow2,if=virtio";
    switch (mode) {
        case RunMode::Install:
            add("-cdrom", installMedium.string());
            add("-boot", "d");
            add("-drive", drive);
            break;
        case RunMode::Snapshot:
            add("-drive", drive + ",snapshot=on");
            break;
        case RunMode::Run:
            add("-drive", drive);
            break;
    }
}

void VirtualMachineBuilder::buildAudioSection() {
    if (!audio) return;
    add("-audiodev", "pa,id=snd0");
    add("-device", "intel-hda");
    add("-device", "hda-duplex,audiodev=snd0");
}

void VirtualMachineBuilder::buildShareSection() {
    if (mode != RunMode::Install || !packageCache) return;
    add("-virtfs", "local,path=" + packageCache->string() +
                       ",mount_tag=pacman-cache,security_model=none,readonly=on");
}

// Fluent interface implementations
VirtualMachineBuilder& VirtualMachineBuilder::setEmulator(const std::filesystem::path& path) {
    emulator = path;
    return *this;
}

VirtualMachineBuilder& VirtualMachineBuilder::setName(std::string_view n) {
    name = n;
    return *this;
}

VirtualMachineBuilder& VirtualMachineBuilder::setMemory(std::string_view m) {
    memory = m;
    return *this;
}

VirtualMachineBuilder& VirtualMachineBuilder::setCpuCount(unsigned int vcpus) {
    vcpuCount = vcpus;
    return *this;
}

VirtualMachineBuilder& VirtualMachineBuilder::setFirmware(const std::filesystem::path& code,
                                                          const std::filesystem::path& vars) {
    firmwareCode = code;
    variableStore = vars;
    return *this;
}

VirtualMachineBuilder& VirtualMachineBuilder::setDisk(const std::filesystem::path& disk, RunMode m) {
    diskPath = disk;
    mode = m;
    return *this;
}

VirtualMachineBuilder& VirtualMachineBuilder::setInstallMedium(const std::filesystem::path& medium) {
    installMedium = medium;
    return *this;
}

VirtualMachineBuilder& VirtualMachineBuilder::setNic(const VirtualMachineNic& n) {
    nic = n;
    return *this;
}

VirtualMachineBuilder& VirtualMachineBuilder::setAcceleration(bool enabled) {
    acceleration = enabled;
    return *this;
}

VirtualMachineBuilder& VirtualMachineBuilder::setAudio(bool enabled) {
    audio = enabled;
    return *this;
}

VirtualMachineBuilder& VirtualMachineBuilder::setPackageCache(const std::optional<std::filesystem::path>& dir) {
    packageCache = dir;
    return *this;
}

VirtualMachineBuilder& VirtualMachineBuilder::setPidFile(const std::filesystem::path& path) {
    pidFile = path;
    return *this;
}

std::vector<std::string> buildHypervisorCommand(RunMode mode,
                                                const LaunchResources& resources,
                                                const VmConfig& cfg,
                                                const HostCapabilities& host) {
    VirtualMachineBuilder builder;
    builder.setEmulator(resources.hypervisor)
        .setName(cfg.name)
        .setMemory(cfg.ram)
        .setCpuCount(cfg.cpus)
        .setFirmware(resources.firmwareCode, resources.variableStore)
        .setDisk(resources.disk, mode)
        .setNic(VirtualMachineNic(cfg.macAddress, cfg.sshPort))
        .setAcceleration(host.acceleration)
        .setAudio(host.audio)
        .setPackageCache(host.packageCache)
        .setPidFile(resources.pidFile);
    if (mode == RunMode::Install) builder.setInstallMedium(resources.installMedium);
    return builder.build();
}

std::vector<std::string> buildSshCommand(const std::filesystem::path& ssh, int port,
                                         const std::vector<std::string>& extra) {
    std::vector<std::string> argv{
        ssh.string(),
        "-o", "StrictHostKeyChecking=no",
        "-o", "UserKnownHostsFile=/dev/null",
        "-o", "LogLevel=ERROR",
        "-p", std::to_string(port),
        "root@localhost",
    };
    argv.insert(argv.end(), extra.begin(), extra.end());
    return argv;
}

} // namespace ReproVM
