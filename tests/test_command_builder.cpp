#include "TestSupport.hpp"

#include "ReproVM/Virtualization/builder/VirtualMachineBuilder.hpp"
#include "ReproVM/Virtualization/builder/VirtualMachineNicBuilder.hpp"
#include "ReproVM/Virtualization/vmm/HypervisorLauncher.hpp"

#include <stdexcept>

using namespace ReproVM;
using reprovm_test::AnyContains;
using reprovm_test::Contains;
using reprovm_test::IndexOf;
using reprovm_test::MakeConfig;
using reprovm_test::Require;
using reprovm_test::TempDir;

namespace {

struct Fixture {
  TempDir dir;
  VmConfig cfg = MakeConfig(dir.path());
  InstanceLayout layout = cfg.layout();
  fs::path scratch = cfg.tempDir / "reprovm-install-vars-test.fd";
  fs::path medium = dir.path() / "media" / "archlinux.iso";

  LaunchResources resources(RunMode mode) const {
    LaunchResources r;
    r.hypervisor = "/usr/bin/qemu-system-x86_64";
    r.firmwareCode = layout.firmwareCode;
    r.pidFile = layout.pidFile;
    if (mode == RunMode::Install) {
      r.variableStore = scratch;
      r.disk = layout.baseDisk;
      r.installMedium = medium;
    } else {
      r.variableStore = layout.varsStore;
      r.disk = layout.overlayDisk;
    }
    return r;
  }
};

HostCapabilities Accelerated() {
  HostCapabilities caps;
  caps.acceleration = true;
  return caps;
}

void TestDeterministic() {
  Fixture f;
  for (RunMode mode : {RunMode::Install, RunMode::Run, RunMode::Snapshot}) {
    const auto a = buildHypervisorCommand(mode, f.resources(mode), f.cfg, Accelerated());
    const auto b = buildHypervisorCommand(mode, f.resources(mode), f.cfg, Accelerated());
    Require(a == b, std::string("identical argv for ") + std::string(toString(mode)));
    Require(!a.empty() && a.front() == "/usr/bin/qemu-system-x86_64", "argv[0] is the hypervisor");
  }

  VirtualMachineBuilder builder;
  builder.setEmulator("/usr/bin/qemu-system-x86_64")
      .setName("demo")
      .setMemory("4G")
      .setCpuCount(4)
      .setFirmware(f.layout.firmwareCode, f.layout.varsStore)
      .setDisk(f.layout.overlayDisk, RunMode::Run)
      .setNic(VirtualMachineNic(f.cfg.macAddress, f.cfg.sshPort));
  Require(builder.build() == builder.build(), "repeated builds of one builder agree");
}

void TestDiskTargets() {
  Fixture f;
  const std::string base = f.layout.baseDisk.string();
  const std::string overlay = f.layout.overlayDisk.string();

  const auto install = buildHypervisorCommand(RunMode::Install, f.resources(RunMode::Install), f.cfg, Accelerated());
  Require(AnyContains(install, base), "install writes to the base disk");
  Require(!AnyContains(install, overlay), "install never references the overlay");

  for (RunMode mode : {RunMode::Run, RunMode::Snapshot}) {
    const auto argv = buildHypervisorCommand(mode, f.resources(mode), f.cfg, Accelerated());
    Require(AnyContains(argv, overlay), "run/snapshot use the overlay");
    Require(!AnyContains(argv, base), "run/snapshot never reference the base disk");
  }

  const auto run = buildHypervisorCommand(RunMode::Run, f.resources(RunMode::Run), f.cfg, Accelerated());
  Require(Contains(run, "file=" + overlay + ",format=qcow2,if=virtio"), "plain read/write overlay");

  const auto snap = buildHypervisorCommand(RunMode::Snapshot, f.resources(RunMode::Snapshot), f.cfg, Accelerated());
  Require(Contains(snap, "file=" + overlay + ",format=qcow2,if=virtio,snapshot=on"), "snapshot discards writes");
}

void TestFirmwareOrderAndVariables() {
  Fixture f;
  const std::string code = "if=pflash,format=raw,readonly=on,file=" + f.layout.firmwareCode.string();
  const std::string store = "if=pflash,format=raw,file=" + f.layout.varsStore.string();
  const std::string scratch = "if=pflash,format=raw,file=" + f.scratch.string();

  const auto run = buildHypervisorCommand(RunMode::Run, f.resources(RunMode::Run), f.cfg, Accelerated());
  const auto codeAt = IndexOf(run, code);
  const auto storeAt = IndexOf(run, store);
  Require(codeAt > 0 && storeAt > 0, "both firmware drives present");
  Require(codeAt < storeAt, "code drive precedes the variable store");

  const auto install = buildHypervisorCommand(RunMode::Install, f.resources(RunMode::Install), f.cfg, Accelerated());
  Require(Contains(install, scratch), "install uses the scratch copy");
  Require(!Contains(install, store), "install never touches the persistent store");
  Require(IndexOf(install, code) < IndexOf(install, scratch), "order holds for install too");
}

void TestSnapshotDiscardsVariableWrites() {
  Fixture f;
  const std::string code = "if=pflash,format=raw,readonly=on,file=" + f.layout.firmwareCode.string();
  const std::string store = "if=pflash,format=raw,file=" + f.layout.varsStore.string();

  const auto snap = buildHypervisorCommand(RunMode::Snapshot, f.resources(RunMode::Snapshot), f.cfg, Accelerated());
  Require(Contains(snap, store + ",snapshot=on"), "snapshot drops variable store writes");
  Require(!Contains(snap, store), "no writable variable store in snapshot mode");
  Require(Contains(snap, code), "code image stays read-only");
  Require(IndexOf(snap, code) < IndexOf(snap, store + ",snapshot=on"), "order holds for snapshot");

  const auto run = buildHypervisorCommand(RunMode::Run, f.resources(RunMode::Run), f.cfg, Accelerated());
  Require(Contains(run, store), "run persists variable writes");
  Require(!Contains(run, store + ",snapshot=on"), "run does not discard variable writes");
}

void TestNetwork() {
  Fixture f;
  f.cfg.sshPort = 2234;
  const auto argv = buildHypervisorCommand(RunMode::Run, f.resources(RunMode::Run), f.cfg, Accelerated());
  Require(Contains(argv, "user,id=net0,hostfwd=tcp::2234-:22"), "single forward to guest port 22");
  Require(Contains(argv, "virtio-net-pci,netdev=net0,mac=52:54:00:12:34:56"), "fixed MAC");

  VirtualMachineNicBuilder nicBuilder;
  const auto nic = nicBuilder.setNic(VirtualMachineNic("52:54:00:AB:CD:EF", 2222)).build();
  Require(nic.size() == 4 && nic[0] == "-netdev" && nic[2] == "-device", "netdev then device");
  Require(nic[3] == "virtio-net-pci,netdev=net0,mac=52:54:00:ab:cd:ef", "MAC normalised to lower case");

  bool threw = false;
  try {
    VirtualMachineNic bad("zz:54:00:12:34:56", 2222);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  Require(threw, "invalid MAC rejected");
}

void TestAccelerationFlags() {
  Fixture f;
  const auto fast = buildHypervisorCommand(RunMode::Run, f.resources(RunMode::Run), f.cfg, Accelerated());
  Require(Contains(fast, "-enable-kvm") && Contains(fast, "q35,accel=kvm"), "acceleration requested");
  Require(IndexOf(fast, "-cpu") >= 0 && fast[IndexOf(fast, "-cpu") + 1] == "host", "host CPU model");

  const auto slow = buildHypervisorCommand(RunMode::Run, f.resources(RunMode::Run), f.cfg, HostCapabilities{});
  Require(!Contains(slow, "-enable-kvm"), "no -enable-kvm without acceleration");
  Require(!AnyContains(slow, "accel=kvm"), "no accel machine option without acceleration");
  Require(!Contains(slow, "host"), "host CPU model needs acceleration");
  Require(Contains(slow, "q35"), "plain q35 machine");
}

void TestOptionalDevices() {
  Fixture f;
  const auto quiet = buildHypervisorCommand(RunMode::Run, f.resources(RunMode::Run), f.cfg, Accelerated());
  Require(!Contains(quiet, "-audiodev"), "no audio without a sound server");
  Require(!Contains(quiet, "-virtfs"), "no share outside install");
  Require(Contains(quiet, "-pidfile") && Contains(quiet, f.layout.pidFile.string()), "PID record path passed");
  Require(Contains(quiet, "-nodefaults") && Contains(quiet, "virtio-vga-gl"), "fixed device set");

  HostCapabilities caps = Accelerated();
  caps.audio = true;
  caps.packageCache = fs::path("/var/cache/pacman/pkg");

  const auto run = buildHypervisorCommand(RunMode::Run, f.resources(RunMode::Run), f.cfg, caps);
  Require(Contains(run, "pa,id=snd0") && Contains(run, "hda-duplex,audiodev=snd0"), "audio devices");
  Require(!Contains(run, "-virtfs"), "package cache only shared during install");

  const auto install = buildHypervisorCommand(RunMode::Install, f.resources(RunMode::Install), f.cfg, caps);
  Require(Contains(install, "-virtfs"), "package cache shared during install");
  Require(Contains(install, "-cdrom") && Contains(install, f.medium.string()), "medium attached");
  const auto boot = IndexOf(install, "-boot");
  Require(boot > 0 && install[boot + 1] == "d", "boots from the medium first");
}

void TestIncompleteBuilderRejected() {
  Fixture f;
  auto r = f.resources(RunMode::Install);
  r.installMedium.clear();
  bool threw = false;
  try {
    (void)buildHypervisorCommand(RunMode::Install, r, f.cfg, Accelerated());
  } catch (const std::logic_error&) {
    threw = true;
  }
  Require(threw, "install without a medium is a programming error");
}

void TestSshAndVersion() {
  const auto ssh = buildSshCommand("/usr/bin/ssh", 2230, {"uname", "-a"});
  const std::vector<std::string> expected{"/usr/bin/ssh", "-o", "StrictHostKeyChecking=no", "-o",
                                          "UserKnownHostsFile=/dev/null", "-o", "LogLevel=ERROR",
                                          "-p", "2230", "root@localhost", "uname", "-a"};
  Require(ssh == expected, "ssh argument list");

  Require(parseVersion("QEMU emulator version 8.2.1\nCopyright (c) 2003-2023").value_or("") == "8.2.1",
          "full version");
  Require(parseVersion("qemu 9.0").value_or("") == "9.0", "short version");
  Require(!parseVersion("no version here 7").has_value(), "bare integers are not versions");
}

} // namespace

int main() {
  TestDeterministic();
  TestDiskTargets();
  TestFirmwareOrderAndVariables();
  TestSnapshotDiscardsVariableWrites();
  TestNetwork();
  TestAccelerationFlags();
  TestOptionalDevices();
  TestIncompleteBuilderRejected();
  TestSshAndVersion();
  std::cout << "test_command_builder completed" << std::endl;
  return 0;
}
