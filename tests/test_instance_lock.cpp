#include "TestSupport.hpp"

#include "ReproVM/Virtualization/vmm/InstanceLock.hpp"

using namespace ReproVM;
using reprovm_test::DeadPid;
using reprovm_test::LivePid;
using reprovm_test::ReadFile;
using reprovm_test::Require;
using reprovm_test::TempDir;
using reprovm_test::WriteFile;

namespace {

void TestAcquireAndRelease() {
  TempDir dir;
  const auto path = dir.path() / "inst" / ".qemu.lock";
  {
    InstanceLock lock(path);
    Require(lock.acquire().has_value(), "fresh acquire succeeds");
    Require(lock.held(), "held after acquire");
    Require(readPidFile(path).value_or(-1) == ::getpid(), "lock names this process");
    Require(lock.acquire().has_value(), "re-acquire while held is a no-op");

    const auto status = InstanceLock::inspect(path);
    Require(status.present && status.ownerAlive && !status.stale(), "inspect sees a live owner");
  }
  Require(!fs::exists(path), "destructor releases");
}

void TestLiveOwnerIsContention() {
  TempDir dir;
  const auto path = dir.path() / ".qemu.lock";
  const pid_t owner = LivePid();
  WriteFile(path, std::to_string(owner) + "\n");

  InstanceLock lock(path);
  auto r = lock.acquire();
  Require(!r.has_value(), "live owner blocks acquisition");
  Require(r.error().category == ErrorCategory::Contention, "reported as contention");
  Require(r.error().remedy.find("stop") != std::string::npos, "remedy points at stop");
  Require(!lock.held(), "not held after contention");
  Require(readPidFile(path).value_or(-1) == owner, "foreign lock left untouched");
}

void TestStaleLockIsReclaimed() {
  TempDir dir;
  const auto path = dir.path() / ".qemu.lock";
  WriteFile(path, std::to_string(DeadPid()) + "\n");
  Require(InstanceLock::inspect(path).stale(), "dead owner is stale");

  InstanceLock lock(path);
  Require(lock.acquire().has_value(), "stale lock reclaimed without intervention");
  Require(readPidFile(path).value_or(-1) == ::getpid(), "lock rewritten with our PID");
}

void TestGarbageLockIsReclaimed() {
  TempDir dir;
  const auto path = dir.path() / ".qemu.lock";
  WriteFile(path, "not-a-pid");

  const auto status = InstanceLock::inspect(path);
  Require(status.present && !status.owner && status.stale(), "unparseable lock is stale");

  InstanceLock lock(path);
  Require(lock.acquire().has_value(), "garbage lock reclaimed");
}

void TestMoveTransfersOwnership() {
  TempDir dir;
  const auto path = dir.path() / ".qemu.lock";
  InstanceLock first(path);
  Require(first.acquire().has_value(), "acquire");

  InstanceLock second(std::move(first));
  Require(second.held(), "ownership moved");
  second.release();
  Require(!fs::exists(path), "release through the new owner");
  Require(!InstanceLock::inspect(path).present, "absent after release");
}

} // namespace

int main() {
  TestAcquireAndRelease();
  TestLiveOwnerIsContention();
  TestStaleLockIsReclaimed();
  TestGarbageLockIsReclaimed();
  TestMoveTransfersOwnership();
  std::cout << "test_instance_lock completed" << std::endl;
  return 0;
}
