#include "TestSupport.hpp"

#include "ReproVM/Virtualization/vm/VirtualMachineDisk.hpp"

using namespace ReproVM;
using reprovm_test::Require;
using reprovm_test::TempDir;
using reprovm_test::WriteFile;
using reprovm_test::WriteQcow2;

namespace {

void TestPlainQcow2() {
  TempDir dir;
  const auto image = dir.path() / "base.qcow2";
  WriteQcow2(image, 40ULL << 30);

  auto disk = inspectDiskImage(image);
  Require(disk.has_value(), "header parses");
  Require(disk->format == "qcow2" && disk->formatVersion == 2, "format and version");
  Require(disk->virtualSize == (40ULL << 30), "virtual size from header");
  Require(!disk->hasBacking(), "no backing reference");
  Require(disk->actualSize < 64 * 1024, "header-only image is tiny on disk");
}

void TestAllocatedSizeTracksPayload() {
  TempDir dir;
  const auto image = dir.path() / "full.qcow2";
  WriteQcow2(image, 1ULL << 30, std::nullopt, 512 * 1024);

  auto disk = inspectDiskImage(image);
  Require(disk.has_value(), "header parses");
  Require(disk->actualSize >= 512 * 1024, "allocated bytes come from st_blocks");
}

void TestBackingReference() {
  TempDir dir;
  const auto base = dir.path() / "shared" / "base.qcow2";
  const auto overlay = dir.path() / "inst" / "disk.qcow2";
  WriteQcow2(base, 40ULL << 30);
  WriteQcow2(overlay, 40ULL << 30, base.string());

  auto disk = inspectDiskImage(overlay);
  Require(disk.has_value(), "overlay parses");
  Require(disk->backingReference.value_or("") == base.string(), "backing reference recorded verbatim");
  Require(disk->backingResolves(), "backing resolves while base exists");

  fs::remove(base);
  auto again = inspectDiskImage(overlay);
  Require(again.has_value(), "overlay still parses");
  Require(again->hasBacking() && !again->backingResolves(), "dangling backing detected");
}

void TestRelativeBackingResolvesAgainstImageDirectory() {
  TempDir dir;
  WriteQcow2(dir.path() / "img" / "base.qcow2", 1ULL << 30);
  WriteQcow2(dir.path() / "img" / "child.qcow2", 1ULL << 30, std::string("base.qcow2"));

  auto disk = inspectDiskImage(dir.path() / "img" / "child.qcow2");
  Require(disk.has_value(), "child parses");
  Require(disk->backingFile.value_or("") == dir.path() / "img" / "base.qcow2", "relative backing resolved");
  Require(disk->backingResolves(), "relative backing resolves");
}

void TestRawAndBrokenImages() {
  TempDir dir;
  const auto raw = dir.path() / "vars.fd";
  WriteFile(raw, std::string(4096, '\0'));
  auto disk = inspectDiskImage(raw);
  Require(disk.has_value() && disk->format == "raw", "non-qcow2 reported as raw");
  Require(disk->virtualSize == 4096, "raw virtual size is the file size");

  const auto truncated = dir.path() / "short.qcow2";
  WriteFile(truncated, std::string("QFI\xfb\0\0\0\x02", 8));
  Require(!inspectDiskImage(truncated).has_value(), "truncated header rejected");

  const auto future = dir.path() / "v9.qcow2";
  WriteQcow2(future, 1ULL << 30);
  {
    std::fstream io(future, std::ios::in | std::ios::out | std::ios::binary);
    io.seekp(7);
    io.put(static_cast<char>(9));
  }
  Require(!inspectDiskImage(future).has_value(), "unknown qcow2 version rejected");

  auto missing = inspectDiskImage(dir.path() / "absent.qcow2");
  Require(!missing && missing.error().category == ErrorCategory::Fatal, "missing image is fatal");
}

} // namespace

int main() {
  TestPlainQcow2();
  TestAllocatedSizeTracksPayload();
  TestBackingReference();
  TestRelativeBackingResolvesAgainstImageDirectory();
  TestRawAndBrokenImages();
  std::cout << "test_disk_image completed" << std::endl;
  return 0;
}
