#include "TestSupport.hpp"

#include "ReproVM/System/Sha256.hpp"
#include "ReproVM/Virtualization/Storage/ResourceProvisioner.hpp"

using namespace ReproVM;
using reprovm_test::FakeImageTool;
using reprovm_test::InstallHostFirmware;
using reprovm_test::MakeConfig;
using reprovm_test::ReadFile;
using reprovm_test::Require;
using reprovm_test::ScriptedPrompter;
using reprovm_test::TempDir;
using reprovm_test::WriteFile;
using reprovm_test::WriteQcow2;

namespace {

struct Fixture {
  TempDir dir;
  VmConfig cfg = MakeConfig(dir.path());
  ScriptedPrompter prompter;
  FakeImageTool images;
  ResourceProvisioner provisioner{cfg, cfg.layout(), prompter, images};

  const InstanceLayout& layout() const { return provisioner.layout(); }
};

void TestFirmwarePrefers4mVariant() {
  Fixture f;
  InstallHostFirmware(f.dir.path(), false, "legacy-code", "legacy-vars");
  InstallHostFirmware(f.dir.path(), true, "4m-code", "4m-vars");

  auto code = f.provisioner.ensureFirmware();
  Require(code.has_value(), "firmware provisioned");
  Require(*code == f.layout().firmwareCode, "returns the shared code image");
  Require(ReadFile(f.layout().firmwareCode) == "4m-code", "4m variant wins");
  Require(ReadFile(f.layout().varsTemplate) == "4m-vars", "template taken from the VARS sibling");
  Require(verifyHashRecord(f.layout().firmwareHash, f.layout().firmwareCode).value_or(false), "digest recorded");

  Require(f.provisioner.ensureFirmware().has_value(), "second call verifies");
  Require(f.prompter.questions.empty(), "no prompts on the happy path");
}

void TestFirmwareLegacyFallbackAndMissingHash() {
  Fixture f;
  InstallHostFirmware(f.dir.path(), false, "legacy-code", "legacy-vars");
  Require(f.provisioner.ensureFirmware().has_value(), "legacy firmware accepted");
  Require(ReadFile(f.layout().firmwareCode) == "legacy-code", "legacy code copied");

  fs::remove(f.layout().firmwareHash);
  WriteFile(f.layout().firmwareCode, "tampered-but-unrecorded");
  Require(f.provisioner.ensureFirmware().has_value(), "no record means nothing to verify");
  Require(ReadFile(f.layout().firmwareCode) == "tampered-but-unrecorded", "left alone without a record");
}

void TestFirmwareMismatchNeedsConfirmation() {
  Fixture f;
  InstallHostFirmware(f.dir.path(), true, "good-code", "good-vars");
  Require(f.provisioner.ensureFirmware().has_value(), "provisioned");

  WriteFile(f.layout().firmwareCode, "corrupted");
  f.prompter.confirms = {false};
  auto declined = f.provisioner.ensureFirmware();
  Require(!declined && declined.error().category == ErrorCategory::Cancelled, "declining is not silent");
  Require(ReadFile(f.layout().firmwareCode) == "corrupted", "nothing deleted without consent");

  f.prompter.confirms = {true};
  Require(f.provisioner.ensureFirmware().has_value(), "re-provisioned after consent");
  Require(ReadFile(f.layout().firmwareCode) == "good-code", "host image copied again");
  Require(verifyHashRecord(f.layout().firmwareHash, f.layout().firmwareCode).value_or(false), "record refreshed");
}

void TestFirmwareMissingOnHost() {
  Fixture f;
  auto none = f.provisioner.ensureFirmware();
  Require(!none && none.error().category == ErrorCategory::Fatal, "no host firmware is fatal");
  Require(none.error().remedy.find("edk2-ovmf") != std::string::npos, "install hint given");

  WriteFile(f.dir.path() / "host" / "ovmf" / "OVMF_CODE.fd", "orphan");
  auto orphan = f.provisioner.ensureFirmware();
  Require(!orphan && orphan.error().message.find("OVMF_VARS") != std::string::npos, "VARS sibling required");
}

void TestBaseDisk() {
  Fixture f;
  f.prompter.confirms = {false};
  auto declined = f.provisioner.ensureBaseDisk();
  Require(!declined && declined.error().category == ErrorCategory::Cancelled, "base creation needs consent");
  Require(f.images.created.empty(), "nothing created");

  auto created = f.provisioner.ensureBaseDisk();
  Require(created.has_value() && created->created, "created on confirmation");
  Require(created->disk.virtualSize == (40ULL << 30), "configured size");
  Require(f.provisioner.baseLooksEmpty(created->disk), "fresh base looks empty");

  auto existing = f.provisioner.ensureBaseDisk();
  Require(existing.has_value() && !existing->created, "existing base reused");
  Require(f.images.created.size() == 1, "created exactly once");

  WriteQcow2(f.layout().baseDisk, 40ULL << 30, std::nullopt, 256 * 1024);
  auto installed = f.provisioner.ensureBaseDisk();
  Require(installed.has_value() && !f.provisioner.baseLooksEmpty(installed->disk), "populated base not empty");
}

void TestOverlayBackingReference() {
  Fixture f;
  auto missingBase = f.provisioner.ensureOverlayDisk();
  Require(!missingBase && missingBase.error().category == ErrorCategory::Fatal, "overlay needs a base");

  WriteQcow2(f.layout().baseDisk, 40ULL << 30);
  auto overlay = f.provisioner.ensureOverlayDisk();
  Require(overlay.has_value() && *overlay == f.layout().overlayDisk, "overlay created");

  auto check = f.provisioner.validateOverlay();
  Require(check.has_value() && check->present && check->valid, "fresh overlay valid");
  Require(check->backingReference.value_or("") == f.layout().baseDisk.string(), "backing reference is the base path");

  fs::remove(f.layout().baseDisk);
  auto broken = f.provisioner.validateOverlay();
  Require(broken.has_value() && broken->present && !broken->valid, "deleted base flags the overlay invalid");
}

void TestBrokenOverlayRebuiltOnlyWithConsent() {
  Fixture f;
  WriteQcow2(f.layout().baseDisk, 40ULL << 30);
  WriteQcow2(f.layout().overlayDisk, 40ULL << 30, std::string("/nonexistent/old-base.qcow2"));

  f.prompter.confirms = {false};
  auto declined = f.provisioner.ensureOverlayDisk();
  Require(!declined && declined.error().category == ErrorCategory::Cancelled, "broken overlay never reused");
  Require(f.images.overlays.empty(), "not recreated without consent");

  f.prompter.confirms = {true};
  Require(f.provisioner.ensureOverlayDisk().has_value(), "recreated after consent");
  Require(f.images.overlays.size() == 1 && f.images.overlays.front().second == f.layout().baseDisk,
          "rebuilt from the current base");
  Require(f.provisioner.validateOverlay().value().valid, "rebuilt overlay valid");
}

void TestVariableStoresAreIsolated() {
  TempDir dir;
  InstallHostFirmware(dir.path(), true, "code", "pristine-vars");

  VmConfig alpha = MakeConfig(dir.path(), "alpha");
  VmConfig beta = MakeConfig(dir.path(), "beta");
  ScriptedPrompter prompter;
  FakeImageTool images;
  ResourceProvisioner a(alpha, alpha.layout(), prompter, images);
  ResourceProvisioner b(beta, beta.layout(), prompter, images);

  Require(a.ensureFirmware().has_value(), "shared firmware");
  auto storeA = a.ensure(ResourceKind::VariableStore);
  auto storeB = b.ensure(ResourceKind::VariableStore);
  Require(storeA.has_value() && storeB.has_value() && *storeA != *storeB, "one store per instance");

  WriteFile(*storeA, "alpha-wrote-boot-entries");
  Require(ReadFile(*storeB) == "pristine-vars", "writes do not cross instances");
  Require(ReadFile(alpha.layout().varsTemplate) == "pristine-vars", "template untouched");
  Require(a.ensureVariableStore().has_value() && ReadFile(*storeA) == "alpha-wrote-boot-entries",
          "existing store kept");
}

void TestVariableTemplateRequired() {
  Fixture f;
  auto r = f.provisioner.copyVariableTemplate(f.cfg.tempDir / "scratch.fd");
  Require(!r && r.error().category == ErrorCategory::Fatal, "no template, no copy");
}

void TestMediaDiscovery() {
  Fixture f;
  const auto media = f.dir.path() / "media";
  WriteFile(media / "arch.iso", "iso");
  WriteFile(media / "nested" / "debian.iso", "iso");
  WriteFile(media / "nested" / "deeper" / "hidden.iso", "iso");
  WriteFile(media / "notes.txt", "txt");

  const auto found = f.provisioner.findInstallMedia();
  Require(found.size() == 2, "two media within depth 2");
  Require(std::find(found.begin(), found.end(), media / "arch.iso") != found.end(), "top-level medium");
  Require(std::find(found.begin(), found.end(), media / "nested" / "debian.iso") != found.end(), "nested medium");

  f.cfg.mediaResultsPerDir = 1;
  Require(f.provisioner.findInstallMedia().size() == 1, "per-directory cap");
}

void TestMediumResolution() {
  {
    Fixture f;
    WriteFile(f.dir.path() / "explicit.iso", "iso");
    f.cfg.installMedium = f.dir.path() / "explicit.iso";
    auto r = f.provisioner.resolveInstallMedium();
    Require(r.has_value() && *r == f.dir.path() / "explicit.iso", "explicit medium used");
    Require(f.prompter.questions.empty(), "no prompt for an explicit medium");
  }
  {
    Fixture f;
    WriteFile(f.cfg.home / "isos" / "typed.iso", "iso");
    f.prompter.answers = {"~/isos/typed.iso"};
    auto r = f.provisioner.resolveInstallMedium();
    Require(r.has_value() && *r == f.cfg.home / "isos" / "typed.iso", "zero candidates: typed path, ~ expanded");
  }
  {
    Fixture f;
    auto r = f.provisioner.resolveInstallMedium();
    Require(!r && r.error().category == ErrorCategory::UserInput, "no medium supplied");
    f.prompter.answers = {"/nonexistent.iso"};
    auto missing = f.provisioner.resolveInstallMedium();
    Require(!missing && missing.error().category == ErrorCategory::UserInput, "typed path must exist");
  }
  {
    Fixture f;
    WriteFile(f.dir.path() / "media" / "only.iso", "iso");
    auto r = f.provisioner.resolveInstallMedium();
    Require(r.has_value() && r->filename() == "only.iso", "single candidate confirmed");
    Require(f.prompter.asked("Use "), "single candidate offered");

    WriteFile(f.dir.path() / "elsewhere.iso", "iso");
    f.prompter.confirms = {false};
    f.prompter.answers = {(f.dir.path() / "elsewhere.iso").string()};
    auto other = f.provisioner.resolveInstallMedium();
    Require(other.has_value() && other->filename() == "elsewhere.iso", "declined candidate falls back to entry");
  }
  {
    Fixture f;
    WriteFile(f.dir.path() / "media" / "a.iso", "iso");
    WriteFile(f.dir.path() / "media" / "b.iso", "iso");
    f.prompter.choices = {1};
    auto r = f.provisioner.resolveInstallMedium();
    Require(r.has_value() && r->filename() == "b.iso", "selection honoured");
    Require(f.prompter.presentedOptions.back().size() == 3, "manual entry offered");
    Require(f.prompter.presentedOptions.back().back() == "Enter path manually...", "manual entry last");

    WriteFile(f.dir.path() / "typed.iso", "iso");
    f.prompter.choices = {2};
    f.prompter.answers = {(f.dir.path() / "typed.iso").string()};
    auto manual = f.provisioner.resolveInstallMedium();
    Require(manual.has_value() && manual->filename() == "typed.iso", "manual escape");
  }
}

} // namespace

int main() {
  TestFirmwarePrefers4mVariant();
  TestFirmwareLegacyFallbackAndMissingHash();
  TestFirmwareMismatchNeedsConfirmation();
  TestFirmwareMissingOnHost();
  TestBaseDisk();
  TestOverlayBackingReference();
  TestBrokenOverlayRebuiltOnlyWithConsent();
  TestVariableStoresAreIsolated();
  TestVariableTemplateRequired();
  TestMediaDiscovery();
  TestMediumResolution();
  std::cout << "test_resource_provisioner completed" << std::endl;
  return 0;
}
