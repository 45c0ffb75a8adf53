#include "ReproVM/Virtualization/vm/VirtualMachineDisk.hpp"
#include <array>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sys/stat.h>
#include <unistd.h>

namespace ReproVM {

namespace {

constexpr std::array<unsigned char, 4> kQcowMagic{'Q', 'F', 'I', 0xfb};
constexpr std::size_t kQcowHeaderV2Size = 72;
constexpr std::uint32_t kMaxBackingNameLength = 1023;

std::uint64_t readBe64(const unsigned char* p) {
    std::uint64_t v = 0;
    for (int i = 0; i < 8; ++i) v = (v << 8) | p[i];
    return v;
}

std::uint32_t readBe32(const unsigned char* p) {
    return (std::uint32_t{p[0]} << 24) | (std::uint32_t{p[1]} << 16) | (std::uint32_t{p[2]} << 8) | p[3];
}

} // namespace

bool VirtualMachineDisk::backingResolves() const {
    if (!backingFile) return false;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(*backingFile, ec)) return false;
    return ::access(backingFile->c_str(), R_OK) == 0;
}

Result<VirtualMachineDisk> inspectDiskImage(const std::filesystem::path& path) {
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        return fatal("cannot stat " + path.string() + ": " + std::strerror(errno));
    }
    if (!S_ISREG(st.st_mode)) return fatal(path.string() + " is not a regular file");

    VirtualMachineDisk disk;
    disk.path = path;
    disk.actualSize = static_cast<std::uint64_t>(st.st_blocks) * 512;

    std::ifstream in(path, std::ios::binary);
    if (!in) return fatal("cannot open " + path.string());

    std::array<unsigned char, kQcowHeaderV2Size> header{};
    in.read(reinterpret_cast<char*>(header.data()), header.size());
    const auto got = static_cast<std::size_t>(in.gcount());

    if (got < kQcowMagic.size() || std::memcmp(header.data(), kQcowMagic.data(), kQcowMagic.size()) != 0) {
        disk.format = "raw";
        disk.virtualSize = static_cast<std::uint64_t>(st.st_size);
        return disk;
    }
    if (got < header.size()) return fatal(path.string() + ": truncated qcow2 header");

    disk.format = "qcow2";
    disk.formatVersion = readBe32(header.data() + 4);
    if (disk.formatVersion < 2 || disk.formatVersion > 3) {
        return fatal(path.string() + ": unsupported qcow2 version " + std::to_string(disk.formatVersion));
    }
    const std::uint64_t backingOffset = readBe64(header.data() + 8);
    const std::uint32_t backingLength = readBe32(header.data() + 16);
    disk.virtualSize = readBe64(header.data() + 24);

    if (backingOffset != 0 && backingLength != 0) {
        if (backingLength > kMaxBackingNameLength ||
            backingOffset + backingLength > static_cast<std::uint64_t>(st.st_size)) {
            return fatal(path.string() + ": corrupt backing file reference");
        }
        std::string name(backingLength, '\0');
        in.clear();
        in.seekg(static_cast<std::streamoff>(backingOffset));
        in.read(name.data(), backingLength);
        if (static_cast<std::uint32_t>(in.gcount()) != backingLength) {
            return fatal(path.string() + ": truncated backing file reference");
        }
        std::filesystem::path resolved(name);
        if (resolved.is_relative()) resolved = path.parent_path() / resolved;
        disk.backingReference = std::move(name);
        disk.backingFile = resolved.lexically_normal();
    }
    return disk;
}

} // namespace ReproVM
