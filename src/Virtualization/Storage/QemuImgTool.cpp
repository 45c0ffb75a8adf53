#include "ReproVM/Virtualization/Storage/QemuImgTool.hpp"
#include "ReproVM/System/Process.hpp"
#include "ReproVM/Utils/Logger.hpp"

namespace ReproVM {

QemuImgTool::QemuImgTool(std::shared_ptr<IHostEnvironment> h, std::string b)
    : host(std::move(h)), binary(std::move(b)) {}

Result<std::filesystem::path> QemuImgTool::locate() const {
    if (auto path = host->findExecutable(binary)) return *path;
    return fatal(binary + " not found",
                 "Install QEMU tools: sudo pacman -S qemu-img (Arch), sudo apt install qemu-utils (Debian/Ubuntu)");
}

Result<void> QemuImgTool::run(std::vector<std::string> args, const std::string& action) {
    auto exe = locate();
    if (!exe) return std::unexpected(exe.error());
    args.insert(args.begin(), exe->string());

    auto out = runCommand(args);
    if (!out) return std::unexpected(out.error());
    if (out->exitCode != 0) {
        std::string detail = out->output;
        while (!detail.empty() && (detail.back() == '\n' || detail.back() == '\r')) detail.pop_back();
        return fatal("failed to " + action + (detail.empty() ? std::string() : ": " + detail));
    }
    BoostLogger::Debug(binary + ": " + action);
    return {};
}

Result<void> QemuImgTool::createImage(const std::filesystem::path& image, std::string_view size) {
    return run({"create", "-q", "-f", "qcow2", image.string(), std::string(size)},
               "create " + image.string());
}

Result<void> QemuImgTool::createOverlay(const std::filesystem::path& overlay, const std::filesystem::path& backing) {
    return run({"create", "-q", "-f", "qcow2", "-F", "qcow2", "-b", backing.string(), overlay.string()},
               "create overlay " + overlay.string());
}

} // namespace ReproVM
