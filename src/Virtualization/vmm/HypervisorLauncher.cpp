#include "ReproVM/Virtualization/vmm/HypervisorLauncher.hpp"
#include "ReproVM/Core/concurrency/ProcessSupervisor.hpp"
#include "ReproVM/System/Process.hpp"
#include "ReproVM/Utils/Logger.hpp"
#include <cctype>
#include <unistd.h>

namespace ReproVM {

namespace {

void removeQuietly(const std::filesystem::path& p) {
    std::error_code ec;
    std::filesystem::remove(p, ec);
    if (ec) BoostLogger::Debug("cannot remove " + p.string() + ": " + ec.message());
}

} // namespace

std::optional<std::string> parseVersion(std::string_view text) {
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) continue;
        if (i > 0 && (std::isalnum(static_cast<unsigned char>(text[i - 1])) || text[i - 1] == '.')) continue;
        std::size_t j = i;
        int dots = 0;
        while (j < text.size() && (std::isdigit(static_cast<unsigned char>(text[j])) || text[j] == '.')) {
            if (text[j] == '.') ++dots;
            ++j;
        }
        std::string_view candidate = text.substr(i, j - i);
        while (!candidate.empty() && candidate.back() == '.') {
            candidate.remove_suffix(1);
            --dots;
        }
        if (dots >= 1) return std::string(candidate);
        i = j;
    }
    return std::nullopt;
}

QemuLauncher::QemuLauncher(std::shared_ptr<IHostEnvironment> h, std::string b)
    : host(std::move(h)), binary(std::move(b)) {}

Result<std::filesystem::path> QemuLauncher::locate() {
    if (!resolved.empty()) return resolved;
    auto path = host->findExecutable(binary);
    if (!path) {
        return fatal(binary + " not found",
                     "Install QEMU: sudo pacman -S qemu-full (Arch), sudo apt install qemu-system-x86 (Debian/Ubuntu), "
                     "sudo dnf install qemu-kvm (Fedora)");
    }
    resolved = *path;
    if (auto v = version()) {
        BoostLogger::Debug("QEMU version: " + *v);
    }
    return resolved;
}

std::optional<std::string> QemuLauncher::version() const {
    if (resolved.empty()) return std::nullopt;
    auto out = runCommand({resolved.string(), "--version"});
    if (!out || out->exitCode != 0) return std::nullopt;
    return parseVersion(out->output);
}

Result<int> QemuLauncher::launch(const std::vector<std::string>& argv, const LaunchSession& session) {
    if (argv.empty()) return fatal("launch: empty argument list");
    // A scratch store can only be cleaned up by a process that outlives the hypervisor.
    if (session.supervise || session.scratchVars) return supervise(argv, session);
    return replace(argv, session);
}

Result<int> QemuLauncher::replace(const std::vector<std::string>& argv, const LaunchSession& session) {
    // The PID survives execv, so the record can be written before the hypervisor starts.
    if (auto w = writePidFile(session.pidFile, ::getpid()); !w) return std::unexpected(w.error());
    BoostLogger::Debug("exec " + argv.front());

    Error err = execReplace(argv);
    removeQuietly(session.pidFile);
    return std::unexpected(err);
}

Result<int> QemuLauncher::supervise(const std::vector<std::string>& argv, const LaunchSession& session) {
    CONCURRENCY::ProcessSupervisor supervisor;

    auto status = supervisor.run(argv, [&](pid_t child) {
        if (auto w = writePidFile(session.pidFile, child); !w) {
            BoostLogger::Warn("cannot record hypervisor PID: " + w.error().message);
        }
    });

    removeQuietly(session.pidFile);
    if (session.scratchVars) removeQuietly(*session.scratchVars);

    if (!status) return std::unexpected(status.error());
    if (*status == 0) {
        BoostLogger::Info("VM exited");
    } else {
        BoostLogger::Warn("VM exited with status " + std::to_string(*status));
    }
    return *status;
}

} // namespace ReproVM
