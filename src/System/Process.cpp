#include "ReproVM/System/Process.hpp"
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace ReproVM {

namespace {

std::vector<char*> toArgv(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);
    return argv;
}

fs::path tempSibling(const fs::path& target) {
    return target.parent_path() / ("." + target.filename().string() + ".tmp." + std::to_string(::getpid()));
}

} // namespace

bool isProcessAlive(pid_t pid) noexcept {
    if (pid <= 0) return false;
    if (::kill(pid, 0) == 0) return true;
    return errno == EPERM;
}

std::optional<pid_t> readPidFile(const fs::path& file) {
    std::ifstream in(file);
    if (!in) return std::nullopt;
    long value = 0;
    if (!(in >> value) || value <= 0) return std::nullopt;
    return static_cast<pid_t>(value);
}

Result<void> writePidFile(const fs::path& file, pid_t pid) {
    const fs::path tmp = tempSibling(file);
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) return fatal("cannot write " + tmp.string() + ": " + std::strerror(errno));
        out << pid << '\n';
        if (!out.flush()) return fatal("cannot write " + tmp.string());
    }
    std::error_code ec;
    fs::rename(tmp, file, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return fatal("cannot install " + file.string() + ": " + ec.message());
    }
    return {};
}

std::optional<fs::path> findExecutable(std::string_view name, const std::vector<fs::path>& searchPath) {
    if (name.find('/') != std::string_view::npos) {
        fs::path p(name);
        if (::access(p.c_str(), X_OK) == 0) return p;
        return std::nullopt;
    }
    for (const auto& dir : searchPath) {
        fs::path candidate = dir / name;
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    return std::nullopt;
}

Result<CommandOutput> runCommand(const std::vector<std::string>& args) {
    if (args.empty()) return fatal("runCommand: empty argument list");

    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) return fatal(std::string("pipe() failed: ") + std::strerror(errno));

    const pid_t pid = ::fork();
    if (pid < 0) {
        ::close(fds[0]);
        ::close(fds[1]);
        return fatal(std::string("fork() failed: ") + std::strerror(errno));
    }
    if (pid == 0) {
        ::dup2(fds[1], STDOUT_FILENO);
        ::dup2(fds[1], STDERR_FILENO);
        auto argv = toArgv(args);
        ::execv(argv[0], argv.data());
        ::_exit(127);
    }
    ::close(fds[1]);

    CommandOutput result;
    std::array<char, 4096> buf{};
    for (;;) {
        const ssize_t n = ::read(fds[0], buf.data(), buf.size());
        if (n > 0) {
            result.output.append(buf.data(), static_cast<std::size_t>(n));
        } else if (n < 0 && errno == EINTR) {
            continue;
        } else {
            break;
        }
    }
    ::close(fds[0]);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return fatal(std::string("waitpid() failed: ") + std::strerror(errno));
    }
    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitCode = 128 + WTERMSIG(status);
    }
    if (result.exitCode == 127) return fatal("cannot execute " + args.front());
    return result;
}

Error execReplace(const std::vector<std::string>& args) {
    if (args.empty()) return Error{ErrorCategory::Fatal, "exec: empty argument list", {}};
    auto argv = toArgv(args);
    ::execv(argv[0], argv.data());
    return Error{ErrorCategory::Fatal, "exec " + args.front() + " failed: " + std::strerror(errno), {}};
}

bool sendSignal(pid_t pid, int signo) noexcept {
    if (pid <= 0) return false;
    return ::kill(pid, signo) == 0;
}

std::string describeProcess(pid_t pid) {
    std::string text = "PID " + std::to_string(pid);
    const fs::path proc = fs::path("/proc") / std::to_string(pid);

    std::string comm;
    std::ifstream in(proc / "comm");
    std::getline(in, comm);

    struct stat st {};
    const bool owned = ::stat(proc.c_str(), &st) == 0;
    if (comm.empty() && !owned) return text;

    text += " (";
    if (!comm.empty()) text += comm;
    if (owned) text += (comm.empty() ? "uid " : ", uid ") + std::to_string(st.st_uid);
    text += ")";
    return text;
}

Result<void> copyFileAtomic(const fs::path& src, const fs::path& dst) {
    const fs::path tmp = tempSibling(dst);
    std::error_code ec;
    fs::copy_file(src, tmp, fs::copy_options::overwrite_existing, ec);
    if (ec) return fatal("cannot copy " + src.string() + ": " + ec.message());
    fs::rename(tmp, dst, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        return fatal("cannot install " + dst.string() + ": " + ec.message());
    }
    return {};
}

} // namespace ReproVM
