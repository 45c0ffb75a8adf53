#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <vector>
#include "ReproVM/Utils/Result.hpp"

namespace ReproVM {

namespace fs = std::filesystem;

struct CommandOutput {
    int exitCode{-1};
    std::string output; // stdout and stderr, interleaved
};

// kill(pid, 0) semantics; EPERM still means the process exists.
[[nodiscard]] bool isProcessAlive(pid_t pid) noexcept;

// Process identifier stored in a record file, or nullopt when the file is absent or unparseable.
[[nodiscard]] std::optional<pid_t> readPidFile(const fs::path& file);

// Replaces the record atomically (temp file + rename).
[[nodiscard]] Result<void> writePidFile(const fs::path& file, pid_t pid);

[[nodiscard]] std::optional<fs::path> findExecutable(std::string_view name, const std::vector<fs::path>& searchPath);

// Runs argv to completion and captures its output.
[[nodiscard]] Result<CommandOutput> runCommand(const std::vector<std::string>& argv);

// execv() into argv; only returns when the exec failed.
[[nodiscard]] Error execReplace(const std::vector<std::string>& argv);

[[nodiscard]] bool sendSignal(pid_t pid, int signo) noexcept;

// "PID <n> (<comm>, uid <u>)" from /proc; falls back to "PID <n>".
[[nodiscard]] std::string describeProcess(pid_t pid);

// Copies src to dst through a temp file in dst's directory.
[[nodiscard]] Result<void> copyFileAtomic(const fs::path& src, const fs::path& dst);

} // namespace ReproVM
