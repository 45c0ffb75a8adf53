#pragma once
#include <utility> // Boost 1.74 asio uses std::exchange without including <utility>
#include <boost/asio.hpp>
#include <functional>
#include <memory>
#include <string>
#include <sys/types.h>
#include <vector>
#include "ReproVM/Utils/Result.hpp"

namespace ReproVM::CONCURRENCY {
namespace asio = boost::asio;

/**
 * @brief Runs one child process in the foreground and waits for it
 *
 * SIGINT, SIGTERM and SIGHUP received by this process are forwarded to the
 * child; SIGCHLD completes the wait. Signal delivery goes through an
 * asio::signal_set so no handler runs in async-signal context.
 */
class ProcessSupervisor {
public:
    using StartedCallback = std::function<void(pid_t)>;

    ProcessSupervisor();
    ~ProcessSupervisor();

    /**
     * @brief Spawns argv and blocks until it exits
     * @param onStarted Invoked with the child PID before waiting
     * @return Exit status, or 128 + signal number when the child was killed
     */
    [[nodiscard]] Result<int> run(const std::vector<std::string>& argv, const StartedCallback& onStarted = {});

    // PID of the running child, or -1
    [[nodiscard]] pid_t child() const noexcept;

    // non-copyable
    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace ReproVM::CONCURRENCY
