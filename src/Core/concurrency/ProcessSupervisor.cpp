#include "ReproVM/Core/concurrency/ProcessSupervisor.hpp"
#include "ReproVM/Utils/Logger.hpp"
#include <boost/system/error_code.hpp>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <optional>
#include <sys/wait.h>
#include <unistd.h>

namespace ReproVM::CONCURRENCY {

namespace {

int decodeStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return 1;
}

constexpr std::array<int, 4> kHandled{SIGINT, SIGTERM, SIGHUP, SIGCHLD};

// The signal_set resets its signals to SIG_DFL when it goes away; this puts
// back whatever the process had installed before supervision.
class SavedDispositions {
public:
    SavedDispositions() {
        for (std::size_t i = 0; i < kHandled.size(); ++i) {
            saved_[i] = ::sigaction(kHandled[i], nullptr, &actions_[i]) == 0;
        }
    }

    ~SavedDispositions() {
        for (std::size_t i = 0; i < kHandled.size(); ++i) {
            if (saved_[i]) ::sigaction(kHandled[i], &actions_[i], nullptr);
        }
    }

    SavedDispositions(const SavedDispositions&) = delete;
    SavedDispositions& operator=(const SavedDispositions&) = delete;

private:
    std::array<struct sigaction, kHandled.size()> actions_{};
    std::array<bool, kHandled.size()> saved_{};
};

} // namespace

//
// ProcessSupervisor::Impl
//
struct ProcessSupervisor::Impl {
    SavedDispositions dispositions; // destroyed after signals
    asio::io_context io_ctx;
    asio::signal_set signals;
    pid_t child{-1};
    std::optional<int> exitStatus;

    Impl() : dispositions(), io_ctx(), signals(io_ctx, SIGINT, SIGTERM, SIGHUP) {
        signals.add(SIGCHLD);
    }

    void arm() {
        signals.async_wait([this](const boost::system::error_code& ec, int signo) {
            if (ec) return;
            if (signo == SIGCHLD) {
                if (reap()) return;
            } else if (child > 0) {
                BoostLogger::Debug("forwarding signal " + std::to_string(signo) + " to " + std::to_string(child));
                ::kill(child, signo);
            }
            arm();
        });
    }

    // True once the child has been collected.
    bool reap() {
        int status = 0;
        pid_t r;
        do {
            r = ::waitpid(child, &status, WNOHANG);
        } while (r < 0 && errno == EINTR);
        if (r == child) {
            exitStatus = decodeStatus(status);
            return true;
        }
        if (r < 0) {
            // ECHILD: collected elsewhere, nothing left to wait for.
            exitStatus = 1;
            return true;
        }
        return false;
    }
};

ProcessSupervisor::ProcessSupervisor()
    : impl_(std::make_unique<Impl>())
{}

ProcessSupervisor::~ProcessSupervisor() {
    boost::system::error_code ec;
    impl_->signals.cancel(ec);
}

pid_t ProcessSupervisor::child() const noexcept {
    return impl_->exitStatus ? -1 : impl_->child;
}

Result<int> ProcessSupervisor::run(const std::vector<std::string>& args, const StartedCallback& onStarted) {
    if (args.empty()) return fatal("supervise: empty argument list");

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    impl_->io_ctx.notify_fork(asio::execution_context::fork_prepare);
    const pid_t pid = ::fork();
    if (pid < 0) {
        impl_->io_ctx.notify_fork(asio::execution_context::fork_parent);
        return fatal(std::string("fork() failed: ") + std::strerror(errno));
    }
    if (pid == 0) {
        ::execv(argv[0], argv.data());
        ::_exit(127);
    }
    impl_->io_ctx.notify_fork(asio::execution_context::fork_parent);

    impl_->child = pid;
    impl_->exitStatus.reset();
    BoostLogger::Debug("supervising " + args.front() + " as pid " + std::to_string(pid));
    if (onStarted) onStarted(pid);

    // A SIGCHLD that arrived before arming is still queued in the signal_set.
    if (!impl_->reap()) {
        impl_->arm();
        impl_->io_ctx.restart();
        impl_->io_ctx.run();
    }

    const int status = impl_->exitStatus.value_or(1);
    if (status == 127) return fatal("cannot execute " + args.front());
    return status;
}

} // namespace ReproVM::CONCURRENCY
