#include "ReproVM/System/HostEnvironment.hpp"
#include "ReproVM/System/Process.hpp"
#include <boost/asio.hpp>
#include <unistd.h>

namespace ReproVM {

HostEnvironment::HostEnvironment(const VmConfig& cfg, std::filesystem::path kvmDevice)
    : searchPath_(cfg.searchPath), cacheDir_(cfg.packageCacheDir), kvmDevice_(std::move(kvmDevice)) {}

Acceleration HostEnvironment::probeAcceleration() const {
    std::error_code ec;
    if (!std::filesystem::exists(kvmDevice_, ec)) return Acceleration::Missing;
    if (::access(kvmDevice_.c_str(), R_OK | W_OK) != 0) return Acceleration::NoPermission;
    return Acceleration::Usable;
}

bool HostEnvironment::audioAvailable() const {
    return findExecutable("pulseaudio").has_value() || findExecutable("pipewire-pulse").has_value();
}

bool HostEnvironment::isPortFree(int port) const {
    if (port < 1 || port > 65535) return false;
    boost::asio::io_context io_context;
    boost::asio::ip::tcp::acceptor acceptor(io_context);
    boost::system::error_code ec;
    acceptor.open(boost::asio::ip::tcp::v4(), ec);
    if (ec) return false;
    // ignore TIME_WAIT leftovers; only a listener makes the port busy
    acceptor.set_option(boost::asio::socket_base::reuse_address(true), ec);
    acceptor.bind({boost::asio::ip::tcp::v4(), static_cast<unsigned short>(port)}, ec);
    const bool free = !ec;
    boost::system::error_code ignored;
    acceptor.close(ignored);
    return free;
}

std::optional<std::filesystem::path> HostEnvironment::findExecutable(std::string_view name) const {
    return ReproVM::findExecutable(name, searchPath_);
}

std::optional<std::filesystem::path> HostEnvironment::packageCacheDir() const {
    std::error_code ec;
    if (!cacheDir_.empty() && std::filesystem::is_directory(cacheDir_, ec)) return cacheDir_;
    return std::nullopt;
}

} // namespace ReproVM
