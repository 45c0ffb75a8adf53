#include "ReproVM/Core/prompt/AutoConfirmPrompter.hpp"
#include "ReproVM/Core/prompt/TerminalPrompter.hpp"
#include "ReproVM/System/Console.hpp"
#include "ReproVM/System/HostEnvironment.hpp"
#include "ReproVM/Utils/Logger.hpp"
#include "ReproVM/Virtualization/Storage/QemuImgTool.hpp"
#include "ReproVM/Virtualization/Utils/VmException.hpp"
#include "ReproVM/Virtualization/vmm/HypervisorLauncher.hpp"
#include "ReproVM/Virtualization/vmm/InstanceLock.hpp"
#include "ReproVM/Virtualization/vmm/VirtualMachineManager.hpp"
#include <charconv>
#include <getopt.h>
#include <iostream>
#include <optional>
#include <string>
#include <unistd.h>
#include <vector>

#ifndef REPROVM_VERSION
#define REPROVM_VERSION "0.0.0"
#endif

using namespace ReproVM;

namespace {

constexpr int kExitUsage = 64;

struct CliOptions {
    std::string command{"run"};
    std::vector<std::string> args;
    std::optional<std::string> name;
    std::optional<std::string> ram;
    std::optional<std::string> cpus;
    std::optional<std::string> iso;
    std::optional<std::string> port;
    bool yes{false};
    bool supervise{false};
    bool verbose{false};
    bool help{false};
    bool version{false};
};

void printUsage(std::ostream& out) {
    out << "reprovm v" REPROVM_VERSION " - reproducible QEMU VM runner\n"
        << "\n"
        << "USAGE:\n"
        << "    reprovm [OPTIONS] [COMMAND] [-- SSH-ARGS...]\n"
        << "\n"
        << "COMMANDS:\n"
        << "    run         Start VM (default), creating missing resources\n"
        << "    install     Install an OS from ISO onto the base disk\n"
        << "    snapshot    Run without saving changes\n"
        << "    reset       Delete overlay and UEFI vars, keep base image\n"
        << "    status      Show VM status\n"
        << "    ssh         Connect to the running VM\n"
        << "    stop        Stop the running VM\n"
        << "\n"
        << "OPTIONS:\n"
        << "    -n, --name NAME     VM name (default: arch-repro)\n"
        << "    -m, --ram SIZE      RAM (default: 4G)\n"
        << "    -c, --cpus N        CPUs (default: 4)\n"
        << "    -i, --iso PATH      ISO file for install\n"
        << "    -p, --port PORT     SSH port (default: 2222)\n"
        << "    -y, --yes           Auto-accept prompts\n"
        << "    -s, --supervise     Keep reprovm running as the VM's parent\n"
        << "    -v, --verbose       Debug output\n"
        << "    -h, --help          This help\n"
        << "        --version       Print version\n"
        << "\n"
        << "ENVIRONMENT:\n"
        << "    VM_NAME VM_RAM VM_CPUS DISK_SIZE VM_ROOT BASE_DIR SSH_FWD_PORT\n"
        << "    MAC_ADDRESS ISO_PATH AUTO_YES VM_SUPERVISE\n";
}

bool isCommand(std::string_view word) {
    for (std::string_view c : {"run", "install", "snapshot", "reset", "status", "ssh", "stop"}) {
        if (word == c) return true;
    }
    return false;
}

// Returns an error message on malformed input.
std::optional<std::string> parseArgs(int argc, char** argv, CliOptions& opts) {
    static struct option long_options[] = {{"name", required_argument, 0, 'n'},
                                           {"ram", required_argument, 0, 'm'},
                                           {"cpus", required_argument, 0, 'c'},
                                           {"iso", required_argument, 0, 'i'},
                                           {"port", required_argument, 0, 'p'},
                                           {"yes", no_argument, 0, 'y'},
                                           {"supervise", no_argument, 0, 's'},
                                           {"verbose", no_argument, 0, 'v'},
                                           {"help", no_argument, 0, 'h'},
                                           {"version", no_argument, 0, 'V'},
                                           {0, 0, 0, 0}};

    opterr = 0;
    int opt;
    int option_index = 0;
    while ((opt = getopt_long(argc, argv, ":n:m:c:i:p:ysvh", long_options, &option_index)) != -1) {
        switch (opt) {
        case 'n':
            opts.name = optarg;
            break;
        case 'm':
            opts.ram = optarg;
            break;
        case 'c':
            opts.cpus = optarg;
            break;
        case 'i':
            opts.iso = optarg;
            break;
        case 'p':
            opts.port = optarg;
            break;
        case 'y':
            opts.yes = true;
            break;
        case 's':
            opts.supervise = true;
            break;
        case 'v':
            opts.verbose = true;
            break;
        case 'h':
            opts.help = true;
            break;
        case 'V':
            opts.version = true;
            break;
        case ':':
            return std::string("Option requires a value: ") + argv[optind - 1];
        default:
            if (optopt != 0) return std::string("Unknown option: -") + static_cast<char>(optopt) + " (use --help)";
            return std::string("Unknown option: ") + argv[optind - 1] + " (use --help)";
        }
    }

    if (optind < argc) {
        if (!isCommand(argv[optind])) return std::string("Unknown argument: ") + argv[optind];
        opts.command = argv[optind++];
        while (optind < argc) opts.args.emplace_back(argv[optind++]);
    }
    if (!opts.args.empty() && opts.command != "ssh") {
        return "Unexpected argument after '" + opts.command + "': " + opts.args.front();
    }
    return std::nullopt;
}

template <typename Int>
std::optional<Int> toInt(const std::string& text) {
    Int value{};
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

// Command-line values override the environment.
std::optional<std::string> applyOverrides(const CliOptions& opts, VmConfig& cfg) {
    if (opts.name) cfg.setName(*opts.name);
    if (opts.ram) cfg.ram = *opts.ram;
    if (opts.cpus) {
        auto v = toInt<unsigned int>(*opts.cpus);
        if (!v) return "--cpus expects a number, got '" + *opts.cpus + "'";
        cfg.cpus = *v;
    }
    if (opts.port) {
        auto v = toInt<int>(*opts.port);
        if (!v) return "--port expects a number, got '" + *opts.port + "'";
        cfg.sshPort = *v;
    }
    if (opts.iso) cfg.installMedium = *opts.iso;
    if (opts.yes) cfg.autoConfirm = true;
    if (opts.supervise) cfg.supervise = true;
    if (opts.verbose) cfg.verbose = true;
    return std::nullopt;
}

int dispatch(VirtualMachineManager& manager, const CliOptions& opts) {
    if (opts.command == "install") return manager.install();
    if (opts.command == "snapshot") return manager.snapshot();
    if (opts.command == "reset") return manager.reset();
    if (opts.command == "status") return manager.status();
    if (opts.command == "ssh") return manager.ssh(opts.args);
    if (opts.command == "stop") return manager.stop();
    return manager.run();
}

int exitCodeFor(ErrorCategory category) {
    return category == ErrorCategory::Contention ? 2 : 1;
}

void reportError(const std::string& message, const std::string& remedy) {
    BoostLogger::Error(message);
    if (!remedy.empty()) BoostLogger::Info("  " + remedy);
}

} // namespace

int main(int argc, char** argv) {
    CliOptions opts;
    if (auto err = parseArgs(argc, argv, opts)) {
        std::cerr << "reprovm: " << *err << '\n';
        return kExitUsage;
    }
    if (opts.help) {
        printUsage(std::cout);
        return 0;
    }
    if (opts.version) {
        std::cout << "reprovm " REPROVM_VERSION "\n";
        return 0;
    }

    BoostLogger::Config logConfig;
    logConfig.console_level = opts.verbose ? BoostLogger::Level::Debug : BoostLogger::Level::Info;
    BoostLogger::Init(logConfig);

    auto loaded = VmConfig::fromEnvironment(VmConfig::processEnvironment());
    if (!loaded) {
        reportError(loaded.error().message, loaded.error().remedy);
        return 1;
    }
    VmConfig cfg = std::move(*loaded);
    if (auto err = applyOverrides(opts, cfg)) {
        std::cerr << "reprovm: " << *err << '\n';
        return kExitUsage;
    }
    if (auto valid = cfg.validate(); !valid) {
        reportError(valid.error().message, valid.error().remedy);
        return 1;
    }

    InstanceLock::installSignalCleanup();

    std::shared_ptr<IPrompter> prompter;
    if (cfg.autoConfirm) {
        prompter = std::make_shared<AutoConfirmPrompter>();
    } else {
        prompter = std::make_shared<TerminalPrompter>(std::cin, std::cerr, logConfig.colour);
    }
    auto host = std::make_shared<HostEnvironment>(cfg);
    auto images = std::make_shared<QemuImgTool>(host, cfg.imageTool);
    auto launcher = std::make_shared<QemuLauncher>(host, cfg.hypervisorBinary);

    try {
        VirtualMachineManager manager(cfg, prompter, host, images, launcher,
                                      Console(std::cout, ::isatty(STDOUT_FILENO) == 1));
        return dispatch(manager, opts);
    } catch (const VmException& e) {
        reportError(e.what(), e.remedy());
        return exitCodeFor(e.category());
    } catch (const std::exception& e) {
        BoostLogger::Critical(std::string("unexpected error: ") + e.what());
        return 1;
    }
}
