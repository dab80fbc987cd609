/**
 * AP Rotation Daemon
 * Main entry point: rotates access point credentials and publishes status
 */

#include <iostream>
#include <csignal>
#include <pthread.h>
#include <unistd.h>
#include <memory>
#include <stdexcept>
#include <string>

#include "core/supervisor.hpp"
#include "core/config.hpp"
#include "core/clock.hpp"
#include "core/logger.hpp"
#include "core/signal_listener.hpp"
#include "services/credential_generator.hpp"
#include "services/status_store.hpp"
#include "services/status_reader.hpp"
#include "infrastructure/command_runner.hpp"
#include "infrastructure/interface_prober.hpp"
#include "infrastructure/hostapd_config_writer.hpp"
#include "infrastructure/qr_generator.hpp"
#include "infrastructure/network_controller.hpp"

// Command line argument parsing
#include <getopt.h>

namespace aprotate {

/**
 * Check if running with required privileges
 */
bool check_root_privileges() {
    if (geteuid() != 0) {
        std::cerr << "ERROR: This daemon must be run as root to manage hostapd." << std::endl;
        std::cerr << "Please run with: sudo ./ap_rotated (or -D for development)" << std::endl;
        return false;
    }
    return true;
}

/**
 * Print usage information
 */
void print_usage(const char* program_name) {
    std::cout << "AP Rotation Daemon\n\n";
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config FILE          Configuration file path (default: " << core::DaemonConfig::DEFAULT_PATH << ")\n";
    std::cout << "  -v, --verbose              Increase verbosity (-v for INFO, -vv for DEBUG)\n";
    std::cout << "  -l, --log-file FILE        Log to file instead of console\n";
    std::cout << "  -r, --run-dir DIR          Override the status/trigger directory\n";
    std::cout << "  -D, --no-privilege-check   Do not require root (for development)\n";
    std::cout << "  -s, --status               Print the status of all interfaces as JSON and exit\n";
    std::cout << "  -R, --rotate IFACE         Request a manual rotation of IFACE and exit\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  --version                  Show version information\n\n";
    std::cout << "Signals:\n";
    std::cout << "  SIGHUP                     Reload the configuration file\n";
    std::cout << "  SIGTERM, SIGINT            Finish the current tick and exit\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << "                          # Run with default config\n";
    std::cout << "  " << program_name << " -c custom_config.json    # Use custom configuration\n";
    std::cout << "  " << program_name << " -vv                      # Debug logging\n";
    std::cout << "  " << program_name << " --rotate wlan0           # Rotate wlan0 now\n";
    std::cout << std::endl;
}

/**
 * Print version information
 */
void print_version() {
    std::cout << "AP Rotation Daemon v0.1.0" << std::endl;
    std::cout << "Built for Linux/Raspberry Pi OS" << std::endl;
    std::cout << "Features: single and dual AP rotation, hostapd, qrencode" << std::endl;
}

/**
 * Parse command line arguments
 */
struct Arguments {
    std::string config_file = core::DaemonConfig::DEFAULT_PATH;
    int verbosity = 0;
    std::string log_file;
    std::string run_dir;
    bool no_privilege_check = false;
    bool status = false;
    std::string rotate_interface;
    bool help = false;
    bool version = false;
};

Arguments parse_arguments(int argc, char* argv[]) {
    Arguments args;

    static struct option long_options[] = {
        {"config",             required_argument, 0, 'c'},
        {"verbose",            no_argument,       0, 'v'},
        {"log-file",           required_argument, 0, 'l'},
        {"run-dir",            required_argument, 0, 'r'},
        {"no-privilege-check", no_argument,       0, 'D'},
        {"status",             no_argument,       0, 's'},
        {"rotate",             required_argument, 0, 'R'},
        {"help",               no_argument,       0, 'h'},
        {"version",            no_argument,       0, 0},
        {0, 0, 0, 0}
    };

    int c;
    int option_index = 0;

    while ((c = getopt_long(argc, argv, "c:vl:r:DsR:h", long_options, &option_index)) != -1) {
        switch (c) {
            case 'c':
                args.config_file = optarg;
                break;
            case 'v':
                args.verbosity++;
                break;
            case 'l':
                args.log_file = optarg;
                break;
            case 'r':
                args.run_dir = optarg;
                break;
            case 'D':
                args.no_privilege_check = true;
                break;
            case 's':
                args.status = true;
                break;
            case 'R':
                args.rotate_interface = optarg;
                break;
            case 'h':
                args.help = true;
                break;
            case 0:
                if (option_index == 8) { // --version
                    args.version = true;
                }
                break;
            case '?':
                // getopt_long already printed an error message
                exit(1);
                break;
            default:
                std::cerr << "Unknown option: " << c << std::endl;
                exit(1);
        }
    }

    return args;
}

/**
 * Load the configuration file and apply command-line overrides.
 * Used at startup and on every SIGHUP, so overrides survive a reload.
 */
std::shared_ptr<const core::DaemonConfig> load_config(const Arguments& args) {
    bool used_defaults = false;
    auto config = core::DaemonConfig::load(args.config_file, &used_defaults);
    if (used_defaults) {
        core::get_logger("main")->warning("Configuration file not found, using defaults",
                                          core::LogContext().add("config_file", args.config_file));
    }

    if (!args.run_dir.empty()) {
        config->paths.run_dir = args.run_dir;
    }
    if (!args.log_file.empty()) {
        config->logging.log_file = args.log_file;
    }
    if (args.verbosity == 1) {
        config->logging.log_level = "INFO";
    } else if (args.verbosity >= 2) {
        config->logging.log_level = "DEBUG";
    }
    if (args.no_privilege_check) {
        config->development.skip_privilege_check = true;
    }

    auto errors = config->validation_errors();
    if (!errors.empty()) {
        throw std::runtime_error("invalid configuration: " + errors.front());
    }
    return std::shared_ptr<const core::DaemonConfig>(std::move(config));
}

/**
 * --status: one JSON object per interface, keyed by name
 */
int print_status(const core::DaemonConfig& config) {
    services::StatusReader reader(config.paths.run_dir, config.primary_interface,
                                  std::make_shared<core::SystemClock>());

    auto interfaces = reader.active_interfaces();
    if (interfaces.empty()) {
        interfaces = config.candidate_interfaces();
    }

    nlohmann::json out = nlohmann::json::object();
    for (const auto& interface : interfaces) {
        auto result = reader.read(interface);
        switch (result.outcome) {
            case services::ReadOutcome::OK:
                out[interface] = result.status.to_json();
                break;
            case services::ReadOutcome::MISSING:
                out[interface] = {{"interface", interface}, {"state", "unknown"}};
                break;
            case services::ReadOutcome::TRANSIENT_ERROR:
                out[interface] = {{"interface", interface}, {"state", "unknown"}, {"error", result.error}};
                break;
        }
    }

    std::cout << out.dump(2) << std::endl;
    return 0;
}

/**
 * --rotate: drop the trigger marker for the running daemon
 */
int request_rotation(const core::DaemonConfig& config, const std::string& interface) {
    services::StatusStore store(config.paths.run_dir);
    if (!store.create_trigger(interface)) {
        std::cerr << "Failed to request rotation for " << interface << std::endl;
        return 1;
    }
    std::cout << "Rotation requested for " << interface << std::endl;
    return 0;
}

/**
 * Build the collaborators, with development stand-ins where configured
 */
services::EngineDependencies build_dependencies(const core::DaemonConfig& config) {
    auto runner = std::make_shared<infrastructure::ProcessCommandRunner>();

    services::EngineDependencies deps;
    deps.clock = std::make_shared<core::SystemClock>();
    deps.generator = std::make_shared<services::CredentialGenerator>();
    deps.store = std::make_shared<services::StatusStore>(config.paths.run_dir);
    deps.config_writer = std::make_shared<infrastructure::HostapdConfigWriter>(
        config.paths.template_dir, config.paths.hostapd_conf_dir);
    deps.qr_generator = std::make_shared<infrastructure::CommandQrGenerator>(
        runner, config.paths.qr_command, config.paths.qr_output_dir, config.primary_interface,
        std::chrono::seconds(config.timeouts.qr_sec));

    if (config.development.mock_interfaces) {
        deps.prober = std::make_shared<infrastructure::MockInterfaceProber>();
    } else {
        deps.prober = std::make_shared<infrastructure::SystemInterfaceProber>(
            runner, std::chrono::seconds(config.timeouts.probe_sec));
    }

    if (config.development.skip_service_restart) {
        deps.network = std::make_shared<infrastructure::NullNetworkController>();
    } else {
        deps.network = std::make_shared<infrastructure::SystemdNetworkController>(
            runner, std::chrono::seconds(config.timeouts.restart_sec));
    }

    return deps;
}

} // namespace aprotate

/**
 * Main entry point
 */
int main(int argc, char* argv[]) {
    using namespace aprotate;

    try {
        // Parse command line arguments
        auto args = parse_arguments(argc, argv);

        if (args.help) {
            print_usage(argv[0]);
            return 0;
        }

        if (args.version) {
            print_version();
            return 0;
        }

        // Console logging until the configuration is known
        core::LogLevel log_level = core::LogLevel::WARNING;
        if (args.verbosity == 1) {
            log_level = core::LogLevel::INFO;
        } else if (args.verbosity >= 2) {
            log_level = core::LogLevel::DEBUG;
        }
        core::setup_logging(log_level, "", true);
        auto logger = core::get_logger("main");

        // Load configuration
        std::shared_ptr<const core::DaemonConfig> config;
        try {
            config = load_config(args);
        } catch (const std::exception& e) {
            logger->error("Failed to load configuration",
                          core::LogContext().add("config_file", args.config_file)
                                            .add("error", e.what()));
            return 1;
        }

        if (args.status) {
            return print_status(*config);
        }

        if (!args.rotate_interface.empty()) {
            return request_rotation(*config, args.rotate_interface);
        }

        core::setup_logging(core::LoggerManager::string_to_level(config->logging.log_level),
                            config->logging.log_file, config->logging.log_file.empty());

        // Check privileges
        if (!config->development.skip_privilege_check && !check_root_privileges()) {
            return 1;
        }

        // Block termination signals before any thread starts; SignalListener receives them
        sigset_t signals;
        sigemptyset(&signals);
        sigaddset(&signals, SIGINT);
        sigaddset(&signals, SIGTERM);
        sigaddset(&signals, SIGHUP);
        pthread_sigmask(SIG_BLOCK, &signals, nullptr);

        logger->info("Starting AP rotation daemon...",
                     core::LogContext().add("config_file", args.config_file)
                                       .add("dual_ap_mode", config->dual_ap_mode));

        core::Supervisor supervisor(config, build_dependencies(*config),
                                    [args]() { return load_config(args); });

        // Declared after the supervisor, so it is joined before the supervisor goes away
        core::SignalListener signal_listener(signals,
                                             [&supervisor]() { supervisor.request_reload(); },
                                             [&supervisor]() { supervisor.request_stop(); });

        if (!supervisor.start()) {
            logger->error("Failed to start daemon");
            return 1;
        }

        // Daemon runs until stopped by signal
        supervisor.run();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
