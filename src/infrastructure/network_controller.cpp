#include "infrastructure/network_controller.hpp"
#include "infrastructure/command_runner.hpp"
#include "core/logger.hpp"

namespace aprotate
{
    namespace infrastructure
    {

        SystemdNetworkController::SystemdNetworkController(std::shared_ptr<CommandRunner> runner,
                                                           std::chrono::milliseconds timeout)
            : runner_(std::move(runner)), timeout_(timeout), logger_(core::get_logger("NetworkController"))
        {
        }

        std::string SystemdNetworkController::service_name(const std::string &interface, bool dual_mode)
        {
            return dual_mode ? "hostapd@" + interface : "hostapd";
        }

        bool SystemdNetworkController::apply(const std::string &interface, bool dual_mode)
        {
            const auto service = service_name(interface, dual_mode);
            logger_->debug("Restarting access point service",
                           core::LogContext().add("interface", interface).add("service", service));

            auto result = runner_->run({"systemctl", "restart", service}, timeout_);
            if (result.timed_out)
            {
                logger_->error("Timeout restarting access point service",
                               core::LogContext().add("interface", interface).add("service", service));
                return false;
            }
            if (!result.ok())
            {
                std::string output = result.output;
                while (!output.empty() && (output.back() == '\n' || output.back() == ' '))
                {
                    output.pop_back();
                }
                logger_->error("Access point service restart failed",
                               core::LogContext()
                                   .add("interface", interface)
                                   .add("service", service)
                                   .add("exit_code", result.exit_code)
                                   .add("output", output));
                return false;
            }

            logger_->info("Access point service restarted",
                          core::LogContext().add("interface", interface).add("service", service));
            return true;
        }

        NullNetworkController::NullNetworkController()
            : logger_(core::get_logger("NetworkController"))
        {
        }

        bool NullNetworkController::apply(const std::string &interface, bool dual_mode)
        {
            logger_->info("Skipping access point restart (development mode)",
                          core::LogContext()
                              .add("interface", interface)
                              .add("service", SystemdNetworkController::service_name(interface, dual_mode)));
            return true;
        }

    } // namespace infrastructure
} // namespace aprotate
