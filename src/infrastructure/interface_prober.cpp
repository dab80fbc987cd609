#include "infrastructure/interface_prober.hpp"
#include "infrastructure/command_runner.hpp"
#include "core/logger.hpp"

#include <sstream>

namespace aprotate
{
    namespace infrastructure
    {

        SystemInterfaceProber::SystemInterfaceProber(std::shared_ptr<CommandRunner> runner,
                                                     std::chrono::milliseconds timeout)
            : runner_(std::move(runner)), timeout_(timeout), logger_(core::get_logger("InterfaceProber"))
        {
        }

        bool SystemInterfaceProber::interface_exists(const std::string &interface)
        {
            auto result = runner_->run({"ip", "link", "show", interface}, timeout_);
            if (result.timed_out)
            {
                logger_->warning("Interface probe timed out", core::LogContext().add("interface", interface));
            }
            return result.ok();
        }

        int SystemInterfaceProber::client_count(const std::string &interface)
        {
            auto result = runner_->run({"iw", "dev", interface, "station", "dump"}, timeout_);
            if (!result.ok())
            {
                logger_->debug("Station dump failed", core::LogContext()
                                                          .add("interface", interface)
                                                          .add("exit_code", result.exit_code)
                                                          .add("timed_out", result.timed_out));
                return 0;
            }
            return count_stations(result.output);
        }

        int SystemInterfaceProber::count_stations(const std::string &station_dump)
        {
            std::istringstream stream(station_dump);
            std::string line;
            int count = 0;

            while (std::getline(stream, line))
            {
                auto first = line.find_first_not_of(" \t");
                if (first != std::string::npos && line.compare(first, 7, "Station") == 0)
                {
                    count++;
                }
            }
            return count;
        }

    } // namespace infrastructure
} // namespace aprotate
