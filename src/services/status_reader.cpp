#include "services/status_reader.hpp"
#include "infrastructure/atomic_file.hpp"
#include "core/clock.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace aprotate
{
    namespace services
    {

        StatusReader::StatusReader(std::filesystem::path run_dir,
                                   std::string primary_interface,
                                   std::shared_ptr<core::Clock> clock)
            : run_dir_(std::move(run_dir)),
              primary_interface_(std::move(primary_interface)),
              clock_(std::move(clock)),
              logger_(core::get_logger("StatusReader"))
        {
        }

        StatusReadResult StatusReader::read(const std::string &interface) const
        {
            auto result = read_file(run_dir_ / ("status-" + interface + ".json"), interface);
            if (result.outcome == ReadOutcome::MISSING && interface == primary_interface_)
            {
                result = read_file(run_dir_ / "status.json", interface);
            }
            return result;
        }

        StatusReadResult StatusReader::read_file(const std::filesystem::path &path, const std::string &interface) const
        {
            StatusReadResult result;
            result.status.interface = interface;

            std::string content;
            if (!infrastructure::read_file(path, content))
            {
                result.outcome = ReadOutcome::MISSING;
                return result;
            }

            try
            {
                result.status.from_json(nlohmann::json::parse(content));
            }
            catch (const std::exception &e)
            {
                logger_->debug("Unreadable status file",
                               core::LogContext().add("file", path.string()).add("error", e.what()));
                result.outcome = ReadOutcome::TRANSIENT_ERROR;
                result.error = e.what();
                result.status = core::InterfaceStatus();
                result.status.interface = interface;
                return result;
            }

            if (result.status.interface.empty())
            {
                result.status.interface = interface;
            }
            double remaining = result.status.expires_at - clock_->now();
            result.status.time_remaining = std::max(0L, static_cast<long>(std::floor(remaining)));
            result.outcome = ReadOutcome::OK;
            return result;
        }

        std::vector<std::string> StatusReader::active_interfaces() const
        {
            static const std::string prefix = "status-";
            static const std::string suffix = ".json";

            std::vector<std::string> active;
            bool found_any = false;
            std::error_code ec;
            std::filesystem::directory_iterator it(run_dir_, ec);
            if (!ec)
            {
                for (const auto &entry : it)
                {
                    const std::string name = entry.path().filename().string();
                    if (name.size() <= prefix.size() + suffix.size() ||
                        name.compare(0, prefix.size(), prefix) != 0 ||
                        name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0)
                    {
                        continue;
                    }

                    found_any = true;
                    const std::string interface = name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());
                    auto result = read_file(entry.path(), interface);
                    if (result.outcome == ReadOutcome::OK && result.status.enabled &&
                        result.status.state != core::InterfaceState::DISABLED)
                    {
                        active.push_back(interface);
                    }
                }
            }

            if (!found_any && std::filesystem::exists(run_dir_ / "status.json", ec))
            {
                active.push_back(primary_interface_);
            }

            std::sort(active.begin(), active.end());
            return active;
        }

    } // namespace services
} // namespace aprotate
