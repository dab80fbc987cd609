#include "services/status_store.hpp"
#include "infrastructure/atomic_file.hpp"
#include "core/logger.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace aprotate
{
    namespace services
    {

        StatusStore::StatusStore(std::filesystem::path run_dir)
            : run_dir_(std::move(run_dir)), logger_(core::get_logger("StatusStore"))
        {
        }

        std::filesystem::path StatusStore::status_path(const std::string &interface) const
        {
            return run_dir_ / ("status-" + interface + ".json");
        }

        std::filesystem::path StatusStore::credentials_path(const std::string &interface) const
        {
            return run_dir_ / ("current-" + interface + ".json");
        }

        std::filesystem::path StatusStore::trigger_path(const std::string &interface) const
        {
            return run_dir_ / ("trigger-rotate-" + interface);
        }

        bool StatusStore::ensure_run_dir()
        {
            std::error_code ec;
            std::filesystem::create_directories(run_dir_, ec);
            if (ec)
            {
                logger_->error("Cannot create run directory",
                               core::LogContext().add("directory", run_dir_.string()).add("error", ec.message()));
                return false;
            }
            if (chmod(run_dir_.c_str(), 0755) != 0)
            {
                logger_->warning("Cannot set run directory permissions",
                                 core::LogContext().add("directory", run_dir_.string()).add("error", std::strerror(errno)));
            }
            return true;
        }

        bool StatusStore::publish_status(const core::InterfaceStatus &status)
        {
            std::string error;
            if (!infrastructure::write_file_atomic(status_path(status.interface), status.to_json().dump(2), 0644, &error))
            {
                logger_->error("Failed to update status",
                               core::LogContext().add("interface", status.interface).add("error", error));
                return false;
            }
            return true;
        }

        bool StatusStore::save_credentials(const core::Credentials &credentials)
        {
            std::string error;
            if (!infrastructure::write_file_atomic(credentials_path(credentials.interface),
                                                   credentials.to_json().dump(2), 0600, &error))
            {
                logger_->error("Failed to save credentials",
                               core::LogContext().add("interface", credentials.interface).add("error", error));
                return false;
            }
            return true;
        }

        std::optional<core::Credentials> StatusStore::load_credentials(const std::string &interface) const
        {
            std::string content;
            if (!infrastructure::read_file(credentials_path(interface), content))
            {
                return std::nullopt;
            }

            try
            {
                core::Credentials credentials;
                credentials.from_json(nlohmann::json::parse(content));
                if (credentials.interface != interface || credentials.ssid.empty() ||
                    credentials.created_at >= credentials.expires_at)
                {
                    logger_->warning("Ignoring inconsistent persisted credentials",
                                     core::LogContext().add("interface", interface));
                    return std::nullopt;
                }
                return credentials;
            }
            catch (const nlohmann::json::exception &e)
            {
                logger_->warning("Ignoring unreadable persisted credentials",
                                 core::LogContext().add("interface", interface).add("error", e.what()));
                return std::nullopt;
            }
        }

        bool StatusStore::consume_trigger(const std::string &interface)
        {
            const auto path = trigger_path(interface);
            if (unlink(path.c_str()) == 0)
            {
                return true;
            }
            if (errno != ENOENT)
            {
                logger_->error("Error consuming rotation trigger",
                               core::LogContext().add("interface", interface).add("error", std::strerror(errno)));
            }
            return false;
        }

        bool StatusStore::create_trigger(const std::string &interface)
        {
            const auto path = trigger_path(interface);
            int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0666);
            if (fd < 0)
            {
                logger_->error("Cannot create rotation trigger",
                               core::LogContext().add("file", path.string()).add("error", std::strerror(errno)));
                return false;
            }
            // World-writable so the LED renderer can request rotations without root
            if (fchmod(fd, 0666) != 0)
            {
                logger_->warning("Cannot set rotation trigger permissions",
                                 core::LogContext().add("file", path.string()).add("error", std::strerror(errno)));
            }
            close(fd);
            return true;
        }

    } // namespace services
} // namespace aprotate
