#include "core/supervisor.hpp"
#include "core/config.hpp"
#include "core/clock.hpp"
#include "core/logger.hpp"
#include "services/rotation_history.hpp"
#include "services/status_store.hpp"
#include "infrastructure/interface_prober.hpp"

#include <filesystem>
#include <stdexcept>

namespace aprotate
{
    namespace core
    {

        Supervisor::Supervisor(std::shared_ptr<const DaemonConfig> config,
                               services::EngineDependencies deps,
                               ConfigLoader loader)
            : config_(std::move(config)),
              deps_(std::move(deps)),
              loader_(std::move(loader)),
              logger_(get_logger("Supervisor"))
        {
            if (!config_)
            {
                throw std::invalid_argument("Supervisor configuration cannot be null");
            }
            if (!deps_.store || !deps_.prober || !deps_.clock)
            {
                throw std::invalid_argument("Supervisor dependencies cannot be null");
            }

            history_ = std::make_unique<services::RotationHistory>(
                std::filesystem::path(config_->paths.log_dir) / "rotations.json");

            logger_->info("AP rotation supervisor initialized",
                          LogContext()
                              .add("dual_ap_mode", config_->dual_ap_mode)
                              .add("rotation_interval_sec", config_->rotation_interval_sec)
                              .add("run_dir", deps_.store->run_dir().string()));
        }

        Supervisor::~Supervisor()
        {
            request_stop();
        }

        std::shared_ptr<const DaemonConfig> Supervisor::config() const
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            return config_;
        }

        bool Supervisor::start()
        {
            logger_->info("Starting AP rotation daemon...");

            if (!deps_.store->ensure_run_dir())
            {
                return false;
            }

            std::error_code ec;
            std::filesystem::create_directories(config()->paths.log_dir, ec);
            if (ec)
            {
                logger_->warning("Cannot create log directory",
                                 LogContext().add("directory", config()->paths.log_dir).add("error", ec.message()));
            }

            build_engines();
            if (engines_.empty())
            {
                logger_->critical("No usable interfaces, cannot start");
                return false;
            }

            for (auto &entry : engines_)
            {
                if (stop_requested_)
                {
                    break;
                }
                startup_rotation(*entry.second);
            }

            logger_->info("AP rotation daemon started", LogContext().add("interfaces", engines_.size()));
            return true;
        }

        void Supervisor::build_engines()
        {
            auto cfg = config();

            for (const auto &name : cfg->candidate_interfaces())
            {
                const auto *iface_cfg = cfg->interface_config(name);
                if (!iface_cfg || !iface_cfg->enabled)
                {
                    logger_->info("Interface disabled in configuration", LogContext().add("interface", name));
                    publish_disabled(name, false, "Interface disabled in configuration");
                    continue;
                }

                if (!deps_.prober->interface_exists(name))
                {
                    logger_->warning("Interface not found, skipping", LogContext().add("interface", name));
                    publish_disabled(name, true, "Interface not found");
                    continue;
                }

                engines_[name] = std::make_shared<services::RotationEngine>(name, cfg, deps_);
                logger_->info("Interface initialized",
                              LogContext().add("interface", name).add("channel", iface_cfg->channel));
            }
        }

        void Supervisor::publish_disabled(const std::string &interface, bool enabled, const std::string &message)
        {
            InterfaceStatus status;
            status.interface = interface;
            status.enabled = enabled;
            status.state = InterfaceState::DISABLED;
            status.last_error = message;
            deps_.store->publish_status(status);
        }

        void Supervisor::startup_rotation(services::RotationEngine &engine)
        {
            auto result = engine.rotate("initial");
            if (result.ok)
            {
                log_rotation(*result.credentials);
                return;
            }

            logger_->error("Initial rotation failed, retrying...",
                           LogContext().add("interface", engine.interface()).add("error", result.message));
            if (!wait_for(std::chrono::seconds(config()->startup_retry_delay_sec)))
            {
                return;
            }

            result = engine.rotate("initial_retry");
            if (result.ok)
            {
                log_rotation(*result.credentials);
                return;
            }

            logger_->error("Startup rotation failed", LogContext().add("interface", engine.interface()));
            engine.mark_error("Startup rotation failed");
        }

        void Supervisor::log_rotation(const Credentials &credentials)
        {
            auto entry = RotationHistoryEntry::from_credentials(credentials, deps_.clock->now());
            history_->append(entry, config()->log_retention_count);
        }

        void Supervisor::tick()
        {
            apply_pending_reload();

            for (auto &entry : engines_)
            {
                const auto &name = entry.first;
                auto &engine = *entry.second;

                if (engine.consume_manual_trigger())
                {
                    auto result = engine.rotate("manual_trigger");
                    if (result.ok)
                    {
                        log_rotation(*result.credentials);
                    }
                    continue;
                }

                auto attempt = engine.rotate_if_due();
                if (attempt.attempted)
                {
                    if (attempt.result.ok)
                    {
                        log_rotation(*attempt.result.credentials);
                    }
                    else
                    {
                        logger_->warning("Rotation failed, will retry", LogContext().add("interface", name));
                    }
                }
                else
                {
                    engine.refresh_status(attempt.client_count);
                }
            }
        }

        void Supervisor::run()
        {
            logger_->info("Entering main loop", LogContext().add("tick_interval_sec", config()->tick_interval_sec));

            while (!stop_requested_)
            {
                try
                {
                    tick();
                }
                catch (const std::exception &e)
                {
                    logger_->error("Error in main loop", LogContext().add("error", e.what()));
                    wait_for(std::chrono::seconds(config()->error_backoff_sec));
                    continue;
                }

                wait_for(std::chrono::seconds(config()->tick_interval_sec));
            }

            logger_->info("AP rotation daemon stopped");
        }

        void Supervisor::request_stop()
        {
            {
                std::lock_guard<std::mutex> lock(wait_mutex_);
                stop_requested_ = true;
            }
            wait_cv_.notify_all();
        }

        void Supervisor::request_reload()
        {
            reload_requested_ = true;
        }

        void Supervisor::apply_pending_reload()
        {
            if (!reload_requested_.exchange(false))
            {
                return;
            }

            logger_->info("Reloading configuration...");
            std::shared_ptr<const DaemonConfig> fresh;
            try
            {
                fresh = loader_();
            }
            catch (const std::exception &e)
            {
                logger_->error("Configuration reload failed, keeping previous configuration",
                               LogContext().add("error", e.what()));
                return;
            }

            if (!fresh)
            {
                logger_->error("Configuration reload produced no configuration, keeping previous configuration");
                return;
            }
            auto errors = fresh->validation_errors();
            if (!errors.empty())
            {
                logger_->error("Reloaded configuration is invalid, keeping previous configuration",
                               LogContext().add("error", errors.front()).add("problems", errors.size()));
                return;
            }

            {
                std::lock_guard<std::mutex> lock(config_mutex_);
                config_ = fresh;
            }
            for (auto &entry : engines_)
            {
                entry.second->update_config(fresh);
            }
            LoggerManager::instance().set_level(LoggerManager::string_to_level(fresh->logging.log_level));

            logger_->info("Configuration reloaded",
                          LogContext()
                              .add("rotation_interval_sec", fresh->rotation_interval_sec)
                              .add("client_threshold", fresh->client_threshold)
                              .add("log_level", fresh->logging.log_level));
        }

        bool Supervisor::wait_for(std::chrono::milliseconds duration)
        {
            std::unique_lock<std::mutex> lock(wait_mutex_);
            return !wait_cv_.wait_for(lock, duration, [this]
                                      { return stop_requested_.load(); });
        }

        std::vector<std::string> Supervisor::active_interfaces() const
        {
            std::vector<std::string> names;
            for (const auto &entry : engines_)
            {
                names.push_back(entry.first);
            }
            return names;
        }

        std::shared_ptr<services::RotationEngine> Supervisor::engine(const std::string &interface) const
        {
            auto it = engines_.find(interface);
            return it == engines_.end() ? nullptr : it->second;
        }

    } // namespace core
} // namespace aprotate
