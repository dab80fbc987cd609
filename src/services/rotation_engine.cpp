#include "services/rotation_engine.hpp"
#include "services/credential_generator.hpp"
#include "services/status_store.hpp"
#include "infrastructure/interface_prober.hpp"
#include "infrastructure/hostapd_config_writer.hpp"
#include "infrastructure/qr_generator.hpp"
#include "infrastructure/network_controller.hpp"
#include "core/config.hpp"
#include "core/clock.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace aprotate
{
    namespace services
    {

        std::string rotation_error_to_string(RotationError error)
        {
            switch (error)
            {
            case RotationError::NONE:
                return "none";
            case RotationError::GENERATION:
                return "generation";
            case RotationError::CONFIG_WRITE:
                return "config_write";
            case RotationError::APPLY:
                return "apply";
            }
            return "unknown";
        }

        RotationEngine::RotationEngine(std::string interface,
                                       std::shared_ptr<const core::DaemonConfig> config,
                                       EngineDependencies deps)
            : interface_(std::move(interface)),
              deps_(std::move(deps)),
              logger_(core::get_logger("RotationEngine")),
              config_(std::move(config))
        {
            if (!config_)
            {
                throw std::invalid_argument("Rotation engine configuration cannot be null");
            }
            const auto *iface_cfg = config_->interface_config(interface_);
            enabled_ = !iface_cfg || iface_cfg->enabled;
            if (!deps_.clock || !deps_.prober || !deps_.generator || !deps_.config_writer ||
                !deps_.qr_generator || !deps_.network || !deps_.store)
            {
                throw std::invalid_argument("Rotation engine dependencies cannot be null");
            }

            // Recovery only; the supervisor still performs the startup rotation
            current_creds_ = deps_.store->load_credentials(interface_);
            if (current_creds_)
            {
                logger_->info("Recovered persisted credentials",
                              core::LogContext()
                                  .add("interface", interface_)
                                  .add("ssid", current_creds_->ssid)
                                  .add("reason", current_creds_->rotation_reason));
            }
        }

        std::shared_ptr<const core::DaemonConfig> RotationEngine::config() const
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            return config_;
        }

        void RotationEngine::update_config(std::shared_ptr<const core::DaemonConfig> config)
        {
            if (!config)
            {
                return;
            }
            std::lock_guard<std::mutex> lock(state_mutex_);
            config_ = std::move(config);
        }

        int RotationEngine::probe_clients()
        {
            int count = deps_.prober->client_count(interface_);
            return count < 0 ? 0 : count;
        }

        RotationDecision RotationEngine::evaluate()
        {
            return decide(probe_clients());
        }

        RotationDecision RotationEngine::decide(int client_count) const
        {
            auto cfg = config();
            auto creds = current_credentials();

            RotationDecision decision;
            if (!creds)
            {
                decision.should_rotate = true;
                decision.reason = "initial";
                return decision;
            }

            const double now = deps_.clock->now();
            const double age = now - creds->created_at;

            if (logger_->is_enabled(core::LogLevel::DEBUG))
            {
                logger_->debug("Rotation check",
                               core::LogContext()
                                   .add("interface", interface_)
                                   .add("age", static_cast<long>(age))
                                   .add("expires_in", static_cast<long>(creds->expires_at - now))
                                   .add("clients", client_count));
            }

            if (now >= creds->expires_at)
            {
                decision.should_rotate = true;
                decision.reason = "time_expired";
                return decision;
            }

            if (client_count >= cfg->client_threshold && age >= cfg->min_time_after_clients_sec)
            {
                decision.should_rotate = true;
                decision.reason = "client_threshold_" + std::to_string(client_count);
            }
            return decision;
        }

        bool RotationEngine::consume_manual_trigger()
        {
            if (!deps_.store->consume_trigger(interface_))
            {
                return false;
            }

            const double now = deps_.clock->now();
            const double cooldown = config()->manual_rotation_cooldown_sec;
            const double elapsed = last_manual_rotation_ ? now - *last_manual_rotation_ : cooldown;
            if (elapsed < cooldown)
            {
                logger_->warning("Manual rotation rejected during cooldown",
                                 core::LogContext()
                                     .add("interface", interface_)
                                     .add("remaining_sec", static_cast<long>(std::ceil(cooldown - elapsed))));
                return false;
            }

            last_manual_rotation_ = now;
            logger_->info("Manual rotation requested", core::LogContext().add("interface", interface_));
            return true;
        }

        RotationResult RotationEngine::rotate(const std::string &reason)
        {
            std::lock_guard<std::mutex> rotation_lock(rotation_mutex_);
            return rotate_locked(reason);
        }

        RotationAttempt RotationEngine::rotate_if_due()
        {
            std::lock_guard<std::mutex> rotation_lock(rotation_mutex_);

            RotationAttempt attempt;
            attempt.client_count = probe_clients();
            auto decision = decide(attempt.client_count);

            std::string reason;
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                if (state_ == core::InterfaceState::ERROR && !last_failed_reason_.empty())
                {
                    reason = last_failed_reason_;
                }
            }
            if (reason.empty() && decision.should_rotate)
            {
                reason = decision.reason;
            }
            if (reason.empty())
            {
                return attempt;
            }

            logger_->info("Rotation trigger", core::LogContext().add("interface", interface_).add("reason", reason));
            attempt.attempted = true;
            attempt.result = rotate_locked(reason);
            return attempt;
        }

        RotationResult RotationEngine::rotate_locked(const std::string &reason)
        {
            auto cfg = config();
            auto previous = current_credentials();

            logger_->info("Starting rotation", core::LogContext().add("interface", interface_).add("reason", reason));
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                state_ = core::InterfaceState::ROTATING;
            }
            publish();

            // (a) Generate
            core::Credentials creds;
            creds.interface = interface_;
            creds.rotation_reason = reason;
            try
            {
                creds.ssid = deps_.generator->generate_ssid(cfg->ssid_prefix, cfg->ssid_length);
                creds.password = deps_.generator->generate_password(cfg->password_length);
            }
            catch (const std::exception &e)
            {
                return fail(RotationError::GENERATION, std::string("Credential generation failed: ") + e.what(), reason);
            }
            creds.created_at = deps_.clock->now();
            creds.expires_at = creds.created_at + cfg->rotation_interval_sec;

            // (b) Write config
            infrastructure::AccessPointSettings settings;
            settings.interface = interface_;
            settings.ssid = creds.ssid;
            settings.password = creds.password;
            settings.country_code = cfg->country_code;
            if (const auto *iface_cfg = cfg->interface_config(interface_))
            {
                settings.channel = iface_cfg->channel;
            }
            try
            {
                if (!deps_.config_writer->write(settings))
                {
                    return fail(RotationError::CONFIG_WRITE, "Failed to write hostapd config", reason);
                }
            }
            catch (const std::exception &e)
            {
                logger_->error("Config writer raised", core::LogContext().add("interface", interface_).add("error", e.what()));
                return fail(RotationError::CONFIG_WRITE, "Failed to write hostapd config", reason);
            }

            // (c) Join image, best effort
            try
            {
                if (!deps_.qr_generator->generate(interface_, creds.ssid, creds.password))
                {
                    logger_->warning("QR generation failed, continuing", core::LogContext().add("interface", interface_));
                }
            }
            catch (const std::exception &e)
            {
                logger_->warning("QR generation failed, continuing",
                                 core::LogContext().add("interface", interface_).add("error", e.what()));
            }

            // (d) Apply
            bool applied = false;
            try
            {
                applied = deps_.network->apply(interface_, cfg->dual_ap_mode);
            }
            catch (const std::exception &e)
            {
                logger_->error("Network controller raised", core::LogContext().add("interface", interface_).add("error", e.what()));
            }
            if (!applied)
            {
                restore_previous_config(previous, *cfg);
                return fail(RotationError::APPLY, "Failed to restart hostapd", reason);
            }

            // (e) Commit
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                current_creds_ = creds;
                last_error_.reset();
                last_failed_reason_.clear();
                state_ = core::InterfaceState::READY;
            }
            deps_.store->save_credentials(creds);
            publish();

            logger_->info("Rotation complete",
                          core::LogContext()
                              .add("interface", interface_)
                              .add("ssid", creds.ssid)
                              .add("password_length", creds.password.size())
                              .add("reason", reason));

            RotationResult result;
            result.ok = true;
            result.credentials = creds;
            return result;
        }

        RotationResult RotationEngine::fail(RotationError error, const std::string &message, const std::string &reason)
        {
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                state_ = core::InterfaceState::ERROR;
                last_error_ = message;
                last_failed_reason_ = reason;
            }
            publish();

            logger_->error("Rotation failed",
                           core::LogContext()
                               .add("interface", interface_)
                               .add("reason", reason)
                               .add("error", rotation_error_to_string(error))
                               .add("message", message));

            RotationResult result;
            result.error = error;
            result.message = message;
            return result;
        }

        void RotationEngine::restore_previous_config(const std::optional<core::Credentials> &previous,
                                                     const core::DaemonConfig &config)
        {
            if (!previous)
            {
                return;
            }

            infrastructure::AccessPointSettings settings;
            settings.interface = interface_;
            settings.ssid = previous->ssid;
            settings.password = previous->password;
            settings.country_code = config.country_code;
            if (const auto *iface_cfg = config.interface_config(interface_))
            {
                settings.channel = iface_cfg->channel;
            }

            bool restored = false;
            try
            {
                restored = deps_.config_writer->write(settings);
            }
            catch (const std::exception &e)
            {
                logger_->error("Config writer raised", core::LogContext().add("interface", interface_).add("error", e.what()));
            }

            if (restored)
            {
                logger_->info("Restored previous hostapd config", core::LogContext().add("interface", interface_));
            }
            else
            {
                logger_->warning("Could not restore previous hostapd config", core::LogContext().add("interface", interface_));
            }
        }

        void RotationEngine::refresh_status(std::optional<int> client_count)
        {
            publish(client_count ? *client_count : probe_clients());
        }

        void RotationEngine::mark_error(const std::string &message)
        {
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                state_ = core::InterfaceState::ERROR;
                last_error_ = message;
            }
            publish();
        }

        core::InterfaceState RotationEngine::state() const
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            return state_;
        }

        std::optional<core::Credentials> RotationEngine::current_credentials() const
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            return current_creds_;
        }

        std::optional<std::string> RotationEngine::last_error() const
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            return last_error_;
        }

        core::InterfaceStatus RotationEngine::status_snapshot(int client_count) const
        {
            const double now = deps_.clock->now();

            std::lock_guard<std::mutex> lock(state_mutex_);
            core::InterfaceStatus status;
            status.interface = interface_;
            status.enabled = enabled_;
            status.state = state_;
            status.client_count = client_count;
            status.last_error = last_error_;
            if (current_creds_)
            {
                status.ssid = current_creds_->ssid;
                status.created_at = current_creds_->created_at;
                status.expires_at = current_creds_->expires_at;
                status.last_rotation_reason = current_creds_->rotation_reason;
                status.time_remaining = std::max(0L, static_cast<long>(std::floor(current_creds_->expires_at - now)));
            }
            return status;
        }

        void RotationEngine::publish(std::optional<int> client_count)
        {
            // Snapshot and write in one critical section, so an older snapshot never replaces a newer one
            std::lock_guard<std::mutex> publish_lock(publish_mutex_);

            int count = 0;
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                if (client_count)
                {
                    last_client_count_ = *client_count;
                }
                count = last_client_count_;
            }
            deps_.store->publish_status(status_snapshot(count));
        }

    } // namespace services
} // namespace aprotate
