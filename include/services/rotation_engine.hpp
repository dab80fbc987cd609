#ifndef APROTATE_SERVICES_ROTATION_ENGINE_HPP
#define APROTATE_SERVICES_ROTATION_ENGINE_HPP

#include <string>
#include <memory>
#include <mutex>
#include <optional>
#include "core/types.hpp"

// Forward declarations
namespace aprotate
{
    namespace core
    {
        class DaemonConfig;
        class Clock;
        class Logger;
    }
    namespace infrastructure
    {
        class InterfaceProber;
        class ConfigWriter;
        class QrGenerator;
        class NetworkController;
    }
    namespace services
    {
        class CredentialGenerator;
        class StatusStore;
    }
}

namespace aprotate
{
    namespace services
    {

        struct RotationDecision
        {
            bool should_rotate = false;
            std::string reason;
        };

        enum class RotationError
        {
            NONE,
            GENERATION,
            CONFIG_WRITE,
            APPLY
        };

        std::string rotation_error_to_string(RotationError error);

        /**
         * Outcome of one rotate() call: the new credentials, or an error
         * with a message suitable for last_error.
         */
        struct RotationResult
        {
            bool ok = false;
            std::optional<core::Credentials> credentials;
            RotationError error = RotationError::NONE;
            std::string message;
        };

        /**
         * What rotate_if_due() did. `client_count` is the live count it
         * observed, so the caller can refresh status without probing again.
         */
        struct RotationAttempt
        {
            bool attempted = false;
            RotationResult result;
            int client_count = 0;
        };

        /**
         * Collaborators shared by all engines
         */
        struct EngineDependencies
        {
            std::shared_ptr<core::Clock> clock;
            std::shared_ptr<infrastructure::InterfaceProber> prober;
            std::shared_ptr<CredentialGenerator> generator;
            std::shared_ptr<infrastructure::ConfigWriter> config_writer;
            std::shared_ptr<infrastructure::QrGenerator> qr_generator;
            std::shared_ptr<infrastructure::NetworkController> network;
            std::shared_ptr<StatusStore> store;
        };

        /**
         * Credential lifecycle of one access point interface.
         *
         * rotation_mutex_ is held for the whole of a rotation, so at most one
         * is in flight per interface. state_mutex_ guards the observable state
         * and is only held briefly, so observers never wait for a rotation.
         *
         * State machine:
         *   uninitialized -> rotating -> ready
         *   ready -> rotating, rotating -> error, error -> rotating
         *
         * Interfaces that are absent or disabled at startup never get an
         * engine; the supervisor publishes their disabled status.
         */
        class RotationEngine
        {
        public:
            RotationEngine(std::string interface,
                           std::shared_ptr<const core::DaemonConfig> config,
                           EngineDependencies deps);

            // Policy check; does not change engine state
            RotationDecision evaluate();

            // Consumes the trigger marker; true if a manual rotation is allowed now
            bool consume_manual_trigger();

            RotationResult rotate(const std::string &reason);

            // Re-evaluates under the rotation lock; an engine in error retries its last reason
            RotationAttempt rotate_if_due();

            // Republishes the current state, probing the client count if not given
            void refresh_status(std::optional<int> client_count = std::nullopt);

            void mark_error(const std::string &message);

            void update_config(std::shared_ptr<const core::DaemonConfig> config);

            const std::string &interface() const { return interface_; }
            core::InterfaceState state() const;
            std::optional<core::Credentials> current_credentials() const;
            std::optional<std::string> last_error() const;

            core::InterfaceStatus status_snapshot(int client_count) const;

        private:
            RotationDecision decide(int client_count) const;
            RotationResult rotate_locked(const std::string &reason);
            RotationResult fail(RotationError error, const std::string &message, const std::string &reason);
            void restore_previous_config(const std::optional<core::Credentials> &previous,
                                         const core::DaemonConfig &config);
            void publish(std::optional<int> client_count = std::nullopt);

            std::shared_ptr<const core::DaemonConfig> config() const;
            int probe_clients();

            std::string interface_;
            // Enablement is fixed at startup; a reload does not change it
            bool enabled_ = true;
            EngineDependencies deps_;
            std::shared_ptr<core::Logger> logger_;

            // Guarded by state_mutex_
            std::shared_ptr<const core::DaemonConfig> config_;
            core::InterfaceState state_ = core::InterfaceState::UNINITIALIZED;
            std::optional<core::Credentials> current_creds_;
            std::optional<std::string> last_error_;
            std::string last_failed_reason_;
            int last_client_count_ = 0;
            mutable std::mutex state_mutex_;

            // Only touched by the polling thread
            std::optional<double> last_manual_rotation_;

            std::mutex rotation_mutex_;
            // Serializes status file writes; taken before state_mutex_
            std::mutex publish_mutex_;
        };

    } // namespace services
} // namespace aprotate

#endif // APROTATE_SERVICES_ROTATION_ENGINE_HPP
