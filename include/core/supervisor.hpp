#ifndef APROTATE_CORE_SUPERVISOR_HPP
#define APROTATE_CORE_SUPERVISOR_HPP

#include <memory>
#include <map>
#include <string>
#include <vector>
#include <atomic>
#include <mutex>
#include <chrono>
#include <functional>
#include <condition_variable>
#include "services/rotation_engine.hpp"

// Forward declarations
namespace aprotate
{
    namespace core
    {
        class DaemonConfig;
        class Logger;
    }
    namespace services
    {
        class RotationHistory;
    }
}

namespace aprotate
{
    namespace core
    {

        /**
         * Top of the daemon: owns the rotation engines (one per usable
         * interface, keyed by name), the rotation history and the live
         * configuration handle, and drives the polling loop.
         *
         * request_stop() and request_reload() may be called from any thread;
         * both take effect at the next tick boundary. A rotation in progress
         * is never interrupted.
         */
        class Supervisor
        {
        public:
            // Returns the new configuration or throws; used for reload
            using ConfigLoader = std::function<std::shared_ptr<const DaemonConfig>()>;

            Supervisor(std::shared_ptr<const DaemonConfig> config,
                       services::EngineDependencies deps,
                       ConfigLoader loader);
            ~Supervisor();

            // Builds the engines and performs the startup rotations; false if no interface is usable
            bool start();

            // Polls until request_stop()
            void run();

            // One pass over all engines in name order
            void tick();

            void request_stop();
            void request_reload();
            bool stop_requested() const { return stop_requested_; }

            std::shared_ptr<const DaemonConfig> config() const;
            std::vector<std::string> active_interfaces() const;
            std::shared_ptr<services::RotationEngine> engine(const std::string &interface) const;
            const services::RotationHistory &history() const { return *history_; }

        private:
            void build_engines();
            void startup_rotation(services::RotationEngine &engine);
            void publish_disabled(const std::string &interface, bool enabled, const std::string &message);
            void log_rotation(const Credentials &credentials);
            void apply_pending_reload();

            // Sleeps up to `duration`; false if woken by request_stop()
            bool wait_for(std::chrono::milliseconds duration);

            std::shared_ptr<const DaemonConfig> config_;
            mutable std::mutex config_mutex_;

            services::EngineDependencies deps_;
            ConfigLoader loader_;
            std::shared_ptr<Logger> logger_;

            std::map<std::string, std::shared_ptr<services::RotationEngine>> engines_;
            std::unique_ptr<services::RotationHistory> history_;

            std::atomic<bool> stop_requested_{false};
            std::atomic<bool> reload_requested_{false};

            // Thread synchro for shutdown
            std::mutex wait_mutex_;
            std::condition_variable wait_cv_;
        };

    } // namespace core
} // namespace aprotate

#endif // APROTATE_CORE_SUPERVISOR_HPP
