#ifndef APROTATE_INFRASTRUCTURE_NETWORK_CONTROLLER_HPP
#define APROTATE_INFRASTRUCTURE_NETWORK_CONTROLLER_HPP

#include <string>
#include <memory>
#include <chrono>

namespace aprotate
{
    namespace core
    {
        class Logger;
    }
}

namespace aprotate
{
    namespace infrastructure
    {
        class CommandRunner;

        /**
         * Control-plane access to the access point service. Success means the
         * service accepted the restart; nothing is assumed about how clients
         * re-associate afterwards.
         */
        class NetworkController
        {
        public:
            virtual ~NetworkController() = default;

            virtual bool apply(const std::string &interface, bool dual_mode) = 0;
        };

        /**
         * Restarts hostapd through systemd: `hostapd` for a single AP,
         * the `hostapd@<iface>` template unit in dual mode.
         */
        class SystemdNetworkController : public NetworkController
        {
        public:
            SystemdNetworkController(std::shared_ptr<CommandRunner> runner, std::chrono::milliseconds timeout);

            bool apply(const std::string &interface, bool dual_mode) override;

            static std::string service_name(const std::string &interface, bool dual_mode);

        private:
            std::shared_ptr<CommandRunner> runner_;
            std::chrono::milliseconds timeout_;
            std::shared_ptr<core::Logger> logger_;
        };

        /**
         * Accepts every request without touching the system (development mode)
         */
        class NullNetworkController : public NetworkController
        {
        public:
            NullNetworkController();

            bool apply(const std::string &interface, bool dual_mode) override;

        private:
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace infrastructure
} // namespace aprotate

#endif // APROTATE_INFRASTRUCTURE_NETWORK_CONTROLLER_HPP
