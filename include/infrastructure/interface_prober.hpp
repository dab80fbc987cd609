#ifndef APROTATE_INFRASTRUCTURE_INTERFACE_PROBER_HPP
#define APROTATE_INFRASTRUCTURE_INTERFACE_PROBER_HPP

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
         * Queries radio devices on the host
         */
        class InterfaceProber
        {
        public:
            virtual ~InterfaceProber() = default;

            // True if the network device exists
            virtual bool interface_exists(const std::string &interface) = 0;

            // Number of associated stations; 0 when the query fails
            virtual int client_count(const std::string &interface) = 0;
        };

        /**
         * Uses `ip link show` and `iw dev <iface> station dump`
         */
        class SystemInterfaceProber : public InterfaceProber
        {
        public:
            SystemInterfaceProber(std::shared_ptr<CommandRunner> runner, std::chrono::milliseconds timeout);

            bool interface_exists(const std::string &interface) override;
            int client_count(const std::string &interface) override;

            // Counts "Station <mac> (on <iface>)" records
            static int count_stations(const std::string &station_dump);

        private:
            std::shared_ptr<CommandRunner> runner_;
            std::chrono::milliseconds timeout_;
            std::shared_ptr<core::Logger> logger_;
        };

        /**
         * Development stand-in: every interface exists and has no clients
         */
        class MockInterfaceProber : public InterfaceProber
        {
        public:
            bool interface_exists(const std::string &) override { return true; }
            int client_count(const std::string &) override { return 0; }
        };

    } // namespace infrastructure
} // namespace aprotate

#endif // APROTATE_INFRASTRUCTURE_INTERFACE_PROBER_HPP
