#ifndef APROTATE_CORE_CONFIG_HPP
#define APROTATE_CORE_CONFIG_HPP

#include <string>
#include <memory>
#include <map>
#include <vector>
#include <nlohmann/json.hpp>

namespace aprotate
{
    namespace core
    {

        /**
         * Per-radio access point settings
         */
        struct InterfaceConfig
        {
            bool enabled = true;
            std::string ap_ip = "192.168.4.1";
            std::string ap_netmask = "255.255.255.0";
            std::string dhcp_range_start = "192.168.4.10";
            std::string dhcp_range_end = "192.168.4.100";
            std::string dhcp_lease_time = "4h";
            int channel = 6;

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Filesystem locations and external helpers
         */
        struct PathsConfig
        {
            std::string run_dir = "/var/run/ssb-ap";
            std::string log_dir = "/var/log/ssb-ap";
            std::string hostapd_conf_dir = "/etc/hostapd";
            std::string template_dir = "/opt/ssb-wifi-kiosk/ap";
            std::string qr_output_dir = "/opt/ssb-wifi-kiosk/web/static";
            std::string qr_command = "qrencode";

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Upper bounds for calls into external processes, in seconds
         */
        struct TimeoutsConfig
        {
            int probe_sec = 5;
            int restart_sec = 30;
            int qr_sec = 10;

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Logging configuration
         */
        struct LoggingConfig
        {
            std::string log_level = "INFO";
            std::string log_file; // Empty means console output

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Development and testing configuration
         */
        struct DevelopmentConfig
        {
            bool skip_privilege_check = false;
            bool skip_service_restart = false;
            bool mock_interfaces = false;

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Complete daemon configuration.
         *
         * Instances are shared read-only between the supervisor and the
         * rotation engines; a reload builds a new object and swaps the handle.
         */
        class DaemonConfig
        {
        public:
            static constexpr const char *DEFAULT_PATH = "/etc/ssb-ap/config.json";

            // Rotation policy
            int rotation_interval_sec = 300;
            int client_threshold = 5;
            int min_time_after_clients_sec = 120;
            int manual_rotation_cooldown_sec = 30;

            // Credential generation
            std::string ssid_prefix = "ssb-";
            int ssid_length = 6;
            int password_length = 16;
            std::string country_code = "AR";

            // Daemon behaviour
            int log_retention_count = 100;
            bool dual_ap_mode = false;
            std::string primary_interface = "wlan0";
            int tick_interval_sec = 1;
            int startup_retry_delay_sec = 5;
            int error_backoff_sec = 5;

            // Radios, keyed by interface name
            std::map<std::string, InterfaceConfig> interfaces;

            // Sub-configurations
            PathsConfig paths;
            TimeoutsConfig timeouts;
            LoggingConfig logging;
            DevelopmentConfig development;

        public:
            DaemonConfig();

            // Factory methods
            static std::unique_ptr<DaemonConfig> from_file(const std::string &config_path);
            // Like from_file, but a missing file yields the defaults
            static std::unique_ptr<DaemonConfig> load(const std::string &config_path, bool *used_defaults = nullptr);
            static std::unique_ptr<DaemonConfig> from_json(const nlohmann::json &j);
            static std::unique_ptr<DaemonConfig> create_default();

            // Serialization
            nlohmann::json to_json() const;
            void save_to_file(const std::string &config_path) const;

            // Validation; returns the list of problems, empty when valid
            std::vector<std::string> validation_errors() const;
            bool validate() const;

            // Interfaces the supervisor should consider, in name order. Outside
            // dual mode that is the primary interface alone, whatever else is configured.
            std::vector<std::string> candidate_interfaces() const;

            const InterfaceConfig *interface_config(const std::string &interface) const;

        private:
            void apply_default_interfaces();
        };

    } // namespace core
} // namespace aprotate

#endif // APROTATE_CORE_CONFIG_HPP
