#include "core/config.hpp"
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <cctype>
#include <arpa/inet.h>

namespace aprotate
{
    namespace core
    {

        namespace
        {
            template <typename T>
            void read_field(const nlohmann::json &j, const char *key, T &target)
            {
                if (j.contains(key) && !j[key].is_null())
                {
                    target = j[key].get<T>();
                }
            }

            bool is_ipv4(const std::string &address)
            {
                in_addr parsed{};
                return inet_pton(AF_INET, address.c_str(), &parsed) == 1;
            }

            bool is_valid_channel(int channel)
            {
                return (channel >= 1 && channel <= 14) || (channel >= 32 && channel <= 177);
            }
        }

        // InterfaceConfig implementation
        void InterfaceConfig::from_json(const nlohmann::json &j)
        {
            read_field(j, "enabled", enabled);
            read_field(j, "ap_ip", ap_ip);
            read_field(j, "ap_netmask", ap_netmask);
            read_field(j, "dhcp_range_start", dhcp_range_start);
            read_field(j, "dhcp_range_end", dhcp_range_end);
            read_field(j, "dhcp_lease_time", dhcp_lease_time);
            read_field(j, "channel", channel);
        }

        nlohmann::json InterfaceConfig::to_json() const
        {
            return nlohmann::json{
                {"enabled", enabled},
                {"ap_ip", ap_ip},
                {"ap_netmask", ap_netmask},
                {"dhcp_range_start", dhcp_range_start},
                {"dhcp_range_end", dhcp_range_end},
                {"dhcp_lease_time", dhcp_lease_time},
                {"channel", channel}};
        }

        // PathsConfig implementation
        void PathsConfig::from_json(const nlohmann::json &j)
        {
            read_field(j, "run_dir", run_dir);
            read_field(j, "log_dir", log_dir);
            read_field(j, "hostapd_conf_dir", hostapd_conf_dir);
            read_field(j, "template_dir", template_dir);
            read_field(j, "qr_output_dir", qr_output_dir);
            read_field(j, "qr_command", qr_command);
        }

        nlohmann::json PathsConfig::to_json() const
        {
            return nlohmann::json{
                {"run_dir", run_dir},
                {"log_dir", log_dir},
                {"hostapd_conf_dir", hostapd_conf_dir},
                {"template_dir", template_dir},
                {"qr_output_dir", qr_output_dir},
                {"qr_command", qr_command}};
        }

        // TimeoutsConfig implementation
        void TimeoutsConfig::from_json(const nlohmann::json &j)
        {
            read_field(j, "probe_sec", probe_sec);
            read_field(j, "restart_sec", restart_sec);
            read_field(j, "qr_sec", qr_sec);
        }

        nlohmann::json TimeoutsConfig::to_json() const
        {
            return nlohmann::json{
                {"probe_sec", probe_sec},
                {"restart_sec", restart_sec},
                {"qr_sec", qr_sec}};
        }

        // LoggingConfig implementation
        void LoggingConfig::from_json(const nlohmann::json &j)
        {
            read_field(j, "log_level", log_level);
            read_field(j, "log_file", log_file);
        }

        nlohmann::json LoggingConfig::to_json() const
        {
            nlohmann::json j{{"log_level", log_level}};
            if (!log_file.empty())
            {
                j["log_file"] = log_file;
            }
            return j;
        }

        // DevelopmentConfig implementation
        void DevelopmentConfig::from_json(const nlohmann::json &j)
        {
            read_field(j, "skip_privilege_check", skip_privilege_check);
            read_field(j, "skip_service_restart", skip_service_restart);
            read_field(j, "mock_interfaces", mock_interfaces);
        }

        nlohmann::json DevelopmentConfig::to_json() const
        {
            return nlohmann::json{
                {"skip_privilege_check", skip_privilege_check},
                {"skip_service_restart", skip_service_restart},
                {"mock_interfaces", mock_interfaces}};
        }

        // DaemonConfig implementation
        DaemonConfig::DaemonConfig()
        {
            apply_default_interfaces();
        }

        std::unique_ptr<DaemonConfig> DaemonConfig::from_file(const std::string &config_path)
        {
            std::ifstream file(config_path);
            if (!file.is_open())
            {
                throw std::runtime_error("Configuration file not found: " + config_path);
            }

            nlohmann::json j;
            try
            {
                file >> j;
            }
            catch (const nlohmann::json::parse_error &e)
            {
                throw std::runtime_error("Invalid JSON in configuration file: " + std::string(e.what()));
            }

            return from_json(j);
        }

        std::unique_ptr<DaemonConfig> DaemonConfig::load(const std::string &config_path, bool *used_defaults)
        {
            std::error_code ec;
            bool exists = std::filesystem::exists(config_path, ec);
            if (used_defaults)
            {
                *used_defaults = !exists;
            }
            if (!exists)
            {
                return create_default();
            }
            return from_file(config_path);
        }

        std::unique_ptr<DaemonConfig> DaemonConfig::from_json(const nlohmann::json &j)
        {
            if (!j.is_object())
            {
                throw std::invalid_argument("Configuration root must be a JSON object");
            }

            auto config = std::make_unique<DaemonConfig>();

            try
            {
                read_field(j, "rotation_interval_sec", config->rotation_interval_sec);
                read_field(j, "client_threshold", config->client_threshold);
                read_field(j, "min_time_after_clients_sec", config->min_time_after_clients_sec);
                read_field(j, "manual_rotation_cooldown_sec", config->manual_rotation_cooldown_sec);
                read_field(j, "ssid_prefix", config->ssid_prefix);
                read_field(j, "ssid_length", config->ssid_length);
                read_field(j, "password_length", config->password_length);
                read_field(j, "country_code", config->country_code);
                read_field(j, "log_retention_count", config->log_retention_count);
                read_field(j, "dual_ap_mode", config->dual_ap_mode);
                read_field(j, "primary_interface", config->primary_interface);
                read_field(j, "tick_interval_sec", config->tick_interval_sec);
                read_field(j, "startup_retry_delay_sec", config->startup_retry_delay_sec);
                read_field(j, "error_backoff_sec", config->error_backoff_sec);

                // Interfaces merge field-by-field over the built-in defaults
                if (j.contains("interfaces") && j["interfaces"].is_object())
                {
                    for (const auto &item : j["interfaces"].items())
                    {
                        config->interfaces[item.key()].from_json(item.value());
                    }
                }

                if (j.contains("paths"))
                {
                    config->paths.from_json(j["paths"]);
                }
                if (j.contains("timeouts"))
                {
                    config->timeouts.from_json(j["timeouts"]);
                }
                if (j.contains("logging"))
                {
                    config->logging.from_json(j["logging"]);
                }
                if (j.contains("development"))
                {
                    config->development.from_json(j["development"]);
                }
            }
            catch (const nlohmann::json::exception &e)
            {
                throw std::invalid_argument("Invalid configuration value: " + std::string(e.what()));
            }

            return config;
        }

        std::unique_ptr<DaemonConfig> DaemonConfig::create_default()
        {
            return std::make_unique<DaemonConfig>();
        }

        nlohmann::json DaemonConfig::to_json() const
        {
            nlohmann::json ifaces = nlohmann::json::object();
            for (const auto &[name, iface] : interfaces)
            {
                ifaces[name] = iface.to_json();
            }

            return nlohmann::json{
                {"rotation_interval_sec", rotation_interval_sec},
                {"client_threshold", client_threshold},
                {"min_time_after_clients_sec", min_time_after_clients_sec},
                {"manual_rotation_cooldown_sec", manual_rotation_cooldown_sec},
                {"ssid_prefix", ssid_prefix},
                {"ssid_length", ssid_length},
                {"password_length", password_length},
                {"country_code", country_code},
                {"log_retention_count", log_retention_count},
                {"dual_ap_mode", dual_ap_mode},
                {"primary_interface", primary_interface},
                {"tick_interval_sec", tick_interval_sec},
                {"startup_retry_delay_sec", startup_retry_delay_sec},
                {"error_backoff_sec", error_backoff_sec},
                {"interfaces", ifaces},
                {"paths", paths.to_json()},
                {"timeouts", timeouts.to_json()},
                {"logging", logging.to_json()},
                {"development", development.to_json()}};
        }

        void DaemonConfig::save_to_file(const std::string &config_path) const
        {
            std::ofstream file(config_path);
            if (!file.is_open())
            {
                throw std::runtime_error("Cannot open configuration file for writing: " + config_path);
            }

            file << to_json().dump(4);
        }

        std::vector<std::string> DaemonConfig::validation_errors() const
        {
            std::vector<std::string> errors;

            if (rotation_interval_sec <= 0)
            {
                errors.push_back("rotation_interval_sec must be positive");
            }
            if (client_threshold <= 0)
            {
                errors.push_back("client_threshold must be positive");
            }
            if (min_time_after_clients_sec < 0)
            {
                errors.push_back("min_time_after_clients_sec cannot be negative");
            }
            if (manual_rotation_cooldown_sec < 0)
            {
                errors.push_back("manual_rotation_cooldown_sec cannot be negative");
            }
            if (ssid_length <= 0)
            {
                errors.push_back("ssid_length must be positive");
            }
            if (ssid_prefix.size() + static_cast<size_t>(ssid_length > 0 ? ssid_length : 0) > 32)
            {
                errors.push_back("ssid_prefix plus ssid_length exceeds 32 bytes");
            }
            // WPA2-PSK passphrases are 8..63 printable characters
            if (password_length < 8 || password_length > 63)
            {
                errors.push_back("password_length must be between 8 and 63");
            }
            if (country_code.size() != 2 ||
                !std::isalpha(static_cast<unsigned char>(country_code[0])) ||
                !std::isalpha(static_cast<unsigned char>(country_code[1])))
            {
                errors.push_back("country_code must be a two-letter code");
            }
            if (log_retention_count <= 0)
            {
                errors.push_back("log_retention_count must be positive");
            }
            if (tick_interval_sec <= 0)
            {
                errors.push_back("tick_interval_sec must be positive");
            }
            if (startup_retry_delay_sec < 0 || error_backoff_sec < 0)
            {
                errors.push_back("retry delays cannot be negative");
            }
            if (timeouts.probe_sec <= 0 || timeouts.restart_sec <= 0 || timeouts.qr_sec <= 0)
            {
                errors.push_back("timeouts must be positive");
            }
            if (paths.run_dir.empty() || paths.log_dir.empty())
            {
                errors.push_back("paths.run_dir and paths.log_dir are required");
            }
            if (interfaces.find(primary_interface) == interfaces.end())
            {
                errors.push_back("primary_interface has no entry in interfaces");
            }

            for (const auto &[name, iface] : interfaces)
            {
                if (!is_valid_channel(iface.channel))
                {
                    errors.push_back("interfaces." + name + ".channel is not a valid WiFi channel");
                }
                if (!is_ipv4(iface.ap_ip) || !is_ipv4(iface.ap_netmask) ||
                    !is_ipv4(iface.dhcp_range_start) || !is_ipv4(iface.dhcp_range_end))
                {
                    errors.push_back("interfaces." + name + " has a malformed IPv4 address");
                }
            }

            return errors;
        }

        bool DaemonConfig::validate() const
        {
            return validation_errors().empty();
        }

        std::vector<std::string> DaemonConfig::candidate_interfaces() const
        {
            std::vector<std::string> result;
            for (const auto &[name, iface] : interfaces)
            {
                if (name == primary_interface || dual_ap_mode)
                {
                    result.push_back(name);
                }
            }
            return result;
        }

        const InterfaceConfig *DaemonConfig::interface_config(const std::string &interface) const
        {
            auto it = interfaces.find(interface);
            return it == interfaces.end() ? nullptr : &it->second;
        }

        void DaemonConfig::apply_default_interfaces()
        {
            InterfaceConfig wlan0;
            interfaces["wlan0"] = wlan0;

            InterfaceConfig wlan1;
            wlan1.enabled = false;
            wlan1.ap_ip = "192.168.5.1";
            wlan1.dhcp_range_start = "192.168.5.10";
            wlan1.dhcp_range_end = "192.168.5.100";
            wlan1.channel = 11;
            interfaces["wlan1"] = wlan1;
        }

    } // namespace core
} // namespace aprotate
