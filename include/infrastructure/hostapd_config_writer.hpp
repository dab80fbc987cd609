#ifndef APROTATE_INFRASTRUCTURE_HOSTAPD_CONFIG_WRITER_HPP
#define APROTATE_INFRASTRUCTURE_HOSTAPD_CONFIG_WRITER_HPP

#include <string>
#include <memory>
#include <filesystem>

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

        /**
         * Values substituted into the access point configuration template
         */
        struct AccessPointSettings
        {
            std::string interface;
            std::string ssid;
            std::string password;
            int channel = 6;
            std::string country_code;
        };

        class ConfigWriter
        {
        public:
            virtual ~ConfigWriter() = default;

            virtual bool write(const AccessPointSettings &settings) = 0;
        };

        /**
         * Renders hostapd-<iface>.conf from a template.
         *
         * Template lookup: <template_dir>/hostapd-<iface>-template.conf, then
         * <template_dir>/hostapd-template.conf. Placeholders: {{SSID}},
         * {{PASSWORD}}, {{CHANNEL}}, {{COUNTRY_CODE}}, {{INTERFACE}}.
         * The output holds the passphrase and is written owner-only (0600).
         */
        class HostapdConfigWriter : public ConfigWriter
        {
        public:
            HostapdConfigWriter(std::filesystem::path template_dir, std::filesystem::path output_dir);

            bool write(const AccessPointSettings &settings) override;

            std::filesystem::path template_path(const std::string &interface) const;
            std::filesystem::path output_path(const std::string &interface) const;

            static std::string render(const std::string &template_text, const AccessPointSettings &settings);

        private:
            std::filesystem::path template_dir_;
            std::filesystem::path output_dir_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace infrastructure
} // namespace aprotate

#endif // APROTATE_INFRASTRUCTURE_HOSTAPD_CONFIG_WRITER_HPP
