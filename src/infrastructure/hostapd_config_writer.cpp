/**
 * hostapd configuration rendering
 */

#include "infrastructure/hostapd_config_writer.hpp"
#include "infrastructure/atomic_file.hpp"
#include "core/logger.hpp"

namespace aprotate
{
    namespace infrastructure
    {

        namespace
        {
            void replace_all(std::string &text, const std::string &placeholder, const std::string &value)
            {
                size_t pos = 0;
                while ((pos = text.find(placeholder, pos)) != std::string::npos)
                {
                    text.replace(pos, placeholder.size(), value);
                    pos += value.size();
                }
            }
        }

        HostapdConfigWriter::HostapdConfigWriter(std::filesystem::path template_dir, std::filesystem::path output_dir)
            : template_dir_(std::move(template_dir)),
              output_dir_(std::move(output_dir)),
              logger_(core::get_logger("HostapdConfigWriter"))
        {
        }

        std::filesystem::path HostapdConfigWriter::template_path(const std::string &interface) const
        {
            auto specific = template_dir_ / ("hostapd-" + interface + "-template.conf");
            std::error_code ec;
            if (std::filesystem::exists(specific, ec))
            {
                return specific;
            }
            return template_dir_ / "hostapd-template.conf";
        }

        std::filesystem::path HostapdConfigWriter::output_path(const std::string &interface) const
        {
            return output_dir_ / ("hostapd-" + interface + ".conf");
        }

        std::string HostapdConfigWriter::render(const std::string &template_text, const AccessPointSettings &settings)
        {
            std::string rendered = template_text;
            replace_all(rendered, "{{INTERFACE}}", settings.interface);
            replace_all(rendered, "{{CHANNEL}}", std::to_string(settings.channel));
            replace_all(rendered, "{{COUNTRY_CODE}}", settings.country_code);
            replace_all(rendered, "{{SSID}}", settings.ssid);
            replace_all(rendered, "{{PASSWORD}}", settings.password);
            return rendered;
        }

        bool HostapdConfigWriter::write(const AccessPointSettings &settings)
        {
            const auto source = template_path(settings.interface);
            const auto target = output_path(settings.interface);

            std::string template_text;
            if (!read_file(source, template_text))
            {
                logger_->error("hostapd template not found",
                               core::LogContext()
                                   .add("interface", settings.interface)
                                   .add("template", source.string()));
                return false;
            }

            std::error_code ec;
            std::filesystem::create_directories(output_dir_, ec);
            if (ec)
            {
                logger_->error("Cannot create hostapd config directory",
                               core::LogContext()
                                   .add("interface", settings.interface)
                                   .add("directory", output_dir_.string())
                                   .add("error", ec.message()));
                return false;
            }

            std::string error;
            if (!write_file_atomic(target, render(template_text, settings), 0600, &error))
            {
                logger_->error("Failed to write hostapd config",
                               core::LogContext()
                                   .add("interface", settings.interface)
                                   .add("file", target.string())
                                   .add("error", error));
                return false;
            }

            logger_->info("Wrote hostapd config",
                          core::LogContext()
                              .add("interface", settings.interface)
                              .add("ssid", settings.ssid)
                              .add("file", target.string()));
            return true;
        }

    } // namespace infrastructure
} // namespace aprotate
