/**
 * WiFi join payload encoding and the image converter boundary
 */

#include "infrastructure/qr_generator.hpp"
#include "infrastructure/command_runner.hpp"
#include "core/logger.hpp"

#include <sys/stat.h>

namespace aprotate
{
    namespace infrastructure
    {

        std::string escape_join_field(const std::string &value)
        {
            std::string escaped;
            escaped.reserve(value.size() * 2);
            for (char c : value)
            {
                if (c == '\\' || c == ';' || c == ',' || c == '"' || c == ':')
                {
                    escaped += '\\';
                }
                escaped += c;
            }
            return escaped;
        }

        std::string encode_join_payload(const JoinPayload &payload)
        {
            return "WIFI:T:" + payload.security +
                   ";S:" + escape_join_field(payload.ssid) +
                   ";P:" + escape_join_field(payload.password) + ";;";
        }

        std::optional<JoinPayload> decode_join_payload(const std::string &text)
        {
            static const std::string prefix = "WIFI:";
            if (text.compare(0, prefix.size(), prefix) != 0)
            {
                return std::nullopt;
            }

            JoinPayload payload;
            payload.security.clear();
            bool terminated = false;
            size_t pos = prefix.size();

            while (pos < text.size())
            {
                // An empty field closes the record (";;")
                if (text[pos] == ';')
                {
                    terminated = true;
                    break;
                }

                size_t colon = text.find(':', pos);
                if (colon == std::string::npos)
                {
                    return std::nullopt;
                }
                std::string key = text.substr(pos, colon - pos);

                std::string value;
                size_t i = colon + 1;
                bool closed = false;
                for (; i < text.size(); ++i)
                {
                    char c = text[i];
                    if (c == '\\' && i + 1 < text.size())
                    {
                        value += text[++i];
                    }
                    else if (c == ';')
                    {
                        closed = true;
                        break;
                    }
                    else
                    {
                        value += c;
                    }
                }
                if (!closed)
                {
                    return std::nullopt;
                }

                if (key == "T")
                    payload.security = value;
                else if (key == "S")
                    payload.ssid = value;
                else if (key == "P")
                    payload.password = value;

                pos = i + 1;
            }

            if (!terminated)
            {
                return std::nullopt;
            }
            return payload;
        }

        CommandQrGenerator::CommandQrGenerator(std::shared_ptr<CommandRunner> runner,
                                               std::string command,
                                               std::filesystem::path output_dir,
                                               std::string primary_interface,
                                               std::chrono::milliseconds timeout)
            : runner_(std::move(runner)),
              command_(std::move(command)),
              output_dir_(std::move(output_dir)),
              primary_interface_(std::move(primary_interface)),
              timeout_(timeout),
              logger_(core::get_logger("QrGenerator"))
        {
        }

        std::filesystem::path CommandQrGenerator::image_path(const std::string &interface) const
        {
            return output_dir_ / ("qr-" + interface + ".png");
        }

        bool CommandQrGenerator::generate(const std::string &interface, const std::string &ssid, const std::string &password)
        {
            if (ssid.empty() || password.empty())
            {
                logger_->error("Refusing to encode empty credentials", core::LogContext().add("interface", interface));
                return false;
            }

            std::error_code ec;
            std::filesystem::create_directories(output_dir_, ec);
            if (ec)
            {
                logger_->error("Cannot create QR output directory",
                               core::LogContext().add("interface", interface).add("error", ec.message()));
                return false;
            }

            const auto target = image_path(interface);
            const auto staging = std::filesystem::path(target.string() + ".tmp");

            JoinPayload payload;
            payload.ssid = ssid;
            payload.password = password;

            // Error correction H, 10px modules, 2-module quiet zone
            auto result = runner_->run({command_, "-t", "PNG", "-l", "H", "-s", "10", "-m", "2",
                                        "-o", staging.string(), encode_join_payload(payload)},
                                       timeout_);
            if (!result.ok())
            {
                logger_->error("QR generation failed",
                               core::LogContext()
                                   .add("interface", interface)
                                   .add("exit_code", result.exit_code)
                                   .add("timed_out", result.timed_out));
                std::filesystem::remove(staging, ec);
                return false;
            }

            // World-readable for the web view
            if (chmod(staging.c_str(), 0644) != 0)
            {
                logger_->warning("Cannot set QR image permissions", core::LogContext().add("interface", interface));
            }
            std::filesystem::rename(staging, target, ec);
            if (ec)
            {
                logger_->error("Cannot install QR image",
                               core::LogContext().add("interface", interface).add("error", ec.message()));
                std::filesystem::remove(staging, ec);
                return false;
            }

            logger_->info("QR code generated",
                          core::LogContext().add("interface", interface).add("file", target.string()));

            if (interface == primary_interface_)
            {
                auto legacy = output_dir_ / "qr.png";
                std::filesystem::copy_file(target, legacy, std::filesystem::copy_options::overwrite_existing, ec);
                if (ec)
                {
                    logger_->warning("Failed to refresh legacy QR image",
                                     core::LogContext().add("file", legacy.string()).add("error", ec.message()));
                }
            }

            return true;
        }

    } // namespace infrastructure
} // namespace aprotate
