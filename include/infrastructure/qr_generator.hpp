#ifndef APROTATE_INFRASTRUCTURE_QR_GENERATOR_HPP
#define APROTATE_INFRASTRUCTURE_QR_GENERATOR_HPP

#include <string>
#include <memory>
#include <chrono>
#include <optional>
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
        class CommandRunner;

        /**
         * WiFi join payload as read by phone cameras:
         *   WIFI:T:<security>;S:<ssid>;P:<password>;;
         */
        struct JoinPayload
        {
            std::string security = "WPA";
            std::string ssid;
            std::string password;
        };

        // Backslash-escapes \ ; , " : (backslash first, so nothing is escaped twice)
        std::string escape_join_field(const std::string &value);

        std::string encode_join_payload(const JoinPayload &payload);

        // Inverse of encode_join_payload; nullopt when the text is not a WIFI: payload
        std::optional<JoinPayload> decode_join_payload(const std::string &text);

        /**
         * Turns credentials into a scannable image
         */
        class QrGenerator
        {
        public:
            virtual ~QrGenerator() = default;

            virtual bool generate(const std::string &interface, const std::string &ssid, const std::string &password) = 0;
        };

        /**
         * Pipes the payload through an external encoder (qrencode by default)
         * into <output_dir>/qr-<iface>.png. The primary interface's image is
         * also copied to qr.png for pages that predate dual mode.
         */
        class CommandQrGenerator : public QrGenerator
        {
        public:
            CommandQrGenerator(std::shared_ptr<CommandRunner> runner,
                               std::string command,
                               std::filesystem::path output_dir,
                               std::string primary_interface,
                               std::chrono::milliseconds timeout);

            bool generate(const std::string &interface, const std::string &ssid, const std::string &password) override;

            std::filesystem::path image_path(const std::string &interface) const;

        private:
            std::shared_ptr<CommandRunner> runner_;
            std::string command_;
            std::filesystem::path output_dir_;
            std::string primary_interface_;
            std::chrono::milliseconds timeout_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace infrastructure
} // namespace aprotate

#endif // APROTATE_INFRASTRUCTURE_QR_GENERATOR_HPP
