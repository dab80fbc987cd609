#ifndef APROTATE_CORE_TYPES_HPP
#define APROTATE_CORE_TYPES_HPP

#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace aprotate
{
    namespace core
    {

        /**
         * Lifecycle state of one access point interface
         */
        enum class InterfaceState
        {
            UNINITIALIZED,
            READY,
            ROTATING,
            ERROR,
            DISABLED
        };

        std::string state_to_string(InterfaceState state);
        std::optional<InterfaceState> state_from_string(const std::string &value);

        /**
         * Network name and passphrase currently served on an interface.
         * Replaced as a whole on every rotation.
         */
        struct Credentials
        {
            std::string interface;
            std::string ssid;
            std::string password;
            double created_at = 0.0;
            double expires_at = 0.0;
            std::string rotation_reason;

            // Throws nlohmann::json::exception on missing or mistyped keys
            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * Snapshot published to status-<iface>.json for the LED renderer and web view
         */
        struct InterfaceStatus
        {
            std::string interface;
            bool enabled = true;
            InterfaceState state = InterfaceState::UNINITIALIZED;
            std::string ssid;
            double created_at = 0.0;
            double expires_at = 0.0;
            long time_remaining = 0;
            int client_count = 0;
            std::string last_rotation_reason;
            std::optional<std::string> last_error;

            // Missing keys keep their defaults; unknown state strings are rejected
            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

        /**
         * One line of the rotation audit log
         */
        struct RotationHistoryEntry
        {
            std::string timestamp; // ISO-8601, local time
            std::string interface;
            std::string ssid;
            std::string reason;
            double created_at = 0.0;

            static RotationHistoryEntry from_credentials(const Credentials &creds, double now);

            void from_json(const nlohmann::json &j);
            nlohmann::json to_json() const;
        };

    } // namespace core
} // namespace aprotate

#endif // APROTATE_CORE_TYPES_HPP
