#include "core/types.hpp"
#include "core/clock.hpp"
#include <stdexcept>

namespace aprotate
{
    namespace core
    {

        std::string state_to_string(InterfaceState state)
        {
            switch (state)
            {
            case InterfaceState::UNINITIALIZED:
                return "uninitialized";
            case InterfaceState::READY:
                return "ready";
            case InterfaceState::ROTATING:
                return "rotating";
            case InterfaceState::ERROR:
                return "error";
            case InterfaceState::DISABLED:
                return "disabled";
            }
            return "unknown";
        }

        std::optional<InterfaceState> state_from_string(const std::string &value)
        {
            if (value == "uninitialized")
                return InterfaceState::UNINITIALIZED;
            if (value == "ready")
                return InterfaceState::READY;
            if (value == "rotating")
                return InterfaceState::ROTATING;
            if (value == "error")
                return InterfaceState::ERROR;
            if (value == "disabled")
                return InterfaceState::DISABLED;
            return std::nullopt;
        }

        // Credentials implementation
        void Credentials::from_json(const nlohmann::json &j)
        {
            interface = j.at("interface").get<std::string>();
            ssid = j.at("ssid").get<std::string>();
            password = j.at("password").get<std::string>();
            created_at = j.at("created_at").get<double>();
            expires_at = j.at("expires_at").get<double>();
            rotation_reason = j.value("rotation_reason", std::string());
        }

        nlohmann::json Credentials::to_json() const
        {
            return nlohmann::json{
                {"interface", interface},
                {"ssid", ssid},
                {"password", password},
                {"created_at", created_at},
                {"expires_at", expires_at},
                {"rotation_reason", rotation_reason}};
        }

        // InterfaceStatus implementation
        void InterfaceStatus::from_json(const nlohmann::json &j)
        {
            if (!j.is_object())
            {
                throw std::invalid_argument("status document is not an object");
            }

            interface = j.value("interface", interface);
            enabled = j.value("enabled", enabled);
            if (j.contains("state"))
            {
                auto parsed = state_from_string(j["state"].get<std::string>());
                if (!parsed)
                {
                    throw std::invalid_argument("unknown interface state: " + j["state"].get<std::string>());
                }
                state = *parsed;
            }
            ssid = j.value("ssid", ssid);
            created_at = j.value("created_at", created_at);
            expires_at = j.value("expires_at", expires_at);
            time_remaining = j.value("time_remaining", time_remaining);
            client_count = j.value("client_count", client_count);
            last_rotation_reason = j.value("last_rotation_reason", last_rotation_reason);
            if (j.contains("last_error") && !j["last_error"].is_null())
            {
                last_error = j["last_error"].get<std::string>();
            }
            else
            {
                last_error.reset();
            }
        }

        nlohmann::json InterfaceStatus::to_json() const
        {
            nlohmann::json j{
                {"interface", interface},
                {"enabled", enabled},
                {"state", state_to_string(state)},
                {"ssid", ssid},
                {"created_at", created_at},
                {"expires_at", expires_at},
                {"time_remaining", time_remaining},
                {"client_count", client_count},
                {"last_rotation_reason", last_rotation_reason}};
            if (last_error)
            {
                j["last_error"] = *last_error;
            }
            else
            {
                j["last_error"] = nullptr;
            }
            return j;
        }

        // RotationHistoryEntry implementation
        RotationHistoryEntry RotationHistoryEntry::from_credentials(const Credentials &creds, double now)
        {
            RotationHistoryEntry entry;
            entry.timestamp = format_iso8601(now);
            entry.interface = creds.interface;
            entry.ssid = creds.ssid;
            entry.reason = creds.rotation_reason;
            entry.created_at = creds.created_at;
            return entry;
        }

        void RotationHistoryEntry::from_json(const nlohmann::json &j)
        {
            timestamp = j.value("timestamp", std::string());
            interface = j.value("interface", std::string());
            ssid = j.value("ssid", std::string());
            reason = j.value("reason", std::string());
            created_at = j.value("created_at", 0.0);
        }

        nlohmann::json RotationHistoryEntry::to_json() const
        {
            return nlohmann::json{
                {"timestamp", timestamp},
                {"interface", interface},
                {"ssid", ssid},
                {"reason", reason},
                {"created_at", created_at}};
        }

    } // namespace core
} // namespace aprotate
