#include "services/rotation_history.hpp"
#include "infrastructure/atomic_file.hpp"
#include "core/logger.hpp"

namespace aprotate
{
    namespace services
    {

        RotationHistory::RotationHistory(std::filesystem::path path)
            : path_(std::move(path)), logger_(core::get_logger("RotationHistory"))
        {
        }

        std::vector<core::RotationHistoryEntry> RotationHistory::load() const
        {
            std::vector<core::RotationHistoryEntry> result;

            std::string content;
            if (!infrastructure::read_file(path_, content))
            {
                return result;
            }

            try
            {
                auto j = nlohmann::json::parse(content);
                if (!j.is_array())
                {
                    logger_->warning("Rotation history is not a list, starting over",
                                     core::LogContext().add("file", path_.string()));
                    return result;
                }
                for (const auto &item : j)
                {
                    core::RotationHistoryEntry entry;
                    entry.from_json(item);
                    result.push_back(entry);
                }
            }
            catch (const nlohmann::json::exception &e)
            {
                logger_->warning("Rotation history unreadable, starting over",
                                 core::LogContext().add("file", path_.string()).add("error", e.what()));
                result.clear();
            }
            return result;
        }

        bool RotationHistory::append(const core::RotationHistoryEntry &entry, int retention)
        {
            std::lock_guard<std::mutex> lock(mutex_);

            auto history = load();
            history.push_back(entry);

            size_t cap = retention > 0 ? static_cast<size_t>(retention) : 1;
            if (history.size() > cap)
            {
                history.erase(history.begin(), history.end() - static_cast<long>(cap));
            }

            nlohmann::json j = nlohmann::json::array();
            for (const auto &item : history)
            {
                j.push_back(item.to_json());
            }

            std::error_code ec;
            std::filesystem::create_directories(path_.parent_path(), ec);

            std::string error;
            if (!infrastructure::write_file_atomic(path_, j.dump(2), 0600, &error))
            {
                logger_->error("Failed to log rotation",
                               core::LogContext().add("interface", entry.interface).add("error", error));
                return false;
            }

            logger_->debug("Rotation logged",
                           core::LogContext().add("interface", entry.interface).add("entries", history.size()));
            return true;
        }

        std::vector<core::RotationHistoryEntry> RotationHistory::entries() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return load();
        }

    } // namespace services
} // namespace aprotate
