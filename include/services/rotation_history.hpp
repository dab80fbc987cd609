#ifndef APROTATE_SERVICES_ROTATION_HISTORY_HPP
#define APROTATE_SERVICES_ROTATION_HISTORY_HPP

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <filesystem>
#include "core/types.hpp"

namespace aprotate
{
    namespace core
    {
        class Logger;
    }

    namespace services
    {

        /**
         * Capped audit log of successful rotations (rotations.json, 0600).
         * Single writer: the supervisor.
         */
        class RotationHistory
        {
        public:
            explicit RotationHistory(std::filesystem::path path);

            // Appends and drops the oldest entries beyond `retention`
            bool append(const core::RotationHistoryEntry &entry, int retention);

            // Current contents; an unreadable file reads as empty
            std::vector<core::RotationHistoryEntry> entries() const;

            const std::filesystem::path &path() const { return path_; }

        private:
            std::vector<core::RotationHistoryEntry> load() const;

            std::filesystem::path path_;
            mutable std::mutex mutex_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace services
} // namespace aprotate

#endif // APROTATE_SERVICES_ROTATION_HISTORY_HPP
