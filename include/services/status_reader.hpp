#ifndef APROTATE_SERVICES_STATUS_READER_HPP
#define APROTATE_SERVICES_STATUS_READER_HPP

#include <string>
#include <vector>
#include <memory>
#include <filesystem>
#include "core/types.hpp"

namespace aprotate
{
    namespace core
    {
        class Clock;
        class Logger;
    }

    namespace services
    {

        enum class ReadOutcome
        {
            OK,
            MISSING,
            TRANSIENT_ERROR
        };

        struct StatusReadResult
        {
            ReadOutcome outcome = ReadOutcome::MISSING;
            core::InterfaceStatus status;
            std::string error;
        };

        /**
         * Reader side of the run-directory protocol, for the --status command
         * and other observers.
         *
         * A missing file means the state is unknown. Partial or unexpected JSON
         * is reported as a transient error; the caller may read again later.
         */
        class StatusReader
        {
        public:
            StatusReader(std::filesystem::path run_dir,
                         std::string primary_interface,
                         std::shared_ptr<core::Clock> clock);

            // Falls back to status.json for the primary interface; time_remaining is recomputed
            StatusReadResult read(const std::string &interface) const;

            // Interfaces with an enabled, non-disabled published status, in name order
            std::vector<std::string> active_interfaces() const;

        private:
            StatusReadResult read_file(const std::filesystem::path &path, const std::string &interface) const;

            std::filesystem::path run_dir_;
            std::string primary_interface_;
            std::shared_ptr<core::Clock> clock_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace services
} // namespace aprotate

#endif // APROTATE_SERVICES_STATUS_READER_HPP
