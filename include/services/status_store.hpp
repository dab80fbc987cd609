#ifndef APROTATE_SERVICES_STATUS_STORE_HPP
#define APROTATE_SERVICES_STATUS_STORE_HPP

#include <string>
#include <memory>
#include <optional>
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
         * Writer side of the run-directory protocol.
         *
         *   status-<iface>.json      InterfaceStatus, 0644
         *   current-<iface>.json     Credentials with passphrase, 0600
         *   trigger-rotate-<iface>   manual rotation marker, deleted when consumed
         *
         * Each interface's files have exactly one writer (its engine). Files are
         * replaced atomically so concurrent readers never see partial JSON.
         */
        class StatusStore
        {
        public:
            explicit StatusStore(std::filesystem::path run_dir);

            const std::filesystem::path &run_dir() const { return run_dir_; }

            std::filesystem::path status_path(const std::string &interface) const;
            std::filesystem::path credentials_path(const std::string &interface) const;
            std::filesystem::path trigger_path(const std::string &interface) const;

            // Creates the run directory world-readable (0755) so other services can read status
            bool ensure_run_dir();

            bool publish_status(const core::InterfaceStatus &status);
            bool save_credentials(const core::Credentials &credentials);

            // nullopt when absent or unreadable; a corrupt file is logged and ignored
            std::optional<core::Credentials> load_credentials(const std::string &interface) const;

            // Detects and deletes the marker in one unlink(2); true only if it existed
            bool consume_trigger(const std::string &interface);

            // Used by the --rotate command line helper
            bool create_trigger(const std::string &interface);

        private:
            std::filesystem::path run_dir_;
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace services
} // namespace aprotate

#endif // APROTATE_SERVICES_STATUS_STORE_HPP
