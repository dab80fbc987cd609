#ifndef APROTATE_INFRASTRUCTURE_ATOMIC_FILE_HPP
#define APROTATE_INFRASTRUCTURE_ATOMIC_FILE_HPP

#include <string>
#include <filesystem>
#include <sys/types.h>

namespace aprotate
{
    namespace infrastructure
    {

        /**
         * Replaces `path` with `content` through a temporary file in the same
         * directory and rename(2). Readers see either the old or the new file,
         * never a partial one. The temporary file is created with `mode`, so
         * secrets are never exposed with wider permissions.
         *
         * @return false on failure, with a description in `error` if given
         */
        bool write_file_atomic(const std::filesystem::path &path,
                               const std::string &content,
                               mode_t mode,
                               std::string *error = nullptr);

        // Whole-file read; false if the file cannot be opened
        bool read_file(const std::filesystem::path &path, std::string &content);

    } // namespace infrastructure
} // namespace aprotate

#endif // APROTATE_INFRASTRUCTURE_ATOMIC_FILE_HPP
