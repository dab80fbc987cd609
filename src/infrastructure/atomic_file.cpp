#include "infrastructure/atomic_file.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <cstdlib>
#include <fcntl.h>
#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>

namespace aprotate
{
    namespace infrastructure
    {

        namespace
        {
            bool fail(std::string *error, const std::string &what)
            {
                if (error)
                {
                    *error = what + ": " + std::strerror(errno);
                }
                return false;
            }
        }

        bool write_file_atomic(const std::filesystem::path &path,
                               const std::string &content,
                               mode_t mode,
                               std::string *error)
        {
            // Unique per call, so concurrent writers of one file never share a temp file
            std::string tmp_path = path.string() + ".XXXXXX";

            int fd = mkostemp(tmp_path.data(), O_CLOEXEC);
            if (fd < 0)
            {
                return fail(error, "create temp file for " + path.string());
            }

            // mkostemp() creates 0600; force the exact mode before any content lands
            if (fchmod(fd, mode) != 0)
            {
                bool result = fail(error, "chmod " + tmp_path);
                close(fd);
                unlink(tmp_path.c_str());
                return result;
            }

            const char *data = content.data();
            size_t left = content.size();
            while (left > 0)
            {
                ssize_t written = ::write(fd, data, left);
                if (written < 0)
                {
                    if (errno == EINTR)
                    {
                        continue;
                    }
                    bool result = fail(error, "write " + tmp_path);
                    close(fd);
                    unlink(tmp_path.c_str());
                    return result;
                }
                data += written;
                left -= static_cast<size_t>(written);
            }

            int sync_result = fsync(fd);
            int close_result = close(fd);
            if (sync_result != 0 || close_result != 0)
            {
                bool result = fail(error, "flush " + tmp_path);
                unlink(tmp_path.c_str());
                return result;
            }

            if (std::rename(tmp_path.c_str(), path.c_str()) != 0)
            {
                bool result = fail(error, "rename " + tmp_path);
                unlink(tmp_path.c_str());
                return result;
            }

            return true;
        }

        bool read_file(const std::filesystem::path &path, std::string &content)
        {
            std::ifstream file(path);
            if (!file.is_open())
            {
                return false;
            }

            std::ostringstream buffer;
            buffer << file.rdbuf();
            content = buffer.str();
            return !file.bad();
        }

    } // namespace infrastructure
} // namespace aprotate
