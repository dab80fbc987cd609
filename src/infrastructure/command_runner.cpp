/**
 * External command execution with a hard deadline
 */

#include "infrastructure/command_runner.hpp"
#include "core/logger.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace aprotate
{
    namespace infrastructure
    {

        namespace
        {
            using SteadyClock = std::chrono::steady_clock;

            int remaining_ms(SteadyClock::time_point deadline)
            {
                auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - SteadyClock::now());
                return left.count() > 0 ? static_cast<int>(left.count()) : 0;
            }

            std::string join_command(const std::vector<std::string> &argv)
            {
                std::string joined;
                for (const auto &arg : argv)
                {
                    if (!joined.empty())
                    {
                        joined += " ";
                    }
                    joined += arg;
                }
                return joined;
            }

            // Returns true once the child has been reaped
            bool try_reap(pid_t pid, int *status)
            {
                while (true)
                {
                    pid_t result = waitpid(pid, status, WNOHANG);
                    if (result == pid)
                    {
                        return true;
                    }
                    if (result == -1 && errno == EINTR)
                    {
                        continue;
                    }
                    // 0: still running; -1 (ECHILD): nothing left to reap
                    return result == -1;
                }
            }

            void kill_and_reap(pid_t pid)
            {
                // The child leads its own process group; take helpers down with it
                kill(-pid, SIGKILL);
                kill(pid, SIGKILL);
                int status = 0;
                while (waitpid(pid, &status, 0) == -1 && errno == EINTR)
                {
                }
            }
        }

        ProcessCommandRunner::ProcessCommandRunner()
            : logger_(core::get_logger("CommandRunner"))
        {
        }

        CommandResult ProcessCommandRunner::run(const std::vector<std::string> &argv,
                                                std::chrono::milliseconds timeout)
        {
            CommandResult result;
            if (argv.empty())
            {
                return result;
            }

            logger_->debug("Running command", core::LogContext()
                                                  .add("command", join_command(argv))
                                                  .add("timeout_ms", timeout.count()));

            // Built before fork(): the child may only make async-signal-safe calls
            std::vector<char *> args;
            for (const auto &arg : argv)
            {
                args.push_back(const_cast<char *>(arg.c_str()));
            }
            args.push_back(nullptr);

            sigset_t unblocked;
            sigemptyset(&unblocked);

            int pipe_fds[2];
            if (pipe2(pipe_fds, O_CLOEXEC) != 0)
            {
                logger_->error("Failed to create pipe", core::LogContext().add("error", std::strerror(errno)));
                return result;
            }

            pid_t pid = fork();
            if (pid < 0)
            {
                logger_->error("Failed to fork", core::LogContext().add("error", std::strerror(errno)));
                close(pipe_fds[0]);
                close(pipe_fds[1]);
                return result;
            }

            if (pid == 0)
            {
                // Child process; the daemon blocks termination signals, the tool must not
                sigprocmask(SIG_SETMASK, &unblocked, nullptr);
                setpgid(0, 0);
                dup2(pipe_fds[1], STDOUT_FILENO);
                dup2(pipe_fds[1], STDERR_FILENO);
                int devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);
                if (devnull >= 0)
                {
                    dup2(devnull, STDIN_FILENO);
                }

                execvp(args[0], args.data());
                _exit(127); // If execvp fails
            }

            // Parent process
            close(pipe_fds[1]);
            result.started = true;

            const auto deadline = SteadyClock::now() + timeout;
            int status = 0;
            bool reaped = false;
            bool eof = false;
            char buffer[512];

            while (!eof)
            {
                int wait_ms = remaining_ms(deadline);
                if (wait_ms == 0)
                {
                    result.timed_out = true;
                    break;
                }

                pollfd pfd{pipe_fds[0], POLLIN, 0};
                int ready = poll(&pfd, 1, wait_ms);
                if (ready < 0)
                {
                    if (errno == EINTR)
                    {
                        continue;
                    }
                    break;
                }
                if (ready == 0)
                {
                    continue; // deadline re-checked at the top
                }

                ssize_t n = read(pipe_fds[0], buffer, sizeof(buffer));
                if (n > 0)
                {
                    result.output.append(buffer, static_cast<size_t>(n));
                }
                else if (n == 0 || (errno != EINTR && errno != EAGAIN))
                {
                    eof = true;
                }
            }
            close(pipe_fds[0]);

            // Output closed; the process may still be finishing up
            while (!result.timed_out && !(reaped = try_reap(pid, &status)))
            {
                if (remaining_ms(deadline) == 0)
                {
                    result.timed_out = true;
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }

            if (result.timed_out)
            {
                kill_and_reap(pid);
                logger_->warning("Command timed out", core::LogContext()
                                                          .add("command", join_command(argv))
                                                          .add("timeout_ms", timeout.count()));
                return result;
            }

            if (reaped && WIFEXITED(status))
            {
                result.exit_code = WEXITSTATUS(status);
            }
            else if (reaped && WIFSIGNALED(status))
            {
                result.exit_code = 128 + WTERMSIG(status);
            }

            logger_->debug("Command finished", core::LogContext()
                                                   .add("command", argv[0])
                                                   .add("exit_code", result.exit_code));
            return result;
        }

    } // namespace infrastructure
} // namespace aprotate
