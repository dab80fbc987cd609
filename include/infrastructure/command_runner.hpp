#ifndef APROTATE_INFRASTRUCTURE_COMMAND_RUNNER_HPP
#define APROTATE_INFRASTRUCTURE_COMMAND_RUNNER_HPP

#include <string>
#include <vector>
#include <chrono>
#include <memory>

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

        /**
         * Outcome of one external command
         */
        struct CommandResult
        {
            bool started = false;
            bool timed_out = false;
            int exit_code = -1;
            std::string output; // stdout and stderr, interleaved

            bool ok() const { return started && !timed_out && exit_code == 0; }
        };

        /**
         * Runs external programs. Every call is bounded by a timeout; a child
         * still running at the deadline is killed and reaped.
         */
        class CommandRunner
        {
        public:
            virtual ~CommandRunner() = default;

            virtual CommandResult run(const std::vector<std::string> &argv,
                                      std::chrono::milliseconds timeout) = 0;
        };

        /**
         * fork/execvp implementation (no shell involved, arguments are passed verbatim)
         */
        class ProcessCommandRunner : public CommandRunner
        {
        public:
            ProcessCommandRunner();

            CommandResult run(const std::vector<std::string> &argv,
                              std::chrono::milliseconds timeout) override;

        private:
            std::shared_ptr<core::Logger> logger_;
        };

    } // namespace infrastructure
} // namespace aprotate

#endif // APROTATE_INFRASTRUCTURE_COMMAND_RUNNER_HPP
