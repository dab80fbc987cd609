#include "core/signal_listener.hpp"
#include "core/logger.hpp"

#include <pthread.h>

namespace aprotate
{
    namespace core
    {

        SignalListener::SignalListener(sigset_t signals,
                                       std::function<void()> on_reload,
                                       std::function<void()> on_stop)
            : signals_(signals),
              on_reload_(std::move(on_reload)),
              on_stop_(std::move(on_stop)),
              logger_(get_logger("main")),
              thread_(&SignalListener::run, this)
        {
        }

        SignalListener::~SignalListener()
        {
            closing_ = true;
            if (!finished_)
            {
                pthread_kill(thread_.native_handle(), SIGTERM);
            }
            thread_.join();
        }

        void SignalListener::run()
        {
            while (true)
            {
                int signum = 0;
                if (sigwait(&signals_, &signum) != 0)
                {
                    continue;
                }
                if (closing_)
                {
                    break;
                }

                if (signum == SIGHUP)
                {
                    logger_->info("Received SIGHUP, reloading configuration");
                    if (on_reload_)
                    {
                        on_reload_();
                    }
                    continue;
                }

                logger_->info("Received signal, shutting down gracefully...", LogContext().add("signal", signum));
                if (on_stop_)
                {
                    on_stop_();
                }
                break;
            }
            finished_ = true;
        }

    } // namespace core
} // namespace aprotate
