#ifndef APROTATE_CORE_SIGNAL_LISTENER_HPP
#define APROTATE_CORE_SIGNAL_LISTENER_HPP

#include <atomic>
#include <functional>
#include <memory>
#include <signal.h>
#include <thread>

namespace aprotate
{
    namespace core
    {

        class Logger;

        /**
         * Receives process signals on a dedicated thread through sigwait(2).
         *
         * `signals` must contain SIGTERM and be blocked in every thread before
         * construction. SIGHUP runs `on_reload`; any other signal in the set
         * runs `on_stop` and ends the thread. The destructor wakes the thread
         * and joins it, so the callbacks never outlive their targets.
         */
        class SignalListener
        {
        public:
            SignalListener(sigset_t signals,
                           std::function<void()> on_reload,
                           std::function<void()> on_stop);
            ~SignalListener();

            SignalListener(const SignalListener &) = delete;
            SignalListener &operator=(const SignalListener &) = delete;

        private:
            void run();

            sigset_t signals_;
            std::function<void()> on_reload_;
            std::function<void()> on_stop_;
            std::shared_ptr<Logger> logger_;
            std::atomic<bool> closing_{false};
            std::atomic<bool> finished_{false};
            std::thread thread_;
        };

    } // namespace core
} // namespace aprotate

#endif // APROTATE_CORE_SIGNAL_LISTENER_HPP
