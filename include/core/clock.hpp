#ifndef APROTATE_CORE_CLOCK_HPP
#define APROTATE_CORE_CLOCK_HPP

#include <string>

namespace aprotate
{
    namespace core
    {

        /**
         * Wall-clock source. Rotation timestamps are Unix epoch seconds.
         */
        class Clock
        {
        public:
            virtual ~Clock() = default;

            virtual double now() const = 0;
        };

        class SystemClock : public Clock
        {
        public:
            double now() const override;
        };

        // "2026-10-18T13:37:00.123456" in local time
        std::string format_iso8601(double epoch_seconds);

    } // namespace core
} // namespace aprotate

#endif // APROTATE_CORE_CLOCK_HPP
