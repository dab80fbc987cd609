#include "core/clock.hpp"
#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace aprotate
{
    namespace core
    {

        double SystemClock::now() const
        {
            auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
            return std::chrono::duration<double>(since_epoch).count();
        }

        std::string format_iso8601(double epoch_seconds)
        {
            double whole = std::floor(epoch_seconds);
            auto seconds = static_cast<std::time_t>(whole);
            auto micros = static_cast<long>((epoch_seconds - whole) * 1e6);

            std::tm local_tm{};
            localtime_r(&seconds, &local_tm);

            std::ostringstream ss;
            ss << std::put_time(&local_tm, "%Y-%m-%dT%H:%M:%S");
            ss << "." << std::setfill('0') << std::setw(6) << micros;
            return ss.str();
        }

    } // namespace core
} // namespace aprotate
