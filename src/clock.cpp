#include "mscan/platform.hpp"

#include <chrono>
#include <thread>

namespace mscan
{
    std::uint64_t SteadyClock::now_ms() const
    {
        using namespace std::chrono;
        return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
    }

    void SteadyClock::sleep_ms(std::uint64_t ms)
    {
        if (ms > 0)
            std::this_thread::sleep_for(std::chrono::milliseconds(ms));
    }
}
