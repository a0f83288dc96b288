#include <ECS/Clock.hpp>

#include <cassert>
#include <chrono>

namespace Metronome::ECS {

double SteadyClock::Now() const
{
    using Seconds = std::chrono::duration<double>;
    return std::chrono::duration_cast<Seconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

SteadyClock& SteadyClock::Instance()
{
    static SteadyClock clock;
    return clock;
}

void ManualClock::Advance(double seconds)
{
    assert(seconds >= 0.0 && "ManualClock::Advance — time must not go backwards");
    if (seconds > 0.0) m_now += seconds;
}

} // namespace Metronome::ECS
