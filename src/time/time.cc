#include <thread>
#include "time/time.hpp"

std::int64_t dmutex::SystemClock::EpochSeconds()
{
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

dmutex::TimePoint dmutex::SystemClock::SteadyNow()
{
    return SteadyClock::now();
}

void dmutex::SystemClock::SleepFor(const Duration &dt)
{
    std::this_thread::sleep_for(dt);
}

std::shared_ptr<dmutex::Clock> dmutex::SystemClock::Instance()
{
    static std::shared_ptr<Clock> systemClock = std::make_shared<SystemClock>();
    return systemClock;
}

dmutex::ManualClock::ManualClock(std::int64_t epochStart)
    : epochStart(epochStart), elapsed(Duration::zero())
{
}

std::int64_t dmutex::ManualClock::EpochSeconds()
{
    std::lock_guard lk(m);
    return epochStart + std::chrono::duration_cast<std::chrono::seconds>(elapsed).count();
}

dmutex::TimePoint dmutex::ManualClock::SteadyNow()
{
    std::lock_guard lk(m);
    return TimePoint(elapsed);
}

void dmutex::ManualClock::SleepFor(const Duration &dt)
{
    Advance(dt);
}

void dmutex::ManualClock::Advance(const Duration &dt)
{
    std::lock_guard lk(m);
    if (dt > Duration::zero())
    {
        elapsed += dt;
    }
}

dmutex::Duration dmutex::ManualClock::Elapsed()
{
    std::lock_guard lk(m);
    return elapsed;
}
