#ifndef DMUTEX_TIME_HH
#define DMUTEX_TIME_HH
#include <mutex>
#include <chrono>
#include <cstdint>
#include <memory>

namespace dmutex
{

    using SteadyClock = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<SteadyClock>;
    using Duration = std::chrono::steady_clock::duration;

    // Source of time for the mutex and the in-memory store.
    // EpochSeconds() is the wall clock written into lock records,
    // SteadyNow() measures timeouts and key deadlines.
    class Clock
    {
    public:
        virtual std::int64_t EpochSeconds() = 0;
        virtual TimePoint SteadyNow() = 0;
        virtual void SleepFor(const Duration &dt) = 0;
        virtual ~Clock() = default;
    };

    class SystemClock : public Clock
    {
    public:
        std::int64_t EpochSeconds() override;
        TimePoint SteadyNow() override;
        void SleepFor(const Duration &dt) override;

        static std::shared_ptr<Clock> Instance();
    };

    // Clock that only moves when told to. SleepFor() advances it instead of blocking.
    class ManualClock : public Clock
    {
    public:
        std::int64_t EpochSeconds() override;
        TimePoint SteadyNow() override;
        void SleepFor(const Duration &dt) override;

        void Advance(const Duration &dt);
        Duration Elapsed();

        explicit ManualClock(std::int64_t epochStart = 1600000000);

    private:
        std::mutex m;
        std::int64_t epochStart;
        Duration elapsed;
    };

} // namespace dmutex
#endif
