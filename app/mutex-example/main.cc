#include <dmutex.hpp>
#include <node/cmdline.hpp>
#include <nlohmann/json.hpp>
#include <iostream>
#include <cstdio>

// Walks through the three ways of taking the lock. Run it twice at the same
// time against one Redis to watch the instances contend.
static void RunDemo(dmutex::Mutex &mutex, dmutex::Clock &clock, dmutex::Duration work)
{
    std::printf("Trying lock (nonblocking)...\n");
    if (mutex.try_lock())
    {
        std::printf("Lock successfully acquired! Doing some work...\n");
        clock.SleepFor(work);
        mutex.unlock();
        std::printf("Work finished\n");
    }
    else
    {
        std::printf("Mutex was already locked!\n");
    }

    std::printf("Trying lock, blocking with 5 seconds timeout\n");
    if (mutex.lock(std::chrono::seconds(5)))
    {
        std::printf("We got the lock! Doing heavy work...\n");
        clock.SleepFor(work);
        mutex.unlock();
        std::printf("Work finished\n");
    }
    else
    {
        std::printf("Timeout!\n");
    }

    // Without a timeout lock() only returns once it holds the lock. Waiters
    // are not queued, another process may take the lock first.
    std::printf("Trying lock, blocking execution until unlocked\n");
    mutex.lock();
    std::printf("Got the lock! Doing work...\n");
    clock.SleepFor(work);
    std::printf("Critical section finished\n");
    // left locked on purpose, the Mutex destructor releases it
}

static void PrintStatus(dmutex::Mutex &mutex, bool asJson)
{
    auto locked = mutex.is_locked();
    std::optional<std::int64_t> acquiredAt;
    if (locked)
    {
        acquiredAt = mutex.AcquiredAt();
    }
    if (asJson)
    {
        nlohmann::json status = {
            {"name", mutex.GetName()},
            {"key", mutex.GetKey()},
            {"locked", locked},
            {"acquired_at", nullptr}
        };
        if (acquiredAt.has_value())
        {
            status["acquired_at"] = *acquiredAt;
        }
        std::cout << status.dump() << std::endl;
        return;
    }
    std::cout << mutex.GetName() << (locked ? " is locked" : " is unlocked");
    if (acquiredAt.has_value())
    {
        std::cout << " since " << *acquiredAt;
    }
    std::cout << std::endl;
}

int main(int argc, char *argv[])
{
    try
    {
        dmutex::CommandLine cmd(argc, argv);
        if (cmd.HelpRequested())
        {
            std::cout << cmd.GetDescription();
            return 0;
        }
        std::shared_ptr<dmutex::KeyValueStore> store;
        if (cmd.UseMemoryStore())
        {
            store = std::make_shared<dmutex::InMemoryStore>();
        }
        else
        {
            store = std::make_shared<dmutex::RedisStore>(cmd.GetRedisOptions());
        }
        auto mode = cmd.GetMode();
        auto clock = dmutex::SystemClock::Instance();
        dmutex::MutexOptions options;
        options.maxTTL = cmd.GetMaxTTL();
        options.clock = clock;
        // only the demo relies on the destructor; the other modes must not drop a lock they did not take
        options.releaseOnDestroy = mode == "demo";
        dmutex::Mutex mutex(store, cmd.GetMutexName(), options);

        if (mode == "demo")
        {
            RunDemo(mutex, *clock, cmd.GetWork());
        }
        else if (mode == "try")
        {
            auto guard = mutex.TryAcquire();
            if (!guard)
            {
                std::printf("Mutex was already locked!\n");
                return 1;
            }
            std::printf("Lock acquired, holding it...\n");
            clock->SleepFor(cmd.GetWork());
            guard.Release();
            std::printf("Released\n");
        }
        else if (mode == "lock")
        {
            auto guard = mutex.Acquire(cmd.GetTimeout(), cmd.GetPollInterval());
            if (!guard)
            {
                std::printf("Timeout!\n");
                return 1;
            }
            std::printf("Lock acquired, holding it...\n");
            clock->SleepFor(cmd.GetWork());
            guard.Release();
            std::printf("Released\n");
        }
        else if (mode == "unlock")
        {
            mutex.unlock();
            std::printf("Mutex %s released\n", mutex.GetName().c_str());
        }
        else
        {
            PrintStatus(mutex, cmd.UseJson());
        }
    }
    catch (const dmutex::InvalidArgumentException &e)
    {
        std::cerr << e.what() << std::endl;
        return 2;
    }
    catch (const dmutex::StoreException &e)
    {
        std::cerr << "Store failure: " << e.what() << std::endl;
        return 3;
    }
    return 0;
}
