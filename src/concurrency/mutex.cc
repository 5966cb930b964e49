#include <cerrno>
#include <cstdlib>
#include <iostream>

#include "concurrency/mutex.hpp"
#include "exception/exception.hpp"

std::optional<std::int64_t> dmutex::ParseLockTimestamp(const std::string &value)
{
    // decimal digits with an optional minus sign, no whitespace or plus sign
    if (value.empty() || (value[0] != '-' && (value[0] < '0' || value[0] > '9')))
    {
        return std::nullopt;
    }
    char *end = nullptr;
    errno = 0;
    long long parsed = std::strtoll(value.c_str(), &end, 10);
    if (errno != 0 || end != value.c_str() + value.size())
    {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(parsed);
}

dmutex::Mutex::Mutex(std::shared_ptr<KeyValueStore> store, std::string name, std::chrono::seconds maxTTL)
    : Mutex(std::move(store), std::move(name), MutexOptions{maxTTL, true, true, nullptr})
{
}

dmutex::Mutex::Mutex(std::shared_ptr<KeyValueStore> store, std::string name, MutexOptions options)
    : store(std::move(store)), name(std::move(name)), options(std::move(options))
{
    if (this->store == nullptr)
    {
        throw InvalidArgumentException("Mutex requires a store");
    }
    if (this->name.empty())
    {
        throw InvalidArgumentException("Mutex name must not be empty");
    }
    if (this->options.maxTTL < std::chrono::seconds(0))
    {
        throw InvalidArgumentException("Mutex " + this->name + " has negative max TTL");
    }
    if (this->options.clock == nullptr)
    {
        this->options.clock = SystemClock::Instance();
    }
    key = kMutexKeyPrefix + this->name;
}

dmutex::Mutex::~Mutex()
{
    if (!options.releaseOnDestroy)
    {
        return;
    }
    try
    {
        unlock();
    }
    catch (const std::exception &e)
    {
        std::cerr << "Mutex " << name << " not released on destruction: " << e.what() << std::endl;
    }
}

std::string dmutex::Mutex::Timestamp() const
{
    return std::to_string(options.clock->EpochSeconds());
}

bool dmutex::Mutex::IsAbandoned(std::int64_t now)
{
    auto stored = store->Get(key);
    if (!stored.has_value())
    {
        return true;
    }
    auto acquiredAt = ParseLockTimestamp(*stored);
    if (!acquiredAt.has_value())
    {
        return true;
    }
    // compared without subtracting the stored value, any record another writer planted stays in range
    return *acquiredAt < now - options.maxTTL.count();
}

bool dmutex::Mutex::try_lock()
{
    if (options.maxTTL == std::chrono::seconds(0))
    {
        return store->SetIfAbsent(key, Timestamp());
    }
    bool atomic = options.atomicExpiry && store->SupportsAtomicExpiry();
    if (atomic)
    {
        if (store->SetIfAbsent(key, Timestamp(), options.maxTTL))
        {
            return true;
        }
    }
    else if (store->SetIfAbsent(key, Timestamp()))
    {
        // key vanished before its TTL was set, drop it rather than leave a key that never expires
        if (!store->Expire(key, options.maxTTL))
        {
            store->Delete(key);
            return false;
        }
        return true;
    }
    if (!IsAbandoned(options.clock->EpochSeconds()))
    {
        return false;
    }
    store->Delete(key);
    if (atomic)
    {
        return store->SetIfAbsent(key, Timestamp(), options.maxTTL);
    }
    return store->SetIfAbsent(key, Timestamp());
}

bool dmutex::Mutex::lock(Duration timeout, Duration pollInterval)
{
    if (timeout < Duration::zero())
    {
        throw InvalidArgumentException("Mutex " + name + " lock timeout must not be negative");
    }
    if (pollInterval < Duration::zero())
    {
        throw InvalidArgumentException("Mutex " + name + " poll interval must not be negative");
    }
    auto start = options.clock->SteadyNow();
    while (!try_lock())
    {
        if (timeout > Duration::zero() && options.clock->SteadyNow() - start > timeout)
        {
            return false;
        }
        options.clock->SleepFor(pollInterval);
    }
    return true;
}

void dmutex::Mutex::unlock()
{
    store->Delete(key);
}

bool dmutex::Mutex::is_locked()
{
    return store->Exists(key);
}

std::optional<std::int64_t> dmutex::Mutex::AcquiredAt()
{
    auto stored = store->Get(key);
    if (!stored.has_value())
    {
        return std::nullopt;
    }
    return ParseLockTimestamp(*stored);
}

dmutex::LockGuard dmutex::Mutex::Acquire(Duration timeout, Duration pollInterval)
{
    bool acquired = lock(timeout, pollInterval);
    return LockGuard(*this, acquired);
}

dmutex::LockGuard dmutex::Mutex::TryAcquire()
{
    bool acquired = try_lock();
    return LockGuard(*this, acquired);
}

dmutex::LockGuard::LockGuard(LockGuard &&other) noexcept : mutex(other.mutex), owns(other.owns)
{
    other.owns = false;
}

dmutex::LockGuard &dmutex::LockGuard::operator=(LockGuard &&other) noexcept
{
    if (this != &other)
    {
        if (owns)
        {
            try
            {
                Release();
            }
            catch (const std::exception &e)
            {
                std::cerr << "Mutex " << mutex->GetName() << " not released: " << e.what() << std::endl;
            }
        }
        mutex = other.mutex;
        owns = other.owns;
        other.owns = false;
    }
    return *this;
}

void dmutex::LockGuard::Release()
{
    if (owns)
    {
        owns = false;
        mutex->unlock();
    }
}

dmutex::LockGuard::~LockGuard()
{
    try
    {
        Release();
    }
    catch (const std::exception &e)
    {
        std::cerr << "Mutex " << mutex->GetName() << " not released on scope exit: " << e.what() << std::endl;
    }
}
