#include "store/memory-store.hpp"

dmutex::InMemoryStore::InMemoryStore(std::shared_ptr<Clock> clock, bool atomicExpiry)
    : clock(clock ? std::move(clock) : SystemClock::Instance()), atomicExpiry(atomicExpiry)
{
}

dmutex::InMemoryStore::EntryMap::iterator dmutex::InMemoryStore::FindLive(const std::string &key, const TimePoint &now)
{
    auto it = entries.find(key);
    if (it != entries.end() && it->second.deadline.has_value() && *it->second.deadline <= now)
    {
        entries.erase(it);
        return entries.end();
    }
    return it;
}

void dmutex::InMemoryStore::PurgeExpired(const TimePoint &now)
{
    for (auto it = entries.begin(); it != entries.end();)
    {
        if (it->second.deadline.has_value() && *it->second.deadline <= now)
        {
            it = entries.erase(it);
        }
        else
        {
            ++it;
        }
    }
}

bool dmutex::InMemoryStore::SetIfAbsent(const std::string &key, const std::string &value)
{
    auto now = clock->SteadyNow();
    std::lock_guard lk(m);
    if (FindLive(key, now) != entries.end())
    {
        return false;
    }
    entries.emplace(key, Entry{value, std::nullopt});
    return true;
}

bool dmutex::InMemoryStore::SetIfAbsent(const std::string &key, const std::string &value, std::chrono::seconds ttl)
{
    auto now = clock->SteadyNow();
    std::lock_guard lk(m);
    if (FindLive(key, now) != entries.end())
    {
        return false;
    }
    entries.emplace(key, Entry{value, now + ttl});
    return true;
}

std::optional<std::string> dmutex::InMemoryStore::Get(const std::string &key)
{
    auto now = clock->SteadyNow();
    std::lock_guard lk(m);
    auto it = FindLive(key, now);
    if (it == entries.end())
    {
        return std::nullopt;
    }
    return it->second.value;
}

bool dmutex::InMemoryStore::Expire(const std::string &key, std::chrono::seconds ttl)
{
    auto now = clock->SteadyNow();
    std::lock_guard lk(m);
    auto it = FindLive(key, now);
    if (it == entries.end())
    {
        return false;
    }
    // non-positive ttl deletes the key, as Redis does
    if (ttl <= std::chrono::seconds(0))
    {
        entries.erase(it);
        return true;
    }
    it->second.deadline = now + ttl;
    return true;
}

void dmutex::InMemoryStore::Delete(const std::string &key)
{
    std::lock_guard lk(m);
    entries.erase(key);
}

bool dmutex::InMemoryStore::Exists(const std::string &key)
{
    auto now = clock->SteadyNow();
    std::lock_guard lk(m);
    auto it = entries.find(key);
    return it != entries.end() && (!it->second.deadline.has_value() || *it->second.deadline > now);
}

void dmutex::InMemoryStore::Set(const std::string &key, const std::string &value)
{
    std::lock_guard lk(m);
    entries[key] = Entry{value, std::nullopt};
}

std::optional<dmutex::Duration> dmutex::InMemoryStore::TimeToLive(const std::string &key)
{
    auto now = clock->SteadyNow();
    std::lock_guard lk(m);
    auto it = FindLive(key, now);
    if (it == entries.end() || !it->second.deadline.has_value())
    {
        return std::nullopt;
    }
    return *it->second.deadline - now;
}

std::size_t dmutex::InMemoryStore::Size()
{
    auto now = clock->SteadyNow();
    std::lock_guard lk(m);
    PurgeExpired(now);
    return entries.size();
}
