#ifndef DMUTEX_MEMORY_STORE_HH
#define DMUTEX_MEMORY_STORE_HH
#include <mutex>
#include <memory>
#include <optional>
#include <unordered_map>

#include "time/time.hpp"
#include "store/store.hpp"

namespace dmutex
{

    // Process-local store with key expiration, driven by a Clock.
    // Safe to share between threads.
    class InMemoryStore : public KeyValueStore
    {
    public:
        bool SetIfAbsent(const std::string &key, const std::string &value) override;
        std::optional<std::string> Get(const std::string &key) override;
        bool Expire(const std::string &key, std::chrono::seconds ttl) override;
        void Delete(const std::string &key) override;
        bool Exists(const std::string &key) override;
        bool SetIfAbsent(const std::string &key, const std::string &value, std::chrono::seconds ttl) override;
        bool SupportsAtomicExpiry() const override { return atomicExpiry; }

        // Writes key unconditionally and clears any expiration.
        void Set(const std::string &key, const std::string &value);
        // Remaining lifetime of key, empty if the key is missing or never expires.
        std::optional<Duration> TimeToLive(const std::string &key);
        std::size_t Size();

        explicit InMemoryStore(std::shared_ptr<Clock> clock = nullptr, bool atomicExpiry = true);

    private:
        struct Entry
        {
            std::string value;
            std::optional<TimePoint> deadline;
        };

        using EntryMap = std::unordered_map<std::string, Entry>;

        EntryMap::iterator FindLive(const std::string &key, const TimePoint &now);
        void PurgeExpired(const TimePoint &now);

        std::shared_ptr<Clock> clock;
        bool atomicExpiry;
        std::mutex m;
        EntryMap entries;
    };

} // namespace dmutex
#endif
