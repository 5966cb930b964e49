#ifndef DMUTEX_STORE_HH
#define DMUTEX_STORE_HH
#include <chrono>
#include <string>
#include <optional>

namespace dmutex
{

    // Minimal set of atomic key-value operations the mutex is built on.
    // Implementations report transport and server failures by throwing StoreException.
    class KeyValueStore
    {
    public:
        // Sets key only if it does not exist. Returns whether the write happened.
        virtual bool SetIfAbsent(const std::string &key, const std::string &value) = 0;
        virtual std::optional<std::string> Get(const std::string &key) = 0;
        // Returns false if the key did not exist.
        virtual bool Expire(const std::string &key, std::chrono::seconds ttl) = 0;
        virtual void Delete(const std::string &key) = 0;
        virtual bool Exists(const std::string &key) = 0;

        // Set-if-absent and expiration applied as one atomic step.
        // Only called when SupportsAtomicExpiry() is true.
        virtual bool SetIfAbsent(const std::string &key, const std::string &value, std::chrono::seconds ttl);
        virtual bool SupportsAtomicExpiry() const { return false; }

        virtual ~KeyValueStore() = default;
    };

} // namespace dmutex
#endif
