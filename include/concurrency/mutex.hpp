#ifndef DMUTEX_MUTEX_HH
#define DMUTEX_MUTEX_HH
#include <mutex>
#include <chrono>
#include <memory>
#include <string>
#include <cstdint>
#include <optional>

#include "time/time.hpp"
#include "store/store.hpp"

namespace dmutex
{

    constexpr const char *kMutexKeyPrefix = "//mutex/";
    constexpr Duration kDefaultPollInterval = std::chrono::milliseconds(250);

    struct MutexOptions
    {
        // Maximum lifetime of a lock record, zero means it never expires
        std::chrono::seconds maxTTL{0};
        // Use the store's atomic set-if-absent-with-expiration when it has one,
        // instead of SETNX followed by EXPIRE
        bool atomicExpiry = true;
        // Delete the lock key when the handle is destroyed
        bool releaseOnDestroy = true;
        // Defaults to the system clock
        std::shared_ptr<Clock> clock;
    };

    class LockGuard;

    /**
     * Mutex shared by every process that uses the same store and name.
     *
     * The lock is the key "//mutex/<name>" in the store, holding the acquisition
     * time in seconds since epoch. The handle keeps no ownership state, every
     * query goes to the store.
     *
     * There is no ownership token: unlock() deletes the key whoever created it,
     * and so does the destructor unless releaseOnDestroy is off. Waiters are not
     * queued, any of them may win once the key is gone.
     *
     * Satisfies Lockable, so std::lock_guard and std::unique_lock work with the
     * default lock() arguments (wait forever).
     */
    class Mutex
    {
    public:

        /**
         * Single attempt to take the lock.
         * When maxTTL is set, a record older than maxTTL (or one that vanished
         * meanwhile) is deleted and the key is claimed once more, so the store may
         * be written even when false is returned.
         * @throws StoreException if the store fails
         */
        bool try_lock();

        /**
         * Polls try_lock() every pollInterval until it succeeds.
         * @param timeout give up once this much time has passed, zero waits forever
         * @return false only if the timeout expired
         */
        bool lock(Duration timeout = Duration::zero(), Duration pollInterval = kDefaultPollInterval);

        // Deletes the lock key, even if another handle took the lock.
        void unlock();

        /**
         * Whether the lock key currently exists.
         * For monitoring only. Never use it to decide whether to enter a critical
         * section, the check and a later try_lock() are not atomic:
         *
         *     if (!m.is_locked()) { m.try_lock(); ... }   // WRONG, races
         *     if (m.try_lock()) { ... }                    // right
         */
        bool is_locked();

        // Scoped variants, the returned guard unlocks on destruction if it owns the lock
        LockGuard Acquire(Duration timeout = Duration::zero(), Duration pollInterval = kDefaultPollInterval);
        LockGuard TryAcquire();

        // Acquisition time stored in the lock record, empty if unlocked or unparsable
        std::optional<std::int64_t> AcquiredAt();

        const std::string &GetName() const { return name; }
        const std::string &GetKey() const { return key; }
        std::chrono::seconds GetMaxTTL() const { return options.maxTTL; }

        Mutex(std::shared_ptr<KeyValueStore> store, std::string name,
              std::chrono::seconds maxTTL = std::chrono::seconds(0));
        Mutex(std::shared_ptr<KeyValueStore> store, std::string name, MutexOptions options);
        ~Mutex();

    private:

        bool IsAbandoned(std::int64_t now);
        std::string Timestamp() const;

        std::shared_ptr<KeyValueStore> store;
        std::string name;
        std::string key;
        MutexOptions options;

        Mutex(Mutex const &) = delete;
        Mutex(Mutex &&) = delete;
        Mutex &operator=(Mutex const &) = delete;
        Mutex &operator=(Mutex &&) = delete;

    };

    // Owns one acquisition of a Mutex, released when the guard goes out of scope.
    class LockGuard
    {
    public:

        bool OwnsLock() const { return owns; }
        explicit operator bool() const { return owns; }
        // Unlocks now if the lock is owned. Store failures propagate.
        void Release();

        LockGuard(Mutex &mutex, bool owns) : mutex(&mutex), owns(owns) {}
        LockGuard(LockGuard &&other) noexcept;
        LockGuard &operator=(LockGuard &&other) noexcept;
        ~LockGuard();

    private:

        Mutex *mutex;
        bool owns;

        LockGuard(LockGuard const &) = delete;
        LockGuard &operator=(LockGuard const &) = delete;

    };

    // Parses the integer seconds stored in a lock record
    std::optional<std::int64_t> ParseLockTimestamp(const std::string &value);

} // namespace dmutex
#endif
