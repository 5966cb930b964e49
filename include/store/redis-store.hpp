#ifndef DMUTEX_REDIS_STORE_HH
#define DMUTEX_REDIS_STORE_HH
#include <mutex>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <optional>

#include "time/time.hpp"
#include "store/store.hpp"

struct redisContext;
struct redisReply;

namespace dmutex
{

    struct RedisOptions
    {
        std::string host = "127.0.0.1";
        int port = 6379;
        // Total time spent trying to connect before giving up
        Duration connectTimeout = std::chrono::seconds(5);
        // Pause between two connection attempts
        Duration retryInterval = std::chrono::milliseconds(50);
        // Zero leaves commands without a socket timeout
        Duration commandTimeout = Duration::zero();
        std::string password;
        int database = 0;
    };

    // KeyValueStore backed by a single synchronous hiredis connection.
    // Commands are serialized on an internal mutex so one instance can be shared across threads.
    // A connection broken by an I/O error is re-established on the next command.
    class RedisStore : public KeyValueStore
    {
    public:
        bool SetIfAbsent(const std::string &key, const std::string &value) override;
        std::optional<std::string> Get(const std::string &key) override;
        bool Expire(const std::string &key, std::chrono::seconds ttl) override;
        void Delete(const std::string &key) override;
        bool Exists(const std::string &key) override;
        bool SetIfAbsent(const std::string &key, const std::string &value, std::chrono::seconds ttl) override;
        bool SupportsAtomicExpiry() const override { return true; }

        const RedisOptions &GetOptions() const { return options; }

        explicit RedisStore(RedisOptions options);
        ~RedisStore() override;

    private:

        struct ContextDeleter
        {
            void operator()(redisContext *c) const;
        };
        struct ReplyDeleter
        {
            void operator()(redisReply *r) const;
        };
        using ContextPtr = std::unique_ptr<redisContext, ContextDeleter>;
        using ReplyPtr = std::unique_ptr<redisReply, ReplyDeleter>;

        void Connect();
        ReplyPtr Execute(const std::vector<std::string> &args);
        ReplyPtr ExecuteWithoutLock(const std::vector<std::string> &args);
        long long ExpectInteger(const ReplyPtr &reply, const std::string &command);

        RedisOptions options;
        std::mutex mCommand;
        ContextPtr context;

        RedisStore(RedisStore const &) = delete;
        RedisStore(RedisStore &&) = delete;
        RedisStore &operator=(RedisStore const &) = delete;
        RedisStore &operator=(RedisStore &&) = delete;

    };

} // namespace dmutex
#endif
