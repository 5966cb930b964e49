#include <thread>
#include <algorithm>
#include <hiredis/hiredis.h>

#include "store/redis-store.hpp"
#include "exception/exception.hpp"

static struct timeval ToTimeval(const dmutex::Duration &dt)
{
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(dt).count();
    struct timeval tv;
    tv.tv_sec = us / 1000000;
    tv.tv_usec = us % 1000000;
    return tv;
}

void dmutex::RedisStore::ContextDeleter::operator()(redisContext *c) const
{
    redisFree(c);
}

void dmutex::RedisStore::ReplyDeleter::operator()(redisReply *r) const
{
    freeReplyObject(r);
}

dmutex::RedisStore::RedisStore(RedisOptions options) : options(std::move(options))
{
    if (this->options.port <= 0 || this->options.port > 65535)
    {
        throw InvalidArgumentException("Redis port out of range: " + std::to_string(this->options.port));
    }
    if (this->options.database < 0)
    {
        throw InvalidArgumentException("Redis database index must not be negative");
    }
    std::lock_guard lk(mCommand);
    Connect();
}

dmutex::RedisStore::~RedisStore() = default;

void dmutex::RedisStore::Connect()
{
    context.reset();
    auto deadline = SteadyClock::now() + options.connectTimeout;
    std::string lastError("no connection attempt made");
    while (true)
    {
        auto remaining = std::max(deadline - SteadyClock::now(), Duration(std::chrono::milliseconds(1)));
        ContextPtr c(redisConnectWithTimeout(options.host.c_str(), options.port, ToTimeval(remaining)));
        if (c == nullptr)
        {
            lastError = "cannot allocate redis context";
        }
        else if (c->err)
        {
            lastError = c->errstr;
        }
        else
        {
            context = std::move(c);
            break;
        }
        if (SteadyClock::now() + options.retryInterval >= deadline)
        {
            throw StoreException("Redis connection to " + options.host + ":" + std::to_string(options.port) +
                                 " failed: " + lastError);
        }
        std::this_thread::sleep_for(options.retryInterval);
    }
    if (options.commandTimeout > Duration::zero() &&
        redisSetTimeout(context.get(), ToTimeval(options.commandTimeout)) != REDIS_OK)
    {
        std::string err(context->errstr);
        context.reset();
        throw StoreException("Redis command timeout could not be set: " + err);
    }
    try
    {
        if (!options.password.empty())
        {
            ExecuteWithoutLock({"AUTH", options.password});
        }
        if (options.database != 0)
        {
            ExecuteWithoutLock({"SELECT", std::to_string(options.database)});
        }
    }
    catch (const StoreException &)
    {
        // never keep a connection that is not authenticated or on the wrong database
        context.reset();
        throw;
    }
}

dmutex::RedisStore::ReplyPtr dmutex::RedisStore::Execute(const std::vector<std::string> &args)
{
    std::lock_guard lk(mCommand);
    if (context == nullptr || context->err)
    {
        Connect();
    }
    return ExecuteWithoutLock(args);
}

dmutex::RedisStore::ReplyPtr dmutex::RedisStore::ExecuteWithoutLock(const std::vector<std::string> &args)
{
    std::vector<const char *> argv;
    std::vector<size_t> argvlen;
    argv.reserve(args.size());
    argvlen.reserve(args.size());
    for (auto &arg : args)
    {
        argv.push_back(arg.data());
        argvlen.push_back(arg.size());
    }
    ReplyPtr reply(reinterpret_cast<redisReply *>(
        redisCommandArgv(context.get(), static_cast<int>(argv.size()), argv.data(), argvlen.data())));
    if (reply == nullptr)
    {
        // context is unusable after an I/O or protocol error, next command reconnects
        throw StoreException("Redis " + args.front() + " failed: " + context->errstr);
    }
    if (reply->type == REDIS_REPLY_ERROR)
    {
        throw StoreException("Redis " + args.front() + " error: " + std::string(reply->str, reply->len));
    }
    return reply;
}

long long dmutex::RedisStore::ExpectInteger(const ReplyPtr &reply, const std::string &command)
{
    if (reply->type != REDIS_REPLY_INTEGER)
    {
        throw StoreException("Redis " + command + " returned unexpected reply type " + std::to_string(reply->type));
    }
    return reply->integer;
}

bool dmutex::RedisStore::SetIfAbsent(const std::string &key, const std::string &value)
{
    return ExpectInteger(Execute({"SETNX", key, value}), "SETNX") == 1;
}

bool dmutex::RedisStore::SetIfAbsent(const std::string &key, const std::string &value, std::chrono::seconds ttl)
{
    auto reply = Execute({"SET", key, value, "NX", "EX", std::to_string(ttl.count())});
    if (reply->type == REDIS_REPLY_NIL)
    {
        return false;
    }
    if (reply->type == REDIS_REPLY_STATUS)
    {
        return true;
    }
    throw StoreException("Redis SET NX EX returned unexpected reply type " + std::to_string(reply->type));
}

std::optional<std::string> dmutex::RedisStore::Get(const std::string &key)
{
    auto reply = Execute({"GET", key});
    if (reply->type == REDIS_REPLY_NIL)
    {
        return std::nullopt;
    }
    if (reply->type != REDIS_REPLY_STRING)
    {
        throw StoreException("Redis GET returned unexpected reply type " + std::to_string(reply->type));
    }
    return std::string(reply->str, reply->len);
}

bool dmutex::RedisStore::Expire(const std::string &key, std::chrono::seconds ttl)
{
    return ExpectInteger(Execute({"EXPIRE", key, std::to_string(ttl.count())}), "EXPIRE") == 1;
}

void dmutex::RedisStore::Delete(const std::string &key)
{
    ExpectInteger(Execute({"DEL", key}), "DEL");
}

bool dmutex::RedisStore::Exists(const std::string &key)
{
    return ExpectInteger(Execute({"EXISTS", key}), "EXISTS") > 0;
}
