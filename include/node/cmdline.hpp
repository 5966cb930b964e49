#ifndef DMUTEX_NODE_COMMANDLINE_HH
#define DMUTEX_NODE_COMMANDLINE_HH
#include <string>
#include <chrono>
#include <boost/program_options.hpp>

#include "time/time.hpp"
#include "store/redis-store.hpp"

namespace dmutex
{

    // Usage: program [-m mode] [-N name] [-t ttl] [-w timeout] [-i poll_ms] [-H host] [-p port] ...
    // Port defaults to 6379, name to "my_mutex" and mode to "demo".
    class CommandLine
    {
    public:
        CommandLine(int argc, const char *const argv[]);

        bool HelpRequested() const;
        const boost::program_options::options_description &GetDescription() const { return desc; }

        std::string GetMode() const;
        std::string GetMutexName() const;
        std::chrono::seconds GetMaxTTL() const;
        Duration GetTimeout() const;
        Duration GetPollInterval() const;
        Duration GetWork() const;
        RedisOptions GetRedisOptions() const;
        bool UseMemoryStore() const;
        bool UseJson() const;

    private:
        boost::program_options::options_description desc;
        boost::program_options::variables_map vm;
        void dieIfNegative(const std::string &option) const;
    };

} // namespace dmutex
#endif
