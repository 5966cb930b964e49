#include "node/cmdline.hpp"
#include "exception/exception.hpp"
#include <set>

namespace po = boost::program_options;

dmutex::CommandLine::CommandLine(int argc, const char *const argv[])
    :   desc("Distributed mutex options")
{
    desc.add_options()
        ("help,h", "Display this help message")
        ("mode,m", po::value<std::string>(), "demo, try, lock, unlock or status")
        ("name,N", po::value<std::string>(), "mutex name")
        ("ttl,t", po::value<long long>(), "max TTL of the lock in seconds, 0 never expires")
        ("timeout,w", po::value<long long>(), "seconds to wait in lock mode, 0 waits forever")
        ("poll,i", po::value<long long>(), "milliseconds between lock attempts")
        ("work,k", po::value<long long>(), "seconds to hold the lock once acquired")
        ("host,H", po::value<std::string>(), "Redis host")
        ("port,p", po::value<int>(), "Redis port number")
        ("password,P", po::value<std::string>(), "Redis password")
        ("db,d", po::value<int>(), "Redis database index")
        ("connect-timeout", po::value<long long>(), "milliseconds to keep trying to connect")
        ("memory", "use a process local store instead of Redis")
        ("json", "print status as JSON");
    try {
        po::store(po::command_line_parser(argc, argv).options(desc).run(), vm);
        po::notify(vm);
    } catch (const po::error &e) {
        throw InvalidArgumentException(e.what());
    }
    for (auto option : {"ttl", "timeout", "poll", "work", "connect-timeout", "db"}) {
        dieIfNegative(option);
    }
    static const std::set<std::string> kModes{"demo", "try", "lock", "unlock", "status"};
    if (kModes.find(GetMode()) == kModes.end()) {
        throw InvalidArgumentException("unknown mode " + GetMode());
    }
    if (vm.count("name") && vm["name"].as<std::string>().empty()) {
        throw InvalidArgumentException("mutex name must not be empty");
    }
}

void dmutex::CommandLine::dieIfNegative(const std::string &option) const
{
    if (!vm.count(option))
        return;
    bool negative = option == "db" ? vm[option].as<int>() < 0 : vm[option].as<long long>() < 0;
    if (negative)
        throw InvalidArgumentException("--" + option + " must not be negative");
}

bool dmutex::CommandLine::HelpRequested() const {
    return vm.count("help") > 0;
}

std::string dmutex::CommandLine::GetMode() const {
    if (vm.count("mode"))
        return vm["mode"].as<std::string>();
    else
        return std::string("demo");
}

std::string dmutex::CommandLine::GetMutexName() const {
    if (vm.count("name"))
        return vm["name"].as<std::string>();
    else
        return std::string("my_mutex");
}

std::chrono::seconds dmutex::CommandLine::GetMaxTTL() const {
    if (vm.count("ttl"))
        return std::chrono::seconds(vm["ttl"].as<long long>());
    else
        return std::chrono::seconds(0);
}

dmutex::Duration dmutex::CommandLine::GetTimeout() const {
    if (vm.count("timeout"))
        return std::chrono::seconds(vm["timeout"].as<long long>());
    else
        return Duration::zero();
}

dmutex::Duration dmutex::CommandLine::GetPollInterval() const {
    if (vm.count("poll"))
        return std::chrono::milliseconds(vm["poll"].as<long long>());
    else
        return std::chrono::milliseconds(250);
}

dmutex::Duration dmutex::CommandLine::GetWork() const {
    if (vm.count("work"))
        return std::chrono::seconds(vm["work"].as<long long>());
    else
        return std::chrono::seconds(10);
}

dmutex::RedisOptions dmutex::CommandLine::GetRedisOptions() const {
    RedisOptions options;
    if (vm.count("host"))
        options.host = vm["host"].as<std::string>();
    if (vm.count("port"))
        options.port = vm["port"].as<int>();
    if (vm.count("password"))
        options.password = vm["password"].as<std::string>();
    if (vm.count("db"))
        options.database = vm["db"].as<int>();
    if (vm.count("connect-timeout"))
        options.connectTimeout = std::chrono::milliseconds(vm["connect-timeout"].as<long long>());
    return options;
}

bool dmutex::CommandLine::UseMemoryStore() const {
    return vm.count("memory") > 0;
}

bool dmutex::CommandLine::UseJson() const {
    return vm.count("json") > 0;
}
