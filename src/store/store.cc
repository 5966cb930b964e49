#include "store/store.hpp"
#include "exception/exception.hpp"

bool dmutex::KeyValueStore::SetIfAbsent(const std::string &key, const std::string &, std::chrono::seconds)
{
    throw StoreException("store has no atomic set-if-absent with expiration, key " + key);
}
