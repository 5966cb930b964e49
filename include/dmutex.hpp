#ifndef DMUTEX_INCLUDE_ALL
#define DMUTEX_INCLUDE_ALL
#include "exception/exception.hpp"
#include "time/time.hpp"
#include "store/store.hpp"
#include "store/memory-store.hpp"
#include "store/redis-store.hpp"
#include "concurrency/mutex.hpp"
#endif
