#ifndef DMUTEX_EXCEPTION_HH
#define DMUTEX_EXCEPTION_HH
#include <string>
#include <exception>
#include <stdexcept>

namespace dmutex
{

    class InvalidArgumentException : public std::exception
    {
    private:
        std::string message_;

    public:
        explicit InvalidArgumentException(const std::string &message) : message_(message){};
        virtual const char *what() const throw() { return message_.c_str(); }
    };

    // Raised when the coordination store cannot be reached or answers with an error.
    // Never used to report that a lock is held by someone else.
    class StoreException : public std::runtime_error
    {
    public:
        explicit StoreException(const std::string &message) : std::runtime_error(message) {}
    };

} // namespace dmutex
#endif
