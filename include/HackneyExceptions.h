#ifndef HACKNEY_EXCEPTIONS_H
#define HACKNEY_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace Hackney {

class HackneyException : public std::runtime_error {
public:
    explicit HackneyException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public HackneyException {
public:
    explicit IOException(const std::string& message) : HackneyException("IO Error: " + message) {}
};

class DatasetException : public HackneyException {
public:
    explicit DatasetException(const std::string& message) : HackneyException("Dataset Error: " + message) {}
};

class ConfigurationException : public HackneyException {
public:
    explicit ConfigurationException(const std::string& message) : HackneyException("Configuration Error: " + message) {}
};

} // namespace Hackney

#endif // HACKNEY_EXCEPTIONS_H
