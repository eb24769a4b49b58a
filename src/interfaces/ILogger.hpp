#pragma once

#include <string>

// Logging sink shared by every component. Implementations must be thread-safe.
class ILogger {
public:
    virtual ~ILogger() noexcept = default;
    virtual void info(const std::string& message) = 0;
    virtual void debug(const std::string& message) = 0;
    virtual void warn(const std::string& message) = 0;
    virtual void error(const std::string& message) = 0;
    // Always printed, regardless of level. Used for startup and shutdown lines.
    virtual void setup(const std::string& message) = 0;
    virtual int getLogLevel() const = 0;
};
