#pragma once

#include <string>
#include <exception>

enum ErrorCode {
    ERR_NONE = 0,
    ERR_VALIDATION,
    ERR_TIMEOUT,
    ERR_PARSE,
    ERR_PORT_UNAVAILABLE,
    ERR_CONFIG,
    ERR_UNKNOWN
};

// Transport could not be acquired (already held, missing device, refused connection).
// Fatal for the session.
class PortUnavailableException : public std::exception {
public:
    PortUnavailableException(const std::string& msg, ErrorCode code = ERR_PORT_UNAVAILABLE) : message_(msg), code_(code) {}
    const char* what() const noexcept override { return message_.c_str(); }
    ErrorCode code() const { return code_; }
    virtual ~PortUnavailableException() noexcept {}
private:
    std::string message_;
    ErrorCode code_;
};

class ConfigException : public std::exception {
public:
    ConfigException(const std::string& msg, ErrorCode code = ERR_CONFIG) : message_(msg), code_(code) {}
    const char* what() const noexcept override { return message_.c_str(); }
    ErrorCode code() const { return code_; }
    virtual ~ConfigException() noexcept {}
private:
    std::string message_;
    ErrorCode code_;
};
