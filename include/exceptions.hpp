#pragma once

#include <string>
#include <exception>

enum ErrorCode {
    ERR_CONFIG = 1,
    ERR_INVALID_UNIT,
    ERR_SOURCE
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

// Thrown by hardware sources when the device itself cannot be reached.
class SourceException : public std::exception {
public:
    SourceException(const std::string& msg, ErrorCode code = ERR_SOURCE) : message_(msg), code_(code) {}
    const char* what() const noexcept override { return message_.c_str(); }
    ErrorCode code() const { return code_; }
    virtual ~SourceException() noexcept {}
private:
    std::string message_;
    ErrorCode code_;
};
