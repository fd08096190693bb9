#pragma once
#include <usb-audio/Constants.hpp>
#include <stdexcept>
#include <string>

namespace usb_audio {

class Error : public std::runtime_error {
public:
    Error(int code, const std::string& message)
        : std::runtime_error(message)
        , m_code(code) {}

    int code() const { return m_code; }

private:
    int m_code;
};

// Malformed vendor/product/friendly-name/port input. Nothing was written.
class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& message)
        : Error(ErrorCodes::INVALID_PARAM, message) {}
};

class StoreWriteError : public Error {
public:
    explicit StoreWriteError(const std::string& message)
        : Error(ErrorCodes::IO_ERROR, message) {}
};

class PrivilegeError : public Error {
public:
    explicit PrivilegeError(const std::string& message)
        : Error(ErrorCodes::ACCESS_DENIED, message) {}
};

}
