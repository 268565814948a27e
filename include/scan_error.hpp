#pragma once
#include <stdexcept>
#include <string>
#include <vector>

// Base of every failure raised by the nl80211 scan path. The context list
// is filled while the error unwinds through the scanner steps, so the
// outermost step ends up first in chain().
class ScanError : public std::runtime_error {
public:
    explicit ScanError(const std::string& message)
        : std::runtime_error(message) {}

    void addContext(const std::string& context) {
        contexts_.insert(contexts_.begin(), context);
    }

    std::vector<std::string> chain() const {
        std::vector<std::string> result = contexts_;
        result.push_back(what());
        return result;
    }

private:
    std::vector<std::string> contexts_;
};

class TransportError : public ScanError {
public:
    using ScanError::ScanError;
};

class InterfaceNotFound : public ScanError {
public:
    using ScanError::ScanError;
};

class DecodeError : public ScanError {
public:
    using ScanError::ScanError;
};

class ScanTimeout : public ScanError {
public:
    using ScanError::ScanError;
};

// The kernel answered a request with a negative NLMSG_ERROR.
class ProtocolError : public ScanError {
public:
    ProtocolError(const std::string& message, int code)
        : ScanError(message), code_(code) {}

    int code() const { return code_; }

private:
    int code_;
};
