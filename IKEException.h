#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include <cstdint>

// Notify message types used to report a failed decode back to the peer
// (RFC 7296 section 3.10.1)
enum NotifyErrorType : uint16_t {
    UNSUPPORTED_CRITICAL_PAYLOAD = 1,
    INVALID_MAJOR_VERSION = 5,
    INVALID_SYNTAX = 7,
    AUTHENTICATION_FAILED = 24
};

// Base of every protocol-level failure. These are outcomes caused by what the
// peer sent, never by misuse of the API.
class IkeException : public std::runtime_error {
private:
    uint16_t error_code;

public:
    IkeException(uint16_t code, const std::string& message)
        : std::runtime_error(message), error_code(code) {}

    uint16_t errorCode() const { return error_code; }
};

class IkeSyntaxException : public IkeException {
public:
    explicit IkeSyntaxException(const std::string& message)
        : IkeException(INVALID_SYNTAX, message) {}
};

class IkeInvalidMajorVersionException : public IkeException {
private:
    uint8_t major_version;

public:
    explicit IkeInvalidMajorVersionException(uint8_t version)
        : IkeException(INVALID_MAJOR_VERSION,
                       "Invalid major version: " + std::to_string(version)),
          major_version(version) {}

    uint8_t getMajorVersion() const { return major_version; }
};

class IkeUnsupportedCriticalPayloadException : public IkeException {
private:
    std::vector<uint8_t> payload_types;

public:
    explicit IkeUnsupportedCriticalPayloadException(const std::vector<uint8_t>& types)
        : IkeException(UNSUPPORTED_CRITICAL_PAYLOAD,
                       "Unsupported critical payload(s) in message"),
          payload_types(types) {}

    const std::vector<uint8_t>& getPayloadTypes() const { return payload_types; }
};

class IkeAuthenticationFailedException : public IkeException {
public:
    explicit IkeAuthenticationFailedException(const std::string& message)
        : IkeException(AUTHENTICATION_FAILED, message) {}
};

// Integrity, decryption and key agreement failures. Not signalled to the peer
// with a notify, so the error code is 0.
class IkeCryptoException : public IkeException {
public:
    explicit IkeCryptoException(const std::string& message)
        : IkeException(0, message) {}
};
