#pragma once

#include <stdexcept>
#include <string>

namespace optick {

struct Error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Credential exchange failed. Fatal to pipeline startup.
struct AuthError : Error {
    using Error::Error;
};

// Stream-level failure (resolve, TLS, handshake, read, write).
struct ConnectionError : Error {
    using Error::Error;
};

// Whole frame is not a well-formed feed message.
struct DecodeError : Error {
    using Error::Error;
};

// Store rejected an operation. `busy()` marks lock contention.
struct StorageError : Error {
    StorageError(const std::string& what, int code, bool busy)
        : Error(what), code_(code), busy_(busy) {}

    int code() const { return code_; }
    bool busy() const { return busy_; }

private:
    int code_;
    bool busy_;
};

// Malformed query arguments.
struct QueryError : Error {
    using Error::Error;
};

// Instrument list or option chain file could not be loaded.
struct RegistryError : Error {
    using Error::Error;
};

} // namespace optick
