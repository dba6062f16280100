#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// Device cannot be opened, is already held, or was lost mid-session.
class DeviceUnavailable : public std::runtime_error {
public:
    explicit DeviceUnavailable(const std::string& what) : std::runtime_error(what) {}
};

// Orderly shutdown of a stream; not a failure for the caller.
class StreamClosed : public std::runtime_error {
public:
    explicit StreamClosed(const std::string& what) : std::runtime_error(what) {}
};

// Playback ring buffer is full; the producer has to pause.
class BackpressureExceeded : public std::runtime_error {
public:
    explicit BackpressureExceeded(const std::string& what) : std::runtime_error(what) {}
};

// Exchange collaborator failed or timed out.
class ResponseFailed : public std::runtime_error {
public:
    explicit ResponseFailed(const std::string& what) : std::runtime_error(what) {}
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

#endif
