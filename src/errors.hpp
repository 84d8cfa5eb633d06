#pragma once
#include <stdexcept>
#include <string>

// Invalid or inconsistent settings detected at engine start.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// The watch root is missing, not a directory, or cannot be monitored.
class WatchInitError : public std::runtime_error {
public:
    explicit WatchInitError(const std::string& what) : std::runtime_error(what) {}
};

// The watcher gave up re-establishing its watches.
class WatchLostError : public std::runtime_error {
public:
    explicit WatchLostError(const std::string& what) : std::runtime_error(what) {}
};
