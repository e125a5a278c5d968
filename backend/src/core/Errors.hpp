#pragma once
#include <stdexcept>
#include <string>

// Base for every failure the scheduling subsystem reports.
class SchedulingError : public std::runtime_error {
public:
    explicit SchedulingError(const std::string& what) : std::runtime_error(what) {}
};

// Grade outside Again/Hard/Good/Easy. Not retried.
class InvalidGradeError : public SchedulingError {
public:
    explicit InvalidGradeError(const std::string& what) : SchedulingError(what) {}
};

// Referenced card does not exist. Not retried.
class UnknownCardError : public SchedulingError {
public:
    explicit UnknownCardError(const std::string& what) : SchedulingError(what) {}
};

// Version check failed on write; the caller retries the single grade call.
class ConcurrentGradeConflict : public SchedulingError {
public:
    explicit ConcurrentGradeConflict(const std::string& what) : SchedulingError(what) {}
};

// Backing persistence failed. Surfaced as-is.
class StoreUnavailableError : public SchedulingError {
public:
    explicit StoreUnavailableError(const std::string& what) : SchedulingError(what) {}
};

class ConfigError : public SchedulingError {
public:
    explicit ConfigError(const std::string& what) : SchedulingError(what) {}
};
