#pragma once

#include <stdexcept>
#include <string>

// Programmer or deployment mistakes: duplicate lock keys, scope misuse,
// missing client factory. Not meant to be caught and retried.
class ConfigurationError : public std::logic_error {
public:
    explicit ConfigurationError(const std::string& msg) : std::logic_error(msg) {}
};

class DuplicateKey : public ConfigurationError {
public:
    explicit DuplicateKey(const std::string& key)
        : ConfigurationError("Attempt to register the same key twice: " + key), key_(key) {}

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

// Malformed key template (unbalanced braces, positional or formatted fields)
class KeyFormatError : public std::invalid_argument {
public:
    explicit KeyFormatError(const std::string& msg) : std::invalid_argument(msg) {}
};

class MissingParameter : public KeyFormatError {
public:
    MissingParameter(const std::string& key_template, const std::string& name)
        : KeyFormatError("Missing parameter '" + name + "' for lock key " + key_template),
          name_(name) {}

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

// Base for acquisition failures the caller is expected to handle.
// key() is the concrete key (placeholders substituted).
class LockError : public std::runtime_error {
public:
    LockError(const std::string& key, const std::string& msg)
        : std::runtime_error(msg), key_(key) {}

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

// Non-blocking acquisition could not be granted immediately
class Locked : public LockError {
public:
    explicit Locked(const std::string& key)
        : LockError(key, "Failed to acquire a non-blocking lock on " + key) {}
};

// Blocking acquisition exceeded its timeout
class LockTimeout : public LockError {
public:
    explicit LockTimeout(const std::string& key)
        : LockError(key, "Timeout occurred while trying to acquire a blocking lock on " + key) {}
};
