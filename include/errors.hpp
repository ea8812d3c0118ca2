#pragma once

#include <stdexcept>
#include <string>

namespace confshield {

// Fixed error taxonomy reported to the orchestrator. Exceptions carry kind,
// rule and location context but never a secret value.
enum class ErrorKind {
    PATTERN_CONFIG,
    DETECTION,
    DUPLICATE_VALUE,
    STORE_LOCKED,
    STORE_INTEGRITY,
    STORE_KEY_MISMATCH,
    STORE_NOT_FOUND,
    CONFIGURATION
};

class EngineError : public std::runtime_error {
public:
    EngineError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// Catalog misconfigured (bad regex, duplicate prefix, unknown kind). Fatal for the run.
class PatternConfigError : public EngineError {
public:
    explicit PatternConfigError(const std::string& message)
        : EngineError(ErrorKind::PATTERN_CONFIG, message) {}
};

// A rule failed while scanning one file. Aborts that file only.
class DetectionError : public EngineError {
public:
    explicit DetectionError(const std::string& message)
        : EngineError(ErrorKind::DETECTION, message) {}
};

class DuplicateValueError : public EngineError {
public:
    explicit DuplicateValueError(const std::string& message)
        : EngineError(ErrorKind::DUPLICATE_VALUE, message) {}
};

class StoreLockedError : public EngineError {
public:
    explicit StoreLockedError(const std::string& message)
        : EngineError(ErrorKind::STORE_LOCKED, message) {}
};

class StoreIntegrityError : public EngineError {
public:
    explicit StoreIntegrityError(const std::string& message)
        : EngineError(ErrorKind::STORE_INTEGRITY, message) {}

protected:
    StoreIntegrityError(ErrorKind kind, const std::string& message)
        : EngineError(kind, message) {}
};

// A wrong key cannot be told apart from a tampered key fingerprint, so it is
// reported as the more specific form of an integrity failure.
class StoreKeyMismatchError : public StoreIntegrityError {
public:
    explicit StoreKeyMismatchError(const std::string& message)
        : StoreIntegrityError(ErrorKind::STORE_KEY_MISMATCH, message) {}
};

class StoreNotFoundError : public EngineError {
public:
    explicit StoreNotFoundError(const std::string& message)
        : EngineError(ErrorKind::STORE_NOT_FOUND, message) {}
};

class ConfigurationError : public EngineError {
public:
    explicit ConfigurationError(const std::string& message)
        : EngineError(ErrorKind::CONFIGURATION, message) {}
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::PATTERN_CONFIG: return "PatternConfigError";
        case ErrorKind::DETECTION: return "DetectionError";
        case ErrorKind::DUPLICATE_VALUE: return "DuplicateValueError";
        case ErrorKind::STORE_LOCKED: return "StoreLockedError";
        case ErrorKind::STORE_INTEGRITY: return "StoreIntegrityError";
        case ErrorKind::STORE_KEY_MISMATCH: return "StoreKeyMismatchError";
        case ErrorKind::STORE_NOT_FOUND: return "StoreNotFoundError";
        case ErrorKind::CONFIGURATION: return "ConfigurationError";
        default: return "UnknownError";
    }
}

// Process exit codes used by the CLI. 0 is success, 1 is reserved for
// unresolved placeholders after a restore pass.
inline int exit_code_for(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::PATTERN_CONFIG: return 10;
        case ErrorKind::DETECTION: return 11;
        case ErrorKind::DUPLICATE_VALUE: return 12;
        case ErrorKind::STORE_LOCKED: return 20;
        case ErrorKind::STORE_INTEGRITY: return 21;
        case ErrorKind::STORE_KEY_MISMATCH: return 22;
        case ErrorKind::STORE_NOT_FOUND: return 23;
        case ErrorKind::CONFIGURATION: return 30;
        default: return 2;
    }
}

}
