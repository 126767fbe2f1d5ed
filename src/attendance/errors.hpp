#pragma once

#include <stdexcept>
#include <string>

class InvalidImageError : public std::runtime_error {
public:
    explicit InvalidImageError(const std::string& what) : std::runtime_error(what) {}
};

class RegistryUnavailableError : public std::runtime_error {
public:
    explicit RegistryUnavailableError(const std::string& what) : std::runtime_error(what) {}
};

class RegistryTimeoutError : public RegistryUnavailableError {
public:
    explicit RegistryTimeoutError(const std::string& what) : RegistryUnavailableError(what) {}
};

class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

enum class EnrollmentFailure {
    NoFace,
    MultipleFaces,
    PoorQuality,
    EmbeddingFailed
};

class EnrollmentError : public std::runtime_error {
public:
    EnrollmentError(EnrollmentFailure failure, const std::string& what)
        : std::runtime_error(what), failure_(failure) {}

    EnrollmentFailure failure() const { return failure_; }

private:
    EnrollmentFailure failure_;
};
