#pragma once

#include <stdexcept>
#include <string>

namespace krishi {

enum class ErrorCode {
    InvalidCoordinates,
    NotFound,
    InsufficientData,
    BackendUnavailable,
    Timeout,
    InvalidArgument,
    InvalidConfiguration
};

inline const char *toErrorCodeString(ErrorCode code)
{
    switch (code) {
    case ErrorCode::InvalidCoordinates:
        return "invalid_coordinates";
    case ErrorCode::NotFound:
        return "not_found";
    case ErrorCode::InsufficientData:
        return "insufficient_data";
    case ErrorCode::BackendUnavailable:
        return "backend_unavailable";
    case ErrorCode::Timeout:
        return "timeout";
    case ErrorCode::InvalidArgument:
        return "invalid_argument";
    case ErrorCode::InvalidConfiguration:
        return "invalid_configuration";
    }
    return "unknown";
}

// Base of every error the engine reports to request handlers.
class KrishiError : public std::runtime_error {
public:
    KrishiError(ErrorCode code, const std::string &message)
        : std::runtime_error(message)
        , m_code(code)
    {
    }

    ErrorCode code() const noexcept
    {
        return m_code;
    }

private:
    ErrorCode m_code;
};

class InvalidCoordinatesError : public KrishiError {
public:
    explicit InvalidCoordinatesError(const std::string &message)
        : KrishiError(ErrorCode::InvalidCoordinates, message)
    {
    }
};

class NotFoundError : public KrishiError {
public:
    explicit NotFoundError(const std::string &message)
        : KrishiError(ErrorCode::NotFound, message)
    {
    }
};

class InsufficientDataError : public KrishiError {
public:
    explicit InsufficientDataError(const std::string &message)
        : KrishiError(ErrorCode::InsufficientData, message)
    {
    }
};

class BackendUnavailableError : public KrishiError {
public:
    explicit BackendUnavailableError(const std::string &message)
        : KrishiError(ErrorCode::BackendUnavailable, message)
    {
    }
};

class TimeoutError : public KrishiError {
public:
    explicit TimeoutError(const std::string &message)
        : KrishiError(ErrorCode::Timeout, message)
    {
    }
};

class InvalidArgumentError : public KrishiError {
public:
    explicit InvalidArgumentError(const std::string &message)
        : KrishiError(ErrorCode::InvalidArgument, message)
    {
    }
};

class InvalidConfigurationError : public KrishiError {
public:
    explicit InvalidConfigurationError(const std::string &message)
        : KrishiError(ErrorCode::InvalidConfiguration, message)
    {
    }
};

} // namespace krishi
