#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Kinds of failure a media job can end with
 */
enum class ErrorKind
{
    VALIDATION,
    PAYLOAD_TOO_LARGE,
    TRANSFORM_TIMEOUT,
    TRANSFORM_FAILED,
    RESOURCE,
    SERVICE_BUSY
};

/**
 * @brief Base class for every typed job failure
 *
 * Carries the HTTP status the failure maps to so that route handlers can
 * answer without knowing the concrete type.
 */
class ToolError : public std::runtime_error
{
public:
    ToolError(ErrorKind kind, int http_status, const std::string &message)
        : std::runtime_error(message), kind_(kind), http_status_(http_status) {}

    ErrorKind kind() const { return kind_; }
    int httpStatus() const { return http_status_; }

    static std::string kindName(ErrorKind kind)
    {
        switch (kind)
        {
        case ErrorKind::VALIDATION:
            return "ValidationError";
        case ErrorKind::PAYLOAD_TOO_LARGE:
            return "PayloadTooLarge";
        case ErrorKind::TRANSFORM_TIMEOUT:
            return "TransformTimeout";
        case ErrorKind::TRANSFORM_FAILED:
            return "TransformFailed";
        case ErrorKind::RESOURCE:
            return "ResourceError";
        case ErrorKind::SERVICE_BUSY:
            return "ServiceBusy";
        default:
            return "Unknown";
        }
    }

private:
    ErrorKind kind_;
    int http_status_;
};

class ValidationError : public ToolError
{
public:
    explicit ValidationError(const std::string &message)
        : ToolError(ErrorKind::VALIDATION, 400, message) {}
};

// A required upload or form field was absent
class MissingInput : public ValidationError
{
public:
    explicit MissingInput(const std::string &message, const std::string &field)
        : ValidationError(message), field_(field) {}

    const std::string &field() const { return field_; }

private:
    std::string field_;
};

class PayloadTooLarge : public ToolError
{
public:
    explicit PayloadTooLarge(const std::string &message)
        : ToolError(ErrorKind::PAYLOAD_TOO_LARGE, 413, message) {}
};

class TransformTimeout : public ToolError
{
public:
    explicit TransformTimeout(const std::string &message)
        : ToolError(ErrorKind::TRANSFORM_TIMEOUT, 504, message) {}
};

class TransformFailed : public ToolError
{
public:
    explicit TransformFailed(const std::string &message)
        : ToolError(ErrorKind::TRANSFORM_FAILED, 500, message) {}
};

class ResourceError : public ToolError
{
public:
    explicit ResourceError(const std::string &message)
        : ToolError(ErrorKind::RESOURCE, 500, message) {}
};

class ServiceBusy : public ToolError
{
public:
    explicit ServiceBusy(const std::string &message)
        : ToolError(ErrorKind::SERVICE_BUSY, 503, message) {}
};
