#ifndef PICTOR_ERRORS_HPP
#define PICTOR_ERRORS_HPP

#include <drogon/HttpTypes.h>
#include <json/json.h>
#include <stdexcept>
#include <string>

namespace pictor {

enum class ErrorKind {
    Validation,
    Overloaded,
    TimedOut,
    ServiceUnavailable,
    Codec,
    Cancelled
};

const char* toString(ErrorKind kind);

/**
 * @brief Typed error carried through the queue, the pipeline and the controllers.
 */
class ServiceError : public std::runtime_error {
public:
    ServiceError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

inline ServiceError validationError(const std::string& message) {
    return ServiceError(ErrorKind::Validation, message);
}

drogon::HttpStatusCode toHttpStatus(ErrorKind kind);

// {statusCode, error, message} body used by every API error response
Json::Value toJson(const ServiceError& error);

}

#endif // PICTOR_ERRORS_HPP
