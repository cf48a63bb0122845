#include <support/errors.hpp>

namespace pictor {

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return "ValidationError";
        case ErrorKind::Overloaded: return "Overloaded";
        case ErrorKind::TimedOut: return "TimedOut";
        case ErrorKind::ServiceUnavailable: return "ServiceUnavailable";
        case ErrorKind::Codec: return "CodecError";
        case ErrorKind::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

drogon::HttpStatusCode toHttpStatus(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return drogon::k400BadRequest;
        case ErrorKind::Overloaded: return drogon::k429TooManyRequests;
        case ErrorKind::TimedOut: return drogon::k408RequestTimeout;
        case ErrorKind::ServiceUnavailable: return drogon::k503ServiceUnavailable;
        case ErrorKind::Codec: return drogon::k422UnprocessableEntity;
        // Nobody is listening any more; nginx's "client closed request"
        case ErrorKind::Cancelled: return static_cast<drogon::HttpStatusCode>(499);
    }
    return drogon::k500InternalServerError;
}

Json::Value toJson(const ServiceError& error) {
    Json::Value body;
    body["statusCode"] = static_cast<int>(toHttpStatus(error.kind()));
    body["error"] = toString(error.kind());
    body["message"] = error.what();
    return body;
}

}
