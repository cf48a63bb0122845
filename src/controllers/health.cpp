#include <controllers/health.hpp>
#include <support/image_service.hpp>
#include <trantor/utils/Date.h>

namespace pictor {
    // ISO 8601 UTC with milliseconds
    static std::string timestamp() {
        std::string micros = trantor::Date::now().toCustomFormattedString("%Y-%m-%dT%H:%M:%S", true);
        return micros.substr(0, micros.size() - 3) + "Z";
    }

    void Health_Controller::health(const drogon::HttpRequestPtr &req, Callback_t callback) {
        QueueStatus status = ImageService::instance()->queue().status();

        Json::Value body;
        body["status"] = "ok";
        body["timestamp"] = timestamp();
        body["queue"]["size"] = static_cast<Json::UInt64>(status.queued);
        body["queue"]["pending"] = static_cast<Json::UInt64>(status.running);
        callback(drogon::HttpResponse::newHttpJsonResponse(body));
    }
}
