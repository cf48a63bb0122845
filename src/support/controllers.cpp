#include <support/controllers.hpp>

namespace pictor {

static constexpr double kDisconnectPollSeconds = 0.5;

drogon::HttpResponsePtr errorResponse(const ServiceError &error) {
    auto resp = drogon::HttpResponse::newHttpJsonResponse(toJson(error));
    resp->setStatusCode(toHttpStatus(error.kind()));
    return resp;
}

drogon::HttpResponsePtr internalErrorResponse(const std::string &message) {
    Json::Value body;
    body["statusCode"] = static_cast<int>(drogon::k500InternalServerError);
    body["error"] = "InternalServerError";
    body["message"] = message;
    auto resp = drogon::HttpResponse::newHttpJsonResponse(body);
    resp->setStatusCode(drogon::k500InternalServerError);
    return resp;
}

DisconnectWatch::DisconnectWatch(const drogon::HttpRequestPtr &req, AbortSignalPtr signal) {
    std::weak_ptr<trantor::TcpConnection> connection = req->getConnectionPtr();
    timer_ = drogon::app().getLoop()->runEvery(kDisconnectPollSeconds, [connection, signal]() {
        auto conn = connection.lock();
        if (!conn || conn->disconnected()) {
            signal->abort(ErrorKind::Cancelled, "Client disconnected");
        }
    });
}

DisconnectWatch::~DisconnectWatch() {
    stop();
}

void DisconnectWatch::stop() {
    trantor::TimerId timer = timer_.exchange(0);
    if (timer != 0) drogon::app().getLoop()->invalidateTimer(timer);
}

}
