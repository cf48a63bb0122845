//
// Created by David Yang on 2026-01-10.
//

#ifndef PICTOR_CONTROLLERS_HPP
#define PICTOR_CONTROLLERS_HPP
#include <drogon/drogon.h>

#include <support/abort_signal.hpp>
#include <support/errors.hpp>

#include <atomic>
#include <memory>

namespace pictor {
    using Callback_t = std::function<void(const drogon::HttpResponsePtr &)>&&;
    using SharedCallback = std::shared_ptr<std::function<void(const drogon::HttpResponsePtr &)>>;

    // {statusCode, error, message} with the status matching the error kind
    drogon::HttpResponsePtr errorResponse(const ServiceError &error);
    drogon::HttpResponsePtr internalErrorResponse(const std::string &message);

    /**
     * @brief Aborts `signal` with Cancelled once the client behind `req` goes away.
     *
     * Polls the connection from the app loop until stop() is called.
     */
    class DisconnectWatch {
    public:
        DisconnectWatch(const drogon::HttpRequestPtr &req, AbortSignalPtr signal);
        ~DisconnectWatch();

        DisconnectWatch(const DisconnectWatch&) = delete;
        DisconnectWatch& operator=(const DisconnectWatch&) = delete;

        void stop();

    private:
        std::atomic<trantor::TimerId> timer_{0};
    };
}

#endif //PICTOR_CONTROLLERS_HPP
