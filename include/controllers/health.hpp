#ifndef PICTOR_HEALTH_HPP
#define PICTOR_HEALTH_HPP
#include <drogon/HttpController.h>

#include <support/controllers.hpp>

namespace pictor {
    class Health_Controller : public drogon::HttpController<Health_Controller> {
    public:
        METHOD_LIST_BEGIN
            ADD_METHOD_TO(Health_Controller::health, "/api/v1/health", drogon::Get);
        METHOD_LIST_END

        // {status, timestamp, queue: {size, pending}}; never authenticated
        void health(const drogon::HttpRequestPtr &req, Callback_t callback);
    };
}

#endif //PICTOR_HEALTH_HPP
