//
// Created by David Yang on 2026-01-08.
//

#ifndef PICTOR_HOME_HPP
#define PICTOR_HOME_HPP
#include <drogon/HttpController.h>

#include <support/controllers.hpp>

namespace pictor {
    // Serves the browser upload form that drives the API
    class Home_Controller : public drogon::HttpController<Home_Controller> {
    public:
        METHOD_LIST_BEGIN
            ADD_METHOD_TO(Home_Controller::index, "/", drogon::Get);
        METHOD_LIST_END

        void index(const drogon::HttpRequestPtr &req,
                    Callback_t callback);
    };
}

#endif //PICTOR_HOME_HPP
