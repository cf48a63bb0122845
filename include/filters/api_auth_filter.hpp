//
// Created by David Yang on 2026-01-20.
//

#ifndef PICTOR_API_AUTH_FILTER_HPP
#define PICTOR_API_AUTH_FILTER_HPP

#include <drogon/HttpFilter.h>
#include <drogon/HttpResponse.h>

#include <support/settings.hpp>

namespace pictor {
    /**
     * @brief Guards the API routes with HTTP Basic and/or Bearer credentials.
     *
     * With neither scheme configured every request passes.
     */
    class ApiAuthFilter : public drogon::HttpFilter<ApiAuthFilter> {
    public:
        ApiAuthFilter();
        explicit ApiAuthFilter(AuthSettings settings) : settings_(std::move(settings)) {}

        void doFilter(const drogon::HttpRequestPtr &req,
                      drogon::FilterCallback &&fcb,
                      drogon::FilterChainCallback &&fccb) override;

        // True when the Authorization header value satisfies one of the enabled schemes
        bool authorized(const std::string &authorization) const;

        // WWW-Authenticate value naming every enabled scheme
        std::string challenge() const;

    private:
        AuthSettings settings_;
    };
}

#endif //PICTOR_API_AUTH_FILTER_HPP
