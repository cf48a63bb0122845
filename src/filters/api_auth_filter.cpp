#include <filters/api_auth_filter.hpp>
#include <drogon/drogon.h>
#include <drogon/utils/Utilities.h>

#include <algorithm>
#include <cctype>
#include <optional>

namespace pictor {
    static bool startsWith(const std::string &text, const std::string &prefix) {
        return text.compare(0, prefix.size(), prefix) == 0;
    }

    static std::string trim(const std::string &text) {
        auto first = std::find_if_not(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
        auto last = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) { return std::isspace(c); }).base();
        return first < last ? std::string(first, last) : std::string();
    }

    // Credentials following `scheme` (matched case-insensitively), trimmed; nullopt for another scheme
    static std::optional<std::string> credentialsFor(const std::string &authorization, const std::string &scheme) {
        std::string header = trim(authorization);
        if (header.size() <= scheme.size() || !std::isspace(static_cast<unsigned char>(header[scheme.size()]))) {
            return std::nullopt;
        }
        bool matches = std::equal(scheme.begin(), scheme.end(), header.begin(), [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
        });
        if (!matches) return std::nullopt;
        return trim(header.substr(scheme.size()));
    }

    ApiAuthFilter::ApiAuthFilter() : settings_(AuthSettings::fromJson(drogon::app().getCustomConfig()["auth"])) {
        if (!settings_.basicEnabled() && !settings_.bearerEnabled()) {
            LOG_WARN << "No API credentials configured, authentication is disabled";
        }
    }

    void ApiAuthFilter::doFilter(const drogon::HttpRequestPtr &req,
                                 drogon::FilterCallback &&fcb,
                                 drogon::FilterChainCallback &&fccb) {
        bool enabled = settings_.basicEnabled() || settings_.bearerEnabled();
        if (!enabled || !startsWith(req->path(), settings_.apiPrefix) || authorized(req->getHeader("authorization"))) {
            fccb();
            return;
        }

        LOG_DEBUG << "Rejected unauthenticated request to " << req->path();
        Json::Value body;
        body["statusCode"] = static_cast<int>(drogon::k401Unauthorized);
        body["error"] = "Unauthorized";
        body["message"] = "Missing or invalid credentials";
        auto resp = drogon::HttpResponse::newHttpJsonResponse(body);
        resp->setStatusCode(drogon::k401Unauthorized);
        resp->addHeader("WWW-Authenticate", challenge());
        fcb(resp);
    }

    bool ApiAuthFilter::authorized(const std::string &authorization) const {
        if (settings_.basicEnabled()) {
            if (auto encoded = credentialsFor(authorization, "Basic")) {
                return drogon::utils::base64Decode(*encoded) == settings_.basicUser + ":" + settings_.basicPass;
            }
        }
        if (settings_.bearerEnabled()) {
            if (auto token = credentialsFor(authorization, "Bearer")) {
                return std::find(settings_.bearerTokens.begin(), settings_.bearerTokens.end(), *token) !=
                       settings_.bearerTokens.end();
            }
        }
        return false;
    }

    std::string ApiAuthFilter::challenge() const {
        std::string value;
        if (settings_.basicEnabled()) {
            value = "Basic realm=\"pictor\"";
        }
        if (settings_.bearerEnabled()) {
            if (!value.empty()) value += ", ";
            value += "Bearer realm=\"pictor\"";
        }
        return value;
    }
}
