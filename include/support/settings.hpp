#ifndef PICTOR_SETTINGS_HPP
#define PICTOR_SETTINGS_HPP

#include <image/transform_spec.hpp>
#include <support/admission_queue.hpp>
#include <json/json.h>

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace pictor {

/**
 * @brief Processing limits and per-field defaults, read from custom_config.image.
 */
struct ImageSettings {
    size_t maxBytes = 25 * 1024 * 1024;
    QueueOptions queue;

    image::ImageFormat defaultFormat = image::ImageFormat::Webp;
    int maxDimension = 3840;
    int quality = 80;
    int effort = 6;
    bool lossless = false;
    bool stripMetadata = false;
    bool autoOrient = true;

    std::string avifChromaSubsampling = "4:2:0";
    bool jpegProgressive = false;
    bool jpegMozjpeg = false;
    std::string jpegChromaSubsampling = "4:2:0";
    int pngCompressionLevel = 6;

    // Missing keys keep their defaults; an unknown default format throws std::invalid_argument
    static ImageSettings fromJson(const Json::Value& image);
};

// Credentials for the API filter; the secrets only ever come from the environment
struct AuthSettings {
    std::string apiPrefix = "/api/v1";
    std::string basicUser;
    std::string basicPass;
    std::vector<std::string> bearerTokens;

    bool basicEnabled() const { return !basicUser.empty() && !basicPass.empty(); }
    bool bearerEnabled() const { return !bearerTokens.empty(); }

    static AuthSettings fromJson(const Json::Value& auth);
};

struct ShutdownOptions {
    std::chrono::milliseconds drainTimeout{0};
    bool logCleanup = false;

    // Absent file or keys leave the defaults in place; malformed YAML throws
    static ShutdownOptions load(const std::string& path);
};

}

#endif // PICTOR_SETTINGS_HPP
