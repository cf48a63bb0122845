#include <support/settings.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <stdexcept>

namespace pictor {

ImageSettings ImageSettings::fromJson(const Json::Value& image) {
    ImageSettings settings;
    settings.maxBytes = static_cast<size_t>(image.get("max_bytes_mb", 25).asUInt64()) * 1024 * 1024;

    const auto& queue = image["queue"];
    settings.queue.concurrency = queue.get("max_concurrency", 4).asUInt();
    settings.queue.maxQueueSize = queue.get("max_queue_size", 100).asUInt();
    settings.queue.jobTimeout = std::chrono::milliseconds(queue.get("job_timeout_ms", 30000).asInt64());
    settings.queue.requestTimeout = std::chrono::milliseconds(queue.get("request_timeout_ms", 60000).asInt64());

    const auto& defaults = image["defaults"];
    std::string format = defaults.get("format", "webp").asString();
    auto parsed = image::parseFormat(format);
    if (!parsed) {
        throw std::invalid_argument("Unsupported default format: " + format);
    }
    settings.defaultFormat = *parsed;
    settings.maxDimension = defaults.get("max_dimension", 3840).asInt();
    settings.quality = defaults.get("quality", 80).asInt();
    settings.effort = defaults.get("effort", 6).asInt();
    settings.lossless = defaults.get("lossless", false).asBool();
    settings.stripMetadata = defaults.get("strip_metadata", false).asBool();
    settings.autoOrient = defaults.get("auto_orient", true).asBool();

    settings.avifChromaSubsampling = image["avif"].get("chroma_subsampling", "4:2:0").asString();
    const auto& jpeg = image["jpeg"];
    settings.jpegProgressive = jpeg.get("progressive", false).asBool();
    settings.jpegMozjpeg = jpeg.get("mozjpeg", false).asBool();
    settings.jpegChromaSubsampling = jpeg.get("chroma_subsampling", "4:2:0").asString();
    settings.pngCompressionLevel = image["png"].get("compression_level", 6).asInt();

    return settings;
}

AuthSettings AuthSettings::fromJson(const Json::Value& auth) {
    AuthSettings settings;
    settings.apiPrefix = auth.get("api_prefix", "/api/v1").asString();
    settings.basicUser = auth.get("basic_user", "").asString();

    const char* env_pass = std::getenv("AUTH_BASIC_PASS");
    settings.basicPass = env_pass ? env_pass : "";

    const char* env_tokens = std::getenv("AUTH_BEARER_TOKENS");
    if (env_tokens) {
        std::stringstream tokens(env_tokens);
        std::string token;
        while (std::getline(tokens, token, ',')) {
            auto first = token.find_first_not_of(" \t");
            auto last = token.find_last_not_of(" \t");
            if (first == std::string::npos) continue;
            settings.bearerTokens.push_back(token.substr(first, last - first + 1));
        }
    }
    return settings;
}

ShutdownOptions ShutdownOptions::load(const std::string& path) {
    ShutdownOptions options;
    if (!std::filesystem::exists(path)) return options;

    YAML::Node root = YAML::LoadFile(path);
    auto node = root["shutdown_options"];
    if (node) {
        if (node["drain_timeout_ms"]) {
            options.drainTimeout = std::chrono::milliseconds(node["drain_timeout_ms"].as<long long>());
        }
        if (node["log_cleanup"]) {
            options.logCleanup = node["log_cleanup"].as<bool>();
        }
    }
    return options;
}

}
