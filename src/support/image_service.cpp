#include <support/image_service.hpp>
#include <drogon/drogon.h>

namespace pictor {

ImageService::ImageService(ImageSettings settings)
    : settings_(std::move(settings)),
      pipeline_(engine_, settings_),
      metadata_(settings_.maxBytes),
      queue_(settings_.queue) {}

std::shared_ptr<ImageService> ImageService::instance() {
    static auto service = []() {
        auto customConfig = drogon::app().getCustomConfig();
        ImageSettings settings = ImageSettings::fromJson(customConfig["image"]);
        settings.queue.drainTimeout = ShutdownOptions::load("shutdown_options.yaml").drainTimeout;
        return std::make_shared<ImageService>(std::move(settings));
    }();
    return service;
}

}
