#include <drogon/drogon.h>
#include <support/image_service.hpp>
#include <support/settings.hpp>
#include <exiv2/error.hpp>
#include <vips/vips8>
#include <filesystem>
#include <thread>

int main(int argc, char** argv) {
    if (VIPS_INIT(argv[0])) {
        vips_error_exit("Unable to start libvips");
    }
    Exiv2::LogMsg::setLevel(Exiv2::LogMsg::mute);

    // load configuration files
    std::string configPath;
    if (std::filesystem::exists("config.json")) {
        configPath = "config.json";
    } else if (std::filesystem::exists("config.yaml")) {
        configPath = "config.yaml";
    } else if (std::filesystem::exists("../config.json")) {
        std::filesystem::current_path("..");
        configPath = "config.json";
    } else if (std::filesystem::exists("../config.yaml")) {
        std::filesystem::current_path("..");
        configPath = "config.yaml";
    }

    if (configPath.empty()) {
        LOG_ERROR << "Could not find config.yaml or config.json";
        return 1;
    }

    // initialize logs/ directory
    if (!std::filesystem::exists("logs")) {
        std::filesystem::create_directory("logs");
        LOG_INFO << "Created log directory";
    }

    pictor::ShutdownOptions shutdownOptions;
    try {
        drogon::app().loadConfigFile(configPath);
        LOG_INFO << "Loaded config file from: " << std::filesystem::absolute(configPath);
        LOG_INFO << "Current working directory: " << std::filesystem::current_path();

        shutdownOptions = pictor::ShutdownOptions::load("shutdown_options.yaml");
        // Build the processing stack now so a bad image config stops startup
        pictor::ImageService::instance();
    } catch (const std::exception& e) {
        LOG_ERROR << "Failed to load configuration: " << e.what();
        return 1;
    }

    // Drain the queue before the loop stops; the signal handler runs on the main loop, so wait elsewhere
    drogon::app().setTermSignalHandler([]() {
        std::thread([]() {
            pictor::ImageService::instance()->queue().shutdown();
            drogon::app().quit();
        }).detach();
    });

    drogon::app().run();

    if (shutdownOptions.logCleanup) {
        LOG_INFO << "Cleaning up log directory";
        std::filesystem::remove_all("logs");
        std::filesystem::create_directory("logs");
    }

    vips_shutdown();
    return 0;
}
