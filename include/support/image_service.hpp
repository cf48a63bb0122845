#ifndef PICTOR_IMAGE_SERVICE_HPP
#define PICTOR_IMAGE_SERVICE_HPP

#include <image/metadata.hpp>
#include <image/pipeline.hpp>
#include <image/vips_engine.hpp>
#include <support/admission_queue.hpp>
#include <support/settings.hpp>

#include <memory>

namespace pictor {
    /**
     * @brief Owns the processing stack shared by every controller.
     *
     * The queue is the last member so it is torn down first; its workers are joined
     * before the pipeline they call into goes away.
     */
    class ImageService {
    public:
        explicit ImageService(ImageSettings settings);

        // Built on first use from custom_config.image and shutdown_options.yaml
        static std::shared_ptr<ImageService> instance();

        AdmissionQueue& queue() { return queue_; }
        const image::Pipeline& pipeline() const { return pipeline_; }
        const image::MetadataExtractor& metadata() const { return metadata_; }
        const ImageSettings& settings() const { return settings_; }

    private:
        ImageSettings settings_;
        image::VipsEngine engine_;
        image::Pipeline pipeline_;
        image::MetadataExtractor metadata_;
        AdmissionQueue queue_;
    };
}

#endif // PICTOR_IMAGE_SERVICE_HPP
