#ifndef PICTOR_PIPELINE_HPP
#define PICTOR_PIPELINE_HPP

#include <image/codec_engine.hpp>
#include <image/watermark.hpp>
#include <support/settings.hpp>

#include <optional>
#include <string>
#include <vector>

namespace pictor::image {

// Everything a run needs once the request has been validated and defaults applied
struct Plan {
    DecodeOptions decode;
    std::vector<Instruction> steps;
    OutputSpec output;
    std::optional<WatermarkSpec> watermark;

    std::vector<Stage> stages() const;
};

struct ProcessingStats {
    size_t beforeBytes = 0;
    size_t afterBytes = 0;
    double reductionPercent = 0;
};

struct PipelineResult {
    // Empty for processStream(); the bytes went to the sink
    std::string data;
    std::string mimeType;
    std::string extension;
    int width = 0;
    int height = 0;
    size_t size = 0;
    ProcessingStats stats;
};

/**
 * @brief Validates a transform request, resolves its defaults and drives the codec.
 *
 * Every check happens before the engine is touched. Steps always run in the order
 * orient, crop, resize, flip, flop, rotate, flatten, watermark, encode.
 */
class Pipeline {
public:
    Pipeline(CodecEngine& engine, ImageSettings settings);

    PipelineResult process(const std::string& bytes, const std::string& mimeType,
                           const std::optional<TransformSpec>& transform,
                           const std::optional<OutputRequest>& output,
                           const std::optional<std::string>& overlay,
                           const AbortSignal& signal) const;

    /**
     * @brief Same as process() but reads from `source` and writes to `sink`.
     *
     * Also accepts application/octet-stream. Input is cut off at maxBytes, which
     * surfaces as a Validation error.
     */
    PipelineResult processStream(ByteSource& source, const std::string& mimeType,
                                 const std::optional<TransformSpec>& transform,
                                 const std::optional<OutputRequest>& output,
                                 const std::optional<std::string>& overlay,
                                 ByteSink& sink, const AbortSignal& signal) const;

    // Validates and resolves; throws a Validation ServiceError
    Plan plan(const std::optional<TransformSpec>& transform, const std::optional<OutputRequest>& output,
              bool hasOverlay) const;

    std::optional<ResizeStep> resolveResize(const std::optional<ResizeSpec>& resize) const;
    OutputSpec resolveOutput(const OutputRequest& output) const;

    const ImageSettings& settings() const { return settings_; }

private:
    Size execute(ByteSource& source, const Plan& plan, const std::optional<std::string>& overlay,
                 ByteSink& sink, const AbortSignal& signal) const;
    PipelineResult finish(const Plan& plan, Size size, size_t beforeBytes, size_t afterBytes,
                          long long durationMs) const;

    CodecEngine& engine_;
    WatermarkCompositor compositor_;
    ImageSettings settings_;
};

}

#endif // PICTOR_PIPELINE_HPP
