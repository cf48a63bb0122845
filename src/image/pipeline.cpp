#include <image/pipeline.hpp>
#include <support/errors.hpp>
#include <trantor/utils/Logger.h>

#include <algorithm>
#include <chrono>
#include <cmath>

namespace pictor::image {

namespace {

bool startsWith(const std::string& text, const std::string& prefix) {
    return text.compare(0, prefix.size(), prefix) == 0;
}

void checkMimeType(const std::string& mimeType, bool allowOctetStream) {
    if (startsWith(mimeType, "image/")) return;
    if (allowOctetStream && mimeType == "application/octet-stream") return;
    throw validationError("Invalid MIME type: " + mimeType);
}

// GIF input keeps its animation; everything else is decoded as a single frame
DecodeOptions decodeOptionsFor(const std::string& mimeType) {
    DecodeOptions options;
    options.animated = mimeType == "image/gif";
    return options;
}

long long millisecondsSince(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start)
        .count();
}

}

std::vector<Stage> Plan::stages() const {
    std::vector<Stage> result;
    result.reserve(steps.size() + 2);
    for (const auto& step : steps) {
        result.push_back(stageOf(step));
    }
    if (watermark) result.push_back(Stage::Watermark);
    result.push_back(Stage::Encode);
    return result;
}

Pipeline::Pipeline(CodecEngine& engine, ImageSettings settings)
    : engine_(engine), compositor_(engine), settings_(std::move(settings)) {}

std::optional<ResizeStep> Pipeline::resolveResize(const std::optional<ResizeSpec>& resize) const {
    ResizeStep step;
    if (resize) {
        step.withoutEnlargement = resize->withoutEnlargement.value_or(true);
        step.position = resize->position.value_or(Gravity::Centre);
        if (resize->maxDimension) {
            // Bounding box: the longer side ends up at maxDimension
            step.width = resize->maxDimension;
            step.height = resize->maxDimension;
            step.fit = Fit::Inside;
            return step;
        }
        if (resize->width || resize->height) {
            step.width = resize->width;
            step.height = resize->height;
            step.fit = resize->fit.value_or(Fit::Inside);
            return step;
        }
    }

    if (settings_.maxDimension <= 0) return std::nullopt;
    ResizeStep fallback;
    fallback.width = settings_.maxDimension;
    fallback.height = settings_.maxDimension;
    fallback.fit = Fit::Inside;
    fallback.withoutEnlargement = true;
    return fallback;
}

OutputSpec Pipeline::resolveOutput(const OutputRequest& output) const {
    ImageFormat format = settings_.defaultFormat;
    if (output.format) {
        auto parsed = parseFormat(*output.format);
        if (!parsed) throw validationError("Unsupported format: " + *output.format);
        format = *parsed;
    }

    int quality = output.quality.value_or(settings_.quality);
    int effort = output.effort.value_or(settings_.effort);
    bool lossless = output.lossless.value_or(settings_.lossless);

    OutputSpec spec;
    spec.stripMetadata = output.stripMetadata.value_or(settings_.stripMetadata);

    switch (format) {
        case ImageFormat::Webp: {
            WebpOptions webp;
            webp.quality = quality;
            webp.lossless = lossless;
            // libwebp stops at 6
            webp.effort = std::min(effort, 6);
            spec.options = webp;
            break;
        }
        case ImageFormat::Avif: {
            AvifOptions avif;
            avif.quality = quality;
            avif.lossless = lossless;
            avif.effort = effort;
            avif.chromaSubsampling = output.chromaSubsampling.value_or(settings_.avifChromaSubsampling);
            spec.options = avif;
            break;
        }
        case ImageFormat::Jpeg: {
            JpegOptions jpeg;
            jpeg.quality = quality;
            jpeg.progressive = output.progressive.value_or(settings_.jpegProgressive);
            jpeg.mozjpeg = output.mozjpeg.value_or(settings_.jpegMozjpeg);
            jpeg.chromaSubsampling = output.chromaSubsampling.value_or(settings_.jpegChromaSubsampling);
            spec.options = jpeg;
            break;
        }
        case ImageFormat::Png: {
            PngOptions png;
            png.compressionLevel = output.compressionLevel.value_or(settings_.pngCompressionLevel);
            png.quality = output.quality;
            png.colors = output.colors;
            png.dither = output.dither;
            // Asking for any quantiser setting implies a palette
            png.palette = output.palette.value_or(output.quality || output.colors || output.dither);
            png.effort = std::max(effort, 1);
            png.adaptiveFiltering = output.adaptiveFiltering.value_or(false);
            spec.options = png;
            break;
        }
        case ImageFormat::Gif: {
            GifOptions gif;
            gif.effort = std::max(effort, 1);
            gif.colors = output.colors;
            gif.dither = output.dither;
            spec.options = gif;
            break;
        }
        case ImageFormat::Tiff: {
            TiffOptions tiff;
            tiff.quality = quality;
            spec.options = tiff;
            break;
        }
    }
    return spec;
}

Plan Pipeline::plan(const std::optional<TransformSpec>& transform, const std::optional<OutputRequest>& output,
                    bool hasOverlay) const {
    if (transform) validate(*transform);
    if (output) validate(*output);

    Plan result;
    result.output = resolveOutput(output.value_or(OutputRequest{}));

    if (transform && transform->watermark) {
        if (!hasOverlay) {
            throw validationError("Watermark file is required when transform.watermark is set");
        }
        result.watermark = transform->watermark;
    } else if (hasOverlay) {
        result.watermark = WatermarkSpec{};
    }

    bool autoOrient = settings_.autoOrient;
    if (transform && transform->autoOrient) autoOrient = *transform->autoOrient;
    if (autoOrient) result.steps.emplace_back(AutoOrientStep{});

    if (transform && transform->crop) result.steps.emplace_back(CropStep{*transform->crop});

    if (auto resize = resolveResize(transform ? transform->resize : std::nullopt)) {
        result.steps.emplace_back(*resize);
    }

    if (transform) {
        if (transform->flip) result.steps.emplace_back(FlipStep{});
        if (transform->flop) result.steps.emplace_back(FlopStep{});
        if (transform->rotate) result.steps.emplace_back(RotateStep{*transform->rotate});
        if (transform->flatten) result.steps.emplace_back(FlattenStep{*transform->flatten});
    }
    return result;
}

Size Pipeline::execute(ByteSource& source, const Plan& plan, const std::optional<std::string>& overlay,
                       ByteSink& sink, const AbortSignal& signal) const {
    signal.throwIfAborted();
    if (!plan.watermark) {
        return engine_.run(source, plan.decode, plan.steps, plan.output, sink, signal);
    }

    auto base = engine_.materialize(source, plan.decode, plan.steps, signal);
    signal.throwIfAborted();
    Composition composition = compositor_.composite(*base, *overlay, *plan.watermark, signal);
    signal.throwIfAborted();
    return engine_.composeAndEncode(*base, *composition.overlay, composition.layout, plan.output, sink, signal);
}

PipelineResult Pipeline::finish(const Plan& plan, Size size, size_t beforeBytes, size_t afterBytes,
                                long long durationMs) const {
    ImageFormat format = plan.output.format();

    PipelineResult result;
    result.mimeType = mimeTypeOf(format);
    result.extension = extensionOf(format);
    result.width = size.width;
    result.height = size.height;
    result.size = afterBytes;
    result.stats.beforeBytes = beforeBytes;
    result.stats.afterBytes = afterBytes;
    if (beforeBytes > 0) {
        double ratio = 1.0 - static_cast<double>(afterBytes) / static_cast<double>(beforeBytes);
        result.stats.reductionPercent = std::round(ratio * 10000.0) / 100.0;
    }

    LOG_INFO << "Image processed, duration: " << durationMs << "ms, format: " << formatName(format)
             << ", dimensions: " << size.width << "x" << size.height << ", " << beforeBytes << " -> "
             << afterBytes << " bytes (" << result.stats.reductionPercent << "% reduction)";
    return result;
}

PipelineResult Pipeline::process(const std::string& bytes, const std::string& mimeType,
                                 const std::optional<TransformSpec>& transform,
                                 const std::optional<OutputRequest>& output,
                                 const std::optional<std::string>& overlay,
                                 const AbortSignal& signal) const {
    auto start = std::chrono::steady_clock::now();
    checkMimeType(mimeType, false);
    if (bytes.size() > settings_.maxBytes) {
        throw validationError("Image size " + std::to_string(bytes.size()) + " bytes exceeds maximum " +
                              std::to_string(settings_.maxBytes) + " bytes");
    }
    Plan resolved = plan(transform, output, overlay.has_value());
    resolved.decode = decodeOptionsFor(mimeType);

    try {
        MemorySource source(bytes);
        StringSink sink;
        Size size = execute(source, resolved, overlay, sink, signal);
        std::string data = sink.release();
        PipelineResult result = finish(resolved, size, bytes.size(), data.size(), millisecondsSince(start));
        result.data = std::move(data);
        return result;
    } catch (const ServiceError& e) {
        LOG_ERROR << "Image processing failed after " << millisecondsSince(start) << "ms: " << e.what();
        throw;
    }
}

PipelineResult Pipeline::processStream(ByteSource& source, const std::string& mimeType,
                                       const std::optional<TransformSpec>& transform,
                                       const std::optional<OutputRequest>& output,
                                       const std::optional<std::string>& overlay,
                                       ByteSink& sink, const AbortSignal& signal) const {
    auto start = std::chrono::steady_clock::now();
    checkMimeType(mimeType, true);
    Plan resolved = plan(transform, output, overlay.has_value());
    resolved.decode = decodeOptionsFor(mimeType);

    BoundedSource bounded(source, settings_.maxBytes);
    try {
        Size size = execute(bounded, resolved, overlay, sink, signal);
        return finish(resolved, size, bounded.consumed(), sink.written(), millisecondsSince(start));
    } catch (const ServiceError& e) {
        LOG_ERROR << "Image processing failed after " << millisecondsSince(start) << "ms: " << e.what();
        if (bounded.exceeded()) {
            throw validationError("Image size exceeds maximum " + std::to_string(settings_.maxBytes) + " bytes");
        }
        throw;
    }
}

}
