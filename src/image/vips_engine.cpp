#include <image/vips_engine.hpp>
#include <image/watermark.hpp>
#include <support/errors.hpp>
#include <trantor/utils/Logger.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>
#include <utility>

namespace pictor::image {

namespace {

gint64 readFromSource(VipsSourceCustom*, void* buffer, gint64 length, gpointer user) {
    auto* source = static_cast<ByteSource*>(user);
    try {
        return source->read(buffer, static_cast<size_t>(length));
    } catch (const std::exception& e) {
        LOG_ERROR << "Input stream failed: " << e.what();
        return -1;
    }
}

gint64 writeToSink(VipsTargetCustom*, const void* data, gint64 length, gpointer user) {
    auto* sink = static_cast<ByteSink*>(user);
    try {
        sink->write(data, static_cast<size_t>(length));
        return length;
    } catch (const std::exception& e) {
        LOG_ERROR << "Output stream failed: " << e.what();
        return -1;
    }
}

// libvips failures become Codec errors, unless they were caused by the abort signal
template <typename Body>
auto guarded(const AbortSignal& signal, Body&& body) -> decltype(body()) {
    try {
        return body();
    } catch (const vips::VError& e) {
        vips_error_clear();
        signal.throwIfAborted();
        throw ServiceError(ErrorKind::Codec, e.what());
    }
}

bool needsRandomAccess(const std::vector<Instruction>& steps) {
    for (const auto& step : steps) {
        switch (stageOf(step)) {
            case Stage::Orient:
            case Stage::Flip:
            case Stage::Rotate:
                return true;
            default:
                break;
        }
    }
    return false;
}

std::vector<double> transparent(const vips::VImage& image) {
    return std::vector<double>(static_cast<size_t>(image.bands()), 0.0);
}

Size frameSize(const vips::VImage& image) {
    return Size{image.width(), image.get_page_height()};
}

int frameCount(const vips::VImage& image) {
    return image.height() / image.get_page_height();
}

// Applies `op` to every frame of a stacked animation and restacks the results
template <typename Op>
vips::VImage eachFrame(const vips::VImage& image, Op&& op) {
    int frames = frameCount(image);
    if (frames <= 1) {
        return op(image);
    }
    int pageHeight = image.get_page_height();
    std::vector<vips::VImage> results;
    results.reserve(static_cast<size_t>(frames));
    for (int frame = 0; frame < frames; ++frame) {
        results.push_back(op(image.extract_area(0, frame * pageHeight, image.width(), pageHeight)));
    }
    vips::VImage stacked = vips::VImage::arrayjoin(results, vips::VImage::option()->set("across", 1)).copy();
    stacked.set(VIPS_META_PAGE_HEIGHT, results.front().height());
    return stacked;
}

bool animates(ImageFormat format) {
    return format == ImageFormat::Gif || format == ImageFormat::Webp;
}

class StepApplier {
public:
    explicit StepApplier(vips::VImage& image) : image_(image) {}

    void operator()(const AutoOrientStep&) {
        image_ = eachFrame(image_, [](const vips::VImage& frame) { return frame.autorot(); }).copy();
        image_.remove(VIPS_META_ORIENTATION);
    }

    void operator()(const CropStep& step) {
        const CropRect& rect = step.rect;
        Size bounds = frameSize(image_);
        if (static_cast<int64_t>(rect.left) + rect.width > bounds.width ||
            static_cast<int64_t>(rect.top) + rect.height > bounds.height) {
            throw ServiceError(ErrorKind::Codec,
                               "Crop area " + std::to_string(rect.width) + "x" + std::to_string(rect.height) +
                               "+" + std::to_string(rect.left) + "+" + std::to_string(rect.top) +
                               " is outside the " + std::to_string(bounds.width) + "x" +
                               std::to_string(bounds.height) + " image");
        }
        image_ = eachFrame(image_, [&rect](const vips::VImage& frame) {
            return frame.extract_area(rect.left, rect.top, rect.width, rect.height);
        });
    }

    void operator()(const ResizeStep& step) {
        image_ = eachFrame(image_, [&step](const vips::VImage& frame) { return resized(frame, step); });
    }

    void operator()(const FlipStep&) {
        image_ = eachFrame(image_, [](const vips::VImage& frame) { return frame.flip(VIPS_DIRECTION_VERTICAL); });
    }

    void operator()(const FlopStep&) {
        image_ = image_.flip(VIPS_DIRECTION_HORIZONTAL);
    }

    void operator()(const RotateStep& step) {
        image_ = eachFrame(image_, [&step](const vips::VImage& frame) { return rotated(frame, step.angle); });
    }

    void operator()(const FlattenStep& step) {
        if (!image_.has_alpha()) return;
        if (image_.bands() < 3) {
            image_ = image_.colourspace(VIPS_INTERPRETATION_sRGB);
        }
        std::vector<double> background{static_cast<double>(step.background.r),
                                       static_cast<double>(step.background.g),
                                       static_cast<double>(step.background.b)};
        image_ = image_.flatten(vips::VImage::option()->set("background", background));
    }

private:
    static vips::VImage resized(vips::VImage image, const ResizeStep& step) {
        Size source{image.width(), image.height()};
        ResizeGeometry geometry = resizeGeometry(source, step);

        if (!(geometry.scaled == source)) {
            double hscale = static_cast<double>(geometry.scaled.width) / source.width;
            double vscale = static_cast<double>(geometry.scaled.height) / source.height;
            image = image.resize(hscale, vips::VImage::option()->set("vscale", vscale));
        }

        Size scaled{image.width(), image.height()};
        if (step.fit == Fit::Cover && !(geometry.canvas == scaled)) {
            Placement corner = anchor(step.position, scaled, geometry.canvas);
            image = image.extract_area(corner.left, corner.top, geometry.canvas.width, geometry.canvas.height);
        } else if (step.fit == Fit::Contain && !(geometry.canvas == scaled)) {
            Placement corner = anchor(step.position, geometry.canvas, scaled);
            image = image.embed(corner.left, corner.top, geometry.canvas.width, geometry.canvas.height,
                                vips::VImage::option()
                                    ->set("extend", VIPS_EXTEND_BACKGROUND)
                                    ->set("background", transparent(image)));
        }
        return image;
    }

    static vips::VImage rotated(const vips::VImage& image, double angle) {
        if (std::fmod(angle, 90.0) != 0.0) {
            return image.rotate(angle, vips::VImage::option()->set("background", transparent(image)));
        }
        int quarters = ((static_cast<int>(angle) % 360 + 360) % 360) / 90;
        switch (quarters) {
            case 1: return image.rot(VIPS_ANGLE_D90);
            case 2: return image.rot(VIPS_ANGLE_D180);
            case 3: return image.rot(VIPS_ANGLE_D270);
            default: return image;
        }
    }

    vips::VImage& image_;
};

int bitDepthFor(int colors) {
    if (colors <= 2) return 1;
    if (colors <= 4) return 2;
    if (colors <= 16) return 4;
    return 8;
}

VipsForeignSubsample subsampleFor(const std::string& chroma) {
    return chroma == "4:4:4" ? VIPS_FOREIGN_SUBSAMPLE_OFF : VIPS_FOREIGN_SUBSAMPLE_ON;
}

struct SaveOptions {
    std::string suffix;
    vips::VOption* options;
};

// Saver suffix and the libvips options for each format
class SaveOptionBuilder {
public:
    explicit SaveOptionBuilder(bool strip) : strip_(strip) {}

    SaveOptions operator()(const WebpOptions& webp) const {
        return {".webp", base()->set("Q", webp.quality)->set("lossless", webp.lossless)->set("effort", webp.effort)};
    }

    SaveOptions operator()(const AvifOptions& avif) const {
        return {".avif", base()
                             ->set("compression", VIPS_FOREIGN_HEIF_COMPRESSION_AV1)
                             ->set("Q", avif.quality)
                             ->set("lossless", avif.lossless)
                             ->set("effort", avif.effort)
                             ->set("subsample_mode", subsampleFor(avif.chromaSubsampling))};
    }

    SaveOptions operator()(const JpegOptions& jpeg) const {
        auto* options = base()
                            ->set("Q", jpeg.quality)
                            ->set("interlace", jpeg.progressive)
                            ->set("subsample_mode", subsampleFor(jpeg.chromaSubsampling));
        if (jpeg.mozjpeg) {
            // Same trade-offs the mozjpeg defaults make
            options->set("optimize_coding", true)
                ->set("trellis_quant", true)
                ->set("overshoot_deringing", true)
                ->set("optimize_scans", true)
                ->set("quant_table", 3);
        }
        return {".jpg", options};
    }

    SaveOptions operator()(const PngOptions& png) const {
        auto* options = base()
                            ->set("compression", png.compressionLevel)
                            ->set("filter", png.adaptiveFiltering ? VIPS_FOREIGN_PNG_FILTER_ALL
                                                                  : VIPS_FOREIGN_PNG_FILTER_NONE);
        if (png.palette) {
            options->set("palette", true)
                ->set("Q", png.quality.value_or(100))
                ->set("effort", png.effort)
                ->set("bitdepth", bitDepthFor(png.colors.value_or(256)))
                ->set("dither", png.dither.value_or(1.0));
        }
        return {".png", options};
    }

    SaveOptions operator()(const GifOptions& gif) const {
        return {".gif", base()
                            ->set("effort", gif.effort)
                            ->set("bitdepth", bitDepthFor(gif.colors.value_or(256)))
                            ->set("dither", gif.dither.value_or(1.0))};
    }

    SaveOptions operator()(const TiffOptions& tiff) const {
        return {".tif", base()->set("Q", tiff.quality)->set("compression", VIPS_FOREIGN_TIFF_COMPRESSION_JPEG)};
    }

private:
    vips::VOption* base() const {
        return vips::VImage::option()->set("strip", strip_);
    }

    bool strip_;
};

const vips::VImage& imageOf(const Raster& raster) {
    auto* vipsRaster = dynamic_cast<const VipsRaster*>(&raster);
    if (!vipsRaster) {
        throw std::invalid_argument("VipsEngine was handed a raster it did not produce");
    }
    return vipsRaster->image();
}

}

vips::VImage VipsEngine::decode(ByteSource& input, const DecodeOptions& options, VipsAccess access) const {
    VipsSourceCustom* custom = vips_source_custom_new();
    g_signal_connect(custom, "read", G_CALLBACK(readFromSource), &input);
    vips::VSource source(VIPS_SOURCE(custom));
    vips::VOption* loadOptions = vips::VImage::option()->set("access", access);
    if (options.animated) {
        loadOptions->set("n", -1);
    }
    return vips::VImage::new_from_source(source, "", loadOptions);
}

vips::VImage VipsEngine::apply(vips::VImage image, const std::vector<Instruction>& steps,
                               const AbortSignal& signal) const {
    StepApplier applier(image);
    for (const auto& step : steps) {
        signal.throwIfAborted();
        std::visit(applier, step);
    }
    return image;
}

Size VipsEngine::encode(vips::VImage image, const OutputSpec& output, ByteSink& sink,
                        const AbortSignal& signal) const {
    signal.throwIfAborted();
    // Still formats get the first frame rather than a stacked strip
    if (frameCount(image) > 1 && !animates(output.format())) {
        image = image.extract_area(0, 0, image.width(), image.get_page_height()).copy();
        image.remove(VIPS_META_PAGE_HEIGHT);
    }
    SaveOptions save = std::visit(SaveOptionBuilder(output.stripMetadata), output.options);

    VipsTargetCustom* custom = vips_target_custom_new();
    g_signal_connect(custom, "write", G_CALLBACK(writeToSink), &sink);
    vips::VTarget target(VIPS_TARGET(custom));

    // Stops pixel evaluation mid-write when the job is cancelled; the copy holds a reference
    AbortScope kill(signal, [image]() { vips_image_set_kill(image.get_image(), TRUE); });
    image.write_to_target(save.suffix.c_str(), target, save.options);
    return frameSize(image);
}

Size VipsEngine::run(ByteSource& input, const DecodeOptions& decode, const std::vector<Instruction>& steps,
                     const OutputSpec& output, ByteSink& sink, const AbortSignal& signal) {
    return guarded(signal, [&]() {
        // Frames are cut out of the stacked strip in any order
        bool random = decode.animated || needsRandomAccess(steps);
        VipsAccess access = random ? VIPS_ACCESS_RANDOM : VIPS_ACCESS_SEQUENTIAL;
        vips::VImage image = apply(this->decode(input, decode, access), steps, signal);
        return encode(image, output, sink, signal);
    });
}

std::unique_ptr<Raster> VipsEngine::materialize(ByteSource& input, const DecodeOptions& decode,
                                                const std::vector<Instruction>& steps,
                                                const AbortSignal& signal) {
    return guarded(signal, [&]() -> std::unique_ptr<Raster> {
        vips::VImage image = apply(this->decode(input, decode, VIPS_ACCESS_RANDOM), steps, signal);
        AbortScope kill(signal, [image]() { vips_image_set_kill(image.get_image(), TRUE); });
        return std::make_unique<VipsRaster>(image.copy_memory());
    });
}

std::unique_ptr<Raster> VipsEngine::decodeOverlay(const std::string& bytes, const AbortSignal& signal) {
    return guarded(signal, [&]() -> std::unique_ptr<Raster> {
        vips::VImage overlay = vips::VImage::new_from_buffer(bytes.data(), bytes.size(), "");
        overlay = overlay.colourspace(VIPS_INTERPRETATION_sRGB);
        if (!overlay.has_alpha()) {
            overlay = overlay.bandjoin_const({255});
        }
        return std::make_unique<VipsRaster>(overlay.cast(VIPS_FORMAT_UCHAR));
    });
}

std::unique_ptr<Raster> VipsEngine::prepareOverlay(const Raster& overlay, Size size, double opacity,
                                                   const AbortSignal& signal) {
    return guarded(signal, [&]() -> std::unique_ptr<Raster> {
        vips::VImage prepared = imageOf(overlay).thumbnail_image(
            size.width, vips::VImage::option()->set("height", size.height)->set("size", VIPS_SIZE_FORCE));

        if (opacity < 1.0) {
            std::vector<double> factors(static_cast<size_t>(prepared.bands() - 1), 1.0);
            factors.push_back(opacity);
            prepared = (prepared * factors).cast(VIPS_FORMAT_UCHAR);
        }
        return std::make_unique<VipsRaster>(prepared.copy_memory());
    });
}

Size VipsEngine::composeAndEncode(const Raster& base, const Raster& overlay, const WatermarkLayout& layout,
                                  const OutputSpec& output, ByteSink& sink, const AbortSignal& signal) {
    return guarded(signal, [&]() {
        const vips::VImage& source = imageOf(base);
        const vips::VImage& mark = imageOf(overlay);
        bool hadAlpha = source.has_alpha();

        Size frame = frameSize(source);
        vips::VImage tiles;
        if (layout.mode == WatermarkMode::Tile) {
            // A step wider than the canvas means one tile; no need to pad past the edge
            int cellWidth = std::max(mark.width(), std::min(layout.stepX, frame.width));
            int cellHeight = std::max(mark.height(), std::min(layout.stepY, frame.height));
            tiles = mark.embed(0, 0, cellWidth, cellHeight)
                        .replicate(layout.columns, layout.rows)
                        .extract_area(0, 0, frame.width, frame.height);
        }

        // Every frame of an animation carries the same mark
        vips::VImage composed = eachFrame(source, [&](const vips::VImage& page) {
            vips::VImage canvas = page.colourspace(VIPS_INTERPRETATION_sRGB);
            if (layout.mode == WatermarkMode::Tile) {
                return canvas.composite2(tiles, VIPS_BLEND_MODE_OVER);
            }
            return canvas.composite2(mark, VIPS_BLEND_MODE_OVER,
                                     vips::VImage::option()
                                         ->set("x", layout.origin.left)
                                         ->set("y", layout.origin.top));
        });

        if (!hadAlpha) {
            composed = composed.extract_band(0, vips::VImage::option()->set("n", composed.bands() - 1));
        }
        composed = composed.cast(VIPS_FORMAT_UCHAR);

        return encode(composed, output, sink, signal);
    });
}

}
