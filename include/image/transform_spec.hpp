#ifndef PICTOR_TRANSFORM_SPEC_HPP
#define PICTOR_TRANSFORM_SPEC_HPP

#include <json/json.h>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace pictor::image {

// Nine placement anchors, compass style
enum class Gravity { North, NorthEast, East, SouthEast, South, SouthWest, West, NorthWest, Centre };

enum class Fit { Cover, Contain, Fill, Inside, Outside };

enum class WatermarkMode { Single, Tile };

enum class ImageFormat { Webp, Avif, Jpeg, Png, Gif, Tiff };

struct Rgb {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
};

struct CropRect {
    int left = 0;
    int top = 0;
    int width = 0;
    int height = 0;
};

struct ResizeSpec {
    std::optional<int> maxDimension;
    std::optional<int> width;
    std::optional<int> height;
    std::optional<Fit> fit;
    std::optional<bool> withoutEnlargement;
    std::optional<Gravity> position;
};

struct WatermarkSpec {
    WatermarkMode mode = WatermarkMode::Single;
    Gravity position = Gravity::SouthEast;
    double opacity = 1.0;
    int scalePercent = 20;
    int spacing = 0;
};

struct TransformSpec {
    std::optional<bool> autoOrient;
    std::optional<CropRect> crop;
    std::optional<ResizeSpec> resize;
    bool flip = false;
    bool flop = false;
    std::optional<double> rotate;
    std::optional<Rgb> flatten;
    std::optional<WatermarkSpec> watermark;
};

/**
 * @brief Output parameters as the caller sent them; every field may be unset.
 *
 * The format stays a string here so an unknown name is reported by validation
 * instead of being replaced by the configured default.
 */
struct OutputRequest {
    std::optional<std::string> format;
    std::optional<int> quality;
    std::optional<bool> lossless;
    std::optional<bool> stripMetadata;
    std::optional<int> effort;
    std::optional<bool> progressive;
    std::optional<bool> mozjpeg;
    std::optional<std::string> chromaSubsampling;
    std::optional<int> compressionLevel;
    std::optional<bool> palette;
    std::optional<int> colors;
    std::optional<double> dither;
    std::optional<bool> adaptiveFiltering;
};

struct WebpOptions {
    int quality = 80;
    bool lossless = false;
    int effort = 4;
};

struct AvifOptions {
    int quality = 50;
    bool lossless = false;
    int effort = 4;
    std::string chromaSubsampling = "4:2:0";
};

struct JpegOptions {
    int quality = 80;
    bool progressive = false;
    bool mozjpeg = false;
    std::string chromaSubsampling = "4:2:0";
};

struct PngOptions {
    int compressionLevel = 6;
    bool palette = false;
    std::optional<int> quality;
    int effort = 7;
    std::optional<int> colors;
    std::optional<double> dither;
    bool adaptiveFiltering = false;
};

struct GifOptions {
    int effort = 7;
    std::optional<int> colors;
    std::optional<double> dither;
};

struct TiffOptions {
    int quality = 80;
};

// Alternatives follow ImageFormat order
using FormatOptions = std::variant<WebpOptions, AvifOptions, JpegOptions, PngOptions, GifOptions, TiffOptions>;

// Fully resolved output; only the chosen format's options exist
struct OutputSpec {
    FormatOptions options;
    bool stripMetadata = false;

    ImageFormat format() const;
};

std::optional<ImageFormat> parseFormat(const std::string& name);
const char* formatName(ImageFormat format);
std::string mimeTypeOf(ImageFormat format);
const char* extensionOf(ImageFormat format);

std::optional<Gravity> parseGravity(const std::string& name);
std::optional<Fit> parseFit(const std::string& name);
std::optional<Rgb> parseColour(const std::string& text);

/**
 * @brief JSON readers for request bodies.
 *
 * Strict: unknown properties and wrongly typed values are rejected with a
 * Validation ServiceError naming the offending path, e.g. "transform.resize.width".
 */
TransformSpec parseTransform(const Json::Value& json);
OutputRequest parseOutput(const Json::Value& json);
WatermarkSpec parseWatermark(const Json::Value& json, const std::string& path = "watermark");

// Range and consistency checks; throw a Validation ServiceError on the first problem
void validate(const TransformSpec& transform);
void validate(const OutputRequest& output);
void validate(const WatermarkSpec& watermark);

}

#endif // PICTOR_TRANSFORM_SPEC_HPP
