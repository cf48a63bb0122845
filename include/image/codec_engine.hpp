#ifndef PICTOR_CODEC_ENGINE_HPP
#define PICTOR_CODEC_ENGINE_HPP

#include <image/byte_stream.hpp>
#include <image/transform_spec.hpp>
#include <support/abort_signal.hpp>

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace pictor::image {

struct Size {
    int width = 0;
    int height = 0;
};

inline bool operator==(const Size& a, const Size& b) {
    return a.width == b.width && a.height == b.height;
}

// Declarative steps the pipeline hands to the engine, applied in list order
struct AutoOrientStep {};

struct CropStep {
    CropRect rect;
};

struct ResizeStep {
    // Unset side is derived from the aspect ratio
    std::optional<int> width;
    std::optional<int> height;
    Fit fit = Fit::Inside;
    bool withoutEnlargement = true;
    Gravity position = Gravity::Centre;
};

struct FlipStep {};
struct FlopStep {};

struct RotateStep {
    double angle = 0;
};

struct FlattenStep {
    Rgb background;
};

using Instruction = std::variant<AutoOrientStep, CropStep, ResizeStep, FlipStep, FlopStep, RotateStep, FlattenStep>;

// Every stage of a run, in the only order they may happen
enum class Stage { Orient, Crop, Resize, Flip, Flop, Rotate, Flatten, Watermark, Encode };

Stage stageOf(const Instruction& step);
const char* toString(Stage stage);

/**
 * @brief Sizes produced by a resize step.
 *
 * `scaled` is what the pixels are resampled to; `canvas` is the final size after
 * cover cropping or contain padding (equal to `scaled` for the other fits).
 */
struct ResizeGeometry {
    Size scaled;
    Size canvas;
};

ResizeGeometry resizeGeometry(Size source, const ResizeStep& step);

struct Placement {
    int left = 0;
    int top = 0;
};

inline bool operator==(const Placement& a, const Placement& b) {
    return a.left == b.left && a.top == b.top;
}

/**
 * @brief Where a prepared overlay goes on the base image.
 *
 * Single mode has one placement at `origin`. Tile mode is a columns x rows grid
 * with a (stepX, stepY) pitch starting at the top-left corner.
 */
struct WatermarkLayout {
    WatermarkMode mode = WatermarkMode::Single;
    Size overlay;
    Placement origin;
    int columns = 1;
    int rows = 1;
    int stepX = 0;
    int stepY = 0;

    std::vector<Placement> placements() const;
};

// Decoded pixels owned by the engine
// How the input should be opened
struct DecodeOptions {
    // Load every frame of a multi-page input, stacked vertically
    bool animated = false;
};

class Raster {
public:
    virtual ~Raster() = default;
    virtual Size size() const = 0;
};

/**
 * @brief Decode / transform / composite / encode backend.
 *
 * Implementations turn their own failures into ServiceError(ErrorKind::Codec) and
 * stop early when the abort signal fires.
 */
class CodecEngine {
public:
    virtual ~CodecEngine() = default;

    // Decode, apply steps and encode in one pass without holding the whole image.
    virtual Size run(ByteSource& input, const DecodeOptions& decode, const std::vector<Instruction>& steps,
                     const OutputSpec& output, ByteSink& sink, const AbortSignal& signal) = 0;

    // Decode and apply steps, keeping the resulting pixels in memory.
    virtual std::unique_ptr<Raster> materialize(ByteSource& input, const DecodeOptions& decode,
                                                const std::vector<Instruction>& steps,
                                                const AbortSignal& signal) = 0;

    virtual std::unique_ptr<Raster> decodeOverlay(const std::string& bytes, const AbortSignal& signal) = 0;

    // Resize the overlay to `size` exactly and multiply its alpha by `opacity` when below 1.
    virtual std::unique_ptr<Raster> prepareOverlay(const Raster& overlay, Size size, double opacity,
                                                   const AbortSignal& signal) = 0;

    virtual Size composeAndEncode(const Raster& base, const Raster& overlay, const WatermarkLayout& layout,
                                  const OutputSpec& output, ByteSink& sink, const AbortSignal& signal) = 0;
};

}

#endif // PICTOR_CODEC_ENGINE_HPP
