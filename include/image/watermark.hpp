#ifndef PICTOR_WATERMARK_HPP
#define PICTOR_WATERMARK_HPP

#include <image/codec_engine.hpp>

#include <memory>
#include <string>

namespace pictor::image {

/**
 * @brief Size of the overlay once scaled against the post-transform base.
 *
 * The larger side becomes scalePercent% of the base's shorter side, keeping the
 * aspect ratio. The overlay is never enlarged past its native size and never
 * shrinks below one pixel.
 */
Size scaleOverlay(Size base, Size overlay, int scalePercent);

// Top-left corner that puts `overlay` at `gravity` inside `base`
Placement anchor(Gravity gravity, Size base, Size overlay);

WatermarkLayout layout(Size base, Size overlay, const WatermarkSpec& spec);

struct Composition {
    std::unique_ptr<Raster> overlay;
    WatermarkLayout layout;
};

class WatermarkCompositor {
public:
    explicit WatermarkCompositor(CodecEngine& engine) : engine_(engine) {}

    /**
     * @brief Decodes, scales and fades the overlay for a materialised base image.
     * @param base The base after every geometric step; its size drives the scaling.
     * @param overlayBytes Encoded overlay (any format the engine decodes, SVG included).
     * @return The prepared overlay and where it goes.
     */
    Composition composite(const Raster& base, const std::string& overlayBytes,
                          const WatermarkSpec& spec, const AbortSignal& signal) const;

private:
    CodecEngine& engine_;
};

}

#endif // PICTOR_WATERMARK_HPP
