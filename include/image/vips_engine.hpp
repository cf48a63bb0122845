#ifndef PICTOR_VIPS_ENGINE_HPP
#define PICTOR_VIPS_ENGINE_HPP

#include <image/codec_engine.hpp>
#include <vips/vips8>

namespace pictor::image {

class VipsRaster : public Raster {
public:
    explicit VipsRaster(vips::VImage image) : image_(std::move(image)) {}

    // Size of one frame; animated images are stacked frames of this size
    Size size() const override { return Size{image_.width(), image_.get_page_height()}; }
    const vips::VImage& image() const { return image_; }

private:
    vips::VImage image_;
};

/**
 * @brief CodecEngine backed by libvips.
 *
 * Reads and writes through custom vips sources and targets, so run() never holds
 * more than the rows the pipeline is working on. VIPS_INIT must have been called.
 */
class VipsEngine : public CodecEngine {
public:
    Size run(ByteSource& input, const DecodeOptions& decode, const std::vector<Instruction>& steps,
             const OutputSpec& output, ByteSink& sink, const AbortSignal& signal) override;

    std::unique_ptr<Raster> materialize(ByteSource& input, const DecodeOptions& decode,
                                        const std::vector<Instruction>& steps,
                                        const AbortSignal& signal) override;

    std::unique_ptr<Raster> decodeOverlay(const std::string& bytes, const AbortSignal& signal) override;

    std::unique_ptr<Raster> prepareOverlay(const Raster& overlay, Size size, double opacity,
                                           const AbortSignal& signal) override;

    Size composeAndEncode(const Raster& base, const Raster& overlay, const WatermarkLayout& layout,
                          const OutputSpec& output, ByteSink& sink, const AbortSignal& signal) override;

private:
    vips::VImage decode(ByteSource& input, const DecodeOptions& options, VipsAccess access) const;
    vips::VImage apply(vips::VImage image, const std::vector<Instruction>& steps,
                       const AbortSignal& signal) const;
    // Returns the size of one written frame
    Size encode(vips::VImage image, const OutputSpec& output, ByteSink& sink,
                const AbortSignal& signal) const;
};

}

#endif // PICTOR_VIPS_ENGINE_HPP
