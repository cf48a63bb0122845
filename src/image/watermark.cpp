#include <image/watermark.hpp>
#include <support/errors.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

namespace pictor::image {

namespace {

int ceilDiv(int64_t value, int64_t step) {
    return static_cast<int>((value + step - 1) / step);
}

// Grid step, saturated so a huge spacing still yields a single tile
int tileStep(int overlay, int spacing) {
    int64_t step = static_cast<int64_t>(overlay) + spacing;
    return static_cast<int>(std::min<int64_t>(step, std::numeric_limits<int>::max()));
}

}

std::vector<Placement> WatermarkLayout::placements() const {
    if (mode == WatermarkMode::Single) {
        return {origin};
    }
    std::vector<Placement> grid;
    grid.reserve(static_cast<size_t>(columns) * static_cast<size_t>(rows));
    for (int row = 0; row < rows; ++row) {
        for (int column = 0; column < columns; ++column) {
            grid.push_back(Placement{column * stepX, row * stepY});
        }
    }
    return grid;
}

Size scaleOverlay(Size base, Size overlay, int scalePercent) {
    if (overlay.width <= 0 || overlay.height <= 0) {
        throw ServiceError(ErrorKind::Codec, "Watermark image has no pixels");
    }

    int longest = std::max(overlay.width, overlay.height);
    double target = std::round(scalePercent / 100.0 * std::min(base.width, base.height));
    target = std::clamp(target, 1.0, static_cast<double>(longest));

    double factor = target / longest;
    Size scaled;
    scaled.width = std::max(1, static_cast<int>(std::lround(overlay.width * factor)));
    scaled.height = std::max(1, static_cast<int>(std::lround(overlay.height * factor)));
    return scaled;
}

Placement anchor(Gravity gravity, Size base, Size overlay) {
    int right = std::max(0, base.width - overlay.width);
    int bottom = std::max(0, base.height - overlay.height);
    int middleX = right / 2;
    int middleY = bottom / 2;

    switch (gravity) {
        case Gravity::North: return {middleX, 0};
        case Gravity::NorthEast: return {right, 0};
        case Gravity::East: return {right, middleY};
        case Gravity::SouthEast: return {right, bottom};
        case Gravity::South: return {middleX, bottom};
        case Gravity::SouthWest: return {0, bottom};
        case Gravity::West: return {0, middleY};
        case Gravity::NorthWest: return {0, 0};
        case Gravity::Centre: return {middleX, middleY};
    }
    return {right, bottom};
}

WatermarkLayout layout(Size base, Size overlay, const WatermarkSpec& spec) {
    WatermarkLayout result;
    result.mode = spec.mode;
    result.overlay = overlay;

    if (spec.mode == WatermarkMode::Tile) {
        // Position is meaningless for a grid that covers everything
        result.stepX = tileStep(overlay.width, spec.spacing);
        result.stepY = tileStep(overlay.height, spec.spacing);
        result.columns = ceilDiv(base.width, result.stepX);
        result.rows = ceilDiv(base.height, result.stepY);
    } else {
        result.origin = anchor(spec.position, base, overlay);
    }
    return result;
}

Composition WatermarkCompositor::composite(const Raster& base, const std::string& overlayBytes,
                                           const WatermarkSpec& spec, const AbortSignal& signal) const {
    signal.throwIfAborted();
    auto overlay = engine_.decodeOverlay(overlayBytes, signal);

    Size baseSize = base.size();
    Size scaled = scaleOverlay(baseSize, overlay->size(), spec.scalePercent);

    signal.throwIfAborted();
    Composition composition;
    composition.overlay = engine_.prepareOverlay(*overlay, scaled, spec.opacity, signal);
    composition.layout = layout(baseSize, scaled, spec);
    return composition;
}

}
