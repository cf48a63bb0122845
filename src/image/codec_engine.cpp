#include <image/codec_engine.hpp>

#include <algorithm>
#include <cmath>

namespace pictor::image {

namespace {

int scaleSide(int side, double factor) {
    return std::max(1, static_cast<int>(std::lround(side * factor)));
}

}

Stage stageOf(const Instruction& step) {
    // Instruction alternatives are declared in Stage order
    return static_cast<Stage>(step.index());
}

const char* toString(Stage stage) {
    switch (stage) {
        case Stage::Orient: return "orient";
        case Stage::Crop: return "crop";
        case Stage::Resize: return "resize";
        case Stage::Flip: return "flip";
        case Stage::Flop: return "flop";
        case Stage::Rotate: return "rotate";
        case Stage::Flatten: return "flatten";
        case Stage::Watermark: return "watermark";
        case Stage::Encode: return "encode";
    }
    return "unknown";
}

ResizeGeometry resizeGeometry(Size source, const ResizeStep& step) {
    ResizeGeometry geometry{source, source};
    if (!step.width && !step.height) return geometry;

    double scaleX = step.width ? static_cast<double>(*step.width) / source.width : 0;
    double scaleY = step.height ? static_cast<double>(*step.height) / source.height : 0;

    if (!step.width || !step.height) {
        // One side given: the other follows the aspect ratio whatever the fit
        double factor = step.width ? scaleX : scaleY;
        if (step.withoutEnlargement) factor = std::min(factor, 1.0);
        geometry.scaled = Size{scaleSide(source.width, factor), scaleSide(source.height, factor)};
        geometry.canvas = geometry.scaled;
        return geometry;
    }

    Size box{*step.width, *step.height};
    switch (step.fit) {
        case Fit::Fill: {
            if (step.withoutEnlargement) {
                scaleX = std::min(scaleX, 1.0);
                scaleY = std::min(scaleY, 1.0);
            }
            geometry.scaled = Size{scaleSide(source.width, scaleX), scaleSide(source.height, scaleY)};
            geometry.canvas = geometry.scaled;
            break;
        }
        case Fit::Inside:
        case Fit::Outside: {
            double factor = step.fit == Fit::Inside ? std::min(scaleX, scaleY) : std::max(scaleX, scaleY);
            if (step.withoutEnlargement) factor = std::min(factor, 1.0);
            geometry.scaled = Size{scaleSide(source.width, factor), scaleSide(source.height, factor)};
            geometry.canvas = geometry.scaled;
            break;
        }
        case Fit::Cover: {
            double factor = std::max(scaleX, scaleY);
            if (step.withoutEnlargement) factor = std::min(factor, 1.0);
            geometry.scaled = Size{scaleSide(source.width, factor), scaleSide(source.height, factor)};
            geometry.canvas = Size{std::min(box.width, geometry.scaled.width),
                                   std::min(box.height, geometry.scaled.height)};
            break;
        }
        case Fit::Contain: {
            double factor = std::min(scaleX, scaleY);
            if (step.withoutEnlargement) factor = std::min(factor, 1.0);
            geometry.scaled = Size{scaleSide(source.width, factor), scaleSide(source.height, factor)};
            geometry.canvas = box;
            break;
        }
    }
    return geometry;
}

}
