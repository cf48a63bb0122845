#include <drogon/drogon_test.h>
#include <image/pipeline.hpp>

#include "fake_engine.hpp"

using namespace pictor;
using namespace pictor::image;
using pictor::testing::RecordingEngine;

namespace {

ErrorKind failureOf(const std::function<void()>& body) {
    try {
        body();
    } catch (const ServiceError& e) {
        return e.kind();
    }
    throw std::logic_error("expected a ServiceError");
}

std::vector<Stage> stagesOf(const std::vector<Instruction>& steps) {
    std::vector<Stage> result;
    for (const auto& step : steps) result.push_back(stageOf(step));
    return result;
}

const std::string kInput(5000, 'x');

}

DROGON_TEST(PipelineAppliesStepsInFixedOrder)
{
    RecordingEngine engine;
    Pipeline pipeline(engine, ImageSettings{});
    auto signal = AbortSignal::create();

    TransformSpec transform;
    transform.rotate = 45;
    transform.flatten = Rgb{255, 255, 255};
    transform.flop = true;
    transform.flip = true;
    transform.crop = CropRect{0, 0, 100, 100};
    transform.resize = ResizeSpec{};
    transform.resize->width = 50;
    transform.watermark = WatermarkSpec{};

    Plan plan = pipeline.plan(transform, std::nullopt, true);
    std::vector<Stage> expected{Stage::Orient, Stage::Crop, Stage::Resize, Stage::Flip, Stage::Flop,
                                Stage::Rotate, Stage::Flatten, Stage::Watermark, Stage::Encode};
    CHECK(plan.stages() == expected);

    pipeline.process(kInput, "image/png", transform, std::nullopt, std::string("overlay"), *signal);
    std::vector<std::string> calls{"materialize", "decodeOverlay", "prepareOverlay", "composeAndEncode"};
    CHECK(engine.calls == calls);
    std::vector<Stage> applied{Stage::Orient, Stage::Crop, Stage::Resize, Stage::Flip, Stage::Flop,
                               Stage::Rotate, Stage::Flatten};
    CHECK(stagesOf(engine.steps) == applied);
}

DROGON_TEST(PipelineKeepsOnlyRequestedSteps)
{
    RecordingEngine engine;
    ImageSettings settings;
    settings.autoOrient = false;
    settings.maxDimension = 0;
    Pipeline pipeline(engine, settings);

    TransformSpec turnAndCrop;
    turnAndCrop.rotate = 90;
    turnAndCrop.crop = CropRect{10, 10, 50, 50};
    std::vector<Stage> cropThenRotate{Stage::Crop, Stage::Rotate, Stage::Encode};
    CHECK(pipeline.plan(turnAndCrop, std::nullopt, false).stages() == cropThenRotate);

    TransformSpec mirrorAndFlatten;
    mirrorAndFlatten.flatten = Rgb{0, 0, 0};
    mirrorAndFlatten.flop = true;
    std::vector<Stage> flopThenFlatten{Stage::Flop, Stage::Flatten, Stage::Encode};
    CHECK(pipeline.plan(mirrorAndFlatten, std::nullopt, false).stages() == flopThenFlatten);

    TransformSpec flipAndResize;
    flipAndResize.flip = true;
    flipAndResize.resize = ResizeSpec{};
    flipAndResize.resize->height = 100;
    flipAndResize.watermark = WatermarkSpec{};
    std::vector<Stage> resizeFlipWatermark{Stage::Resize, Stage::Flip, Stage::Watermark, Stage::Encode};
    CHECK(pipeline.plan(flipAndResize, std::nullopt, true).stages() == resizeFlipWatermark);

    std::vector<Stage> encodeOnly{Stage::Encode};
    CHECK(pipeline.plan(std::nullopt, std::nullopt, false).stages() == encodeOnly);
}

DROGON_TEST(PipelineDecodesGifFrames)
{
    RecordingEngine engine;
    Pipeline pipeline(engine, ImageSettings{});
    auto signal = AbortSignal::create();

    pipeline.process(kInput, "image/gif", std::nullopt, std::nullopt, std::nullopt, *signal);
    REQUIRE(engine.decoded.has_value());
    CHECK(engine.decoded->animated);

    pipeline.process(kInput, "image/png", std::nullopt, std::nullopt, std::nullopt, *signal);
    CHECK(engine.decoded->animated == false);

    pipeline.process(kInput, "image/gif", std::nullopt, std::nullopt, std::string("overlay"), *signal);
    CHECK(engine.calls.back() == "composeAndEncode");
    CHECK(engine.decoded->animated);
}

DROGON_TEST(PipelineValidatesBeforeTouchingTheCodec)
{
    RecordingEngine engine;
    ImageSettings settings;
    settings.maxBytes = 1000;
    Pipeline pipeline(engine, settings);
    auto signal = AbortSignal::create();
    std::string small(100, 'x');

    TransformSpec conflict;
    conflict.resize = ResizeSpec{};
    conflict.resize->maxDimension = 1000;
    conflict.resize->width = 500;
    CHECK(failureOf([&]() { pipeline.process(small, "image/jpeg", conflict, std::nullopt, std::nullopt, *signal); }) ==
          ErrorKind::Validation);

    CHECK(failureOf([&]() { pipeline.process(small, "text/plain", std::nullopt, std::nullopt, std::nullopt, *signal); }) ==
          ErrorKind::Validation);

    CHECK(failureOf([&]() { pipeline.process(std::string(1001, 'x'), "image/jpeg", std::nullopt, std::nullopt, std::nullopt, *signal); }) ==
          ErrorKind::Validation);

    OutputRequest unknown;
    unknown.format = "bmp";
    CHECK(failureOf([&]() { pipeline.process(small, "image/jpeg", std::nullopt, unknown, std::nullopt, *signal); }) ==
          ErrorKind::Validation);

    TransformSpec watermarked;
    watermarked.watermark = WatermarkSpec{};
    CHECK(failureOf([&]() { pipeline.process(small, "image/jpeg", watermarked, std::nullopt, std::nullopt, *signal); }) ==
          ErrorKind::Validation);

    CHECK(engine.calls.empty());
}

DROGON_TEST(PipelineResolvesDefaultsPerField)
{
    RecordingEngine engine;
    ImageSettings settings;
    settings.quality = 70;
    settings.jpegProgressive = true;
    Pipeline pipeline(engine, settings);
    auto signal = AbortSignal::create();

    auto result = pipeline.process(kInput, "image/jpeg", std::nullopt, std::nullopt, std::nullopt, *signal);
    CHECK(result.mimeType == "image/webp");
    CHECK(result.extension == "webp");

    // Orientation and the configured bounding box apply without any transform
    REQUIRE(engine.steps.size() == 2);
    CHECK(stageOf(engine.steps[0]) == Stage::Orient);
    const auto& resize = std::get<ResizeStep>(engine.steps[1]);
    CHECK(resize.width == 3840);
    CHECK(resize.height == 3840);
    CHECK(resize.fit == Fit::Inside);
    CHECK(resize.withoutEnlargement);

    REQUIRE(engine.output.has_value());
    const auto& webp = std::get<WebpOptions>(engine.output->options);
    CHECK(webp.quality == 70);
    CHECK(webp.effort == 6);

    OutputRequest jpeg;
    jpeg.format = "jpg";
    jpeg.quality = 90;
    pipeline.process(kInput, "image/jpeg", std::nullopt, jpeg, std::nullopt, *signal);
    const auto& jpegOptions = std::get<JpegOptions>(engine.output->options);
    CHECK(jpegOptions.quality == 90);
    CHECK(jpegOptions.progressive);
    CHECK(jpegOptions.mozjpeg == false);
    CHECK(jpegOptions.chromaSubsampling == "4:2:0");

    OutputRequest png;
    png.format = "png";
    png.colors = 16;
    pipeline.process(kInput, "image/jpeg", std::nullopt, png, std::nullopt, *signal);
    const auto& pngOptions = std::get<PngOptions>(engine.output->options);
    CHECK(pngOptions.palette);
    CHECK(pngOptions.colors == 16);
    CHECK(pngOptions.compressionLevel == 6);
}

DROGON_TEST(PipelineHonoursExplicitResizeAndOrientation)
{
    RecordingEngine engine;
    ImageSettings settings;
    settings.autoOrient = false;
    settings.maxDimension = 0;
    Pipeline pipeline(engine, settings);
    auto signal = AbortSignal::create();

    pipeline.process(kInput, "image/jpeg", std::nullopt, std::nullopt, std::nullopt, *signal);
    CHECK(engine.steps.empty());

    TransformSpec transform;
    transform.autoOrient = true;
    transform.resize = ResizeSpec{};
    transform.resize->maxDimension = 1000;
    pipeline.process(kInput, "image/jpeg", transform, std::nullopt, std::nullopt, *signal);
    REQUIRE(engine.steps.size() == 2);
    const auto& resize = std::get<ResizeStep>(engine.steps[1]);
    CHECK(resize.width == 1000);
    CHECK(resize.height == 1000);
    CHECK(resize.fit == Fit::Inside);
}

DROGON_TEST(PipelineWatermarkUsesPostTransformSize)
{
    RecordingEngine engine;
    engine.baseSize = Size{1000, 1000};
    engine.overlaySize = Size{400, 400};
    Pipeline pipeline(engine, ImageSettings{});
    auto signal = AbortSignal::create();

    TransformSpec transform;
    transform.watermark = WatermarkSpec{};
    transform.watermark->opacity = 0.5;
    auto result = pipeline.process(kInput, "image/png", transform, std::nullopt, std::string("overlay"), *signal);

    REQUIRE(engine.preparedSize.has_value());
    CHECK(engine.preparedSize->width == 200);
    CHECK(engine.preparedSize->height == 200);
    CHECK(engine.preparedOpacity == 0.5);
    REQUIRE(engine.layout.has_value());
    CHECK(engine.layout->origin == (Placement{800, 800}));
    CHECK(result.width == 1000);

    // Overlay bytes alone bring the default watermark
    engine.calls.clear();
    pipeline.process(kInput, "image/png", std::nullopt, std::nullopt, std::string("overlay"), *signal);
    CHECK(engine.calls.back() == "composeAndEncode");
    CHECK(engine.layout->mode == WatermarkMode::Single);
}

DROGON_TEST(PipelineReportsStats)
{
    RecordingEngine engine;
    engine.encoded = std::string(1250, 'y');
    Pipeline pipeline(engine, ImageSettings{});
    auto signal = AbortSignal::create();

    auto result = pipeline.process(kInput, "image/jpeg", std::nullopt, std::nullopt, std::nullopt, *signal);
    CHECK(result.size == 1250);
    CHECK(result.data.size() == 1250);
    CHECK(result.stats.beforeBytes == 5000);
    CHECK(result.stats.afterBytes == 1250);
    CHECK(result.stats.reductionPercent == 75.0);
    CHECK(result.width == 1000);
}

DROGON_TEST(PipelineStreamEnforcesSizeLimit)
{
    RecordingEngine engine;
    ImageSettings settings;
    settings.maxBytes = 1000;
    Pipeline pipeline(engine, settings);
    auto signal = AbortSignal::create();

    MemorySource small(std::string_view(kInput).substr(0, 800));
    StringSink sink;
    auto result = pipeline.processStream(small, "application/octet-stream", std::nullopt, std::nullopt, std::nullopt,
                                         sink, *signal);
    CHECK(result.stats.beforeBytes == 800);
    CHECK(result.size == sink.written());
    CHECK(result.data.empty());

    MemorySource large(kInput);
    StringSink rejected;
    CHECK(failureOf([&]() {
              pipeline.processStream(large, "image/jpeg", std::nullopt, std::nullopt, std::nullopt, rejected, *signal);
          }) == ErrorKind::Validation);

    MemorySource text(kInput);
    CHECK(failureOf([&]() {
              pipeline.processStream(text, "text/plain", std::nullopt, std::nullopt, std::nullopt, rejected, *signal);
          }) == ErrorKind::Validation);
}

DROGON_TEST(PipelineStopsWhenAborted)
{
    RecordingEngine engine;
    Pipeline pipeline(engine, ImageSettings{});
    auto signal = AbortSignal::create();
    signal->abort(ErrorKind::Cancelled, "Client disconnected");

    CHECK(failureOf([&]() {
              pipeline.process(kInput, "image/jpeg", std::nullopt, std::nullopt, std::nullopt, *signal);
          }) == ErrorKind::Cancelled);
    CHECK(engine.calls.empty());
}
