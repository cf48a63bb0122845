#include <drogon/drogon_test.h>
#include <image/transform_spec.hpp>
#include <support/errors.hpp>

#include <climits>
#include <sstream>

using namespace pictor;
using namespace pictor::image;

namespace {

Json::Value parse(const std::string& text) {
    Json::CharReaderBuilder builder;
    Json::Value value;
    std::string errors;
    std::istringstream stream(text);
    Json::parseFromStream(builder, stream, &value, &errors);
    return value;
}

std::string validationMessage(const std::function<void()>& body) {
    try {
        body();
    } catch (const ServiceError& e) {
        if (e.kind() == ErrorKind::Validation) return e.what();
    }
    return "";
}

}

DROGON_TEST(ParseFullTransform)
{
    auto transform = parseTransform(parse(R"({
        "autoOrient": false,
        "crop": {"left": 10, "top": 20, "width": 300, "height": 200},
        "resize": {"width": 800, "fit": "cover", "position": "northwest", "withoutEnlargement": false},
        "flip": true,
        "rotate": 90,
        "backgroundColor": "#ff8000",
        "watermark": {"mode": "tile", "opacity": 0.5, "scale": 10, "spacing": 4}
    })"));

    REQUIRE(transform.autoOrient.has_value());
    CHECK(*transform.autoOrient == false);
    REQUIRE(transform.crop.has_value());
    CHECK(transform.crop->left == 10);
    CHECK(transform.crop->height == 200);
    REQUIRE(transform.resize.has_value());
    CHECK(transform.resize->width == 800);
    CHECK(transform.resize->height.has_value() == false);
    CHECK(transform.resize->fit == Fit::Cover);
    CHECK(transform.resize->position == Gravity::NorthWest);
    CHECK(transform.flip);
    CHECK(transform.flop == false);
    CHECK(transform.rotate == 90.0);
    REQUIRE(transform.flatten.has_value());
    CHECK(transform.flatten->r == 255);
    CHECK(transform.flatten->g == 128);
    CHECK(transform.flatten->b == 0);
    REQUIRE(transform.watermark.has_value());
    CHECK(transform.watermark->mode == WatermarkMode::Tile);
    CHECK(transform.watermark->opacity == 0.5);
    CHECK(transform.watermark->scalePercent == 10);
    CHECK(transform.watermark->position == Gravity::SouthEast);
}

DROGON_TEST(ParseRejectsUnknownProperties)
{
    auto message = validationMessage([]() { parseTransform(parse(R"({"blur": 3})")); });
    CHECK(message.find("property blur should not exist") != std::string::npos);

    message = validationMessage([]() { parseOutput(parse(R"({"format": "png", "speed": 1})")); });
    CHECK(message.find("property speed should not exist") != std::string::npos);

    message = validationMessage([]() { parseTransform(parse(R"({"resize": {"width": "wide"}})")); });
    CHECK(message.find("transform.resize.width") != std::string::npos);
}

DROGON_TEST(ValidateResizeConflict)
{
    TransformSpec transform;
    transform.resize = ResizeSpec{};
    transform.resize->maxDimension = 1000;
    transform.resize->width = 500;
    CHECK(validationMessage([&]() { validate(transform); }) == "Cannot use maxDimension together with width/height");

    transform.resize->width.reset();
    CHECK(validationMessage([&]() { validate(transform); }).empty());

    transform.resize->maxDimension = 9000;
    CHECK(validationMessage([&]() { validate(transform); }).empty() == false);
}

DROGON_TEST(ValidateRanges)
{
    TransformSpec transform;
    transform.rotate = 361;
    CHECK(validationMessage([&]() { validate(transform); }).empty() == false);
    transform.rotate = -360;
    CHECK(validationMessage([&]() { validate(transform); }).empty());

    transform.crop = CropRect{0, 0, 0, 10};
    CHECK(validationMessage([&]() { validate(transform); }).empty() == false);
    transform.crop = CropRect{-1, 0, 10, 10};
    CHECK(validationMessage([&]() { validate(transform); }).empty() == false);
    transform.crop = CropRect{INT_MAX - 5, 0, 10, 10};
    CHECK(validationMessage([&]() { validate(transform); }) == "crop.left must be between 0 and 10000000");
    transform.crop = CropRect{0, 0, 10, INT_MAX};
    CHECK(validationMessage([&]() { validate(transform); }).empty() == false);
    transform.crop = CropRect{10000000, 10000000, 10000000, 10000000};
    CHECK(validationMessage([&]() { validate(transform); }).empty());
    transform.crop.reset();

    WatermarkSpec watermark;
    watermark.opacity = 1.5;
    CHECK(validationMessage([&]() { validate(watermark); }).empty() == false);
    watermark.opacity = 0;
    watermark.scalePercent = 0;
    CHECK(validationMessage([&]() { validate(watermark); }).empty() == false);
    watermark.scalePercent = 100;
    watermark.spacing = -1;
    CHECK(validationMessage([&]() { validate(watermark); }).empty() == false);
    watermark.spacing = INT_MAX - 10;
    CHECK(validationMessage([&]() { validate(watermark); }) == "watermark.spacing must be between 0 and 10000000");
    watermark.spacing = 0;

    OutputRequest output;
    output.quality = 0;
    CHECK(validationMessage([&]() { validate(output); }).empty() == false);
    output.quality = 100;
    output.effort = 10;
    CHECK(validationMessage([&]() { validate(output); }).empty() == false);
    output.effort = 9;
    output.colors = 1;
    CHECK(validationMessage([&]() { validate(output); }).empty() == false);
    output.colors = 256;
    output.chromaSubsampling = "4:2:2";
    CHECK(validationMessage([&]() { validate(output); }).empty() == false);
    output.chromaSubsampling = "4:4:4";
    CHECK(validationMessage([&]() { validate(output); }).empty());
}

DROGON_TEST(UnknownFormatIsRejected)
{
    OutputRequest output;
    output.format = "bmp";
    CHECK(validationMessage([&]() { validate(output); }) == "Unsupported format: bmp");
}

DROGON_TEST(FormatNames)
{
    CHECK(parseFormat("jpg") == ImageFormat::Jpeg);
    CHECK(parseFormat("JPEG") == ImageFormat::Jpeg);
    CHECK(parseFormat("tif") == ImageFormat::Tiff);
    CHECK(parseFormat("heic").has_value() == false);
    CHECK(mimeTypeOf(ImageFormat::Jpeg) == "image/jpeg");
    CHECK(std::string(extensionOf(ImageFormat::Jpeg)) == "jpg");
    CHECK(std::string(extensionOf(ImageFormat::Tiff)) == "tif");
    CHECK(std::string(extensionOf(ImageFormat::Webp)) == "webp");

    CHECK(parseGravity("center") == Gravity::Centre);
    CHECK(parseGravity("southeast") == Gravity::SouthEast);
    CHECK(parseGravity("sideways").has_value() == false);
    CHECK(parseColour("#fff").has_value());
    CHECK(parseColour("white").has_value() == false);
}
