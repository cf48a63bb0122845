#include <image/metadata.hpp>
#include <support/errors.hpp>
#include <exiv2/exif.hpp>
#include <exiv2/image.hpp>
#include <turbojpeg.h>
#include <trantor/utils/Logger.h>

namespace pictor::image {

// Larger undefined-typed values (maker notes, embedded blobs) are not worth printing
static constexpr long kMaxUndefinedValueSize = 256;

static bool isJpeg(const std::string& data) {
    return data.size() >= 2 && (unsigned char)data[0] == 0xFF && (unsigned char)data[1] == 0xD8;
}

static void readJpegHeader(const std::string& inputData, MetadataRecord& record) {
    tjhandle decompressor = tjInitDecompress();
    if (!decompressor) return;

    int width, height, subsamp, colorspace;
    if (tjDecompressHeader3(decompressor, (const unsigned char*)inputData.data(), inputData.size(), &width, &height, &subsamp, &colorspace) >= 0) {
        record["width"] = std::to_string(width);
        record["height"] = std::to_string(height);
    } else {
        LOG_DEBUG << "TurboJPEG DecompressHeader failed: " << tjGetErrorStr2(decompressor);
    }
    tjDestroy(decompressor);
}

static void readExif(const std::string& inputData, MetadataRecord& record) {
    auto image = Exiv2::ImageFactory::open(reinterpret_cast<const Exiv2::byte*>(inputData.data()), inputData.size());
    image->readMetadata();

    const Exiv2::ExifData& exif = image->exifData();
    for (const auto& datum : exif) {
        if (datum.typeId() == Exiv2::undefined && static_cast<long>(datum.size()) > kMaxUndefinedValueSize) {
            continue;
        }
        // IFD0 comes before the thumbnail IFD, so the main image's value wins
        record.emplace(datum.tagName(), datum.toString());
    }
}

std::optional<MetadataRecord> MetadataExtractor::extract(const std::string& inputData, const std::string& mimeType) const {
    if (mimeType.rfind("image/", 0) != 0) {
        throw validationError("Invalid MIME type: " + mimeType);
    }
    if (inputData.size() > maxBytes_) {
        throw validationError("Image size " + std::to_string(inputData.size()) + " bytes exceeds maximum " +
                              std::to_string(maxBytes_) + " bytes");
    }

    MetadataRecord record;
    try {
        readExif(inputData, record);
    } catch (const Exiv2::Error& e) {
        LOG_WARN << "EXIF extraction failed: " << e.what();
        return std::nullopt;
    }

    if (isJpeg(inputData)) {
        readJpegHeader(inputData, record);
    }

    if (record.empty()) return std::nullopt;
    return record;
}
}
