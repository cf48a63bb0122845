#ifndef PICTOR_METADATA_HPP
#define PICTOR_METADATA_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace pictor::image {
    // EXIF tag name -> printable value, plus width/height for JPEG input
    using MetadataRecord = std::map<std::string, std::string>;

    class MetadataExtractor {
    public:
        explicit MetadataExtractor(size_t maxBytes) : maxBytes_(maxBytes) {}

        /**
         * @brief Reads the EXIF tags of an encoded image.
         * @param inputData The raw bytes of the image.
         * @param mimeType Must start with "image/".
         * @return The tags, or std::nullopt when nothing could be read from the image.
         * @throws ServiceError (Validation) on a bad MIME type or oversized input.
         */
        std::optional<MetadataRecord> extract(const std::string& inputData, const std::string& mimeType) const;

    private:
        size_t maxBytes_;
    };
}

#endif // PICTOR_METADATA_HPP
