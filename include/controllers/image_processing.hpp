#ifndef PICTOR_IMAGE_PROCESSING_HPP
#define PICTOR_IMAGE_PROCESSING_HPP

#include <drogon/HttpController.h>

#include <image/transform_spec.hpp>
#include <support/controllers.hpp>

#include <optional>
#include <string>

namespace pictor {
    // priority / transform / output as carried by a JSON body or the multipart "params" field
    struct ProcessParams {
        int priority = 2;
        std::optional<image::TransformSpec> transform;
        std::optional<image::OutputRequest> output;
    };

    // Integer in [0, 2]; absent means the default priority
    int parsePriority(const Json::Value &json);

    ProcessParams parseProcessParams(const Json::Value &json);

    // MIME type from the upload's file name; application/octet-stream when unknown
    std::string mimeFromFileName(const std::string &fileName);

    // The part's declared Content-Type when it names an image type, else the file extension
    std::string uploadMimeType(drogon::ContentType declared, const std::string &fileName);

    class ImageProcessing_Controller : public drogon::HttpController<ImageProcessing_Controller> {
    public:
        METHOD_LIST_BEGIN
            ADD_METHOD_TO(ImageProcessing_Controller::process, "/api/v1/process", drogon::Post, "pictor::ApiAuthFilter");
            ADD_METHOD_TO(ImageProcessing_Controller::processStream, "/api/v1/process/stream", drogon::Post, "pictor::ApiAuthFilter");
            ADD_METHOD_TO(ImageProcessing_Controller::extractExif, "/api/v1/exif", drogon::Post, "pictor::ApiAuthFilter");
            ADD_METHOD_TO(ImageProcessing_Controller::extractExifStream, "/api/v1/exif/stream", drogon::Post, "pictor::ApiAuthFilter");
        METHOD_LIST_END

        /**
         * @brief Transforms an image sent either as base64 JSON or as multipart/form-data.
         *
         * JSON requests get a JSON reply with the base64 result; multipart requests get
         * the encoded image back as the body.
         */
        void process(const drogon::HttpRequestPtr &req, Callback_t callback);
        void processStream(const drogon::HttpRequestPtr &req, Callback_t callback);
        void extractExif(const drogon::HttpRequestPtr &req, Callback_t callback);
        void extractExifStream(const drogon::HttpRequestPtr &req, Callback_t callback);

    private:
        void processJson(const drogon::HttpRequestPtr &req, Callback_t callback);
        void processMultipart(const drogon::HttpRequestPtr &req, Callback_t callback, bool streamed);
    };
}

#endif // PICTOR_IMAGE_PROCESSING_HPP
