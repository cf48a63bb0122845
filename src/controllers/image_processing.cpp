#include <controllers/image_processing.hpp>
#include <filters/api_auth_filter.hpp>
#include <support/image_service.hpp>
#include <drogon/MultiPart.h>
#include <drogon/utils/Utilities.h>

#include <algorithm>
#include <cctype>
#include <future>
#include <map>
#include <sstream>

namespace pictor {
    static const std::map<std::string, std::string> kMimeByExtension = {
        {"jpg", "image/jpeg"}, {"jpeg", "image/jpeg"}, {"png", "image/png"},
        {"webp", "image/webp"}, {"avif", "image/avif"}, {"gif", "image/gif"},
        {"tif", "image/tiff"}, {"tiff", "image/tiff"}, {"heic", "image/heic"},
        {"heif", "image/heif"}, {"svg", "image/svg+xml"}, {"bmp", "image/bmp"},
    };

    static const std::map<drogon::ContentType, std::string> kMimeByContentType = {
        {drogon::CT_IMAGE_JPG, "image/jpeg"}, {drogon::CT_IMAGE_PNG, "image/png"},
        {drogon::CT_IMAGE_WEBP, "image/webp"}, {drogon::CT_IMAGE_GIF, "image/gif"},
        {drogon::CT_IMAGE_TIFF, "image/tiff"}, {drogon::CT_IMAGE_BMP, "image/bmp"},
        {drogon::CT_IMAGE_SVG_XML, "image/svg+xml"},
    };

    static void requireKnownKeys(const Json::Value &json, std::initializer_list<const char*> allowed) {
        if (!json.isObject()) {
            throw validationError("Request body must be a JSON object");
        }
        for (const auto &name : json.getMemberNames()) {
            if (std::none_of(allowed.begin(), allowed.end(), [&name](const char* key) { return name == key; })) {
                throw validationError("property " + name + " should not exist");
            }
        }
    }

    static std::string requireString(const Json::Value &json, const char* key) {
        if (!json.isMember(key) || !json[key].isString() || json[key].asString().empty()) {
            throw validationError(std::string(key) + " must be a non-empty string");
        }
        return json[key].asString();
    }

    static Json::Value parseJsonText(const std::string &text) {
        Json::CharReaderBuilder builder;
        Json::Value value;
        std::string errors;
        std::istringstream stream(text);
        if (!Json::parseFromStream(builder, stream, &value, &errors)) {
            throw validationError("Invalid params format: " + errors);
        }
        return value;
    }

    static std::string decodeBase64(const std::string &encoded) {
        return drogon::utils::base64Decode(encoded);
    }

    static Json::Value toJson(const image::PipelineResult &result) {
        Json::Value body;
        body["buffer"] = drogon::utils::base64Encode(reinterpret_cast<const unsigned char*>(result.data.data()), result.data.size());
        body["size"] = static_cast<Json::UInt64>(result.size);
        body["mimeType"] = result.mimeType;
        body["extension"] = result.extension;
        body["dimensions"]["width"] = result.width;
        body["dimensions"]["height"] = result.height;
        body["stats"]["beforeBytes"] = static_cast<Json::UInt64>(result.stats.beforeBytes);
        body["stats"]["afterBytes"] = static_cast<Json::UInt64>(result.stats.afterBytes);
        body["stats"]["reductionPercent"] = result.stats.reductionPercent;
        return body;
    }

    static Json::Value toJson(const std::optional<image::MetadataRecord> &record) {
        Json::Value body;
        if (!record) {
            body["exif"] = Json::Value(Json::nullValue);
            return body;
        }
        body["exif"] = Json::Value(Json::objectValue);
        for (const auto &[name, value] : *record) {
            body["exif"][name] = value;
        }
        return body;
    }

    static drogon::HttpResponsePtr imageResponse(image::PipelineResult &&result) {
        auto resp = drogon::HttpResponse::newHttpResponse();
        resp->setContentTypeString(result.mimeType);
        resp->addHeader("Content-Disposition", "inline; filename=\"processed." + result.extension + "\"");
        resp->setBody(std::move(result.data));
        return resp;
    }

    // Hands a queued job's outcome to the client, whichever way it ended
    template <typename T, typename Render>
    static std::function<void(std::future<T>)> respondWith(SharedCallback respond,
                                                           std::shared_ptr<DisconnectWatch> watch,
                                                           Render render) {
        return [respond, watch, render](std::future<T> outcome) {
            watch->stop();
            try {
                (*respond)(render(outcome.get()));
            } catch (const ServiceError &e) {
                (*respond)(errorResponse(e));
            } catch (const std::exception &e) {
                LOG_ERROR << "Unexpected failure while handling request: " << e.what();
                (*respond)(internalErrorResponse(e.what()));
            }
        };
    }

    int parsePriority(const Json::Value &json) {
        if (!json.isMember("priority") || json["priority"].isNull()) {
            return AdmissionQueue::kDefaultPriority;
        }
        const Json::Value &value = json["priority"];
        if (!value.isInt()) {
            throw validationError("priority must be an integer number");
        }
        int priority = value.asInt();
        if (priority < 0) throw validationError("priority must not be less than 0");
        if (priority > 2) throw validationError("priority must not be greater than 2");
        return priority;
    }

    ProcessParams parseProcessParams(const Json::Value &json) {
        requireKnownKeys(json, {"priority", "transform", "output"});
        ProcessParams params;
        params.priority = parsePriority(json);
        if (json.isMember("transform") && !json["transform"].isNull()) {
            params.transform = image::parseTransform(json["transform"]);
        }
        if (json.isMember("output") && !json["output"].isNull()) {
            params.output = image::parseOutput(json["output"]);
        }
        return params;
    }

    std::string mimeFromFileName(const std::string &fileName) {
        auto dot = fileName.find_last_of('.');
        if (dot == std::string::npos) return "application/octet-stream";
        std::string extension = fileName.substr(dot + 1);
        std::transform(extension.begin(), extension.end(), extension.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        auto it = kMimeByExtension.find(extension);
        return it == kMimeByExtension.end() ? "application/octet-stream" : it->second;
    }

    std::string uploadMimeType(drogon::ContentType declared, const std::string &fileName) {
        auto it = kMimeByContentType.find(declared);
        return it == kMimeByContentType.end() ? mimeFromFileName(fileName) : it->second;
    }

    void ImageProcessing_Controller::process(const drogon::HttpRequestPtr &req, Callback_t callback) {
        if (req->contentType() == drogon::CT_MULTIPART_FORM_DATA) {
            processMultipart(req, std::move(callback), false);
        } else {
            processJson(req, std::move(callback));
        }
    }

    void ImageProcessing_Controller::processStream(const drogon::HttpRequestPtr &req, Callback_t callback) {
        processMultipart(req, std::move(callback), true);
    }

    void ImageProcessing_Controller::processJson(const drogon::HttpRequestPtr &req, Callback_t callback) {
        struct Payload {
            std::string image;
            std::string mimeType;
            std::optional<std::string> overlay;
            ProcessParams params;
        };
        auto payload = std::make_shared<Payload>();

        try {
            auto json = req->getJsonObject();
            if (!json) {
                throw validationError("Request body must be JSON or multipart/form-data");
            }
            requireKnownKeys(*json, {"image", "mimeType", "priority", "transform", "output", "watermark"});
            payload->image = decodeBase64(requireString(*json, "image"));
            payload->mimeType = requireString(*json, "mimeType");
            if (json->isMember("watermark") && !(*json)["watermark"].isNull()) {
                payload->overlay = decodeBase64(requireString(*json, "watermark"));
            }

            Json::Value params(Json::objectValue);
            for (const char* key : {"priority", "transform", "output"}) {
                if (json->isMember(key)) params[key] = (*json)[key];
            }
            payload->params = parseProcessParams(params);
        } catch (const ServiceError &e) {
            callback(errorResponse(e));
            return;
        }

        auto service = ImageService::instance();
        auto signal = AbortSignal::create();
        auto watch = std::make_shared<DisconnectWatch>(req, signal);
        auto respond = std::make_shared<std::function<void(const drogon::HttpResponsePtr &)>>(std::move(callback));

        service->queue().submit<image::PipelineResult>(
            [service, payload](const AbortSignal &abort) {
                return service->pipeline().process(payload->image, payload->mimeType, payload->params.transform,
                                                   payload->params.output, payload->overlay, abort);
            },
            respondWith<image::PipelineResult>(respond, watch, [](image::PipelineResult &&result) {
                return drogon::HttpResponse::newHttpJsonResponse(toJson(result));
            }),
            payload->params.priority, signal);
    }

    void ImageProcessing_Controller::processMultipart(const drogon::HttpRequestPtr &req, Callback_t callback, bool streamed) {
        // Uploaded parts point into the request body; both stay alive until the job is done
        struct Upload {
            drogon::HttpRequestPtr req;
            drogon::MultiPartParser parser;
            const drogon::HttpFile* file = nullptr;
            const drogon::HttpFile* watermark = nullptr;
            ProcessParams params;
        };
        auto upload = std::make_shared<Upload>();
        upload->req = req;

        try {
            if (upload->parser.parse(req) != 0) {
                throw validationError("Invalid multipart request");
            }
            for (const auto &file : upload->parser.getFiles()) {
                if (file.getItemName() == "file") upload->file = &file;
                else if (file.getItemName() == "watermark") upload->watermark = &file;
            }
            if (!upload->file) {
                throw validationError("No file uploaded");
            }
            const auto &fields = upload->parser.getParameters();
            auto params = fields.find("params");
            if (params != fields.end() && !params->second.empty()) {
                upload->params = parseProcessParams(parseJsonText(params->second));
            }
        } catch (const ServiceError &e) {
            callback(errorResponse(e));
            return;
        }

        auto service = ImageService::instance();
        auto signal = AbortSignal::create();
        auto watch = std::make_shared<DisconnectWatch>(req, signal);
        auto respond = std::make_shared<std::function<void(const drogon::HttpResponsePtr &)>>(std::move(callback));

        service->queue().submit<image::PipelineResult>(
            [service, upload, streamed](const AbortSignal &abort) {
                const drogon::HttpFile &file = *upload->file;
                std::string mimeType = uploadMimeType(file.getContentType(), file.getFileName());
                std::optional<std::string> overlay;
                if (upload->watermark) {
                    overlay.emplace(upload->watermark->fileData(), upload->watermark->fileLength());
                }

                if (!streamed) {
                    std::string bytes(file.fileData(), file.fileLength());
                    return service->pipeline().process(bytes, mimeType, upload->params.transform,
                                                       upload->params.output, overlay, abort);
                }
                image::MemorySource source(std::string_view(file.fileData(), file.fileLength()));
                image::StringSink sink;
                image::PipelineResult result = service->pipeline().processStream(
                    source, mimeType, upload->params.transform, upload->params.output, overlay, sink, abort);
                result.data = sink.release();
                return result;
            },
            respondWith<image::PipelineResult>(respond, watch, [](image::PipelineResult &&result) {
                return imageResponse(std::move(result));
            }),
            upload->params.priority, signal);
    }

    void ImageProcessing_Controller::extractExif(const drogon::HttpRequestPtr &req, Callback_t callback) {
        auto bytes = std::make_shared<std::string>();
        std::string mimeType;
        int priority = AdmissionQueue::kDefaultPriority;

        try {
            auto json = req->getJsonObject();
            if (!json) {
                throw validationError("Request body must be JSON");
            }
            requireKnownKeys(*json, {"image", "mimeType", "priority"});
            *bytes = decodeBase64(requireString(*json, "image"));
            mimeType = requireString(*json, "mimeType");
            priority = parsePriority(*json);
        } catch (const ServiceError &e) {
            callback(errorResponse(e));
            return;
        }

        auto service = ImageService::instance();
        auto signal = AbortSignal::create();
        auto watch = std::make_shared<DisconnectWatch>(req, signal);
        auto respond = std::make_shared<std::function<void(const drogon::HttpResponsePtr &)>>(std::move(callback));

        service->queue().submit<std::optional<image::MetadataRecord>>(
            [service, bytes, mimeType](const AbortSignal &) {
                return service->metadata().extract(*bytes, mimeType);
            },
            respondWith<std::optional<image::MetadataRecord>>(respond, watch, [](std::optional<image::MetadataRecord> &&record) {
                return drogon::HttpResponse::newHttpJsonResponse(toJson(record));
            }),
            priority, signal);
    }

    void ImageProcessing_Controller::extractExifStream(const drogon::HttpRequestPtr &req, Callback_t callback) {
        auto parser = std::make_shared<drogon::MultiPartParser>();
        const drogon::HttpFile* upload = nullptr;

        try {
            if (parser->parse(req) != 0) {
                throw validationError("Invalid multipart request");
            }
            for (const auto &file : parser->getFiles()) {
                if (file.getItemName() == "file") upload = &file;
            }
            if (!upload) {
                throw validationError("No file uploaded");
            }
        } catch (const ServiceError &e) {
            callback(errorResponse(e));
            return;
        }

        auto service = ImageService::instance();
        auto signal = AbortSignal::create();
        auto watch = std::make_shared<DisconnectWatch>(req, signal);
        auto respond = std::make_shared<std::function<void(const drogon::HttpResponsePtr &)>>(std::move(callback));

        service->queue().submit<std::optional<image::MetadataRecord>>(
            [service, req, parser, upload](const AbortSignal &) {
                std::string bytes(upload->fileData(), upload->fileLength());
                return service->metadata().extract(bytes, uploadMimeType(upload->getContentType(), upload->getFileName()));
            },
            respondWith<std::optional<image::MetadataRecord>>(respond, watch, [](std::optional<image::MetadataRecord> &&record) {
                return drogon::HttpResponse::newHttpJsonResponse(toJson(record));
            }),
            AdmissionQueue::kDefaultPriority, signal);
    }
}
