#include <petsc.h>
#include "ProfileService.hpp"
#include "ProfilePipeline.hpp"
#include "Base64.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <utility>

namespace GeoProfile {

const char* const ProfileService::LIVENESS_TEXT = "Earth depth profile generator is running.";

ProfileService::ProfileService(const ProfileConfig& config,
                               std::shared_ptr<const SceneEncoder> document_encoder,
                               std::shared_ptr<const SceneEncoder> raster_encoder)
    : config_(config),
      document_encoder_(std::move(document_encoder)),
      raster_encoder_(std::move(raster_encoder)) {
    if (!document_encoder_ || !raster_encoder_) {
        throw std::invalid_argument("ProfileService needs both a document and a raster encoder");
    }
}

HttpResponse ProfileService::handle(const HttpRequest& request) const {
    if (request.path == "/") {
        if (request.method == "GET" || request.method == "HEAD") return liveness();
        return errorResponse(405, "Method not allowed", "Use GET on /");
    }
    if (request.path == "/generate-pdf") {
        if (request.method == "POST") return generateDocument(request);
        return errorResponse(405, "Method not allowed", "Use POST on /generate-pdf");
    }
    if (request.path == "/generate-image") {
        if (request.method == "POST") return generateImage(request);
        return errorResponse(405, "Method not allowed", "Use POST on /generate-image");
    }
    return errorResponse(404, "Not found", "No route for " + request.path);
}

HttpResponse ProfileService::liveness() const {
    return HttpResponse::text(200, LIVENESS_TEXT);
}

HttpResponse ProfileService::generateDocument(const HttpRequest& request) const {
    return render(request, *document_encoder_, false);
}

HttpResponse ProfileService::generateImage(const HttpRequest& request) const {
    return render(request, *raster_encoder_, true);
}

void ProfileService::validateBody(const std::string& body) {
    if (body.find_first_not_of(" \t\r\n") == std::string::npos) return;

    try {
        nlohmann::json parsed = nlohmann::json::parse(body);
        (void)parsed;
    } catch (const nlohmann::json::parse_error& e) {
        throw InvalidRequestError(std::string("Request body is not valid JSON: ") + e.what());
    }
}

HttpResponse ProfileService::errorResponse(int status, const std::string& error,
                                           const std::string& message) {
    nlohmann::json body = {{"error", error}, {"message", message}};
    return HttpResponse::json(status, body.dump());
}

std::string ProfileService::publicMessage(const ProfileError& error) {
    if (dynamic_cast<const DegenerateInputError*>(&error)) {
        return "The sample set could not be triangulated";
    }
    if (dynamic_cast<const RenderingError*>(&error)) {
        return "The chart could not be rendered";
    }
    return "The profile could not be generated";
}

HttpResponse ProfileService::render(const HttpRequest& request, const SceneEncoder& encoder,
                                    bool as_base64_json) const {
    try {
        validateBody(request.body);
    } catch (const InvalidRequestError& e) {
        return errorResponse(400, "Invalid JSON data", e.what());
    }

    try {
        ProfilePipeline pipeline(config_);
        ChartScene scene = pipeline.generate();
        std::string bytes = encoder.encode(scene);

        if (as_base64_json) {
            nlohmann::json body = {{"image", encodeBase64(bytes)}};
            return HttpResponse::json(200, body.dump());
        }

        HttpResponse response;
        response.status = 200;
        response.content_type = encoder.contentType();
        response.headers["Content-Disposition"] =
            "attachment; filename=\"" + encoder.fileName() + "\"";
        response.body = std::move(bytes);
        return response;
    } catch (const ProfileError& e) {
        PetscPrintf(PETSC_COMM_SELF, "Error: %s failed: %s\n", request.path.c_str(), e.what());
        return errorResponse(500, "Failed to generate plot", publicMessage(e));
    } catch (const std::exception& e) {
        PetscPrintf(PETSC_COMM_SELF, "Error: %s failed: %s\n", request.path.c_str(), e.what());
        return errorResponse(500, "Failed to generate plot", "The profile could not be generated");
    }
}

} // namespace GeoProfile
