#ifndef PROFILE_SERVICE_HPP
#define PROFILE_SERVICE_HPP

#include "GeoProfile.hpp"
#include "HttpServer.hpp"
#include "ProfileErrors.hpp"
#include "SceneEncoder.hpp"
#include <memory>
#include <string>

namespace GeoProfile {

/**
 * @brief HTTP routes of the depth profile generator
 *
 *   POST /generate-pdf    document attachment "earth_depth_profile.pdf"
 *   POST /generate-image  {"image": "<base64 png>"}
 *   GET  /                liveness text, no generation
 *
 * A non-empty request body must be valid JSON; its content is otherwise
 * ignored. Every generation request runs the pipeline with a fresh random
 * stream, so all responses for one configuration carry the same chart.
 */
class ProfileService {
public:
    static const char* const LIVENESS_TEXT;

    ProfileService(const ProfileConfig& config,
                   std::shared_ptr<const SceneEncoder> document_encoder,
                   std::shared_ptr<const SceneEncoder> raster_encoder);

    /// Route dispatch; usable directly as an HttpHandler
    HttpResponse handle(const HttpRequest& request) const;

    HttpResponse generateDocument(const HttpRequest& request) const;
    HttpResponse generateImage(const HttpRequest& request) const;
    HttpResponse liveness() const;

    /// Throws InvalidRequestError unless body is blank or parses as JSON
    static void validateBody(const std::string& body);

    /// {"error": error, "message": message}
    static HttpResponse errorResponse(int status, const std::string& error,
                                      const std::string& message);

    /// Client-safe message for a pipeline failure
    static std::string publicMessage(const ProfileError& error);

private:
    ProfileConfig config_;
    std::shared_ptr<const SceneEncoder> document_encoder_;
    std::shared_ptr<const SceneEncoder> raster_encoder_;

    /// Validates, generates and encodes; maps failures to 400/500 responses
    HttpResponse render(const HttpRequest& request, const SceneEncoder& encoder,
                        bool as_base64_json) const;
};

} // namespace GeoProfile

#endif // PROFILE_SERVICE_HPP
