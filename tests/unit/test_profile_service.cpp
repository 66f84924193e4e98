/**
 * @file test_profile_service.cpp
 * @brief Unit tests for request routing and response shaping
 */

#include <gtest/gtest.h>
#include "ProfileService.hpp"
#include "Base64.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <sstream>
#include <stdexcept>
#include <utility>

using namespace GeoProfile;

namespace {

/// Encoder that fingerprints the scene instead of drawing it
class StubEncoder : public SceneEncoder {
public:
    StubEncoder(std::string type, std::string name)
        : type_(std::move(type)), name_(std::move(name)) {}

    std::string encode(const ChartScene& scene) const override {
        ++calls;
        std::ostringstream out;
        out.precision(17);
        out << type_ << "|" << scene.title() << "|" << scene.polygonCount();
        for (const auto& band : scene.bands()) {
            for (const auto& poly : band.polygons) {
                for (const auto& p : poly) out << ";" << p.x << "," << p.z;
            }
        }
        return out.str();
    }

    std::string contentType() const override { return type_; }
    std::string fileName() const override { return name_; }

    mutable std::atomic<int> calls{0};

private:
    std::string type_;
    std::string name_;
};

class ThrowingEncoder : public SceneEncoder {
public:
    std::string encode(const ChartScene&) const override {
        throw RenderingError("terminal pngcairo not available at /opt/private/gnuplot");
    }
    std::string contentType() const override { return "image/png"; }
    std::string fileName() const override { return "earth_depth_profile.png"; }
};

} // namespace

class ProfileServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.n_points = 200;
        config_.grid_resolution = 20;
        document_ = std::make_shared<StubEncoder>("application/pdf", "earth_depth_profile.pdf");
        raster_ = std::make_shared<StubEncoder>("image/png", "earth_depth_profile.png");
    }

    HttpRequest request(const std::string& method, const std::string& path,
                        const std::string& body = "") const {
        HttpRequest r;
        r.method = method;
        r.path = path;
        r.version = "HTTP/1.1";
        r.body = body;
        return r;
    }

    ProfileService service() const { return ProfileService(config_, document_, raster_); }

    ProfileConfig config_;
    std::shared_ptr<StubEncoder> document_;
    std::shared_ptr<StubEncoder> raster_;
};

TEST_F(ProfileServiceTest, LivenessDoesNotGenerate) {
    HttpResponse r = service().handle(request("GET", "/"));
    EXPECT_EQ(r.status, 200);
    EXPECT_EQ(r.body, ProfileService::LIVENESS_TEXT);
    EXPECT_NE(r.content_type.find("text/plain"), std::string::npos);
    EXPECT_EQ(document_->calls.load(), 0);
    EXPECT_EQ(raster_->calls.load(), 0);
}

TEST_F(ProfileServiceTest, DocumentAttachment) {
    HttpResponse r = service().handle(request("POST", "/generate-pdf"));
    ASSERT_EQ(r.status, 200);
    EXPECT_EQ(r.content_type, "application/pdf");
    EXPECT_EQ(r.headers["Content-Disposition"],
              "attachment; filename=\"earth_depth_profile.pdf\"");
    EXPECT_EQ(r.body.rfind("application/pdf|Earth Depth Profile|", 0), 0u);
    EXPECT_EQ(document_->calls.load(), 1);
    EXPECT_EQ(raster_->calls.load(), 0);
}

TEST_F(ProfileServiceTest, ImageAsBase64Json) {
    HttpResponse r = service().handle(request("POST", "/generate-image", "{}"));
    ASSERT_EQ(r.status, 200);
    EXPECT_EQ(r.content_type, "application/json");

    nlohmann::json body = nlohmann::json::parse(r.body);
    ASSERT_TRUE(body.contains("image"));
    std::string decoded = decodeBase64(body["image"].get<std::string>());
    EXPECT_EQ(decoded.rfind("image/png|Earth Depth Profile|", 0), 0u);
    EXPECT_EQ(raster_->calls.load(), 1);
}

TEST_F(ProfileServiceTest, RepeatedRequestsIdentical) {
    ProfileService svc = service();
    HttpResponse a = svc.handle(request("POST", "/generate-image"));
    HttpResponse b = svc.handle(request("POST", "/generate-image", "{\"ignored\": [1, 2]}"));
    ASSERT_EQ(a.status, 200);
    ASSERT_EQ(b.status, 200);
    EXPECT_EQ(a.body, b.body);

    HttpResponse c = svc.handle(request("POST", "/generate-pdf"));
    HttpResponse d = svc.handle(request("POST", "/generate-pdf"));
    EXPECT_EQ(c.body, d.body);
}

TEST_F(ProfileServiceTest, InvalidJsonRejected) {
    HttpResponse r = service().handle(request("POST", "/generate-image", "{not json"));
    EXPECT_EQ(r.status, 400);
    nlohmann::json body = nlohmann::json::parse(r.body);
    EXPECT_EQ(body["error"].get<std::string>(), "Invalid JSON data");
    EXPECT_EQ(raster_->calls.load(), 0);

    r = service().handle(request("POST", "/generate-pdf", "[1, 2"));
    EXPECT_EQ(r.status, 400);
    EXPECT_EQ(document_->calls.load(), 0);
}

TEST_F(ProfileServiceTest, BlankBodyAccepted) {
    EXPECT_NO_THROW(ProfileService::validateBody(""));
    EXPECT_NO_THROW(ProfileService::validateBody(" \r\n"));
    EXPECT_NO_THROW(ProfileService::validateBody("{\"a\": 1}"));
    EXPECT_NO_THROW(ProfileService::validateBody("42"));
    EXPECT_THROW(ProfileService::validateBody("{\"a\":}"), InvalidRequestError);
}

TEST_F(ProfileServiceTest, RenderingFailureHidesDetail) {
    ProfileService svc(config_, document_, std::make_shared<ThrowingEncoder>());
    HttpResponse r = svc.handle(request("POST", "/generate-image"));

    EXPECT_EQ(r.status, 500);
    nlohmann::json body = nlohmann::json::parse(r.body);
    EXPECT_EQ(body["error"].get<std::string>(), "Failed to generate plot");
    EXPECT_EQ(body["message"].get<std::string>(), "The chart could not be rendered");
    EXPECT_EQ(r.body.find("/opt/private"), std::string::npos);
}

TEST_F(ProfileServiceTest, DegenerateSamplesGive500) {
    config_.n_points = 2;
    HttpResponse r = service().handle(request("POST", "/generate-pdf"));

    EXPECT_EQ(r.status, 500);
    nlohmann::json body = nlohmann::json::parse(r.body);
    EXPECT_EQ(body["error"].get<std::string>(), "Failed to generate plot");
    EXPECT_EQ(body["message"].get<std::string>(), "The sample set could not be triangulated");
    EXPECT_EQ(document_->calls.load(), 0);
}

TEST_F(ProfileServiceTest, UnknownRoute) {
    HttpResponse r = service().handle(request("GET", "/generate-gif"));
    EXPECT_EQ(r.status, 404);
    EXPECT_EQ(nlohmann::json::parse(r.body)["error"].get<std::string>(), "Not found");
}

TEST_F(ProfileServiceTest, WrongMethod) {
    EXPECT_EQ(service().handle(request("GET", "/generate-pdf")).status, 405);
    EXPECT_EQ(service().handle(request("PUT", "/generate-image")).status, 405);
    EXPECT_EQ(service().handle(request("POST", "/")).status, 405);
    EXPECT_EQ(service().handle(request("HEAD", "/")).status, 200);
    EXPECT_EQ(document_->calls.load() + raster_->calls.load(), 0);
}

TEST_F(ProfileServiceTest, PublicMessages) {
    EXPECT_EQ(ProfileService::publicMessage(DegenerateInputError("x")),
              "The sample set could not be triangulated");
    EXPECT_EQ(ProfileService::publicMessage(RenderingError("x")),
              "The chart could not be rendered");
    EXPECT_EQ(ProfileService::publicMessage(ProfileError("x")),
              "The profile could not be generated");
}

TEST_F(ProfileServiceTest, RequiresEncoders) {
    EXPECT_THROW(ProfileService(config_, nullptr, raster_), std::invalid_argument);
    EXPECT_THROW(ProfileService(config_, document_, nullptr), std::invalid_argument);
}
