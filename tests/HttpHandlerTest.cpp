#include "gtest/gtest.h"

#include <cstdint>
#include <string>

#include "http/http_handler.hpp"

namespace {
const char *kRouteBody = R"({
  "waypoints": [
    {"lat": 59.9100, "lon": 10.7500, "ele": 10},
    {"lat": 59.9130, "lon": 10.7500, "ele": 18},
    {"lat": 59.9130, "lon": 10.7560, "ele": 22},
    {"lat": 59.9100, "lon": 10.7560, "ele": 12}
  ],
  "params": {"seed": 42, "avg_speed_mps": 4.0, "start_time": "2024-12-02T06:05:38Z"}
})";

HttpHandler MakeHandler(int rate_limit = 5) {
  return HttpHandler(SynthesisParams{}, OrsRouteClient::Config{}, rate_limit);
}

httplib::Request MakeRequest(const std::string &body,
                             const std::string &addr = "127.0.0.1") {
  httplib::Request req;
  req.body = body;
  req.remote_addr = addr;
  return req;
}
}

TEST(HttpHandlerTest, GenerateReturnsAlignedProfiles) {
  auto handler = MakeHandler();
  httplib::Response res;
  handler.callPostHandler("generate", MakeRequest(kRouteBody), res);

  ASSERT_EQ(res.status, 200) << res.body;
  const auto j = nlohmann::json::parse(res.body);
  EXPECT_TRUE(j["ok"].get<bool>());
  EXPECT_EQ(j["seed"].get<uint64_t>(), 42u);
  const size_t n = j["points"].get<size_t>();
  EXPECT_GT(n, 0u);
  EXPECT_EQ(j["timestamps"].size(), n);
  EXPECT_EQ(j["bpmProfile"].size(), n);
  EXPECT_EQ(j["cadenceProfile"].size(), n);
  EXPECT_EQ(j["paceProfile"].size(), n);
  EXPECT_EQ(j["route"].size(), n);
  EXPECT_EQ(j["timestamps"][0].get<std::string>(), "2024-12-02T06:05:38Z");
}

TEST(HttpHandlerTest, SameSeedSameResponse) {
  auto handler = MakeHandler();
  httplib::Response a;
  httplib::Response b;
  handler.callPostHandler("generate", MakeRequest(kRouteBody), a);
  handler.callPostHandler("generate", MakeRequest(kRouteBody), b);
  EXPECT_EQ(a.body, b.body);
}

TEST(HttpHandlerTest, GpxFormat) {
  auto handler = MakeHandler();
  auto req = MakeRequest(kRouteBody);
  req.params.emplace("format", "gpx");
  httplib::Response res;
  handler.callPostHandler("generate", req, res);

  ASSERT_EQ(res.status, 200);
  EXPECT_EQ(res.get_header_value("Content-Type"), "application/gpx+xml");
  EXPECT_NE(res.body.find("<trkpt"), std::string::npos);
  EXPECT_NE(res.body.find("<ns3:hr>"), std::string::npos);
}

TEST(HttpHandlerTest, MalformedJsonReportsPosition) {
  auto handler = MakeHandler();
  httplib::Response res;
  handler.callPostHandler("generate",
                          MakeRequest("{\n  \"waypoints\": [\n    {,}\n  ]\n}"),
                          res);
  EXPECT_EQ(res.status, 400);
  const auto j = nlohmann::json::parse(res.body);
  EXPECT_FALSE(j["ok"].get<bool>());
  EXPECT_EQ(j["kind"], "parse_error");
  EXPECT_EQ(j["line"].get<int>(), 3);
}

TEST(HttpHandlerTest, SingleWaypointRejected) {
  auto handler = MakeHandler();
  httplib::Response res;
  handler.callPostHandler(
      "generate",
      MakeRequest(R"({"waypoints": [{"lat": 59.91, "lon": 10.75, "ele": 3}]})"),
      res);
  EXPECT_EQ(res.status, 400);
}

TEST(HttpHandlerTest, InvalidParamsRejected) {
  auto handler = MakeHandler();
  httplib::Response res;
  handler.callPostHandler(
      "generate",
      MakeRequest(R"({"waypoints": [{"lat": 1, "lon": 1}, {"lat": 1.01, "lon": 1}],
                      "params": {"avg_speed_mps": -2}})"),
      res);
  EXPECT_EQ(res.status, 400);
}

TEST(HttpHandlerTest, BadStartTimeIsBadRequest) {
  auto handler = MakeHandler();
  httplib::Response res;
  handler.callPostHandler(
      "generate",
      MakeRequest(R"({"waypoints": [{"lat": 1, "lon": 1}, {"lat": 1.01, "lon": 1}],
                      "params": {"start_time": "next tuesday"}})"),
      res);
  EXPECT_EQ(res.status, 400);
}

TEST(HttpHandlerTest, OversizedRouteLengthIsBadRequest) {
  auto handler = MakeHandler();
  httplib::Response res;
  handler.callPostHandler(
      "generate",
      MakeRequest(R"({"waypoints": [{"lat": 1, "lon": 1}, {"lat": 1.01, "lon": 1}],
                      "params": {"route_length_m": 1e10}})"),
      res);
  EXPECT_EQ(res.status, 400) << res.body;
  EXPECT_NE(res.body.find("max_duration_s"), std::string::npos);
}

TEST(HttpHandlerTest, OversizedRoundTripRejectedBeforeFetch) {
  auto handler = MakeHandler();
  httplib::Response res;
  handler.callPostHandler(
      "generate-single",
      MakeRequest(
          R"({"startCoords": {"lat": 59.91, "lon": 10.75}, "routeLength": 1e10})"),
      res);
  EXPECT_EQ(res.status, 400);
}

TEST(HttpHandlerTest, GenerateSingleWithoutStartIsBadRequest) {
  auto handler = MakeHandler();
  httplib::Response res;
  handler.callPostHandler("generate-single",
                          MakeRequest(R"({"routeLength": 5000})"), res);
  EXPECT_EQ(res.status, 400);
}

TEST(HttpHandlerTest, GenerateSingleWithoutApiKeyIsBadGateway) {
  auto handler = MakeHandler();
  httplib::Response res;
  handler.callPostHandler(
      "generate-single",
      MakeRequest(
          R"({"startCoords": {"lat": 59.91, "lon": 10.75}, "routeLength": 5000})"),
      res);
  EXPECT_EQ(res.status, 502);
}

TEST(HttpHandlerTest, UnknownActionIs404) {
  auto handler = MakeHandler();
  httplib::Response post;
  handler.callPostHandler("teleport", MakeRequest("{}"), post);
  EXPECT_EQ(post.status, 404);
  httplib::Response get;
  handler.callGetHandler("teleport", MakeRequest(""), get);
  EXPECT_EQ(get.status, 404);
}

TEST(HttpHandlerTest, RateLimitPerClient) {
  auto handler = MakeHandler(5);
  for (int i = 0; i < 5; ++i) {
    httplib::Response res;
    handler.callPostHandler("generate", MakeRequest("not json", "10.1.1.1"),
                            res);
    EXPECT_EQ(res.status, 400);
  }
  httplib::Response limited;
  handler.callPostHandler("generate", MakeRequest("not json", "10.1.1.1"),
                          limited);
  EXPECT_EQ(limited.status, 429);

  httplib::Response other;
  handler.callPostHandler("generate", MakeRequest("not json", "10.1.1.2"),
                          other);
  EXPECT_EQ(other.status, 400);
}

TEST(HttpHandlerTest, Health) {
  auto handler = MakeHandler();
  httplib::Response res;
  handler.callGetHandler("health", MakeRequest(""), res);
  EXPECT_EQ(res.status, 200);
  EXPECT_TRUE(nlohmann::json::parse(res.body)["ok"].get<bool>());
}

int main(int argc, char **argv) {
  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
