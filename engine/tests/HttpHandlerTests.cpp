#include "TestFixtures.hpp"
#include "TestMacros.hpp"
#include "http/http_handler.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

const char *kThreePointTrack = R"({"points":[
    {"lat":0,"lon":0,"ele":100},
    {"lat":0,"lon":0.001,"ele":105},
    {"lat":0,"lon":0.002,"ele":102}]})";

httplib::Response post(HttpHandler &h, const std::string &action,
                       const std::string &body, bool stats = false) {
  httplib::Request req;
  req.method = "POST";
  req.path = "/" + action;
  req.body = body;
  if (stats)
    req.params.emplace("stats", "true");
  httplib::Response res;
  h.callPostHandler(action, req, res);
  return res;
}

void TestAnalyzeSurface() {
  FakeGeodata geo({make_way("asphalt", {{0, -0.001}, {0, 0.003}}, 5)});
  HttpHandler handler(geo, SurfaceAnalyzer{});

  const auto res = post(handler, "analyze_surface", kThreePointTrack);
  EXPECT_EQ(res.status, 200);
  const json j = json::parse(res.body);
  ASSERT_TRUE(j.contains("surface_lengths_km"));
  EXPECT_NEAR(j["surface_lengths_km"]["asphalt"].get<double>(), 0.222, 1e-9);
  EXPECT_NEAR(j["suitability_scores"]["roadbike"].get<double>(), 1.0, 1e-9);
  EXPECT_NEAR(j["suitability_scores"]["gravelbike"].get<double>(), 1.0, 1e-9);
  EXPECT_NEAR(j["elevation"]["elevation_up"].get<double>(), 5.0, 1e-9);
  EXPECT_NEAR(j["elevation"]["elevation_down"].get<double>(), 3.0, 1e-9);
  EXPECT_FALSE(j.contains("stats"));

  const auto with_stats =
      json::parse(post(handler, "analyze_surface", kThreePointTrack, true).body);
  EXPECT_EQ(with_stats["stats"]["segments"].get<int>(), 2);
  EXPECT_EQ(with_stats["stats"]["ways_fetched"].get<int>(), 1);
}

void TestErrorMapping() {
  FakeGeodata down({}, /*failures=*/10);
  HttpHandler handler(down, SurfaceAnalyzer{});

  auto res = post(handler, "analyze_surface", "{\"points\": [");
  EXPECT_EQ(res.status, 400);
  json j = json::parse(res.body);
  EXPECT_EQ(j["stage"].get<std::string>(), std::string("parse"));
  EXPECT_EQ(j["line"].get<int>(), 1);

  res = post(handler, "analyze_surface", R"({"points":[]})");
  EXPECT_EQ(res.status, 400);
  EXPECT_EQ(json::parse(res.body)["stage"].get<std::string>(),
            std::string("input"));

  res = post(handler, "analyze_surface", kThreePointTrack);
  EXPECT_EQ(res.status, 503);
  EXPECT_EQ(json::parse(res.body)["stage"].get<std::string>(),
            std::string("geodata"));

  // per-request policy override degrades instead of failing
  json body = json::parse(kThreePointTrack);
  body["params"] = {{"geodata_policy", "degrade"}};
  res = post(handler, "analyze_surface", body.dump(), true);
  EXPECT_EQ(res.status, 200);
  j = json::parse(res.body);
  EXPECT_NEAR(j["surface_lengths_km"]["unknown"].get<double>(), 0.222, 1e-9);
  EXPECT_TRUE(j["stats"]["degraded"].get<bool>());

  body["params"] = {{"geodata_policy", "sometimes"}};
  res = post(handler, "analyze_surface", body.dump());
  EXPECT_EQ(res.status, 400);
  EXPECT_EQ(json::parse(res.body)["stage"].get<std::string>(),
            std::string("params"));

  // grid and search radius from the request are bounded
  body["params"] = {{"match_tolerance_m", 1e300}};
  res = post(handler, "analyze_surface", body.dump());
  EXPECT_EQ(res.status, 400);
  EXPECT_EQ(json::parse(res.body)["stage"].get<std::string>(),
            std::string("params"));

  body["params"] = {{"index_cell_m", 0.05}};
  res = post(handler, "analyze_surface", body.dump());
  EXPECT_EQ(res.status, 400);
  EXPECT_EQ(json::parse(res.body)["stage"].get<std::string>(),
            std::string("params"));

  res = post(handler, "segment", kThreePointTrack);
  EXPECT_EQ(res.status, 404);
}

void TestGetEndpoints() {
  FakeGeodata geo;
  HttpHandler handler(geo, SurfaceAnalyzer{});
  httplib::Request req;
  httplib::Response res;

  handler.callGetHandler("health", req, res);
  EXPECT_TRUE(json::parse(res.body)["ok"].get<bool>());

  httplib::Response weights;
  handler.callGetHandler("weights", req, weights);
  const json w = json::parse(weights.body)["weights"];
  EXPECT_NEAR(w["asphalt"]["roadbike"].get<double>(), 1.0, 0.0);
  EXPECT_NEAR(w["gravel"]["roadbike"].get<double>(), 0.0, 0.0);

  httplib::Response missing;
  handler.callGetHandler("nope", req, missing);
  EXPECT_EQ(missing.status, 404);
}

} // namespace

int main() {
  TestAnalyzeSurface();
  TestErrorMapping();
  TestGetEndpoints();
  return report("http_handler_tests");
}
