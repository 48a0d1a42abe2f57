#pragma once
#include "core/GeodataSource.hpp"
#include <string>
#include <utility>

// GeodataSource backed by an Overpass API endpoint.
class OverpassClient final : public GeodataSource {
public:
  struct Settings {
    std::string url = "http://overpass-api.de"; // scheme://host[:port]
    std::string path = "/api/interpreter";
    int timeout_s = 30;
  };

  explicit OverpassClient(Settings s) : settings_(std::move(s)) {}

  std::vector<TaggedWay> fetch_ways(const BBox &bbox) override;

  // Overpass QL for all surface-tagged ways in `bbox`, with geometry.
  static std::string build_query(const BBox &bbox, int timeout_s);

  const Settings &settings() const noexcept { return settings_; }

private:
  Settings settings_;
};
