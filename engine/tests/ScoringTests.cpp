#include "TestMacros.hpp"
#include "core/SuitabilityScorer.hpp"
#include "core/SurfaceAggregator.hpp"

#include <algorithm>
#include <random>
#include <stdexcept>

namespace {

void TestAggregateSumsPerLabel() {
  const std::vector<SegmentMatch> matches = {
      {100.0, SurfaceType::Asphalt},
      {50.0, SurfaceType::Gravel},
      {25.0, SurfaceType::Asphalt},
      {10.0, SurfaceType::Unknown},
  };
  const auto lengths = SurfaceAggregator::aggregate(matches);
  EXPECT_EQ(lengths.size(), 3u);
  EXPECT_NEAR(lengths.at(SurfaceType::Asphalt), 125.0, 1e-12);
  EXPECT_NEAR(lengths.at(SurfaceType::Gravel), 50.0, 1e-12);
  EXPECT_NEAR(lengths.at(SurfaceType::Unknown), 10.0, 1e-12);
  EXPECT_TRUE(lengths.count(SurfaceType::Dirt) == 0);
  EXPECT_NEAR(SurfaceAggregator::total(lengths), 185.0, 1e-12);

  EXPECT_TRUE(SurfaceAggregator::aggregate({}).empty());
}

void TestAggregateIsOrderIndependent() {
  std::vector<SegmentMatch> matches;
  std::mt19937 rng(7);
  std::uniform_real_distribution<double> len(1.0, 500.0);
  for (int i = 0; i < 500; ++i)
    matches.push_back({len(rng), static_cast<SurfaceType>(i % 5)});

  const auto ref = SurfaceAggregator::aggregate(matches);
  for (int round = 0; round < 5; ++round) {
    std::shuffle(matches.begin(), matches.end(), rng);
    const auto got = SurfaceAggregator::aggregate(matches);
    ASSERT_TRUE(got.size() == ref.size());
    for (const auto &[surface, metres] : ref)
      EXPECT_NEAR(got.at(surface), metres, metres * 1e-12);
  }
}

void TestWeightTable() {
  const SuitabilityScorer scorer;
  EXPECT_NEAR(scorer.weight(SurfaceType::Asphalt).roadbike, 1.0, 0.0);
  EXPECT_NEAR(scorer.weight(SurfaceType::Asphalt).gravelbike, 1.0, 0.0);
  EXPECT_NEAR(scorer.weight(SurfaceType::Gravel).roadbike, 0.0, 0.0);
  EXPECT_NEAR(scorer.weight(SurfaceType::Gravel).gravelbike, 1.0, 0.0);
  EXPECT_NEAR(scorer.weight(SurfaceType::Ice).gravelbike, 0.1, 0.0);
  EXPECT_NEAR(scorer.weight(SurfaceType::Unknown).roadbike, 0.0, 0.0);
  EXPECT_NEAR(scorer.weight(SurfaceType::Unknown).gravelbike, 0.0, 0.0);

  for (const auto &w : kSurfaceSuitability) {
    EXPECT_TRUE(w.roadbike >= 0.0 && w.roadbike <= 1.0);
    EXPECT_TRUE(w.gravelbike >= 0.0 && w.gravelbike <= 1.0);
  }

  const auto j = scorer.tableJson();
  EXPECT_EQ(j.size(), kSurfaceTypeCount);
  EXPECT_NEAR(j["sett"]["roadbike"].get<double>(), 0.6, 0.0);
}

void TestScores() {
  const SuitabilityScorer scorer;

  const auto empty = scorer.score({});
  EXPECT_EQ(empty.roadbike, 0.0);
  EXPECT_EQ(empty.gravelbike, 0.0);

  const auto zero = scorer.score({{SurfaceType::Asphalt, 0.0}});
  EXPECT_EQ(zero.roadbike, 0.0);
  EXPECT_EQ(zero.gravelbike, 0.0);

  // 1.5 km asphalt, 0.8 km gravel, 0.7 km dirt
  const auto mixed = scorer.score({{SurfaceType::Asphalt, 1500.0},
                                   {SurfaceType::Gravel, 800.0},
                                   {SurfaceType::Dirt, 700.0}});
  EXPECT_NEAR(mixed.roadbike, 0.5, 1e-12);
  EXPECT_NEAR(mixed.gravelbike, 1.0, 1e-12);
  EXPECT_TRUE(mixed.roadbike >= 0.0 && mixed.roadbike <= 1.0);

  const auto unknown = scorer.score({{SurfaceType::Unknown, 1234.0}});
  EXPECT_NEAR(unknown.roadbike, kSurfaceSuitability.back().roadbike, 1e-12);
  EXPECT_NEAR(unknown.gravelbike, kSurfaceSuitability.back().gravelbike, 1e-12);
}

void TestOverrides() {
  auto table = SuitabilityScorer::tableFromJson(
      nlohmann::json{{"unknown", {0.5, 0.5}}, {"gravel", {0.2, 0.9}}});
  const SuitabilityScorer scorer(table);
  EXPECT_NEAR(scorer.weight(SurfaceType::Unknown).roadbike, 0.5, 0.0);
  EXPECT_NEAR(scorer.weight(SurfaceType::Gravel).gravelbike, 0.9, 0.0);
  EXPECT_NEAR(scorer.weight(SurfaceType::Asphalt).roadbike, 1.0, 0.0);

  const auto s = scorer.score({{SurfaceType::Unknown, 100.0}});
  EXPECT_NEAR(s.roadbike, 0.5, 1e-12);

  const auto defaults = SuitabilityScorer::tableFromJson(nlohmann::json());
  EXPECT_NEAR(defaults[static_cast<std::size_t>(SurfaceType::Sett)].roadbike,
              0.6, 0.0);
  EXPECT_THROW(SuitabilityScorer::tableFromJson(
                   nlohmann::json{{"lava", {0.1, 0.1}}}),
               std::runtime_error);
  EXPECT_THROW(SuitabilityScorer::tableFromJson(
                   nlohmann::json{{"gravel", nlohmann::json::array({0.1})}}),
               std::runtime_error);
  EXPECT_THROW(SuitabilityScorer::tableFromJson(nlohmann::json::array()),
               std::runtime_error);
}

} // namespace

int main() {
  TestAggregateSumsPerLabel();
  TestAggregateIsOrderIndependent();
  TestWeightTable();
  TestScores();
  TestOverrides();
  return report("scoring_tests");
}
