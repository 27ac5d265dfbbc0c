#include <gtest/gtest.h>

#include "FakeBackend.hpp"
#include "ResidencyCache.hpp"
#include "TestModels.hpp"

using namespace infu;
using infu::test::config_with;

class ResidencyCacheTest : public ::testing::Test
{
protected:
  test::TestModels models;
  test::FakeBackend backend;
  ResidencyCache cache{backend, models.store(), 0};
};

TEST_F(ResidencyCacheTest, FirstRequestBuilds)
{
  EXPECT_TRUE(cache.empty());

  auto res = cache.prepare(config_with(Variant::Stage2));
  ASSERT_TRUE(res.has_value()) << res.error().describe();
  EXPECT_FALSE(cache.empty());
  EXPECT_EQ((*res)->variant, Variant::Stage2);
  EXPECT_EQ(backend.state.builds, 1);
  EXPECT_EQ(cache.statistics().reconstructions, 1);
  EXPECT_TRUE(backend.last_description.infu_model_path.endsWith("aes_stage2"));
}

TEST_F(ResidencyCacheTest, SameConfigurationIsHit)
{
  auto first = cache.prepare(config_with(Variant::Stage2));
  ASSERT_TRUE(first.has_value());
  backend.state.clear();

  for (int i = 0; i < 3; i++)
  {
    auto again = cache.prepare(config_with(Variant::Stage2));
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(*again, *first);
  }

  EXPECT_EQ(backend.state.builds, 1);
  EXPECT_TRUE(backend.state.events().empty());
  EXPECT_EQ(cache.statistics().hits, 3);
}

TEST_F(ResidencyCacheTest, AddOnChangeSwapsWithoutRebuild)
{
  ASSERT_TRUE(cache.prepare(config_with(Variant::Stage1)).has_value());
  auto* first = cache.resident()->pipeline.get();

  auto res = cache.prepare(config_with(Variant::Stage1, AddOnSet{{"realism", 1.f}}));
  ASSERT_TRUE(res.has_value());
  EXPECT_EQ((*res)->pipeline.get(), first);
  EXPECT_EQ(backend.state.builds, 1);
  EXPECT_EQ(cache.statistics().adapter_swaps, 1);
  EXPECT_TRUE((*res)->adapters.contains("realism"));

  res = cache.prepare(config_with(Variant::Stage1));
  ASSERT_TRUE(res.has_value());
  EXPECT_FALSE((*res)->adapters.contains("realism"));
  EXPECT_EQ(backend.state.builds, 1);
  EXPECT_EQ(cache.statistics().adapter_swaps, 2);
}

TEST_F(ResidencyCacheTest, VariantChangeReleasesBeforeBuilding)
{
  ASSERT_TRUE(cache.prepare(config_with(Variant::Stage1)).has_value());
  backend.state.clear();

  ASSERT_TRUE(cache.prepare(config_with(Variant::Stage2)).has_value());

  const auto events = backend.state.events();
  ASSERT_EQ(events.size(), 3u);
  EXPECT_EQ(events[0], "destroy sim_stage1");
  EXPECT_EQ(events[1], "reclaim 0");
  EXPECT_EQ(events[2], "build aes_stage2 q=true o=true");
  EXPECT_EQ(backend.state.max_live_pipelines, 1);
  EXPECT_EQ(cache.statistics().releases, 1);
  EXPECT_EQ(cache.statistics().reconstructions, 2);
}

TEST_F(ResidencyCacheTest, QuantizationChangeReconstructs)
{
  ASSERT_TRUE(cache.prepare(PipelineConfig{Variant::Stage2, true, true}).has_value());
  ASSERT_TRUE(cache.prepare(PipelineConfig{Variant::Stage2, false, true}).has_value());
  ASSERT_TRUE(cache.prepare(PipelineConfig{Variant::Stage2, false, false}).has_value());
  EXPECT_EQ(backend.state.builds, 3);
  EXPECT_EQ(backend.state.max_live_pipelines, 1);
}

TEST_F(ResidencyCacheTest, AlternatingVariantsNeverOverlap)
{
  for (int i = 0; i < 6; i++)
    ASSERT_TRUE(cache.prepare(config_with(i % 2 ? Variant::Stage1 : Variant::Stage2)).has_value());
  EXPECT_EQ(backend.state.builds, 6);
  EXPECT_EQ(backend.state.max_live_pipelines, 1);
}

TEST_F(ResidencyCacheTest, BuildFailureLeavesCacheEmpty)
{
  ASSERT_TRUE(cache.prepare(config_with(Variant::Stage1)).has_value());
  backend.state.fail_build = true;

  auto res = cache.prepare(config_with(Variant::Stage2));
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().kind, ErrorKind::ConstructionFailed);
  EXPECT_TRUE(cache.empty());
  EXPECT_EQ(cache.statistics().failures, 1);
  EXPECT_EQ(backend.state.count("reclaim"), 2);

  // The next request retries the build.
  backend.state.fail_build = false;
  res = cache.prepare(config_with(Variant::Stage2));
  ASSERT_TRUE(res.has_value());
  EXPECT_EQ((*res)->variant, Variant::Stage2);
}

TEST_F(ResidencyCacheTest, ThrowingBuildBecomesConstructionFailed)
{
  backend.state.throw_on_build = true;
  auto res = cache.prepare(config_with(Variant::Stage2));
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().kind, ErrorKind::ConstructionFailed);
  EXPECT_NE(res.error().message.find("CUDA out of memory"), std::string::npos);
  EXPECT_TRUE(cache.empty());
  EXPECT_EQ(backend.state.count("reclaim"), 1);
}

TEST_F(ResidencyCacheTest, FailedBuildReclaimsDeviceMemory)
{
  backend.state.fail_build = true;
  auto res = cache.prepare(config_with(Variant::Stage1));
  ASSERT_FALSE(res.has_value());
  EXPECT_TRUE(cache.empty());
  EXPECT_EQ(backend.state.count("reclaim"), 1);
}

TEST_F(ResidencyCacheTest, NonStandardThrowDuringBuildBecomesConstructionFailed)
{
  backend.state.throw_foreign_on_build = true;
  auto res = cache.prepare(config_with(Variant::Stage2));
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().kind, ErrorKind::ConstructionFailed);
  EXPECT_TRUE(cache.empty());
  EXPECT_EQ(cache.statistics().failures, 1);
  EXPECT_EQ(backend.state.count("reclaim"), 1);

  backend.state.throw_foreign_on_build = false;
  EXPECT_TRUE(cache.prepare(config_with(Variant::Stage2)).has_value());
}

TEST_F(ResidencyCacheTest, MissingModelIsResourceUnavailable)
{
  models.remove("FLUX.1-dev");
  auto res = cache.prepare(config_with(Variant::Stage2));
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().kind, ErrorKind::ResourceUnavailable);
  EXPECT_EQ(backend.state.builds, 0);
}

TEST_F(ResidencyCacheTest, AddOnFailureDuringReconstructionDiscardsPipeline)
{
  backend.state.failing_adapters.insert("realism");
  auto res = cache.prepare(config_with(Variant::Stage2, AddOnSet{{"realism", 1.f}}));
  ASSERT_FALSE(res.has_value());
  EXPECT_TRUE(cache.empty());
  EXPECT_EQ(backend.state.live_pipelines, 0);
  EXPECT_EQ(backend.state.count("destroy"), 1);
}

TEST_F(ResidencyCacheTest, AddOnFailureDuringSwapKeepsPipeline)
{
  ASSERT_TRUE(cache.prepare(config_with(Variant::Stage2)).has_value());
  backend.state.failing_adapters.insert("anti_blur");

  auto res = cache.prepare(config_with(Variant::Stage2, AddOnSet{{"anti_blur", 1.f}}));
  ASSERT_FALSE(res.has_value());
  ASSERT_FALSE(cache.empty());
  EXPECT_FALSE(cache.resident()->adapters.contains("anti_blur"));

  // Still usable for a configuration without the add-on.
  backend.state.failing_adapters.clear();
  res = cache.prepare(config_with(Variant::Stage2));
  ASSERT_TRUE(res.has_value());
  EXPECT_EQ(backend.state.builds, 1);
}

TEST_F(ResidencyCacheTest, NonStandardThrowFromAddOnKeepsPipeline)
{
  ASSERT_TRUE(cache.prepare(config_with(Variant::Stage2)).has_value());
  backend.state.throwing_adapters.insert("realism");

  auto res = cache.prepare(config_with(Variant::Stage2, AddOnSet{{"realism", 1.f}}));
  ASSERT_FALSE(res.has_value());
  EXPECT_EQ(res.error().kind, ErrorKind::ConstructionFailed);
  ASSERT_FALSE(cache.empty());
  EXPECT_FALSE(cache.resident()->adapters.contains("realism"));
}

TEST_F(ResidencyCacheTest, ReleaseDestroysAndReclaims)
{
  ASSERT_TRUE(cache.prepare(config_with(Variant::Stage2)).has_value());
  backend.state.clear();

  cache.release();
  EXPECT_TRUE(cache.empty());
  const auto events = backend.state.events();
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0], "destroy aes_stage2");
  EXPECT_EQ(events[1], "reclaim 0");

  cache.release();
  EXPECT_EQ(backend.state.events().size(), 2u);
}

TEST_F(ResidencyCacheTest, ResidentConfigReflectsAddOns)
{
  const auto wanted = config_with(Variant::Stage1, AddOnSet{{"realism", 0.5f}});
  ASSERT_TRUE(cache.prepare(wanted).has_value());
  EXPECT_EQ(cache.resident()->config(), wanted);
}
