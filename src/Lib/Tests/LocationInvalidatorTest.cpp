#include <chrono>     // std::chrono::{seconds, system_clock}
#include <filesystem> // std::filesystem::{path, remove_all, temp_directory_path}
#include <format>     // std::format

#include <BucketCache/Cache/Buckets.hpp>
#include <BucketCache/Cache/CacheEngine.hpp>
#include <BucketCache/Cache/LocationInvalidator.hpp>
#include <BucketCache/Cache/PropertyStore.hpp>

#include <BucketCache/Utils/Error.hpp>
#include <BucketCache/Utils/Logging.hpp>
#include <BucketCache/Utils/Types.hpp>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "TestMocks.hpp"

using namespace testing;
using namespace bucketcache::cache;
using namespace bucketcache::utils::types;
using bucketcache::utils::error::BkcError;
using bucketcache::utils::logging::GetRuntimeLogLevel;
using bucketcache::utils::logging::LogLevel;
using bucketcache::utils::logging::SetRuntimeLogLevel;

using enum bucketcache::utils::error::BkcErrorCode;

using std::chrono::seconds;
using std::chrono::system_clock;

namespace fs = std::filesystem;

class LocationInvalidatorTest : public Test {
 protected:
  fs::path              m_root;
  InMemoryPropertyStore m_properties;
  MockListIdResolver    m_resolver;

  fn SetUp() -> Unit override {
    m_root = fs::temp_directory_path() / std::format("bucketcache_location_{}", UnitTest::GetInstance()->current_test_info()->name());
    fs::remove_all(m_root);
  }

  fn TearDown() -> Unit override {
    std::error_code errc;
    fs::remove_all(m_root, errc);
  }

  fn engineOptions() -> CacheOptions {
    return {
      .dataPath       = m_root,
      .defaultTtl     = DEFAULT_TTL,
      .propertyPrefix = "bkctest",
      .clock          = [] { return system_clock::time_point(seconds(1'700'000'000)); },
    };
  }

  static fn Seed(CacheEngine& engine, const StringView bucket, const StringView identifier) -> Unit {
    ASSERT_TRUE(engine.add<String>(bucket, identifier, "cached", None, true));
  }

  static fn IsCached(CacheEngine& engine, const StringView bucket, const StringView identifier) -> bool {
    return engine.getRaw(bucket, identifier).has_value();
  }
};

TEST_F(LocationInvalidatorTest, SplitLocation_KeepsLeadingEmptySegment) {
  const Vec<String> segments = SplitLocation("/video_list/queue");

  ASSERT_EQ(segments.size(), 3);
  EXPECT_EQ(segments[0], "");
  EXPECT_EQ(segments[1], "video_list");
  EXPECT_EQ(segments[2], "queue");
}

TEST_F(LocationInvalidatorTest, SplitLocation_NoSeparator) {
  const Vec<String> segments = SplitLocation("home");

  ASSERT_EQ(segments.size(), 1);
  EXPECT_EQ(segments[0], "home");
}

TEST_F(LocationInvalidatorTest, VideoList_KnownListTypeResolvesListId) {
  CacheEngine         engine(engineOptions(), m_properties);
  LocationInvalidator invalidator(engine, m_resolver);

  Seed(engine, CACHE_VIDEO_LIST, "L123");
  Seed(engine, CACHE_COMMON, "queue");
  Seed(engine, CACHE_VIDEO_LIST, "L999");

  EXPECT_CALL(m_resolver, listIdForType(Eq(StringView("queue"))))
    .WillOnce(Return(Result<String>("L123")));

  invalidator.invalidate(SplitLocation("/video_list/queue"));

  EXPECT_FALSE(IsCached(engine, CACHE_VIDEO_LIST, "L123"));
  EXPECT_FALSE(IsCached(engine, CACHE_COMMON, "queue"));
  EXPECT_FALSE(engine.diskStore().exists(CACHE_VIDEO_LIST, "L123"));
  EXPECT_TRUE(IsCached(engine, CACHE_VIDEO_LIST, "L999"));
}

TEST_F(LocationInvalidatorTest, VideoList_ResolverFailureStillClearsCommon) {
  CacheEngine         engine(engineOptions(), m_properties);
  LocationInvalidator invalidator(engine, m_resolver);

  Seed(engine, CACHE_VIDEO_LIST, "L123");
  Seed(engine, CACHE_COMMON, "topTen");

  EXPECT_CALL(m_resolver, listIdForType(Eq(StringView("topTen"))))
    .WillOnce(Return(Result<String>(Err(BkcError(NotFound, "no such list")))));

  invalidator.invalidate(SplitLocation("/video_list/topTen"));

  EXPECT_FALSE(IsCached(engine, CACHE_COMMON, "topTen"));
  EXPECT_TRUE(IsCached(engine, CACHE_VIDEO_LIST, "L123"));
}

TEST_F(LocationInvalidatorTest, VideoList_PlainIdIsInvalidatedDirectly) {
  CacheEngine         engine(engineOptions(), m_properties);
  LocationInvalidator invalidator(engine, m_resolver);

  Seed(engine, CACHE_VIDEO_LIST, "81234");

  EXPECT_CALL(m_resolver, listIdForType(_)).Times(0);

  invalidator.invalidate(SplitLocation("/video_list/81234"));

  EXPECT_FALSE(IsCached(engine, CACHE_VIDEO_LIST, "81234"));
}

TEST_F(LocationInvalidatorTest, VideoList_CustomListTypes) {
  CacheEngine         engine(engineOptions(), m_properties);
  LocationInvalidator invalidator(engine, m_resolver, { "recommendations" });

  EXPECT_TRUE(invalidator.isListType("recommendations"));
  EXPECT_FALSE(invalidator.isListType("queue"));

  EXPECT_CALL(m_resolver, listIdForType(Eq(StringView("recommendations"))))
    .WillOnce(Return(Result<String>("L555")));

  Seed(engine, CACHE_VIDEO_LIST, "L555");

  invalidator.invalidate(SplitLocation("/video_list/recommendations"));

  EXPECT_FALSE(IsCached(engine, CACHE_VIDEO_LIST, "L555"));
}

TEST_F(LocationInvalidatorTest, Show_InvalidatesSeasons) {
  CacheEngine         engine(engineOptions(), m_properties);
  LocationInvalidator invalidator(engine, m_resolver);

  Seed(engine, CACHE_SEASONS, "70123");

  invalidator.invalidate(SplitLocation("/show/70123"));

  EXPECT_FALSE(IsCached(engine, CACHE_SEASONS, "70123"));
}

TEST_F(LocationInvalidatorTest, Show_WithSeasonInvalidatesEpisodes) {
  CacheEngine         engine(engineOptions(), m_properties);
  LocationInvalidator invalidator(engine, m_resolver);

  Seed(engine, CACHE_SEASONS, "70123");
  Seed(engine, CACHE_EPISODES, "80001");

  invalidator.invalidate(SplitLocation("/show/70123/season/80001"));

  EXPECT_FALSE(IsCached(engine, CACHE_EPISODES, "80001"));
  EXPECT_TRUE(IsCached(engine, CACHE_SEASONS, "70123"));
}

TEST_F(LocationInvalidatorTest, ShortLocationIsIgnored) {
  CacheEngine         engine(engineOptions(), m_properties);
  LocationInvalidator invalidator(engine, m_resolver);

  Seed(engine, CACHE_SEASONS, "show");

  invalidator.invalidate(SplitLocation("/show"));

  EXPECT_TRUE(IsCached(engine, CACHE_SEASONS, "show"));
}

TEST_F(LocationInvalidatorTest, ShortLocationOnOtherRouteIsNotAnError) {
  CacheEngine         engine(engineOptions(), m_properties);
  LocationInvalidator invalidator(engine, m_resolver);

  const LogLevel previous = GetRuntimeLogLevel();
  SetRuntimeLogLevel(LogLevel::Error);

  testing::internal::CaptureStdout();
  invalidator.invalidate(SplitLocation("/home"));
  const String otherRoute = testing::internal::GetCapturedStdout();

  testing::internal::CaptureStdout();
  invalidator.invalidate(SplitLocation("/show"));
  const String showRoute = testing::internal::GetCapturedStdout();

  SetRuntimeLogLevel(previous);

  EXPECT_EQ(otherRoute, "");
  EXPECT_THAT(showRoute, HasSubstr("ERROR"));
}

TEST_F(LocationInvalidatorTest, OtherRouteIsIgnored) {
  CacheEngine         engine(engineOptions(), m_properties);
  LocationInvalidator invalidator(engine, m_resolver);

  Seed(engine, CACHE_SEASONS, "terms");

  EXPECT_CALL(m_resolver, listIdForType(_)).Times(0);

  invalidator.invalidate(SplitLocation("/search/terms"));

  EXPECT_TRUE(IsCached(engine, CACHE_SEASONS, "terms"));
}

TEST_F(LocationInvalidatorTest, LastLocation_ReadFromHost) {
  CacheEngine         engine(engineOptions(), m_properties);
  LocationInvalidator invalidator(engine, m_resolver);
  MockHostLocation    host;

  Seed(engine, CACHE_SEASONS, "70123");

  EXPECT_CALL(host, lastLocation()).WillOnce(Return(Option<String>("/show/70123")));

  invalidator.invalidateLastLocation(host);

  EXPECT_FALSE(IsCached(engine, CACHE_SEASONS, "70123"));
}

TEST_F(LocationInvalidatorTest, LastLocation_AbsentIsNoOp) {
  CacheEngine         engine(engineOptions(), m_properties);
  LocationInvalidator invalidator(engine, m_resolver);
  MockHostLocation    host;

  Seed(engine, CACHE_SEASONS, "70123");

  EXPECT_CALL(host, lastLocation()).WillOnce(Return(Option<String>()));
  EXPECT_CALL(m_resolver, listIdForType(_)).Times(0);

  invalidator.invalidateLastLocation(host);

  EXPECT_TRUE(IsCached(engine, CACHE_SEASONS, "70123"));
}
