#include "EntropyProvider.h"
#include "Crypto.h"
#include "MetricsCollector.h"
#include "TestDoubles.h"

#include <gtest/gtest.h>
#include <cctype>
#include <set>

using namespace SkipKP;

TEST(EntropyProviderTest, GeneratesUppercaseHexOfRequestedStrength) {
    EntropyProvider entropy;

    auto random = entropy.generate(256);
    ASSERT_TRUE(random);
    EXPECT_EQ(random->size(), 64u);
    for (char c : *random) {
        EXPECT_TRUE(std::isxdigit(static_cast<unsigned char>(c)));
        EXPECT_FALSE(std::islower(static_cast<unsigned char>(c)));
    }

    auto small = entropy.generate(8);
    ASSERT_TRUE(small);
    EXPECT_EQ(small->size(), 2u);
}

TEST(EntropyProviderTest, RoundsUpPartialBytes) {
    EntropyProvider entropy;
    auto random = entropy.generate(12);
    ASSERT_TRUE(random);
    EXPECT_EQ(random->size(), 4u);
}

TEST(EntropyProviderTest, RejectsNonPositiveRequest) {
    EntropyProvider entropy;
    EXPECT_EQ(entropy.generate(0).code(), skp::ErrorCode::ValidationError);
    EXPECT_EQ(entropy.generate(-8).code(), skp::ErrorCode::ValidationError);
}

TEST(EntropyProviderTest, ReportsDeadRandomSource) {
    auto source = std::make_shared<FailingRandomSource>();
    EntropyProvider entropy(source);

    auto before = MetricsCollector::instance().getSecurityMetrics().rngFailures;

    EXPECT_EQ(entropy.generate(128).code(), skp::ErrorCode::RngUnavailable);
    EXPECT_EQ(entropy.randomBytes(32).code(), skp::ErrorCode::RngUnavailable);
    EXPECT_EQ(entropy.randomId(16).code(), skp::ErrorCode::RngUnavailable);
    EXPECT_EQ(MetricsCollector::instance().getSecurityMetrics().rngFailures, before + 3);

    source->failing = false;
    EXPECT_TRUE(entropy.generate(128));
}

TEST(EntropyProviderTest, RandomIdsAreLowercaseAndDistinct) {
    EntropyProvider entropy;
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        auto id = entropy.randomId(16);
        ASSERT_TRUE(id);
        EXPECT_EQ(id->size(), 32u);
        EXPECT_TRUE(Crypto::isHex(*id));
        for (char c : *id) {
            EXPECT_FALSE(std::isupper(static_cast<unsigned char>(c)));
        }
        seen.insert(*id);
    }
    EXPECT_EQ(seen.size(), 100u);
}
