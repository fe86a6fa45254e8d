#include "CapabilityRegistry.h"
#include "KeyProviderConfig.h"

#include <gtest/gtest.h>

using namespace SkipKP;

class CapabilityRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.localSystemId = "KP_QuIIN_Server";
        config_.remoteSystemIds = {"KP_QuIIN_Client", "KP_*_Test", "KP_Development_*"};
        config_.algorithm = "TLS_DHE_PSK_WITH_AES_256_CBC_SHA384";
    }

    KeyProviderConfig config_;
};

TEST_F(CapabilityRegistryTest, DescribesLocalSystem) {
    CapabilityRegistry registry(config_);
    const auto& descriptor = registry.describe();

    EXPECT_TRUE(descriptor.entropy);
    EXPECT_TRUE(descriptor.key);
    EXPECT_EQ(descriptor.algorithm, "TLS_DHE_PSK_WITH_AES_256_CBC_SHA384");
    EXPECT_EQ(registry.localSystemId(), "KP_QuIIN_Server");

    auto json = descriptor.toJson();
    EXPECT_EQ(json["localSystemID"].asString(), "KP_QuIIN_Server");
    ASSERT_TRUE(json["remoteSystemID"].isArray());
    EXPECT_EQ(json["remoteSystemID"].size(), 3u);
    EXPECT_EQ(json["remoteSystemID"][1].asString(), "KP_*_Test");
}

TEST_F(CapabilityRegistryTest, MatchesGlobPatterns) {
    CapabilityRegistry registry(config_);

    EXPECT_TRUE(registry.authorize("KP_QuIIN_Client"));
    EXPECT_TRUE(registry.authorize("KP_Alpha_Test"));
    EXPECT_TRUE(registry.authorize("KP_Development_42"));

    EXPECT_FALSE(registry.authorize("KP_Alpha_Prod"));
    EXPECT_FALSE(registry.authorize("kp_alpha_test"));
    EXPECT_FALSE(registry.authorize("KP_QuIIN_Client2"));
    EXPECT_FALSE(registry.authorize("XKP_Alpha_Test"));
}

TEST_F(CapabilityRegistryTest, NeverAuthorizesEmptyId) {
    config_.remoteSystemIds = {"*"};
    CapabilityRegistry registry(config_);
    EXPECT_TRUE(registry.authorize("anything"));
    EXPECT_FALSE(registry.authorize(""));
}

TEST_F(CapabilityRegistryTest, SupportsCharacterClasses) {
    config_.remoteSystemIds = {"KP_Node[0-9]", "KP_?"};
    CapabilityRegistry registry(config_);
    EXPECT_TRUE(registry.authorize("KP_Node7"));
    EXPECT_FALSE(registry.authorize("KP_NodeX"));
    EXPECT_TRUE(registry.authorize("KP_Z"));
    EXPECT_FALSE(registry.authorize("KP_ZZ"));
}

TEST_F(CapabilityRegistryTest, DescriptorFromJson) {
    CapabilityRegistry registry(config_);
    auto parsed = CapabilityDescriptor::fromJson(registry.describe().toJson());
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed->localSystemId, "KP_QuIIN_Server");
    EXPECT_EQ(parsed->remoteSystemIds, config_.remoteSystemIds);

    Json::Value broken = registry.describe().toJson();
    broken["remoteSystemID"] = "KP_*";
    EXPECT_EQ(CapabilityDescriptor::fromJson(broken).code(), skp::ErrorCode::ValidationError);

    broken = registry.describe().toJson();
    broken["remoteSystemID"].append(5);
    EXPECT_FALSE(CapabilityDescriptor::fromJson(broken));

    EXPECT_FALSE(CapabilityDescriptor::fromJson(Json::Value("not an object")));
}
