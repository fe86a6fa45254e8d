#include "ProtocolHandler.h"
#include "CapabilityRegistry.h"
#include "Crypto.h"
#include "EntropyProvider.h"
#include "InMemoryKeyPersistence.h"
#include "KeyStore.h"
#include "PeerRegistry.h"
#include "SyncMessenger.h"
#include "TestDoubles.h"

#include <gtest/gtest.h>
#include <cctype>
#include <memory>

using namespace SkipKP;

namespace {

HttpRequest makeRequest(const std::string& method, const std::string& path,
                        std::map<std::string, std::string> query = {}) {
    HttpRequest request;
    request.method = method;
    request.path = path;
    request.query = std::move(query);
    return request;
}

Json::Value parseBody(const std::string& body) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    EXPECT_TRUE(reader->parse(body.data(), body.data() + body.size(), &root, &errors)) << errors;
    return root;
}

const char* kClient = "KP_QuIIN_Client";
const char* kPeer = "KP_Replica";

} // namespace

class ProtocolHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = makeTestConfig("KP_QuIIN_Server");
        addPeer(config_, kPeer, pairSecret("KP_QuIIN_Server", kPeer));
        build();
    }

    void build() {
        randomSource_ = std::make_shared<FailingRandomSource>();
        randomSource_->failing = false;
        auto entropy = std::make_shared<EntropyProvider>(randomSource_);
        auto capabilities = std::make_shared<CapabilityRegistry>(config_);
        keyStore_ = std::make_shared<KeyStore>(config_, std::make_shared<InMemoryKeyPersistence>(), capabilities, entropy);
        peers_ = std::make_shared<PeerRegistry>(config_);
        std::shared_ptr<SyncMessenger> messenger;
        if (config_.syncEnabled) {
            messenger = std::make_shared<SyncMessenger>(config_, peers_, keyStore_, capabilities, entropy,
                                                        std::make_shared<ScriptedTransport>());
        }
        handler_ = std::make_shared<ProtocolHandler>(config_, keyStore_, entropy, capabilities, peers_, messenger);
    }

    Json::Value newKey(int expectedStatus = 200) {
        auto response = handler_->handle(makeRequest("GET", "/key", {{"remoteSystemID", kClient}}));
        EXPECT_EQ(response.status, expectedStatus) << response.body;
        return parseBody(response.body);
    }

    KeyProviderConfig config_;
    std::shared_ptr<FailingRandomSource> randomSource_;
    std::shared_ptr<KeyStore> keyStore_;
    std::shared_ptr<PeerRegistry> peers_;
    std::shared_ptr<ProtocolHandler> handler_;
};

TEST_F(ProtocolHandlerTest, UnknownPathsAndMethods) {
    auto missing = handler_->handle(makeRequest("GET", "/keys"));
    EXPECT_EQ(missing.status, 404);
    EXPECT_EQ(parseBody(missing.body)["error"].asString(), "Endpoint not found");

    EXPECT_EQ(handler_->handle(makeRequest("GET", "/key/abc/extra")).status, 404);
    EXPECT_EQ(handler_->handle(makeRequest("POST", "/key")).status, 405);
    EXPECT_EQ(handler_->handle(makeRequest("DELETE", "/capabilities")).status, 405);
    EXPECT_EQ(handler_->handle(makeRequest("GET", "/sync")).status, 405);
}

TEST_F(ProtocolHandlerTest, ServesCapabilities) {
    auto response = handler_->handle(makeRequest("GET", "/capabilities"));
    ASSERT_EQ(response.status, 200);
    EXPECT_FALSE(response.sensitive);

    auto body = parseBody(response.body);
    EXPECT_TRUE(body["entropy"].asBool());
    EXPECT_TRUE(body["key"].asBool());
    EXPECT_EQ(body["localSystemID"].asString(), "KP_QuIIN_Server");
    EXPECT_EQ(body["remoteSystemID"][0].asString(), "KP_*");
}

TEST_F(ProtocolHandlerTest, NewKeyResponse) {
    auto response = handler_->handle(makeRequest("GET", "/key", {{"remoteSystemID", kClient}, {"size", "128"}}));
    ASSERT_EQ(response.status, 200);
    EXPECT_TRUE(response.sensitive);

    auto body = parseBody(response.body);
    EXPECT_EQ(body["keyId"].asString().size(), 32u);
    EXPECT_EQ(body["key"].asString().size(), 32u);
    EXPECT_TRUE(Crypto::isHex(body["key"].asString()));

    auto defaulted = newKey();
    EXPECT_EQ(defaulted["key"].asString().size(), 64u);
}

TEST_F(ProtocolHandlerTest, NewKeyValidation) {
    auto noCaller = handler_->handle(makeRequest("GET", "/key"));
    EXPECT_EQ(noCaller.status, 400);
    EXPECT_EQ(parseBody(noCaller.body)["error"].asString(), "remoteSystemID is required");

    auto notNumber = handler_->handle(makeRequest("GET", "/key", {{"remoteSystemID", kClient}, {"size", "big"}}));
    EXPECT_EQ(notNumber.status, 400);

    auto tooSmall = handler_->handle(makeRequest("GET", "/key", {{"remoteSystemID", kClient}, {"size", "100"}}));
    EXPECT_EQ(tooSmall.status, 400);
    EXPECT_NE(parseBody(tooSmall.body)["error"].asString().find("Invalid key size"), std::string::npos);

    auto stranger = handler_->handle(makeRequest("GET", "/key", {{"remoteSystemID", "Rogue_System"}}));
    EXPECT_EQ(stranger.status, 400);
    EXPECT_EQ(parseBody(stranger.body)["error"].asString(), "Invalid remoteSystemID");
}

TEST_F(ProtocolHandlerTest, KeyCanBeRetrievedOnlyOnce) {
    auto created = newKey();
    std::string keyId = created["keyId"].asString();

    auto first = handler_->handle(makeRequest("GET", "/key/" + keyId, {{"remoteSystemID", kClient}}));
    ASSERT_EQ(first.status, 200);
    EXPECT_TRUE(first.sensitive);
    auto body = parseBody(first.body);
    EXPECT_EQ(body["keyId"].asString(), keyId);
    EXPECT_EQ(body["key"].asString(), created["key"].asString());

    auto second = handler_->handle(makeRequest("GET", "/key/" + keyId, {{"remoteSystemID", kClient}}));
    EXPECT_EQ(second.status, 400);
    EXPECT_EQ(parseBody(second.body)["error"].asString(), "Key not found");
}

TEST_F(ProtocolHandlerTest, RetrievalEchoesLowercaseId) {
    auto created = newKey();
    std::string upper = created["keyId"].asString();
    for (auto& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    auto response = handler_->handle(makeRequest("GET", "/key/" + upper, {{"remoteSystemID", kClient}}));
    ASSERT_EQ(response.status, 200);
    EXPECT_EQ(parseBody(response.body)["keyId"].asString(), created["keyId"].asString());
}

TEST_F(ProtocolHandlerTest, RetrievalValidation) {
    auto created = newKey();
    std::string keyId = created["keyId"].asString();

    auto malformed = handler_->handle(makeRequest("GET", "/key/xyz", {{"remoteSystemID", kClient}}));
    EXPECT_EQ(malformed.status, 400);

    auto noCaller = handler_->handle(makeRequest("GET", "/key/" + keyId));
    EXPECT_EQ(noCaller.status, 400);

    auto stranger = handler_->handle(makeRequest("GET", "/key/" + keyId, {{"remoteSystemID", "Rogue_System"}}));
    EXPECT_EQ(stranger.status, 400);
    EXPECT_EQ(parseBody(stranger.body)["error"].asString(), "Invalid remoteSystemID");

    auto unknown = handler_->handle(makeRequest("GET", "/key/0123456789abcdef0123456789abcdef",
                                                {{"remoteSystemID", kClient}}));
    EXPECT_EQ(unknown.status, 400);
    EXPECT_EQ(parseBody(unknown.body)["error"].asString(), "Key not found");

    // None of the refused attempts consumed the key
    auto owner = handler_->handle(makeRequest("GET", "/key/" + keyId, {{"remoteSystemID", kClient}}));
    EXPECT_EQ(owner.status, 200);
}

TEST_F(ProtocolHandlerTest, EntropyResponse) {
    auto response = handler_->handle(makeRequest("GET", "/entropy"));
    ASSERT_EQ(response.status, 200);
    auto body = parseBody(response.body);
    EXPECT_EQ(body["minentropy"].asInt(), 256);
    std::string random = body["randomStr"].asString();
    EXPECT_EQ(random.size(), 64u);
    for (char c : random) {
        EXPECT_FALSE(std::islower(static_cast<unsigned char>(c)));
    }

    auto small = handler_->handle(makeRequest("GET", "/entropy", {{"minentropy", "8"}}));
    ASSERT_EQ(small.status, 200);
    EXPECT_EQ(parseBody(small.body)["randomStr"].asString().size(), 2u);

    auto large = handler_->handle(makeRequest("GET", "/entropy", {{"minentropy", "2048"}}));
    ASSERT_EQ(large.status, 200);
    EXPECT_EQ(parseBody(large.body)["randomStr"].asString().size(), 512u);
}

TEST_F(ProtocolHandlerTest, EntropyRoundsUpToWholeBytes) {
    auto response = handler_->handle(makeRequest("GET", "/entropy", {{"minentropy", "12"}}));
    ASSERT_EQ(response.status, 200) << response.body;
    auto body = parseBody(response.body);
    EXPECT_EQ(body["minentropy"].asInt(), 12);
    EXPECT_EQ(body["randomStr"].asString().size(), 4u);

    auto odd = handler_->handle(makeRequest("GET", "/entropy", {{"minentropy", "1025"}}));
    ASSERT_EQ(odd.status, 200);
    EXPECT_EQ(parseBody(odd.body)["randomStr"].asString().size(), 258u);
}

TEST_F(ProtocolHandlerTest, EntropyValidation) {
    for (const char* bad : {"4", "4096", "lots", "-8", ""}) {
        auto response = handler_->handle(makeRequest("GET", "/entropy", {{"minentropy", bad}}));
        EXPECT_EQ(response.status, 400) << "minentropy=" << bad;
    }
}

TEST_F(ProtocolHandlerTest, DeadRandomSourceIsServiceUnavailable) {
    randomSource_->failing = true;

    auto key = handler_->handle(makeRequest("GET", "/key", {{"remoteSystemID", kClient}}));
    EXPECT_EQ(key.status, 503);
    EXPECT_EQ(parseBody(key.body)["error"].asString(), "Hardware random number generator not available");

    auto entropy = handler_->handle(makeRequest("GET", "/entropy"));
    EXPECT_EQ(entropy.status, 503);
}

TEST_F(ProtocolHandlerTest, SyncEndpointRejectsGarbage) {
    auto request = makeRequest("POST", "/sync");
    request.body = "{\"not\":\"a sync message\"}";

    auto response = handler_->handle(request);
    EXPECT_EQ(response.status, 400);
    auto body = parseBody(response.body);
    EXPECT_EQ(body["status"].asString(), "error");
    EXPECT_EQ(body["message"].asString(), "rejected");
}

TEST_F(ProtocolHandlerTest, SyncEndpointAcceptsSignedHeartbeat) {
    SyncMessage message;
    message.messageId = "00000000000000000000000000000001";
    message.senderId = kPeer;
    message.receiverId = "KP_QuIIN_Server";
    message.type = SyncMessageType::Heartbeat;
    message.timestamp = SyncMessenger::nowMillis();
    message.payload = "{\"status\":\"online\"}";
    SyncMessenger::sign(message, skp::SecureBuffer::fromString(pairSecret("KP_QuIIN_Server", kPeer)));

    auto request = makeRequest("POST", "/sync");
    request.body = message.serialize();

    auto response = handler_->handle(request);
    ASSERT_EQ(response.status, 200) << response.body;
    auto body = parseBody(response.body);
    EXPECT_EQ(body["status"].asString(), "ok");
    EXPECT_EQ(body["message"].asString(), "Heartbeat acknowledged");
}

TEST_F(ProtocolHandlerTest, SyncDisabledRejectsEverything) {
    config_.syncEnabled = false;
    build();

    auto request = makeRequest("POST", "/sync");
    request.body = "{}";
    EXPECT_EQ(handler_->handle(request).status, 400);

    auto status = parseBody(handler_->handle(makeRequest("GET", "/status/sync")).body);
    EXPECT_FALSE(status["sync_enabled"].asBool());
}

TEST_F(ProtocolHandlerTest, SyncStatusListsPeers) {
    auto response = handler_->handle(makeRequest("GET", "/status/sync"));
    ASSERT_EQ(response.status, 200);

    auto body = parseBody(response.body);
    EXPECT_TRUE(body["sync_enabled"].asBool());
    EXPECT_EQ(body["local_system_id"].asString(), "KP_QuIIN_Server");
    EXPECT_EQ(body["peer_count"].asUInt(), 1u);
    EXPECT_EQ(body["online_count"].asUInt(), 0u);

    const Json::Value& peer = body["peers"][kPeer];
    ASSERT_TRUE(peer.isObject());
    EXPECT_EQ(peer["endpoint"].asString(), "127.0.0.1:9");
    EXPECT_EQ(peer["status"].asString(), "unknown");
    EXPECT_TRUE(peer["last_heartbeat"].isNull());
    EXPECT_TRUE(peer["stale"].asBool());
    // Never exposes the shared secret
    EXPECT_EQ(response.body.find(pairSecret("KP_QuIIN_Server", kPeer)), std::string::npos);

    peers_->recordHeartbeatReceived(kPeer);
    body = parseBody(handler_->handle(makeRequest("GET", "/status/sync")).body);
    EXPECT_EQ(body["peers"][kPeer]["status"].asString(), "online");
    EXPECT_TRUE(body["peers"][kPeer]["last_heartbeat"].isIntegral());
    EXPECT_FALSE(body["peers"][kPeer]["stale"].asBool());
    EXPECT_EQ(body["online_count"].asUInt(), 1u);
}

TEST_F(ProtocolHandlerTest, HealthReportsStoreAndCounters) {
    newKey();
    newKey();

    auto response = handler_->handle(makeRequest("GET", "/status/health"));
    ASSERT_EQ(response.status, 200);

    auto body = parseBody(response.body);
    EXPECT_EQ(body["status"].asString(), "ok");
    EXPECT_EQ(body["database"].asString(), "connected");
    EXPECT_EQ(body["localSystemID"].asString(), "KP_QuIIN_Server");
    EXPECT_FALSE(body["version"].asString().empty());
    EXPECT_EQ(body["keys"]["live"].asUInt(), 2u);
    EXPECT_EQ(body["keys"]["consumed"].asUInt(), 0u);
    EXPECT_GE(body["metrics"]["keys_generated"].asUInt64(), 2u);
}

TEST_F(ProtocolHandlerTest, StatusMapping) {
    EXPECT_EQ(ProtocolHandler::statusFor(skp::ErrorCode::InvalidSize), 400);
    EXPECT_EQ(ProtocolHandler::statusFor(skp::ErrorCode::Unauthorized), 400);
    EXPECT_EQ(ProtocolHandler::statusFor(skp::ErrorCode::ReplayRejected), 400);
    EXPECT_EQ(ProtocolHandler::statusFor(skp::ErrorCode::RngUnavailable), 503);
    EXPECT_EQ(ProtocolHandler::statusFor(skp::ErrorCode::StorageUnavailable), 503);
    EXPECT_EQ(ProtocolHandler::statusFor(skp::ErrorCode::CapacityExceeded), 503);
    EXPECT_EQ(ProtocolHandler::statusFor(skp::ErrorCode::InternalError), 500);
}
