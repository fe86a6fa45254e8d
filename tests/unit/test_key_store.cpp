#include "KeyStore.h"
#include "CapabilityRegistry.h"
#include "EntropyProvider.h"
#include "InMemoryKeyPersistence.h"
#include "SQLiteKeyPersistence.h"
#include "TestDoubles.h"

#include <gtest/gtest.h>
#include <atomic>
#include <cctype>
#include <thread>
#include <vector>

using namespace SkipKP;

namespace {

struct MemoryBackend {
    static std::shared_ptr<IKeyPersistence> make() {
        return std::make_shared<InMemoryKeyPersistence>();
    }
};

struct SQLiteBackend {
    static std::shared_ptr<IKeyPersistence> make() {
        auto db = std::make_shared<SQLiteKeyPersistence>(":memory:");
        auto opened = db->open();
        EXPECT_TRUE(opened) << (opened ? "" : opened.error().message);
        return db;
    }
};

const char* kClient = "KP_Client";

} // namespace

template<typename Backend>
class KeyStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = makeTestConfig("KP_Server");
        addPeer(config_, "KP_Peer1", pairSecret("KP_Server", "KP_Peer1"));
        addPeer(config_, "KP_Peer2", pairSecret("KP_Server", "KP_Peer2"));
        rebuild();
    }

    void rebuild() {
        persistence_ = Backend::make();
        randomSource_ = std::make_shared<FailingRandomSource>();
        randomSource_->failing = false;
        entropy_ = std::make_shared<EntropyProvider>(randomSource_);
        store_ = std::make_shared<KeyStore>(config_, persistence_,
                                            std::make_shared<CapabilityRegistry>(config_), entropy_);
    }

    GeneratedKey generate(int bits = 256) {
        auto key = store_->generate(kClient, bits);
        if (!key) {
            ADD_FAILURE() << key.error().message;
            return GeneratedKey();
        }
        return std::move(*key);
    }

    KeyRecord replicated(const std::string& keyId, const std::string& origin) {
        KeyRecord record;
        record.keyId = keyId;
        record.remoteSystemId = kClient;
        record.originSystemId = origin;
        record.sizeBits = 128;
        record.createdAt = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        record.syncedPeers = {origin};
        record.keyMaterial = skp::SecureBuffer(16);
        record.keyMaterial.data()[0] = 0x42;
        return record;
    }

    KeyProviderConfig config_;
    std::shared_ptr<IKeyPersistence> persistence_;
    std::shared_ptr<FailingRandomSource> randomSource_;
    std::shared_ptr<EntropyProvider> entropy_;
    std::shared_ptr<KeyStore> store_;
};

using Backends = ::testing::Types<MemoryBackend, SQLiteBackend>;
TYPED_TEST_SUITE(KeyStoreTest, Backends);

TYPED_TEST(KeyStoreTest, GeneratedKeyIsRetrievedExactlyOnce) {
    auto key = this->generate(256);
    EXPECT_EQ(key.keyId.size(), 32u);
    EXPECT_TRUE(KeyStore::isWellFormedKeyId(key.keyId));
    EXPECT_EQ(key.keyMaterial.size(), 32u);

    auto first = this->store_->retrieve(key.keyId, kClient);
    ASSERT_TRUE(first);
    EXPECT_TRUE(*first == key.keyMaterial);

    auto second = this->store_->retrieve(key.keyId, kClient);
    EXPECT_EQ(second.code(), skp::ErrorCode::AlreadyConsumed);

    auto counts = this->store_->counts();
    ASSERT_TRUE(counts);
    EXPECT_EQ(counts->live, 0u);
    EXPECT_EQ(counts->consumed, 1u);
}

TYPED_TEST(KeyStoreTest, RejectsSizesOutsideBounds) {
    EXPECT_EQ(this->store_->generate(kClient, 100).code(), skp::ErrorCode::InvalidSize);
    EXPECT_EQ(this->store_->generate(kClient, 1024).code(), skp::ErrorCode::InvalidSize);
    EXPECT_EQ(this->store_->generate(kClient, 130).code(), skp::ErrorCode::InvalidSize);
    EXPECT_TRUE(this->store_->generate(kClient, 128));
    EXPECT_TRUE(this->store_->generate(kClient, 512));
}

TYPED_TEST(KeyStoreTest, RefusesUnauthorizedRequester) {
    EXPECT_EQ(this->store_->generate("Rogue_System", 256).code(), skp::ErrorCode::Unauthorized);
    EXPECT_EQ(this->store_->generate("", 256).code(), skp::ErrorCode::Unauthorized);

    auto counts = this->store_->counts();
    ASSERT_TRUE(counts);
    EXPECT_EQ(counts->live, 0u);
}

TYPED_TEST(KeyStoreTest, UnauthorizedRetrievalLeavesKeyLive) {
    auto key = this->generate();

    EXPECT_EQ(this->store_->retrieve(key.keyId, "Rogue_System").code(), skp::ErrorCode::Unauthorized);
    // Authorized pattern, but the key was issued to someone else
    EXPECT_EQ(this->store_->retrieve(key.keyId, "KP_Other").code(), skp::ErrorCode::Unauthorized);

    auto live = this->store_->isLive(key.keyId);
    ASSERT_TRUE(live);
    EXPECT_TRUE(*live);
    EXPECT_TRUE(this->store_->retrieve(key.keyId, kClient));
}

TYPED_TEST(KeyStoreTest, OriginMayRetrieve) {
    auto key = this->generate();
    EXPECT_TRUE(this->store_->retrieve(key.keyId, "KP_Server"));
}

TYPED_TEST(KeyStoreTest, AcceptsUppercaseKeyId) {
    auto key = this->generate();
    std::string upper = key.keyId;
    for (auto& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    auto material = this->store_->retrieve(upper, kClient);
    ASSERT_TRUE(material);
    EXPECT_TRUE(*material == key.keyMaterial);
}

TYPED_TEST(KeyStoreTest, UnknownAndMalformedIdsAreNotFound) {
    EXPECT_EQ(this->store_->retrieve("0123456789abcdef0123456789abcdef", kClient).code(), skp::ErrorCode::NotFound);
    EXPECT_EQ(this->store_->retrieve("not-a-key", kClient).code(), skp::ErrorCode::NotFound);
    EXPECT_EQ(this->store_->retrieve("0123456789abcdef0123456789abcdeg", kClient).code(), skp::ErrorCode::NotFound);
}

TYPED_TEST(KeyStoreTest, ConcurrentRetrievalHasOneWinner) {
    auto key = this->generate();

    std::atomic<int> winners{0};
    std::atomic<int> losers{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            auto result = this->store_->retrieve(key.keyId, kClient);
            if (result) {
                ++winners;
            } else if (result.code() == skp::ErrorCode::AlreadyConsumed) {
                ++losers;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(winners.load(), 1);
    EXPECT_EQ(losers.load(), 7);
}

TYPED_TEST(KeyStoreTest, EnforcesCapacityOnLiveKeys) {
    this->config_.maxStoredKeys = 2;
    this->rebuild();

    auto first = this->generate();
    this->generate();
    EXPECT_EQ(this->store_->generate(kClient, 256).code(), skp::ErrorCode::CapacityExceeded);

    ASSERT_TRUE(this->store_->retrieve(first.keyId, kClient));
    EXPECT_TRUE(this->store_->generate(kClient, 256));
}

TYPED_TEST(KeyStoreTest, DeadRandomSourceStoresNothing) {
    this->randomSource_->failing = true;
    EXPECT_EQ(this->store_->generate(kClient, 256).code(), skp::ErrorCode::RngUnavailable);

    auto counts = this->store_->counts();
    ASSERT_TRUE(counts);
    EXPECT_EQ(counts->live + counts->consumed, 0u);
}

TYPED_TEST(KeyStoreTest, SweepRemovesExpiredRecords) {
    auto live = this->generate();
    auto consumed = this->generate();
    ASSERT_TRUE(this->store_->retrieve(consumed.keyId, kClient));

    auto now = std::chrono::system_clock::now();
    auto none = this->store_->sweep(now);
    ASSERT_TRUE(none);
    EXPECT_EQ(*none, 0u);

    auto removed = this->store_->sweep(now + this->config_.keyExpiry + std::chrono::seconds(2));
    ASSERT_TRUE(removed);
    EXPECT_EQ(*removed, 2u);

    EXPECT_EQ(this->store_->retrieve(live.keyId, kClient).code(), skp::ErrorCode::NotFound);
    auto counts = this->store_->counts();
    ASSERT_TRUE(counts);
    EXPECT_EQ(counts->live + counts->consumed, 0u);
}

TYPED_TEST(KeyStoreTest, RetiresLocalKeyOnceEveryPeerHoldsIt) {
    auto key = this->generate();

    auto pending = this->store_->pendingFor("KP_Peer1");
    ASSERT_TRUE(pending);
    ASSERT_EQ(pending->size(), 1u);
    EXPECT_EQ((*pending)[0].keyId, key.keyId);
    EXPECT_TRUE((*pending)[0].keyMaterial == key.keyMaterial);

    ASSERT_TRUE(this->store_->markSynced(key.keyId, "KP_Peer1"));
    EXPECT_TRUE(*this->store_->isLive(key.keyId));

    pending = this->store_->pendingFor("KP_Peer1");
    ASSERT_TRUE(pending);
    EXPECT_TRUE(pending->empty());
    pending = this->store_->pendingFor("KP_Peer2");
    ASSERT_TRUE(pending);
    EXPECT_EQ(pending->size(), 1u);

    ASSERT_TRUE(this->store_->markSynced(key.keyId, "KP_Peer2"));
    EXPECT_FALSE(*this->store_->isLive(key.keyId));
    EXPECT_EQ(this->store_->retrieve(key.keyId, kClient).code(), skp::ErrorCode::AlreadyConsumed);
}

TYPED_TEST(KeyStoreTest, ReplicatedKeyIsKeptForRetrieval) {
    const std::string id = "00112233445566778899aabbccddeeff";
    auto stored = this->store_->insertReplicated(this->replicated(id, "KP_Peer1"));
    ASSERT_TRUE(stored);
    EXPECT_TRUE(*stored);

    // The sender already holds it
    auto pending = this->store_->pendingFor("KP_Peer1");
    ASSERT_TRUE(pending);
    EXPECT_TRUE(pending->empty());

    ASSERT_TRUE(this->store_->markSynced(id, "KP_Peer2"));
    EXPECT_TRUE(*this->store_->isLive(id));

    auto material = this->store_->retrieve(id, kClient);
    ASSERT_TRUE(material);
    EXPECT_EQ(material->size(), 16u);
    EXPECT_EQ(material->data()[0], 0x42);
}

TYPED_TEST(KeyStoreTest, ReplicationNeverRevivesKnownKey) {
    const std::string id = "ffeeddccbbaa99887766554433221100";
    ASSERT_TRUE(*this->store_->insertReplicated(this->replicated(id, "KP_Peer1")));

    auto duplicate = this->store_->insertReplicated(this->replicated(id, "KP_Peer2"));
    ASSERT_TRUE(duplicate);
    EXPECT_FALSE(*duplicate);

    ASSERT_TRUE(this->store_->retrieve(id, kClient));

    auto revived = this->store_->insertReplicated(this->replicated(id, "KP_Peer1"));
    ASSERT_TRUE(revived);
    EXPECT_FALSE(*revived);
    EXPECT_FALSE(*this->store_->isLive(id));
}

TYPED_TEST(KeyStoreTest, RejectsInconsistentReplica) {
    auto wrongLength = this->replicated("0123456789abcdef0123456789abcdef", "KP_Peer1");
    wrongLength.sizeBits = 256;
    EXPECT_EQ(this->store_->insertReplicated(std::move(wrongLength)).code(), skp::ErrorCode::InvalidSize);

    auto foreign = this->replicated("0123456789abcdef0123456789abcdef", "KP_Peer1");
    foreign.remoteSystemId = "Rogue_System";
    EXPECT_EQ(this->store_->insertReplicated(std::move(foreign)).code(), skp::ErrorCode::Unauthorized);

    auto badId = this->replicated("xyz", "KP_Peer1");
    EXPECT_EQ(this->store_->insertReplicated(std::move(badId)).code(), skp::ErrorCode::ValidationError);
}

TYPED_TEST(KeyStoreTest, HealthCheckSucceeds) {
    EXPECT_TRUE(this->store_->healthCheck());
}
