#include <gtest/gtest.h>
#include "realmauth/realmauth.hpp"
#include "test_support.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

// ============================================================================
// Test Fixture with Temporary Directory
// ============================================================================

class E2ETest : public ::testing::Test {
protected:
    fs::path temp_dir;

    void SetUp() override {
        temp_dir = fs::temp_directory_path() /
                   ("realmauth-e2e-test-" +
                    std::to_string(std::chrono::system_clock::now().time_since_epoch().count()));
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    std::string readFile(const fs::path& path) {
        std::ifstream file(path);
        if (!file) {
            throw std::runtime_error("Failed to read file: " + path.string());
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }
};

// ============================================================================
// Realm provisioning workflow
// ============================================================================

TEST_F(E2ETest, RealmKeypairToVerifiedTokens) {
    // Provision the realm keypair on disk
    auto files = realmauth::generateRealmKeypair("myrealm", temp_dir);
    ASSERT_TRUE(fs::exists(temp_dir / "myrealm_private.pem"));
    ASSERT_TRUE(fs::exists(temp_dir / "myrealm_public.pem"));

    std::string private_pem = readFile(files.privateKey);
    std::string public_pem = readFile(files.publicKey);

    // Every API family can be addressed with the realm key
    for (auto type : realmauth::ALL_TOKEN_TYPES) {
        auto token = realmauth::mintToken(realmauth::tokenTypeName(type), private_pem);
        EXPECT_TRUE(test_support::verifyToken(token, public_pem))
            << realmauth::tokenTypeName(type);

        auto payload = test_support::decodePayload(token);
        EXPECT_TRUE(payload.contains(std::string(realmauth::claimKey(type))));
    }

    // Pairing operations authenticate with the short lived token
    auto pairing = realmauth::mintPairingToken("myrealm", files.privateKey);
    EXPECT_TRUE(test_support::verifyToken(pairing, public_pem));
    auto payload = test_support::decodePayload(pairing);
    EXPECT_EQ(payload["exp"].get<std::int64_t>() - payload["iat"].get<std::int64_t>(), 300);
}

TEST_F(E2ETest, RegeneratingRealmReplacesBothHalves) {
    auto first = realmauth::generateRealmKeypair("rotate", temp_dir);
    std::string old_private = readFile(first.privateKey);
    std::string old_public = readFile(first.publicKey);

    auto second = realmauth::generateRealmKeypair("rotate", temp_dir);
    EXPECT_NE(readFile(second.privateKey), old_private);
    EXPECT_NE(readFile(second.publicKey), old_public);

    // Tokens from the new key do not verify with the old public key
    auto token = realmauth::mintToken("realm-management", readFile(second.privateKey));
    EXPECT_FALSE(test_support::verifyToken(token, old_public));
    EXPECT_TRUE(test_support::verifyToken(token, readFile(second.publicKey)));
}

TEST_F(E2ETest, ScopedNeverExpiringToken) {
    auto files = realmauth::generateRealmKeypair("scoped", temp_dir);
    std::vector<std::string> patterns = {"GET::devices/.*", "POST::interfaces"};

    auto token = realmauth::mintToken("appengine", readFile(files.privateKey), patterns, 0);
    ASSERT_TRUE(test_support::verifyToken(token, readFile(files.publicKey)));

    auto payload = test_support::decodePayload(token);
    EXPECT_EQ(payload["a_aea"], nlohmann::json(patterns));
    EXPECT_FALSE(payload.contains("exp"));
}

TEST_F(E2ETest, InvalidTypeLeavesNoTrace) {
    auto before = std::distance(fs::directory_iterator(temp_dir), fs::directory_iterator{});
    EXPECT_THROW((void)realmauth::mintToken("bogus", ""), realmauth::InvalidTokenType);
    auto after = std::distance(fs::directory_iterator(temp_dir), fs::directory_iterator{});
    EXPECT_EQ(before, after);
}

TEST_F(E2ETest, DeviceIdsForRegistration) {
    std::set<std::string> ids;
    for (int i = 0; i < 100; ++i) {
        auto id = realmauth::generateDeviceId();
        EXPECT_EQ(realmauth::internal::base64url_decode(id).size(), 16u);
        ids.insert(id);
    }
    EXPECT_EQ(ids.size(), 100u);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
