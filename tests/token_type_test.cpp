#include <gtest/gtest.h>
#include "realmauth/realmauth.hpp"
#include <set>
#include <string>

using realmauth::TokenType;

TEST(TokenTypeTest, ClaimKeysMatchTaxonomy) {
    EXPECT_EQ(realmauth::claimKey(TokenType::Housekeeping), "a_ha");
    EXPECT_EQ(realmauth::claimKey(TokenType::RealmManagement), "a_rma");
    EXPECT_EQ(realmauth::claimKey(TokenType::Pairing), "a_pa");
    EXPECT_EQ(realmauth::claimKey(TokenType::AppEngine), "a_aea");
    EXPECT_EQ(realmauth::claimKey(TokenType::Channels), "a_ch");
}

TEST(TokenTypeTest, NamesRoundTripThroughParse) {
    for (auto type : realmauth::ALL_TOKEN_TYPES) {
        auto name = realmauth::tokenTypeName(type);
        EXPECT_EQ(realmauth::parseTokenType(name), type) << name;
    }
}

TEST(TokenTypeTest, ParsesCommandLineNames) {
    EXPECT_EQ(realmauth::parseTokenType("housekeeping"), TokenType::Housekeeping);
    EXPECT_EQ(realmauth::parseTokenType("realm-management"), TokenType::RealmManagement);
    EXPECT_EQ(realmauth::parseTokenType("pairing"), TokenType::Pairing);
    EXPECT_EQ(realmauth::parseTokenType("appengine"), TokenType::AppEngine);
    EXPECT_EQ(realmauth::parseTokenType("channels"), TokenType::Channels);
}

TEST(TokenTypeTest, ClaimKeysAreDistinct) {
    std::set<std::string> keys;
    for (auto type : realmauth::ALL_TOKEN_TYPES) {
        keys.insert(std::string(realmauth::claimKey(type)));
    }
    EXPECT_EQ(keys.size(), realmauth::ALL_TOKEN_TYPES.size());
}

TEST(TokenTypeTest, ValidNamesListedInOrder) {
    EXPECT_EQ(realmauth::validTokenTypeNames(),
              "housekeeping, realm-management, pairing, appengine, channels");
}

TEST(TokenTypeTest, UnknownNameThrowsWithValidChoices) {
    try {
        (void)realmauth::parseTokenType("bogus");
        FAIL() << "Expected InvalidTokenType";
    } catch (const realmauth::InvalidTokenType& e) {
        EXPECT_EQ(e.given(), "bogus");
        EXPECT_STREQ(e.what(),
                     "Invalid type. Valid types are: housekeeping, realm-management, pairing, appengine, channels");
    }
}

TEST(TokenTypeTest, InvalidTokenTypeIsInvalidArgument) {
    EXPECT_THROW((void)realmauth::parseTokenType(""), std::invalid_argument);
}

TEST(TokenTypeTest, ParseIsCaseSensitive) {
    EXPECT_THROW((void)realmauth::parseTokenType("Pairing"), realmauth::InvalidTokenType);
    EXPECT_THROW((void)realmauth::parseTokenType("realm_management"), realmauth::InvalidTokenType);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
