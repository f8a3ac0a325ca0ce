#include <gtest/gtest.h>
#include "handoff/security/room_registry.hpp"
#include "handoff/crypto/hash.hpp"
#include "handoff/crypto/random.hpp"
#include <set>

using namespace handoff::security;
using namespace handoff::core;

class RoomRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(handoff::crypto::SecureRandom::initialize());
        registry = std::make_unique<RoomRegistry>(clock, limits);
    }
    
    ManualClock clock;
    SecurityLimits limits;
    std::unique_ptr<RoomRegistry> registry;
};

TEST_F(RoomRegistryTest, GeneratedCodesUseAlphabetOnly) {
    for (int i = 0; i < 500; ++i) {
        auto code = generate_room_code();
        ASSERT_EQ(code.size(), 8u);
        for (char c : code) {
            EXPECT_NE(ROOM_CODE_ALPHABET.find(c), std::string_view::npos) << code;
        }
        EXPECT_EQ(code.find_first_of("01OI"), std::string::npos);
    }
}

TEST_F(RoomRegistryTest, FormattingAndNormalization) {
    EXPECT_EQ(format_room_code("AB3DEF7H"), "AB3D-EF7H");
    EXPECT_EQ(format_room_code("ab3d-ef7h"), "AB3D-EF7H");
    EXPECT_EQ(format_room_code("ABC"), "ABC");
    EXPECT_EQ(normalize_room_code("ab3d-ef7h"), "AB3DEF7H");
    
    EXPECT_TRUE(is_valid_room_code_format("AB3D-EF7H"));
    EXPECT_TRUE(is_valid_room_code_format("ab3def7h"));
    EXPECT_FALSE(is_valid_room_code_format("AB3D-EF7"));
    EXPECT_FALSE(is_valid_room_code_format("AB0D-EF7H"));
    EXPECT_FALSE(is_valid_room_code_format("ABID-EF7H"));
}

TEST_F(RoomRegistryTest, PinFormat) {
    EXPECT_TRUE(is_valid_pin_format("0042"));
    EXPECT_FALSE(is_valid_pin_format("042"));
    EXPECT_FALSE(is_valid_pin_format("12a4"));
    EXPECT_FALSE(is_valid_pin_format("12345"));
    EXPECT_TRUE(is_valid_pin_format("123456", 6));
}

TEST_F(RoomRegistryTest, IssuedSessionExpiresAfterOneHour) {
    auto session = registry->issue();
    
    EXPECT_EQ(session.expires_at - session.created_at, std::chrono::hours(1));
    EXPECT_TRUE(registry->is_valid(session.room_code));
    EXPECT_TRUE(registry->is_valid(format_room_code(session.room_code)));
    
    clock.advance(std::chrono::minutes(59));
    EXPECT_TRUE(registry->is_valid(session.room_code));
    
    clock.advance(std::chrono::minutes(2));
    EXPECT_FALSE(registry->is_valid(session.room_code));
    EXPECT_EQ(registry->size(), 0u);
}

TEST_F(RoomRegistryTest, IssuedCodesDoNotCollide) {
    std::set<std::string> codes;
    for (int i = 0; i < 200; ++i) {
        codes.insert(registry->issue().room_code);
    }
    EXPECT_EQ(codes.size(), 200u);
    EXPECT_EQ(registry->size(), 200u);
}

TEST_F(RoomRegistryTest, SetPinStoresHash) {
    auto session = registry->issue();
    auto hashed = handoff::crypto::hash_utils::hash_pin(std::string("1234"));
    
    ASSERT_TRUE(registry->set_pin(session.room_code, hashed));
    
    auto stored = registry->get(session.room_code);
    ASSERT_TRUE(stored.has_value());
    ASSERT_TRUE(stored->pin_hash.has_value());
    EXPECT_EQ(*stored->pin_hash, hashed);
}

TEST_F(RoomRegistryTest, SetPinRejectsPlaintextAndUnknownRooms) {
    auto session = registry->issue();
    
    auto plaintext = registry->set_pin(session.room_code, "1234");
    EXPECT_FALSE(plaintext);
    EXPECT_EQ(plaintext.error, handoff::crypto::CryptoError::INVALID_INPUT);
    
    auto unknown = registry->set_pin("ZZZZZZZZ", std::string(64, 'a'));
    EXPECT_EQ(unknown.error, handoff::crypto::CryptoError::INVALID_STATE);
}

TEST_F(RoomRegistryTest, DestroyAndCleanup) {
    auto first = registry->issue();
    clock.advance(std::chrono::minutes(30));
    auto second = registry->issue();
    
    EXPECT_TRUE(registry->destroy(format_room_code(first.room_code)));
    EXPECT_FALSE(registry->destroy(first.room_code));
    
    auto third = registry->issue();
    clock.advance(std::chrono::minutes(45));
    EXPECT_EQ(registry->cleanup_expired(), 1u);
    EXPECT_FALSE(registry->get(second.room_code).has_value());
    EXPECT_TRUE(registry->get(third.room_code).has_value());
}
