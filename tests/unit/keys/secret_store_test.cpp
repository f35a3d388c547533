#include <gtest/gtest.h>

#include "keyring/keys/secret_store.hpp"

#include <string>
#include <thread>
#include <vector>

using namespace keyring::keys;

TEST(SecretKeysTest, EntryNames) {
    EXPECT_EQ(secret_keys::entry("kid-1", secret_keys::kPrivatePem),
              "keyring/keys/kid-1/private_pem");
    EXPECT_EQ(secret_keys::entry("kid-1", secret_keys::kActivatedAt),
              "keyring/keys/kid-1/activated_at");
}

class InMemorySecretStoreTest : public ::testing::Test {
protected:
    InMemorySecretStore store_;
};

TEST_F(InMemorySecretStoreTest, GetMissingReturnsNullopt) {
    EXPECT_FALSE(store_.get("missing").has_value());
}

TEST_F(InMemorySecretStoreTest, PutAndGet) {
    EXPECT_TRUE(store_.put("a", "1"));
    auto value = store_.get("a");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "1");
    EXPECT_EQ(store_.size(), 1u);
}

TEST_F(InMemorySecretStoreTest, PutOverwrites) {
    EXPECT_TRUE(store_.put("a", "1"));
    EXPECT_TRUE(store_.put("a", "2"));
    EXPECT_EQ(store_.get("a").value_or(""), "2");
    EXPECT_EQ(store_.size(), 1u);
}

TEST_F(InMemorySecretStoreTest, Remove) {
    EXPECT_TRUE(store_.put("a", "1"));
    EXPECT_TRUE(store_.remove("a"));
    EXPECT_FALSE(store_.remove("a"));
    EXPECT_FALSE(store_.get("a").has_value());
    EXPECT_EQ(store_.size(), 0u);
}

TEST_F(InMemorySecretStoreTest, ConcurrentWriters) {
    constexpr int kThreads = 4;
    constexpr int kPerThread = 100;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([this, t]() {
            for (int i = 0; i < kPerThread; ++i) {
                store_.put("t" + std::to_string(t) + "/" + std::to_string(i), "v");
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    EXPECT_EQ(store_.size(), static_cast<std::size_t>(kThreads * kPerThread));
}
