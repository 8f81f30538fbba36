#include <gtest/gtest.h>
#include "vault/vault.hpp"
#include <atomic>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace vault;

class VaultTest : public ::testing::Test {
protected:
    Vault<std::string> vault;
};


TEST_F(VaultTest, AddHasItem) {
    VaultKey key = vault.add("stuff");
    EXPECT_TRUE(vault.has_item(key));
    EXPECT_EQ(vault.size(), 1);
}

TEST_F(VaultTest, HasItemWrongKey) {
    vault.add("garbage");
    EXPECT_FALSE(vault.has_item(VaultKey::generate()));
    EXPECT_FALSE(vault.has_item(VaultKey::zero()));
}

TEST_F(VaultTest, AddDuplicatesGetUniqueKeys) {
    VaultKey first = vault.add("same");
    VaultKey second = vault.add("same");
    EXPECT_NE(first, second);
    EXPECT_EQ(vault.size(), 2);
}

TEST_F(VaultTest, AddWithKeyHasItem) {
    VaultKey key = VaultKey::generate();
    EXPECT_TRUE(vault.add_with_key("value", key));
    EXPECT_TRUE(vault.has_item(key));
}

TEST_F(VaultTest, AddWithKeyDuplicateKeepsOriginal) {
    VaultKey key = VaultKey::generate();
    EXPECT_TRUE(vault.add_with_key("first", key));
    EXPECT_FALSE(vault.add_with_key("second", key));
    EXPECT_EQ(vault.remove(key), "first");
}

TEST_F(VaultTest, AddWithZeroKey) {
    EXPECT_TRUE(vault.add_with_key("sentinel", VaultKey::zero()));
    EXPECT_TRUE(vault.has_item(VaultKey::zero()));
}

TEST_F(VaultTest, AddRemove) {
    VaultKey key = vault.add("value");
    auto removed = vault.remove(key);
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(*removed, "value");
}

TEST_F(VaultTest, RemoveBeforeAdd) {
    EXPECT_EQ(vault.remove(VaultKey::generate()), std::nullopt);
}

TEST_F(VaultTest, RemoveTwice) {
    VaultKey key = vault.add("value");
    EXPECT_TRUE(vault.remove(key).has_value());
    EXPECT_FALSE(vault.remove(key).has_value());
}

TEST_F(VaultTest, RemoveDropsItem) {
    VaultKey key = vault.add("an item");
    vault.remove(key);
    EXPECT_FALSE(vault.has_item(key));
    EXPECT_TRUE(vault.empty());
}

TEST_F(VaultTest, ClearDropsItems) {
    VaultKey key = vault.add("thing");
    VaultKey other = vault.add("other thing");
    vault.clear();
    EXPECT_FALSE(vault.has_item(key));
    EXPECT_FALSE(vault.has_item(other));
    EXPECT_TRUE(vault.empty());
}

TEST_F(VaultTest, UpdateWithTransform) {
    VaultKey key = vault.add("old");
    EXPECT_TRUE(vault.update_item(key, [](std::string&&) { return std::string{"new"}; }));
    EXPECT_EQ(vault.remove(key), "new");
}

TEST_F(VaultTest, UpdateWithMutator) {
    VaultKey key = vault.add("abc");
    EXPECT_TRUE(vault.update_item(key, [](std::string& value) { value += "def"; }));
    EXPECT_EQ(vault.remove(key), "abcdef");
}

TEST_F(VaultTest, UpdateMissingKey) {
    VaultKey kept = vault.add("kept");
    bool called = false;
    EXPECT_FALSE(vault.update_item(VaultKey::generate(), [&](std::string& value) {
        called = true;
        value.clear();
    }));
    EXPECT_FALSE(called);
    EXPECT_EQ(vault.size(), 1);
    EXPECT_EQ(vault.remove(kept), "kept");
}

TEST_F(VaultTest, HandlesLargeValues) {
    std::string big_data(1024 * 1024, 'A'); // 1MB value
    VaultKey key = vault.add(big_data);
    EXPECT_EQ(vault.remove(key), big_data);
}


TEST(VaultNumericTest, UpdateDoublesValue) {
    Vault<int> vault;
    VaultKey key = vault.add(1);
    EXPECT_TRUE(vault.update_item(key, [](int x) { return x * 2; }));
    EXPECT_EQ(vault.remove(key), 2);
}

TEST(VaultNumericTest, UpdateDoublesFloatInPlace) {
    Vault<double> vault;
    VaultKey key = vault.add(1.0);
    EXPECT_TRUE(vault.update_item(key, [](double& x) { x *= 2.0; }));
    EXPECT_EQ(vault.remove(key), 2.0);
}

TEST(VaultNumericTest, UpdateWithLvalueTransformUsesResult) {
    Vault<int> vault;
    VaultKey key = vault.add(1);
    EXPECT_TRUE(vault.update_item(key, [](int& x) { return x * 2; }));
    EXPECT_EQ(vault.remove(key), 2);
}

TEST(VaultNumericTest, UpdateWithConstRefTransform) {
    Vault<int> vault;
    VaultKey key = vault.add(3);
    EXPECT_TRUE(vault.update_item(key, [](const int& x) { return x + 4; }));
    EXPECT_EQ(vault.remove(key), 7);
}

TEST(VaultNumericTest, InitialCapacity) {
    Vault<int> vault{128};
    EXPECT_TRUE(vault.empty());
    vault.add(7);
    EXPECT_EQ(vault.size(), 1);
}

TEST(VaultOwnershipTest, MoveOnlyValues) {
    Vault<std::unique_ptr<int>> vault;
    VaultKey key = vault.add(std::make_unique<int>(41));
    EXPECT_TRUE(vault.update_item(key, [](std::unique_ptr<int>&& ptr) {
        ++*ptr;
        return std::move(ptr);
    }));

    auto removed = vault.remove(key);
    ASSERT_TRUE(removed.has_value());
    ASSERT_TRUE(*removed);
    EXPECT_EQ(**removed, 42);
}

TEST(VaultOwnershipTest, ClearDestroysValues) {
    auto tracker = std::make_shared<int>(0);
    Vault<std::shared_ptr<int>> vault;
    vault.add(tracker);
    vault.add(tracker);
    EXPECT_EQ(tracker.use_count(), 3);

    vault.clear();
    EXPECT_EQ(tracker.use_count(), 1);
}

TEST(VaultOwnershipTest, DestructorDestroysValues) {
    auto tracker = std::make_shared<int>(0);
    {
        Vault<std::shared_ptr<int>> vault;
        vault.add(tracker);
        EXPECT_EQ(tracker.use_count(), 2);
    }
    EXPECT_EQ(tracker.use_count(), 1);
}


// Lock failures

TEST(VaultLockTest, ReentrantCallThrowsAndPoisons) {
    Vault<int> vault;
    VaultKey key = vault.add(1);
    VaultKey other = vault.add(2);

    EXPECT_THROW(vault.update_item(key, [&](int& value) {
        value += vault.has_item(other) ? 1 : 0;
    }), LockError);

    EXPECT_TRUE(vault.poisoned());
    EXPECT_THROW(vault.has_item(other), PoisonedError);
}

TEST(VaultLockTest, ThrowingTransformPoisons) {
    Vault<int> vault;
    VaultKey key = vault.add(1);

    EXPECT_THROW(vault.update_item(key, [](int) -> int {
        throw std::runtime_error{"transform failed"};
    }), std::runtime_error);

    EXPECT_TRUE(vault.poisoned());
    EXPECT_THROW(vault.add(3), PoisonedError);
    EXPECT_THROW(vault.remove(key), PoisonedError);
    EXPECT_THROW(vault.clear(), PoisonedError);
    EXPECT_THROW(vault.size(), PoisonedError);
}

TEST(VaultLockTest, PoisonedErrorIsLockError) {
    Vault<int> vault;
    VaultKey key = vault.add(1);
    EXPECT_ANY_THROW(vault.update_item(key, [](int&) { throw std::logic_error{"boom"}; }));
    EXPECT_THROW(vault.has_item(key), LockError);
}

TEST(VaultLockTest, HealthyVaultIsNotPoisoned) {
    Vault<int> vault;
    VaultKey key = vault.add(1);
    vault.update_item(key, [](int x) { return x + 1; });
    vault.remove(key);
    EXPECT_FALSE(vault.poisoned());
}


// Concurrency

TEST(VaultConcurrencyTest, ConcurrentAdds) {
    const int num_threads = 10;
    const int ops_per_thread = 100;
    Vault<int> vault;
    std::vector<std::vector<VaultKey>> keys(num_threads);
    std::vector<std::thread> threads;
    threads.reserve(num_threads);

    for (int i = 0; i < num_threads; i++) {
        threads.emplace_back([&vault, &keys, i]() {
            for (int j = 0; j < ops_per_thread; j++) {
                VaultKey key = vault.add(i * ops_per_thread + j);
                EXPECT_TRUE(vault.has_item(key));
                keys[i].push_back(key);
            }
        });
    }
    for (auto& t : threads)
        t.join();

    EXPECT_EQ(vault.size(), num_threads * ops_per_thread);

    std::set<std::string> distinct;
    for (const auto& per_thread : keys)
        for (const auto& key : per_thread)
            distinct.insert(key.to_string());
    EXPECT_EQ(distinct.size(), num_threads * ops_per_thread);
}

TEST(VaultConcurrencyTest, ConcurrentUpdatesAreNotLost) {
    const int num_threads = 8;
    const int ops_per_thread = 500;
    Vault<int> vault;
    VaultKey counter = vault.add(0);
    std::vector<std::thread> threads;
    threads.reserve(num_threads);

    for (int i = 0; i < num_threads; i++) {
        threads.emplace_back([&vault, counter]() {
            for (int j = 0; j < ops_per_thread; j++) {
                EXPECT_TRUE(vault.update_item(counter, [](int& value) { ++value; }));
            }
        });
    }
    for (auto& t : threads)
        t.join();

    EXPECT_EQ(vault.remove(counter), num_threads * ops_per_thread);
}

TEST(VaultConcurrencyTest, UpdateNeverObservedAbsent) {
    Vault<int> vault;
    VaultKey key = vault.add(0);
    std::atomic<bool> done{false};
    std::atomic<int> misses{0};

    std::thread reader([&]() {
        while (!done) {
            if (!vault.has_item(key))
                ++misses;
        }
    });

    for (int i = 0; i < 2000; i++)
        vault.update_item(key, [](int x) { return x + 1; });
    done = true;
    reader.join();

    EXPECT_EQ(misses.load(), 0);
    EXPECT_EQ(vault.remove(key), 2000);
}

TEST(VaultConcurrencyTest, ConcurrentAddWithSameKeyInsertsOnce) {
    const int num_threads = 8;
    Vault<int> vault;
    VaultKey key = VaultKey::generate();
    std::atomic<int> wins{0};
    std::vector<std::thread> threads;
    threads.reserve(num_threads);

    for (int i = 0; i < num_threads; i++) {
        threads.emplace_back([&, i]() {
            if (vault.add_with_key(i, key))
                ++wins;
        });
    }
    for (auto& t : threads)
        t.join();

    EXPECT_EQ(wins.load(), 1);
    EXPECT_EQ(vault.size(), 1);
}
