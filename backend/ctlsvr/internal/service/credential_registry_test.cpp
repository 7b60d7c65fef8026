/**
 * @file credential_registry_test.cpp
 * @brief CredentialRegistry 单元测试
 */

#include "credential_registry.h"
#include <keyward/log_helper.h>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

namespace keyward::ctl {

namespace {

/// 确定性生成器：按调用顺序产出 "K000...001" / "S000...001" 这类可预期的值
class SequenceCredentialGenerator : public CredentialGenerator {
public:
    Credential NewCredential() override {
        int n = ++calls_;
        std::string digits = std::to_string(n);
        Credential cred;
        cred.access_key_id = "K" + std::string(kAccessKeyIdLength - 1 - digits.size(), '0') + digits;
        cred.secret_access_key = "S" + std::string(kSecretAccessKeyLength - 1 - digits.size(), '0') + digits;
        return cred;
    }

    int calls() const { return calls_; }

private:
    std::atomic<int> calls_{0};
};

/// 固定值生成器：每次返回同一凭证，用于验证 Reset 的重新生成上限
class ConstantCredentialGenerator : public CredentialGenerator {
public:
    Credential NewCredential() override {
        Credential cred;
        cred.access_key_id = std::string(kAccessKeyIdLength, 'C');
        cred.secret_access_key = std::string(kSecretAccessKeyLength, 'c');
        return cred;
    }
};

/// Put 总是失败的存储
class FailingCredentialStore : public MemoryCredentialStore {
public:
    Status Put(const Credential &) override {
        return Status(ErrorCode::STORAGE_ERROR, "disk full");
    }
};

void ExpectWellFormed(const Credential &cred) {
    EXPECT_EQ(cred.access_key_id.size(), kAccessKeyIdLength);
    EXPECT_EQ(cred.secret_access_key.size(), kSecretAccessKeyLength);
}

}  // namespace

class CredentialRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry_ = std::make_unique<CredentialRegistry>(
            std::make_shared<MemoryCredentialStore>(),
            std::make_shared<RandomCredentialGenerator>());
    }

    std::unique_ptr<CredentialRegistry> registry_;
};

// ============================================================================
// Generate
// ============================================================================

TEST_F(CredentialRegistryTest, Generate_FreshUser) {
    auto result = registry_->Generate("alice");
    ASSERT_TRUE(result.ok()) << result.error().ToString();
    EXPECT_EQ(result->name, "alice");
    ExpectWellFormed(result.value());
    EXPECT_GT(result->created_at, 0);
    EXPECT_EQ(result->created_at, result->updated_at);
    EXPECT_EQ(registry_->Size(), 1u);
}

TEST_F(CredentialRegistryTest, Generate_Twice_AlreadyExists) {
    auto first = registry_->Generate("alice");
    ASSERT_TRUE(first.ok());

    auto second = registry_->Generate("alice");
    ASSERT_FALSE(second.ok());
    EXPECT_EQ(second.error().code, ErrorCode::ALREADY_EXISTS);

    // 原凭证不受影响
    auto fetched = registry_->Fetch("alice");
    ASSERT_TRUE(fetched.ok());
    EXPECT_EQ(fetched->access_key_id, first->access_key_id);
    EXPECT_EQ(fetched->secret_access_key, first->secret_access_key);
}

TEST_F(CredentialRegistryTest, DistinctUsers_DistinctCredentials) {
    auto a = registry_->Generate("alice");
    auto b = registry_->Generate("bob");
    ASSERT_TRUE(a.ok());
    ASSERT_TRUE(b.ok());
    EXPECT_NE(a->access_key_id, b->access_key_id);
    EXPECT_NE(a->secret_access_key, b->secret_access_key);
    EXPECT_EQ(registry_->Size(), 2u);
}

// ============================================================================
// 用户名校验
// ============================================================================

TEST_F(CredentialRegistryTest, EmptyName_InvalidParam) {
    auto g = registry_->Generate("");
    auto f = registry_->Fetch("");
    auto r = registry_->Reset("");
    ASSERT_FALSE(g.ok());
    ASSERT_FALSE(f.ok());
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(g.error().code, ErrorCode::INVALID_PARAM);
    EXPECT_EQ(f.error().code, ErrorCode::INVALID_PARAM);
    EXPECT_EQ(r.error().code, ErrorCode::INVALID_PARAM);
    EXPECT_EQ(registry_->Size(), 0u);
}

TEST_F(CredentialRegistryTest, MalformedName_InvalidParam) {
    EXPECT_EQ(registry_->Generate("bad\nname").error().code, ErrorCode::INVALID_PARAM);
    EXPECT_EQ(registry_->Generate(std::string("nul\0byte", 8)).error().code,
              ErrorCode::INVALID_PARAM);
    EXPECT_EQ(registry_->Generate(std::string(CredentialRegistry::kMaxNameLength + 1, 'a'))
                  .error().code,
              ErrorCode::INVALID_PARAM);
}

TEST(CredentialRegistryNameTest, IsValidName) {
    EXPECT_TRUE(CredentialRegistry::IsValidName("alice"));
    EXPECT_TRUE(CredentialRegistry::IsValidName("ops:team/alice bob"));
    EXPECT_TRUE(CredentialRegistry::IsValidName(std::string(CredentialRegistry::kMaxNameLength, 'a')));
    EXPECT_FALSE(CredentialRegistry::IsValidName(""));
    EXPECT_FALSE(CredentialRegistry::IsValidName("tab\there"));
    EXPECT_FALSE(CredentialRegistry::IsValidName("del\x7f"));
}

// ============================================================================
// Fetch
// ============================================================================

TEST_F(CredentialRegistryTest, Fetch_AfterGenerate_Identical) {
    auto gen = registry_->Generate("alice");
    ASSERT_TRUE(gen.ok());

    for (int i = 0; i < 3; ++i) {
        auto fetched = registry_->Fetch("alice");
        ASSERT_TRUE(fetched.ok());
        EXPECT_EQ(fetched->name, "alice");
        EXPECT_EQ(fetched->access_key_id, gen->access_key_id);
        EXPECT_EQ(fetched->secret_access_key, gen->secret_access_key);
    }
}

TEST_F(CredentialRegistryTest, Fetch_Unknown_NotFound) {
    auto result = registry_->Fetch("ghost");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::NOT_FOUND);
}

// ============================================================================
// Reset
// ============================================================================

TEST_F(CredentialRegistryTest, Reset_ReplacesBothFields) {
    auto gen = registry_->Generate("alice");
    ASSERT_TRUE(gen.ok());

    auto reset = registry_->Reset("alice");
    ASSERT_TRUE(reset.ok());
    ExpectWellFormed(reset.value());
    EXPECT_EQ(reset->name, "alice");
    EXPECT_NE(reset->access_key_id, gen->access_key_id);
    EXPECT_NE(reset->secret_access_key, gen->secret_access_key);
    EXPECT_EQ(reset->created_at, gen->created_at);

    auto fetched = registry_->Fetch("alice");
    ASSERT_TRUE(fetched.ok());
    EXPECT_EQ(fetched->access_key_id, reset->access_key_id);
    EXPECT_EQ(fetched->secret_access_key, reset->secret_access_key);
    EXPECT_EQ(registry_->Size(), 1u);
}

TEST_F(CredentialRegistryTest, Reset_Unknown_NotFound) {
    auto result = registry_->Reset("ghost");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::NOT_FOUND);
    EXPECT_FALSE(registry_->Fetch("ghost").ok());
}

TEST(CredentialRegistryDeterministicTest, SequenceGenerator) {
    auto gen = std::make_shared<SequenceCredentialGenerator>();
    CredentialRegistry registry(std::make_shared<MemoryCredentialStore>(), gen);

    auto first = registry.Generate("alice");
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(first->access_key_id, "K0000000000000000001");
    ExpectWellFormed(first.value());

    auto reset = registry.Reset("alice");
    ASSERT_TRUE(reset.ok());
    EXPECT_EQ(reset->access_key_id, "K0000000000000000002");
    EXPECT_EQ(gen->calls(), 2);

    // 失败路径不消耗生成器
    EXPECT_FALSE(registry.Generate("alice").ok());
    EXPECT_FALSE(registry.Reset("ghost").ok());
    EXPECT_EQ(gen->calls(), 2);
}

TEST(CredentialRegistryDeterministicTest, Reset_GeneratorStuck_EntropyUnavailable) {
    CredentialRegistry registry(std::make_shared<MemoryCredentialStore>(),
                                std::make_shared<ConstantCredentialGenerator>());
    auto gen = registry.Generate("alice");
    ASSERT_TRUE(gen.ok());

    auto reset = registry.Reset("alice");
    ASSERT_FALSE(reset.ok());
    EXPECT_EQ(reset.error().code, ErrorCode::ENTROPY_UNAVAILABLE);

    // 旧凭证仍然有效
    auto fetched = registry.Fetch("alice");
    ASSERT_TRUE(fetched.ok());
    EXPECT_EQ(fetched->access_key_id, gen->access_key_id);
}

TEST(CredentialRegistryDeterministicTest, StoreFailure_Propagates) {
    CredentialRegistry registry(std::make_shared<FailingCredentialStore>(),
                                std::make_shared<RandomCredentialGenerator>());
    auto result = registry.Generate("alice");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::STORAGE_ERROR);
    EXPECT_EQ(registry.Fetch("alice").error().code, ErrorCode::NOT_FOUND);
}

// ============================================================================
// 并发
// ============================================================================

TEST_F(CredentialRegistryTest, ConcurrentGenerate_SingleWinner) {
    constexpr int kThreads = 16;
    std::vector<std::thread> threads;
    std::mutex mu;
    std::vector<Credential> winners;
    std::atomic<int> already_exists{0};
    std::atomic<int> other_errors{0};

    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&]() {
            auto result = registry_->Generate("newuser");
            if (result.ok()) {
                std::lock_guard<std::mutex> lock(mu);
                winners.push_back(result.value());
            } else if (result.error().code == ErrorCode::ALREADY_EXISTS) {
                ++already_exists;
            } else {
                ++other_errors;
            }
        });
    }
    for (auto &t : threads)
        t.join();

    ASSERT_EQ(winners.size(), 1u);
    EXPECT_EQ(already_exists.load(), kThreads - 1);
    EXPECT_EQ(other_errors.load(), 0);

    auto fetched = registry_->Fetch("newuser");
    ASSERT_TRUE(fetched.ok());
    EXPECT_EQ(fetched->access_key_id, winners[0].access_key_id);
    EXPECT_EQ(fetched->secret_access_key, winners[0].secret_access_key);
}

TEST_F(CredentialRegistryTest, ConcurrentReset_LastWriterVisible) {
    auto gen = registry_->Generate("alice");
    ASSERT_TRUE(gen.ok());

    constexpr int kThreads = 8;
    std::vector<std::thread> threads;
    std::mutex mu;
    std::vector<Credential> results;

    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&]() {
            auto result = registry_->Reset("alice");
            ASSERT_TRUE(result.ok());
            std::lock_guard<std::mutex> lock(mu);
            results.push_back(result.value());
        });
    }
    for (auto &t : threads)
        t.join();

    ASSERT_EQ(results.size(), static_cast<size_t>(kThreads));
    std::set<std::string> ids;
    for (const auto &c : results) {
        ExpectWellFormed(c);
        EXPECT_NE(c.access_key_id, gen->access_key_id);
        ids.insert(c.access_key_id);
    }
    EXPECT_EQ(ids.size(), static_cast<size_t>(kThreads));

    auto fetched = registry_->Fetch("alice");
    ASSERT_TRUE(fetched.ok());
    bool matched = false;
    for (const auto &c : results) {
        if (c.access_key_id == fetched->access_key_id &&
            c.secret_access_key == fetched->secret_access_key)
            matched = true;
    }
    EXPECT_TRUE(matched);
}

TEST_F(CredentialRegistryTest, ConcurrentFetch_NeverTorn) {
    ASSERT_TRUE(registry_->Generate("alice").ok());

    std::atomic<bool> stop{false};
    std::mutex mu;
    std::set<std::pair<std::string, std::string>> committed;
    {
        auto f = registry_->Fetch("alice");
        committed.emplace(f->access_key_id, f->secret_access_key);
    }

    std::thread writer([&]() {
        for (int i = 0; i < 50; ++i) {
            auto r = registry_->Reset("alice");
            if (r.ok()) {
                std::lock_guard<std::mutex> lock(mu);
                committed.emplace(r->access_key_id, r->secret_access_key);
            }
        }
        stop = true;
    });

    std::vector<std::pair<std::string, std::string>> observed;
    while (!stop) {
        auto f = registry_->Fetch("alice");
        EXPECT_TRUE(f.ok());
        if (!f.ok())
            break;
        observed.emplace_back(f->access_key_id, f->secret_access_key);
    }
    writer.join();

    for (const auto &pair : observed)
        EXPECT_EQ(committed.count(pair), 1u);
}

// ============================================================================
// RocksDB 持久化
// ============================================================================

TEST(CredentialRegistryRocksDBTest, SurvivesRestart) {
    std::string path = "/tmp/ctl_registry_test_" +
        std::to_string(std::chrono::system_clock::now().time_since_epoch().count());
    Credential before;
    {
        CredentialRegistry registry(std::make_shared<RocksDBCredentialStore>(path),
                                    std::make_shared<RandomCredentialGenerator>());
        auto gen = registry.Generate("alice");
        ASSERT_TRUE(gen.ok());
        auto reset = registry.Reset("alice");
        ASSERT_TRUE(reset.ok());
        before = reset.value();
    }
    {
        CredentialRegistry registry(std::make_shared<RocksDBCredentialStore>(path),
                                    std::make_shared<RandomCredentialGenerator>());
        auto fetched = registry.Fetch("alice");
        ASSERT_TRUE(fetched.ok());
        EXPECT_EQ(fetched->access_key_id, before.access_key_id);
        EXPECT_EQ(fetched->secret_access_key, before.secret_access_key);
        EXPECT_EQ(registry.Generate("alice").error().code, ErrorCode::ALREADY_EXISTS);
    }
    std::filesystem::remove_all(path);
}

}  // namespace keyward::ctl

int main(int argc, char** argv) {
    keyward::log::InitConsoleOnly(keyward::log::Level::ERROR);
    ::testing::InitGoogleTest(&argc, argv);
    int rc = RUN_ALL_TESTS();
    keyward::log::Shutdown();
    return rc;
}
