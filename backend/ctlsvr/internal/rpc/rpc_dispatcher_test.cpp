/**
 * @file rpc_dispatcher_test.cpp
 * @brief RpcDispatcher / 编解码单元测试（不经网络）
 */

#include "rpc_dispatcher.h"
#include "rpc_codec.h"
#include "../handler/auth_handler.h"
#include "../handler/server_handler.h"
#include "../service/credential_registry.h"
#include "../service/node_stats.h"
#include <keyward/log_helper.h>
#include <gtest/gtest.h>

namespace keyward::ctl {

using json = nlohmann::json;

namespace {

/// 生成器在第一次调用时抛异常，模拟随机源失败
class BrokenCredentialGenerator : public CredentialGenerator {
public:
    Credential NewCredential() override {
        throw std::runtime_error("RAND_bytes failed");
    }
};

std::shared_ptr<RpcDispatcher> MakeDispatcher(std::shared_ptr<CredentialGenerator> gen) {
    auto registry = std::make_shared<CredentialRegistry>(
        std::make_shared<MemoryCredentialStore>(), std::move(gen));
    return std::make_shared<RpcDispatcher>(
        std::make_shared<AuthHandler>(registry),
        std::make_shared<ServerHandler>(std::make_shared<NodeStats>("test")));
}

}  // namespace

class RpcDispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        dispatcher_ = MakeDispatcher(std::make_shared<RandomCredentialGenerator>());
    }

    http::response<http::string_body> Post(const std::string& body,
                                           const std::string& content_type = kJsonContentType,
                                           const std::string& target = kRpcPath,
                                           http::verb verb = http::verb::post) {
        http::request<http::string_body> req{verb, target, 11};
        if (!content_type.empty())
            req.set(http::field::content_type, content_type);
        req.body() = body;
        req.prepare_payload();
        return dispatcher_->HandleRequest(req);
    }

    http::response<http::string_body> Call(const std::string& method, const json& arg, int id = 1) {
        return Post(EncodeRequest(method, arg, id));
    }

    static json Body(const http::response<http::string_body>& res) {
        return json::parse(res.body());
    }

    std::shared_ptr<RpcDispatcher> dispatcher_;
};

// ============================================================================
// 传输层校验
// ============================================================================

TEST_F(RpcDispatcherTest, WrongPath_404) {
    auto res = Call(kMethodServerSysInfo, json::object());
    EXPECT_EQ(res.result_int(), 200u);

    res = Post(EncodeRequest(kMethodServerSysInfo, json::object(), 1),
               kJsonContentType, "/other");
    EXPECT_EQ(res.result_int(), 404u);
    EXPECT_EQ(Body(res)["error"]["kind"], "PathNotFound");
}

TEST_F(RpcDispatcherTest, NonPost_405WithAllow) {
    auto res = Post("", kJsonContentType, kRpcPath, http::verb::get);
    EXPECT_EQ(res.result_int(), 405u);
    EXPECT_EQ(std::string(res[http::field::allow]), "POST");
    EXPECT_EQ(std::string(res[http::field::content_type]), kJsonContentType);
}

TEST_F(RpcDispatcherTest, WrongContentType_415) {
    auto res = Post(EncodeRequest(kMethodServerSysInfo, json::object(), 1), "text/plain");
    EXPECT_EQ(res.result_int(), 415u);
    EXPECT_EQ(Body(res)["error"]["kind"], "UnsupportedMediaType");

    res = Post(EncodeRequest(kMethodServerSysInfo, json::object(), 1), "");
    EXPECT_EQ(res.result_int(), 415u);
}

TEST_F(RpcDispatcherTest, NonUtf8ContentType_415) {
    const std::string body = EncodeRequest(kMethodServerSysInfo, json::object(), 1);
    http::response<http::string_body> res;
    EXPECT_NO_THROW(res = Post(body, "\xff\xfe"));
    EXPECT_EQ(res.result_int(), 415u);
    json parsed = json::parse(res.body(), nullptr, false);
    ASSERT_FALSE(parsed.is_discarded());
    EXPECT_EQ(parsed["error"]["kind"], "UnsupportedMediaType");
}

TEST_F(RpcDispatcherTest, NonUtf8Path_404) {
    const std::string body = EncodeRequest(kMethodServerSysInfo, json::object(), 1);
    http::response<http::string_body> res;
    EXPECT_NO_THROW(res = Post(body, kJsonContentType, "/\xff"));
    EXPECT_EQ(res.result_int(), 404u);
    json parsed = json::parse(res.body(), nullptr, false);
    ASSERT_FALSE(parsed.is_discarded());
    EXPECT_EQ(parsed["error"]["kind"], "PathNotFound");
}

TEST_F(RpcDispatcherTest, NonUtf8Body_400) {
    auto res = Post("{\"method\":\"Auth.Fetch\",\"params\":[{\"User\":\"ok\"}],\"id\":\"\xff\"}");
    EXPECT_EQ(res.result_int(), 400u);
    EXPECT_EQ(std::string(res[http::field::content_type]), kJsonContentType);
}

TEST_F(RpcDispatcherTest, ContentTypeWithCharset_Accepted) {
    auto res = Post(EncodeRequest(kMethodServerSysInfo, json::object(), 1),
                    "Application/JSON; charset=utf-8");
    EXPECT_EQ(res.result_int(), 200u);
}

TEST(RpcDispatcherContentTypeTest, IsJsonContentType) {
    EXPECT_TRUE(RpcDispatcher::IsJsonContentType("application/json"));
    EXPECT_TRUE(RpcDispatcher::IsJsonContentType(" application/json ;charset=UTF-8"));
    EXPECT_FALSE(RpcDispatcher::IsJsonContentType("application/json-patch+json"));
    EXPECT_FALSE(RpcDispatcher::IsJsonContentType(""));
}

// ============================================================================
// 请求解码
// ============================================================================

TEST_F(RpcDispatcherTest, MalformedJson_400) {
    auto res = Post("{not json");
    EXPECT_EQ(res.result_int(), 400u);
    json body = Body(res);
    EXPECT_TRUE(body["result"].is_null());
    EXPECT_EQ(body["error"]["kind"], "InvalidRequest");
    EXPECT_EQ(body["error"]["code"], ErrorCodeToInt(ErrorCode::RPC_INVALID_REQUEST));
    EXPECT_TRUE(body["id"].is_null());
}

TEST_F(RpcDispatcherTest, MissingMethod_400) {
    auto res = Post(R"({"params":[{}],"id":7})");
    EXPECT_EQ(res.result_int(), 400u);
    json body = Body(res);
    EXPECT_EQ(body["error"]["kind"], "InvalidRequest");
    EXPECT_EQ(body["id"], 7);
}

TEST_F(RpcDispatcherTest, UnknownMethod_400) {
    auto res = Call("Auth.Delete", json{{"User", "alice"}}, 3);
    EXPECT_EQ(res.result_int(), 400u);
    json body = Body(res);
    EXPECT_EQ(body["error"]["kind"], "MethodNotFound");
    EXPECT_EQ(body["id"], 3);
}

TEST_F(RpcDispatcherTest, NonStringUser_400) {
    auto res = Call(kMethodAuthGenerate, json{{"User", 42}});
    EXPECT_EQ(res.result_int(), 400u);
    EXPECT_EQ(Body(res)["error"]["kind"], "InvalidRequest");
}

TEST_F(RpcDispatcherTest, BareObjectParams_Accepted) {
    auto res = Post(R"({"method":"Auth.Generate","params":{"User":"carol"},"id":"abc"})");
    ASSERT_EQ(res.result_int(), 200u);
    json body = Body(res);
    EXPECT_EQ(body["id"], "abc");
    EXPECT_EQ(body["result"]["Name"], "carol");
}

TEST(RpcCodecTest, ParseOperation) {
    auto op = ParseOperation("Auth.Reset", json::array({json{{"User", "bob"}}}));
    ASSERT_TRUE(op.ok());
    ASSERT_TRUE(std::holds_alternative<ResetOp>(op.value()));
    EXPECT_EQ(std::get<ResetOp>(op.value()).args.user, "bob");
    EXPECT_STREQ(MethodName(op.value()), "Auth.Reset");

    auto stats = ParseOperation("Server.MemStats", nullptr);
    ASSERT_TRUE(stats.ok());
    EXPECT_TRUE(std::holds_alternative<MemStatsOp>(stats.value()));

    auto two = ParseOperation("Auth.Fetch", json::array({json::object(), json::object()}));
    ASSERT_FALSE(two.ok());
    EXPECT_EQ(two.error().code, ErrorCode::RPC_INVALID_REQUEST);
}

TEST(RpcCodecTest, DecodeReply) {
    auto ok = DecodeReply(R"({"result":{"Name":"alice"},"error":null,"id":4})", 4);
    ASSERT_TRUE(ok.ok());
    EXPECT_EQ((*ok)["Name"], "alice");

    auto server_err = DecodeReply(
        R"({"result":null,"error":{"code":5,"kind":"AlreadyExists","message":"dup"},"id":4})", 4);
    ASSERT_FALSE(server_err.ok());
    EXPECT_EQ(server_err.error().code, ErrorCode::ALREADY_EXISTS);
    EXPECT_EQ(server_err.error().message, "dup");

    auto mismatch = DecodeReply(R"({"result":{},"error":null,"id":5})", 4);
    ASSERT_FALSE(mismatch.ok());
    EXPECT_EQ(mismatch.error().code, ErrorCode::RPC_TRANSPORT_ERROR);
}

TEST(RpcCodecTest, DecodeReply_MalformedError) {
    for (const char* body : {R"({"result":null,"error":"rpc: can't find method","id":1})",
                             R"({"result":null,"error":{"code":"5"},"id":1})",
                             R"({"result":null,"error":[1],"id":1})",
                             "not json"}) {
        Result<json> reply = Error(ErrorCode::OK);
        EXPECT_NO_THROW(reply = DecodeReply(body, 1)) << body;
        ASSERT_FALSE(reply.ok()) << body;
        EXPECT_EQ(reply.error().code, ErrorCode::RPC_TRANSPORT_ERROR) << body;
    }
}

// ============================================================================
// 方法调用
// ============================================================================

TEST_F(RpcDispatcherTest, AuthFlow) {
    auto res = Call(kMethodAuthGenerate, json{{"User", "alice"}}, 1);
    ASSERT_EQ(res.result_int(), 200u);
    EXPECT_EQ(std::string(res[http::field::content_type]), kJsonContentType);
    json gen = Body(res);
    EXPECT_TRUE(gen["error"].is_null());
    EXPECT_EQ(gen["id"], 1);
    EXPECT_EQ(gen["result"]["Name"], "alice");
    EXPECT_EQ(gen["result"]["AccessKeyID"].get<std::string>().size(), 20u);
    EXPECT_EQ(gen["result"]["SecretAccessKey"].get<std::string>().size(), 40u);

    json fetched = Body(Call(kMethodAuthFetch, json{{"User", "alice"}}, 2));
    EXPECT_EQ(fetched["result"], gen["result"]);

    json reset = Body(Call(kMethodAuthReset, json{{"User", "alice"}}, 3));
    EXPECT_NE(reset["result"]["AccessKeyID"], gen["result"]["AccessKeyID"]);
    EXPECT_NE(reset["result"]["SecretAccessKey"], gen["result"]["SecretAccessKey"]);

    res = Call(kMethodAuthGenerate, json{{"User", "alice"}}, 4);
    EXPECT_EQ(res.result_int(), 400u);
    EXPECT_EQ(Body(res)["error"]["kind"], "AlreadyExists");

    res = Call(kMethodAuthFetch, json{{"User", "ghost"}}, 5);
    EXPECT_EQ(res.result_int(), 400u);
    EXPECT_EQ(Body(res)["error"]["kind"], "NotFound");
}

TEST_F(RpcDispatcherTest, EmptyOrMissingUser_InvalidArgument) {
    for (const char* method : {kMethodAuthGenerate, kMethodAuthFetch, kMethodAuthReset}) {
        auto res = Call(method, json{{"User", ""}});
        EXPECT_EQ(res.result_int(), 400u) << method;
        EXPECT_EQ(Body(res)["error"]["kind"], "InvalidArgument") << method;
    }
    auto res = Call(kMethodAuthGenerate, json::object());
    EXPECT_EQ(res.result_int(), 400u);
    EXPECT_EQ(Body(res)["error"]["kind"], "InvalidArgument");
}

TEST_F(RpcDispatcherTest, ServerMethods) {
    json mem = Body(Call(kMethodServerMemStats, json::object()));
    EXPECT_TRUE(mem["error"].is_null());
    EXPECT_GT(mem["result"]["memstats"]["rss_bytes"].get<uint64_t>(), 0u);

    json info = Body(Call(kMethodServerSysInfo, json::object()));
    EXPECT_FALSE(info["result"]["hostname"].get<std::string>().empty());
    EXPECT_GT(info["result"]["sys.ncpus"].get<int>(), 0);
    EXPECT_EQ(info["result"]["version"], "test");
}

TEST(RpcDispatcherFailureTest, GeneratorException_500) {
    auto dispatcher = MakeDispatcher(std::make_shared<BrokenCredentialGenerator>());
    http::request<http::string_body> req{http::verb::post, kRpcPath, 11};
    req.set(http::field::content_type, kJsonContentType);
    req.body() = EncodeRequest(kMethodAuthGenerate, json{{"User", "alice"}}, 9);
    req.prepare_payload();

    auto res = dispatcher->HandleRequest(req);
    EXPECT_EQ(res.result_int(), 500u);
    json body = json::parse(res.body());
    EXPECT_EQ(body["error"]["kind"], "Internal");
    EXPECT_EQ(body["id"], 9);
}

}  // namespace keyward::ctl

int main(int argc, char** argv) {
    keyward::log::InitConsoleOnly(keyward::log::Level::FATAL);
    ::testing::InitGoogleTest(&argc, argv);
    int rc = RUN_ALL_TESTS();
    keyward::log::Shutdown();
    return rc;
}
