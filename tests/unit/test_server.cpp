#include <gtest/gtest.h>
#include "warden/warden.hpp"
#include "mocks/mock_channel.hpp"
#include "mocks/mock_provider.hpp"
#include "fixtures/wire_messages.hpp"

#include <thread>

using namespace warden;
using namespace warden::testing;
using std::chrono::milliseconds;
using json = nlohmann::json;

class ServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        provider_ = std::make_shared<MockProvider>("expert");
        provider_->default_response = R"({"summary": "all good"})";
        config_.timeouts.base = milliseconds(1000);
        audit_ = std::make_shared<engine::MemoryAuditLog>();
    }

    std::unique_ptr<Server> make_server() {
        Server::Components components;
        components.audit = audit_;
        auto server = Server::create(config_, provider_, nullptr, components);
        EXPECT_TRUE(server.has_value());
        if (!server) {
            return nullptr;
        }
        return std::move(*server);
    }

    bool wait_for_audit(size_t count) {
        auto until = Clock::now() + milliseconds(3000);
        while (audit_->size() < count && Clock::now() < until) {
            std::this_thread::sleep_for(milliseconds(5));
        }
        return audit_->size() >= count;
    }

    Config config_;
    std::shared_ptr<MockProvider> provider_;
    std::shared_ptr<engine::MemoryAuditLog> audit_;
};

TEST_F(ServerTest, InvalidConfigRejected) {
    config_.timeouts.base = milliseconds(-5);
    auto server = Server::create(config_, provider_);
    ASSERT_FALSE(server.has_value());
    EXPECT_EQ(server.error().code, ErrorCode::InvalidConfig);
}

TEST_F(ServerTest, BuiltinToolsRegistered) {
    auto server = make_server();
    ASSERT_NE(server, nullptr);
    EXPECT_TRUE(server->registry().has_tool("echo"));
    EXPECT_TRUE(server->registry().has_tool("version"));
    EXPECT_TRUE(server->registry().has_tool("ask"));
    EXPECT_TRUE(server->registry().has_tool("analyze"));
}

TEST_F(ServerTest, InProcessEchoCall) {
    auto server = make_server();
    auto outcome = server->call(ToolCall::make("local", "echo", {{"k", "v"}}));
    ASSERT_TRUE(outcome.is_success());
    EXPECT_EQ(outcome.payload["echo"]["k"], "v");

    ASSERT_TRUE(server->observer().wait_idle(milliseconds(2000)));
    EXPECT_EQ(audit_->find("local").size(), 1u);
}

TEST_F(ServerTest, InProcessCallGetsGeneratedId) {
    auto server = make_server();
    auto outcome = server->call(ToolCall::make("", "version"));
    ASSERT_TRUE(outcome.is_success());
    EXPECT_EQ(outcome.payload["version"], WARDEN_VERSION);

    ASSERT_TRUE(server->observer().wait_idle(milliseconds(2000)));
    EXPECT_EQ(audit_->find("local-1").size(), 1u);
}

TEST_F(ServerTest, UnknownToolFailure) {
    auto server = make_server();
    auto outcome = server->call(ToolCall::make("u1", "does_not_exist"));
    EXPECT_EQ(outcome.status, OutcomeStatus::Failure);
    EXPECT_EQ(outcome.error_kind, ErrorCode::UnknownTool);
}

TEST_F(ServerTest, AliasSuffixFromConfig) {
    config_.tool_name_suffixes = {"_mcp"};
    auto server = make_server();
    auto outcome = server->call(ToolCall::make("a1", "echo_mcp", {{"x", 1}}));
    EXPECT_TRUE(outcome.is_success());
}

TEST_F(ServerTest, AnalyzeWorkflowEndToEnd) {
    config_.default_effort = "medium";
    auto server = make_server();

    std::vector<ProgressUpdate> updates;
    auto outcome = server->call(ToolCall::make("w1", "analyze", wire::analyze_parameters(2)),
                                [&updates](const ProgressUpdate& u) { updates.push_back(u); });
    ASSERT_TRUE(outcome.is_success()) << outcome.to_json().dump();
    EXPECT_EQ(outcome.payload["expert_analysis"]["analysis"]["summary"], "all good");
    EXPECT_EQ(provider_->last_parameters()["thinking_mode"], "medium");
    EXPECT_GE(updates.size(), 2u);
}

TEST_F(ServerTest, StoppedServerRefusesWork) {
    auto server = make_server();
    server->stop();
    EXPECT_FALSE(server->is_running());

    auto outcome = server->call(ToolCall::make("s1", "echo"));
    EXPECT_EQ(outcome.error_kind, ErrorCode::ServerNotRunning);

    auto attached = server->attach(std::make_shared<MockChannel>());
    ASSERT_FALSE(attached.has_value());
    EXPECT_EQ(attached.error().code, ErrorCode::ServerNotRunning);

    server->stop();
}

TEST_F(ServerTest, ChannelEndToEnd) {
    auto server = make_server();
    auto channel = std::make_shared<MockChannel>();
    auto id = server->attach(channel);
    ASSERT_TRUE(id.has_value());

    channel->simulate_receive(wire::hello());
    channel->simulate_receive(wire::call_tool("1", "echo", {{"n", 5}}));

    ASSERT_TRUE(channel->wait_for("call_tool_res", "1"));
    auto ack = channel->sent_with("hello_ack");
    ASSERT_EQ(ack.size(), 1u);
    EXPECT_EQ(ack[0]["session_id"], *id);
    EXPECT_EQ(ack[0]["server"], "warden");
    EXPECT_TRUE(ack[0]["limits"].contains("timeouts"));

    auto result = channel->sent_with("call_tool_res", "1").front();
    EXPECT_EQ(result["payload"]["echo"]["n"], 5);

    ASSERT_TRUE(wait_for_audit(1));
    EXPECT_EQ(audit_->records().front().session_id, *id);

    EXPECT_TRUE(server->detach(*id));
    EXPECT_EQ(server->sessions().session_count(), 0u);
}

TEST_F(ServerTest, EmptyAuditPathRejected) {
    config_.audit_db_path = "";
    auto bad = Server::create(config_, provider_);
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().code, ErrorCode::InvalidConfig);
}
