#include <gtest/gtest.h>
#include <thread>
#include <atomic>
#include "warden/engine/tool_registry.hpp"
#include "fixtures/tool_definitions.hpp"

using namespace warden;
using namespace warden::engine;
using namespace warden::testing::tools;
using json = nlohmann::json;

class ToolRegistryTest : public ::testing::Test {
protected:
    Expected<json> invoke(const std::string& name, const json& args) {
        auto handler = registry.resolve(name);
        if (!handler) {
            return tl::unexpected(Error{ErrorCode::UnknownTool, "Unknown tool: " + name});
        }
        CallContext ctx;
        ctx.call = ToolCall::make("t1", name, args);
        return handler->invoke(ctx);
    }

    ToolRegistry registry;
};

// ============================================================================
// Schema generation from typed callables
// ============================================================================

TEST_F(ToolRegistryTest, RegisterIntParams) {
    registry.register_tool("add", "Add two integers", {"a", "b"}, add);

    EXPECT_TRUE(registry.has_tool("add"));
    EXPECT_EQ(registry.size(), 1u);

    auto params = registry.get_parameters_schema("add");
    ASSERT_TRUE(params.has_value());
    EXPECT_EQ((*params)["type"], "object");
    EXPECT_EQ((*params)["properties"]["a"]["type"], "integer");
    EXPECT_EQ((*params)["properties"]["b"]["type"], "integer");
}

TEST_F(ToolRegistryTest, DoubleAndStringTypes) {
    registry.register_tool("circle_area", "Compute circle area", {"radius"}, circle_area);
    registry.register_tool("greet", "Greet someone", {"name"}, greet);

    EXPECT_EQ((*registry.get_parameters_schema("circle_area"))["properties"]["radius"]["type"], "number");
    EXPECT_EQ((*registry.get_parameters_schema("greet"))["properties"]["name"]["type"], "string");
}

TEST_F(ToolRegistryTest, RequiredFieldsInSchema) {
    registry.register_tool("add", "Add two integers", {"a", "b"}, add);

    auto required = (*registry.get_parameters_schema("add"))["required"];
    EXPECT_EQ(required.size(), 2u);
    EXPECT_NE(std::find(required.begin(), required.end(), "a"), required.end());
    EXPECT_NE(std::find(required.begin(), required.end(), "b"), required.end());
}

TEST_F(ToolRegistryTest, ArityMismatchThrows) {
    EXPECT_THROW(registry.register_tool("add", "Add", {"a"}, add), std::invalid_argument);
    EXPECT_THROW(registry.register_tool("add", "Add", {"a", "b", "c"}, add), std::invalid_argument);
    EXPECT_EQ(registry.size(), 0u);
}

// ============================================================================
// Invocation
// ============================================================================

TEST_F(ToolRegistryTest, InvokeWithValidArgs) {
    registry.register_tool("add", "Add two integers", {"a", "b"}, add);

    auto result = invoke("add", {{"a", 3}, {"b", 4}});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ((*result)["result"], 7);
}

TEST_F(ToolRegistryTest, InvokeStringTool) {
    registry.register_tool("greet", "Greet someone", {"name"}, greet);

    auto result = invoke("greet", {{"name", "Alice"}});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ((*result)["result"], "Hello, Alice!");
}

TEST_F(ToolRegistryTest, InvokeWrongArgType) {
    registry.register_tool("add", "Add two integers", {"a", "b"}, add);

    auto result = invoke("add", {{"a", "not_a_number"}, {"b", 4}});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidParameters);
}

TEST_F(ToolRegistryTest, InvokeMissingArg) {
    registry.register_tool("add", "Add two integers", {"a", "b"}, add);

    auto result = invoke("add", {{"a", 3}});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidParameters);
}

TEST_F(ToolRegistryTest, HandlerThrowsStdException) {
    auto throwing = [](int x) -> int {
        if (x < 0) throw std::runtime_error("negative input");
        return x;
    };
    registry.register_tool("check", "Check positive", {"x"}, throwing);

    auto result = invoke("check", {{"x", -1}});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ToolExecutionFailed);
    EXPECT_NE(result.error().message.find("negative input"), std::string::npos);
}

TEST_F(ToolRegistryTest, ZeroArgTool) {
    registry.register_tool("now", "Get current time", {}, []() { return std::string("2024-01-01T00:00:00Z"); });

    auto params = registry.get_parameters_schema("now");
    ASSERT_TRUE(params.has_value());
    EXPECT_TRUE((*params)["properties"].empty());

    auto result = invoke("now", json::object());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ((*result)["result"], "2024-01-01T00:00:00Z");
}

TEST_F(ToolRegistryTest, TypedToolReturningExpected) {
    registry.register_tool("checked", "Positive or error", {"x"}, [](int x) -> Expected<json> {
        if (x < 0) {
            return tl::unexpected(Error{ErrorCode::ToolExecutionFailed, "negative"});
        }
        return json{{"value", x}};
    });

    auto ok = invoke("checked", {{"x", 2}});
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ((*ok)["value"], 2);

    auto bad = invoke("checked", {{"x", -2}});
    ASSERT_FALSE(bad.has_value());
    EXPECT_EQ(bad.error().message, "negative");
}

TEST_F(ToolRegistryTest, ManualRegistrationSeesContext) {
    json schema = {
        {"type", "object"},
        {"properties", {{"q", {{"type", "string"}}}}},
        {"required", json::array({"q"})}
    };
    registry.register_tool("whoami", "Report call id", schema,
                           [](const json& args, CallContext& ctx) -> Expected<json> {
                               return json{{"call_id", ctx.call.call_id}, {"q", args["q"]}};
                           });

    auto result = invoke("whoami", {{"q", "x"}});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ((*result)["call_id"], "t1");
    EXPECT_EQ(*registry.get_parameters_schema("whoami"), schema);
}

TEST_F(ToolRegistryTest, ReRegisterOverwrites) {
    registry.register_tool("calc", "Old description", {"a", "b"}, add);
    registry.register_tool("calc", "New description", {"a", "b"}, [](int a, int b) { return a * b; });

    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.resolve("calc")->description(), "New description");
    auto result = invoke("calc", {{"a", 3}, {"b", 4}});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ((*result)["result"], 12);
}

// ============================================================================
// Lookup
// ============================================================================

TEST_F(ToolRegistryTest, UnknownToolResolvesToNull) {
    EXPECT_EQ(registry.resolve("nonexistent"), nullptr);
    EXPECT_FALSE(registry.has_tool("nonexistent"));
    EXPECT_FALSE(registry.get_parameters_schema("nonexistent").has_value());
}

TEST_F(ToolRegistryTest, AliasSuffixStripped) {
    registry.register_tool("add", "Add two integers", {"a", "b"}, add);
    registry.set_alias_suffixes({"_remote", "-v2"});

    EXPECT_EQ(registry.normalize("add"), std::optional<std::string>("add"));
    EXPECT_EQ(registry.normalize("add_remote"), std::optional<std::string>("add"));
    EXPECT_EQ(registry.normalize("add-v2"), std::optional<std::string>("add"));
    EXPECT_FALSE(registry.normalize("sub_remote").has_value());
    EXPECT_FALSE(registry.normalize("_remote").has_value());
    ASSERT_NE(registry.resolve("add_remote"), nullptr);
    EXPECT_EQ(registry.resolve("add_remote")->name(), "add");
}

TEST_F(ToolRegistryTest, ExactNameBeatsAlias) {
    registry.register_tool("add", "Plain", {"a", "b"}, add);
    registry.register_tool("add_remote", "Exact", {"a", "b"}, add);
    registry.set_alias_suffixes({"_remote"});

    EXPECT_EQ(registry.resolve("add_remote")->description(), "Exact");
}

TEST_F(ToolRegistryTest, DescribeAllSortedWithKind) {
    register_test_tools(registry);
    WorkflowDefinition workflow;
    workflow.name = "analyze";
    workflow.description = "Investigate";
    registry.register_workflow(workflow);

    auto tools = registry.describe_all();
    ASSERT_EQ(tools.size(), registry.size());
    for (size_t i = 1; i < tools.size(); ++i) {
        EXPECT_LT(tools[i - 1]["name"].get<std::string>(), tools[i]["name"].get<std::string>());
    }
    EXPECT_EQ(tools[0]["name"], "add");
    EXPECT_EQ(tools[1]["name"], "analyze");
    EXPECT_EQ(tools[1]["kind"], "workflow");
    EXPECT_EQ(tools[0]["kind"], "simple");
    EXPECT_TRUE(tools[0].contains("inputSchema"));
}

TEST_F(ToolRegistryTest, WorkflowWithoutCallbacksRejected) {
    WorkflowDefinition workflow;
    workflow.name = "broken";
    workflow.next_step = nullptr;
    EXPECT_THROW(registry.register_workflow(workflow), std::invalid_argument);
}

TEST_F(ToolRegistryTest, NullHandlerRejected) {
    EXPECT_THROW(registry.add(nullptr), std::invalid_argument);
}

TEST_F(ToolRegistryTest, ConcurrentReadsDuringWrite) {
    registry.register_tool("add", "Add two integers", {"a", "b"}, add);

    std::atomic<bool> start{false};
    std::atomic<int> successes{0};

    auto reader = [&]() {
        while (!start.load()) {}
        for (int i = 0; i < 100; ++i) {
            if (registry.has_tool("add")) successes++;
            (void)registry.get_tool_names();
            (void)registry.describe_all();
        }
    };

    auto writer = [&]() {
        while (!start.load()) {}
        for (int i = 0; i < 100; ++i) {
            registry.register_tool("t_" + std::to_string(i), "Tool", {"a", "b"}, add);
        }
    };

    std::thread t1(reader);
    std::thread t2(reader);
    std::thread t3(writer);
    start.store(true);
    t1.join(); t2.join(); t3.join();

    EXPECT_EQ(successes.load(), 200);
    EXPECT_EQ(registry.size(), 101u);
}
