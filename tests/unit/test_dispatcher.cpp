#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "fake_engine.hpp"
#include "policy/privacy_filter.hpp"
#include "runtime/dispatcher.hpp"
#include "runtime/worker_pool.hpp"
#include "tools/context_tools.hpp"
#include "tools/tool_registry.hpp"

namespace {

using continuity::core::errors::ErrorKind;
using continuity::core::errors::Result;
using continuity::core::errors::get_error;
using continuity::core::errors::get_value;
using continuity::core::errors::is_error;
using continuity::engine::StoreError;
using continuity::fakes::FakeEngine;
using continuity::fakes::make_activity;
using continuity::policy::Blacklist;
using continuity::policy::BlacklistAction;
using continuity::policy::BlacklistKind;
using continuity::policy::PrivacyFilter;
using continuity::protocol::ParamSpec;
using continuity::protocol::ParamType;
using continuity::protocol::ResultShape;
using continuity::protocol::ToolArguments;
using continuity::protocol::ToolCall;
using continuity::protocol::ToolDescriptor;
using continuity::runtime::DispatchOptions;
using continuity::runtime::Dispatcher;
using continuity::runtime::WorkerPool;
using continuity::runtime::normalize_arguments;
using continuity::tools::ToolRegistry;
using nlohmann::json;

ToolCall make_call(json id, const std::string& name, json arguments = json::object()) {
    ToolCall call;
    call.id = std::move(id);
    call.name = name;
    call.arguments = std::move(arguments);
    return call;
}

ToolDescriptor echo_tool() {
    ToolDescriptor descriptor;
    descriptor.name = "echo";
    descriptor.params = {
        ParamSpec{"text", ParamType::String, true, nullptr, "Text", {}, true},
        ParamSpec{"times", ParamType::Integer, false, 1, "Repeat count"},
        ParamSpec{"ratio", ParamType::Number, false, 0.5, "Ratio"},
        ParamSpec{"mode", ParamType::String, false, "plain", "Mode", {"plain", "loud"}},
        ParamSpec{"tags", ParamType::StringArray, false, nullptr, "Tags"}};
    descriptor.handler = [](const ToolArguments& args) -> Result<json> {
        return json{{"status", "success"}, {"arguments", args.values()}};
    };
    return descriptor;
}

class DispatcherTest : public ::testing::Test {
protected:
    DispatcherTest() : privacy_(Blacklist{{"BankApp"}, {}}), pool_(4) {}

    void register_tool(ToolDescriptor descriptor) {
        ASSERT_FALSE(is_error(registry_.register_tool(std::move(descriptor))));
    }

    Dispatcher dispatcher(std::uint32_t timeout_ms = 2000) {
        DispatchOptions options;
        options.handler_timeout_ms = timeout_ms;
        return Dispatcher(registry_, privacy_, pool_, options);
    }

    ToolRegistry registry_;
    PrivacyFilter privacy_;
    WorkerPool pool_;
};

TEST(NormalizeArgumentsTest, FillsDefaultsAndKeepsProvidedValues) {
    auto normalized = normalize_arguments(echo_tool(), json{{"text", "hi"}, {"ratio", 2}});
    ASSERT_FALSE(is_error(normalized));
    const auto& values = get_value(normalized);
    EXPECT_EQ(values["text"], "hi");
    EXPECT_EQ(values["times"], 1);
    EXPECT_EQ(values["ratio"], 2);
    EXPECT_EQ(values["mode"], "plain");
    EXPECT_FALSE(values.contains("tags"));
}

TEST(NormalizeArgumentsTest, RejectsBadArguments) {
    const auto tool = echo_tool();
    const std::vector<json> bad = {
        json::object(),                                    // missing required
        json{{"text", 5}},                                 // wrong type
        json{{"text", "   "}},                             // blank
        json{{"text", "hi"}, {"times", 1.5}},              // integer only
        json{{"text", "hi"}, {"mode", "quiet"}},           // enum
        json{{"text", "hi"}, {"tags", json::array({1})}},  // array of strings
        json::array()};                                    // not an object
    for (const auto& arguments : bad) {
        auto result = normalize_arguments(tool, arguments);
        ASSERT_TRUE(is_error(result)) << arguments.dump();
        EXPECT_EQ(get_error(result).kind, ErrorKind::InvalidParams) << arguments.dump();
    }
}

TEST(NormalizeArgumentsTest, NullArgumentsCountAsEmpty) {
    ToolDescriptor descriptor = echo_tool();
    descriptor.params.erase(descriptor.params.begin());
    EXPECT_FALSE(is_error(normalize_arguments(descriptor, nullptr)));
}

TEST(NormalizeArgumentsTest, ExtraArgumentsIgnoredUnlessStrict) {
    ToolDescriptor descriptor = echo_tool();
    const json arguments = {{"text", "hi"}, {"unexpected", true}};

    auto lenient = normalize_arguments(descriptor, arguments);
    ASSERT_FALSE(is_error(lenient));
    EXPECT_FALSE(get_value(lenient).contains("unexpected"));

    descriptor.strict = true;
    auto strict = normalize_arguments(descriptor, arguments);
    ASSERT_TRUE(is_error(strict));
    EXPECT_EQ(get_error(strict).code, "unknown_parameter");
}

TEST_F(DispatcherTest, UnknownToolKeepsId) {
    const auto response = dispatcher().dispatch(make_call("req-9", "nope"));
    EXPECT_EQ(response.id, "req-9");
    ASSERT_TRUE(is_error(response.outcome));
    EXPECT_EQ(get_error(response.outcome).kind, ErrorKind::UnknownTool);
}

TEST_F(DispatcherTest, SuccessPassesNormalizedArguments) {
    register_tool(echo_tool());
    const auto response = dispatcher().dispatch(make_call(4, "echo", {{"text", "hi"}}));
    EXPECT_EQ(response.id, 4);
    ASSERT_FALSE(is_error(response.outcome));
    EXPECT_EQ(get_value(response.outcome)["arguments"]["times"], 1);
}

TEST_F(DispatcherTest, HandlerExceptionsBecomeHandlerFailure) {
    ToolDescriptor store_fault = echo_tool();
    store_fault.name = "store_fault";
    store_fault.handler = [](const ToolArguments&) -> Result<json> {
        throw StoreError("graph", "daemon unreachable");
    };
    ToolDescriptor generic_fault = echo_tool();
    generic_fault.name = "generic_fault";
    generic_fault.handler = [](const ToolArguments&) -> Result<json> {
        throw std::runtime_error("bad state");
    };
    register_tool(store_fault);
    register_tool(generic_fault);

    const auto store = dispatcher().dispatch(make_call(1, "store_fault", {{"text", "x"}}));
    ASSERT_TRUE(is_error(store.outcome));
    EXPECT_EQ(get_error(store.outcome).kind, ErrorKind::HandlerFailure);
    EXPECT_EQ(get_error(store.outcome).store, "graph");

    const auto generic = dispatcher().dispatch(make_call(2, "generic_fault", {{"text", "x"}}));
    ASSERT_TRUE(is_error(generic.outcome));
    EXPECT_EQ(get_error(generic.outcome).kind, ErrorKind::HandlerFailure);
    EXPECT_NE(get_error(generic.outcome).message.find("bad state"), std::string::npos);
}

TEST_F(DispatcherTest, NonStandardThrowBecomesHandlerFailure) {
    ToolDescriptor odd_fault = echo_tool();
    odd_fault.name = "odd_fault";
    odd_fault.handler = [](const ToolArguments&) -> Result<json> { throw 42; };
    register_tool(odd_fault);
    register_tool(echo_tool());

    const Dispatcher live = dispatcher();
    const auto failed = live.dispatch(make_call("f", "odd_fault", {{"text", "x"}}));
    EXPECT_EQ(failed.id, "f");
    ASSERT_TRUE(is_error(failed.outcome));
    EXPECT_EQ(get_error(failed.outcome).kind, ErrorKind::HandlerFailure);
    EXPECT_EQ(get_error(failed.outcome).code, "handler_exception");

    const auto next = live.dispatch(make_call("g", "echo", {{"text", "still here"}}));
    ASSERT_FALSE(is_error(next.outcome));
    EXPECT_EQ(get_value(next.outcome)["arguments"]["text"], "still here");
}

TEST_F(DispatcherTest, SlowHandlerTimesOutAndSeesCancellation) {
    auto saw_cancel = std::make_shared<std::promise<bool>>();
    auto saw_cancel_future = saw_cancel->get_future();
    ToolDescriptor slow = echo_tool();
    slow.name = "slow";
    slow.handler = [saw_cancel](const ToolArguments& args) -> Result<json> {
        const auto until = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (!args.cancelled() && std::chrono::steady_clock::now() < until) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        saw_cancel->set_value(args.cancelled());
        return json{{"status", "success"}};
    };
    register_tool(slow);

    const auto response = dispatcher(50).dispatch(make_call(3, "slow", {{"text", "x"}}));
    EXPECT_EQ(response.id, 3);
    ASSERT_TRUE(is_error(response.outcome));
    EXPECT_EQ(get_error(response.outcome).kind, ErrorKind::Timeout);
    EXPECT_TRUE(saw_cancel_future.get());
}

TEST_F(DispatcherTest, ListResultsAreRedactedAndRecounted) {
    ToolDescriptor listing = echo_tool();
    listing.name = "listing";
    listing.params.clear();
    listing.shape = ResultShape::List;
    listing.list_field = "activities";
    listing.handler = [](const ToolArguments&) -> Result<json> {
        return json{{"status", "success"},
                    {"count", 2},
                    {"activities", json::array({{{"id", "1"}, {"app_name", "BankApp"}},
                                                {{"id", "2"}, {"app_name", "Editor"}}})}};
    };
    register_tool(listing);

    const auto response = dispatcher().dispatch(make_call(5, "listing"));
    ASSERT_FALSE(is_error(response.outcome));
    EXPECT_EQ(get_value(response.outcome)["count"], 1);
    EXPECT_EQ(get_value(response.outcome)["activities"][0]["id"], "2");
}

TEST_F(DispatcherTest, BlacklistedAppNeverAppearsInRecentActivities) {
    FakeEngine engine;
    const double now = engine.activities->now;
    engine.activities->add(make_activity("bank", now - 30, "BankApp"));
    engine.activities->add(make_activity("code", now - 60, "Editor"));
    auto filter = std::make_shared<PrivacyFilter>(Blacklist{});
    ToolRegistry registry;
    ASSERT_FALSE(is_error(continuity::tools::register_context_tools(
        registry, std::make_shared<const continuity::tools::ContextTools>(engine.handles(), filter))));
    registry.seal();
    Dispatcher live(registry, *filter, pool_);

    const auto before = live.dispatch(make_call(1, "context_recent_activities"));
    ASSERT_FALSE(is_error(before.outcome));
    EXPECT_EQ(get_value(before.outcome)["count"], 2);

    const auto edit = live.dispatch(make_call(
        2, "context_privacy_blacklist", {{"type", "app"}, {"value", "BankApp"}, {"action", "add"}}));
    ASSERT_FALSE(is_error(edit.outcome));

    const auto after = live.dispatch(make_call(3, "context_recent_activities"));
    ASSERT_FALSE(is_error(after.outcome));
    const auto& payload = get_value(after.outcome);
    EXPECT_EQ(payload["count"], 1);
    for (const auto& activity : payload["activities"]) {
        EXPECT_NE(activity["app_name"], "BankApp");
    }
}

TEST_F(DispatcherTest, ContextToolValidationThroughDispatch) {
    FakeEngine engine;
    auto filter = std::make_shared<PrivacyFilter>(Blacklist{});
    ToolRegistry registry;
    ASSERT_FALSE(is_error(continuity::tools::register_context_tools(
        registry, std::make_shared<const continuity::tools::ContextTools>(engine.handles(), filter))));
    Dispatcher live(registry, *filter, pool_);

    const auto empty_query = live.dispatch(make_call(1, "context_search", {{"query", ""}}));
    ASSERT_TRUE(is_error(empty_query.outcome));
    EXPECT_EQ(get_error(empty_query.outcome).kind, ErrorKind::InvalidParams);

    const auto bad_action = live.dispatch(make_call(
        2, "context_privacy_blacklist", {{"type", "app"}, {"value", "X"}, {"action", "toggle"}}));
    ASSERT_TRUE(is_error(bad_action.outcome));
    EXPECT_EQ(get_error(bad_action.outcome).kind, ErrorKind::InvalidParams);

    engine.activities->fail = true;
    const auto fault = live.dispatch(make_call(3, "context_list_contexts"));
    ASSERT_TRUE(is_error(fault.outcome));
    EXPECT_EQ(get_error(fault.outcome).store, "activity_db");
}

TEST_F(DispatcherTest, ConcurrentDispatchKeepsIdsPaired) {
    register_tool(echo_tool());
    const Dispatcher shared = dispatcher();
    std::vector<std::future<bool>> checks;
    for (int i = 0; i < 32; ++i) {
        checks.push_back(std::async(std::launch::async, [&shared, i]() {
            const auto response =
                shared.dispatch(make_call(i, "echo", {{"text", std::to_string(i)}}));
            return response.id == i && !is_error(response.outcome) &&
                   get_value(response.outcome)["arguments"]["text"] == std::to_string(i);
        }));
    }
    for (auto& check : checks) {
        EXPECT_TRUE(check.get());
    }
}

}  // namespace
