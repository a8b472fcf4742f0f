#include <gtest/gtest.h>

#include "fakes.hpp"
#include "interval_scheduler.hpp"
#include "reconciler.hpp"
#include "server.hpp"
#include "settings.hpp"
#include "sqlite.hpp"
#include "tools.hpp"
#include "weather.hpp"

using namespace std::chrono_literals;

class ServerRpcTest : public ::testing::Test {
  protected:
    SQLite db{":memory:"};
    FakeTaskSource source;
    Reconciler reconciler{db, source};
    RecordingNotifier notifier;
    Weather weather;
    ToolBox tools{db, reconciler, weather};
    IntervalSyncScheduler sync{db, reconciler, notifier, 30, 1s};
    Settings settings;
    Server server{tools, sync, settings, db, nullptr};
};

TEST_F(ServerRpcTest, Initialize) {
    nlohmann::json resp = server.HandleRpc({{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"}});
    EXPECT_EQ(resp["jsonrpc"], "2.0");
    EXPECT_EQ(resp["id"], 1);
    EXPECT_EQ(resp["result"]["protocolVersion"], "2024-11-05");
    EXPECT_EQ(resp["result"]["serverInfo"]["name"], "taskagent");
}

TEST_F(ServerRpcTest, ToolsListAndCall) {
    nlohmann::json list = server.HandleRpc({{"id", "a"}, {"method", "tools/list"}});
    EXPECT_EQ(list["id"], "a");
    EXPECT_FALSE(list["result"]["tools"].empty());

    nlohmann::json call = server.HandleRpc(
        {{"id", 2},
         {"method", "tools/call"},
         {"params", {{"name", "add_task"}, {"arguments", {{"title", "from rpc"}}}}}});
    EXPECT_EQ(call["result"]["isError"], false);
    EXPECT_EQ(db.ListTasks().size(), 1u);
}

TEST_F(ServerRpcTest, ToolErrorIsAResultNotAnRpcError) {
    nlohmann::json call = server.HandleRpc(
        {{"id", 3}, {"method", "tools/call"}, {"params", {{"name", "complete_task"}}}});
    EXPECT_FALSE(call.contains("error"));
    EXPECT_EQ(call["result"]["isError"], true);
}

TEST_F(ServerRpcTest, EmptyListsAndNotifications) {
    EXPECT_TRUE(server.HandleRpc({{"id", 4}, {"method", "resources/list"}})["result"]["resources"]
                    .empty());
    EXPECT_TRUE(
        server.HandleRpc({{"id", 5}, {"method", "prompts/list"}})["result"]["prompts"].empty());
    EXPECT_TRUE(server.HandleRpc({{"method", "notifications/initialized"}})["result"].is_object());
}

TEST_F(ServerRpcTest, ProtocolErrors) {
    nlohmann::json unknown = server.HandleRpc({{"id", 6}, {"method", "nope"}});
    EXPECT_EQ(unknown["error"]["code"], -32601);
    EXPECT_EQ(unknown["id"], 6);

    nlohmann::json parse = nlohmann::json::parse(server.HandleRpcBody("{not json"));
    EXPECT_EQ(parse["error"]["code"], -32700);
    EXPECT_TRUE(parse["id"].is_null());

    EXPECT_EQ(server.HandleRpc(nlohmann::json::array())["error"]["code"], -32600);
    EXPECT_EQ(server.HandleRpc({{"id", 7}})["error"]["code"], -32600);
}

TEST_F(ServerRpcTest, SetInterval) {
    int status = 0;
    nlohmann::json ok = server.HandleSetInterval(R"({"interval_minutes": 5})", status);
    EXPECT_EQ(status, 200);
    EXPECT_EQ(ok["status"], "success");
    EXPECT_EQ(ok["interval_minutes"], 5);
    EXPECT_EQ(sync.GetInterval(), 5);

    nlohmann::json bad = server.HandleSetInterval(R"({"interval_minutes": 0})", status);
    EXPECT_EQ(status, 400);
    EXPECT_EQ(bad["message"], "Invalid interval");
    EXPECT_EQ(sync.GetInterval(), 5);

    server.HandleSetInterval(R"({"interval_minutes": "ten"})", status);
    EXPECT_EQ(status, 400);
    server.HandleSetInterval("garbage", status);
    EXPECT_EQ(status, 400);
}

TEST_F(ServerRpcTest, SetTokenUpdatesSettings) {
    int status = 0;
    nlohmann::json ok = server.HandleSetToken(R"({"token": "abc123"})", status);
    EXPECT_EQ(status, 200);
    EXPECT_EQ(ok["status"], "success");
    EXPECT_EQ(settings.GetTodoistToken(), "abc123");

    server.HandleSetToken(R"({"token": ""})", status);
    EXPECT_EQ(status, 200);
    EXPECT_FALSE(settings.HasTodoistToken());

    server.HandleSetToken(R"({"token": 42})", status);
    EXPECT_EQ(status, 400);
}

TEST_F(ServerRpcTest, SetTokenPersistsThroughTokenStore) {
    MemoryTokenStore tokens;
    Server persisting{tools, sync, settings, db, &tokens};

    int status = 0;
    persisting.HandleSetToken(R"({"token": "abc123"})", status);
    EXPECT_EQ(status, 200);
    EXPECT_EQ(tokens.Saves(), 1);
    EXPECT_EQ(tokens.LoadToken().value_or(""), "abc123");

    persisting.HandleSetToken(R"({"token": ""})", status);
    EXPECT_EQ(status, 200);
    EXPECT_EQ(tokens.Clears(), 1);
    EXPECT_FALSE(tokens.LoadToken().has_value());

    persisting.HandleSetToken(R"({"token": 7})", status);
    EXPECT_EQ(status, 400);
    EXPECT_EQ(tokens.Saves(), 1);
    EXPECT_EQ(tokens.Clears(), 1);
}

TEST_F(ServerRpcTest, Summaries) {
    db.InsertDailySummary("2024-01-01", "text", 3);
    nlohmann::json rows = server.HandleSummaries(10);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0]["date"], "2024-01-01");
    EXPECT_EQ(rows[0]["tasks_completed"], 3);
}
