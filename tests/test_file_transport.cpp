#include <gtest/gtest.h>

#include "test_helpers.hpp"
#include "../shared/cpp/bridge_sdk/include/file_transport.hpp"
#include <atomic>
#include <set>

using json = nlohmann::json;

namespace {
void drop_message(const std::filesystem::path& dir, const std::string& name, const BridgeMessage& msg) {
    write_text_file_atomic(dir / name, msg.serialize());
}
}

TEST(FileTransport, ConnectCreatesMailboxDirectories)
{
    TempDir dir("ft-connect");
    FileTransport ft(dir.path);
    EXPECT_FALSE(ft.connected());
    ft.connect();
    EXPECT_TRUE(ft.connected());
    EXPECT_TRUE(std::filesystem::is_directory(dir.path / ".bridge" / "outbox"));
    EXPECT_TRUE(std::filesystem::is_directory(dir.path / ".bridge" / "inbox"));
    ft.disconnect();
    ft.disconnect();
    EXPECT_FALSE(ft.connected());
}

TEST(FileTransport, SendBeforeConnectThrows)
{
    TempDir dir("ft-unconnected");
    FileTransport ft(dir.path);
    EXPECT_THROW(ft.send(make_start_session("p", json::object())), BridgeError);
}

TEST(FileTransport, RapidSendsNeverCollide)
{
    TempDir dir("ft-send");
    FileTransport ft(dir.path, Mailbox::Controller, 60000);
    ft.connect();
    std::set<std::string> names;
    for (int i = 0; i < 100; ++i) {
        names.insert(ft.send(make_start_session("p" + std::to_string(i), json::object())).filename().string());
    }
    EXPECT_EQ(names.size(), 100u);
    EXPECT_EQ(count_json_files(ft.outbox_dir()), 100u);

    // File order is send order.
    auto files = list_files(ft.outbox_dir(), ".json");
    ValidationResult first = deserialize_message(read_text_file(files.front()));
    ValidationResult last = deserialize_message(read_text_file(files.back()));
    ASSERT_TRUE(first.valid && last.valid);
    EXPECT_EQ(plan_id_of(*first.message), std::optional<std::string>("p0"));
    EXPECT_EQ(plan_id_of(*last.message), std::optional<std::string>("p99"));
}

TEST(FileTransport, PollDispatchesEachFileOnceAndRemovesIt)
{
    TempDir dir("ft-poll");
    FileTransport ft(dir.path, Mailbox::Controller, 60000);
    ft.connect();

    std::vector<std::string> seen;
    ft.on_message([&](const BridgeMessage& m) { seen.push_back(*plan_id_of(m)); });

    for (int i = 0; i < 5; ++i) {
        drop_message(ft.inbox_dir(), "000" + std::to_string(i) + ".json",
                     make_start_session("plan-" + std::to_string(i), json::object()));
    }

    EXPECT_EQ(ft.poll_once(), 5u);
    ASSERT_EQ(seen.size(), 5u);
    EXPECT_EQ(seen.front(), "plan-0");
    EXPECT_EQ(seen.back(), "plan-4");
    EXPECT_EQ(count_json_files(ft.inbox_dir()), 0u);

    EXPECT_EQ(ft.poll_once(), 0u);
    EXPECT_EQ(seen.size(), 5u);
}

TEST(FileTransport, EverySubscriberIsCalledInOrder)
{
    TempDir dir("ft-fanout");
    FileTransport ft(dir.path, Mailbox::Controller, 60000);
    ft.connect();

    std::vector<int> calls;
    ft.on_message([&](const BridgeMessage&) { calls.push_back(1); });
    ft.on_message([&](const BridgeMessage&) { throw std::runtime_error("boom"); });
    ft.on_message([&](const BridgeMessage&) { calls.push_back(3); });

    drop_message(ft.inbox_dir(), "1.json", BridgeMessage::create(MessageType::AgentReady, json::object()));
    EXPECT_EQ(ft.poll_once(), 1u);
    EXPECT_EQ(calls, (std::vector<int>{1, 3}));
    EXPECT_EQ(count_json_files(ft.inbox_dir()), 0u);
}

TEST(FileTransport, FilesWaitForFirstSubscriber)
{
    TempDir dir("ft-nosub");
    FileTransport ft(dir.path, Mailbox::Controller, 60000);
    ft.connect();
    drop_message(ft.inbox_dir(), "1.json", make_start_session("early", json::object()));

    EXPECT_EQ(ft.poll_once(), 0u);
    EXPECT_TRUE(std::filesystem::exists(ft.inbox_dir() / "1.json"));

    std::vector<std::string> seen;
    ft.on_message([&](const BridgeMessage& m) { seen.push_back(*plan_id_of(m)); });
    EXPECT_EQ(ft.poll_once(), 1u);
    EXPECT_EQ(seen, (std::vector<std::string>{"early"}));
    EXPECT_EQ(count_json_files(ft.inbox_dir()), 0u);
}

TEST(FileTransport, MalformedFilesStayInPlace)
{
    TempDir dir("ft-malformed");
    FileTransport ft(dir.path, Mailbox::Controller, 60000);
    ft.connect();
    int calls = 0;
    ft.on_message([&](const BridgeMessage&) { ++calls; });

    write_text_file_atomic(ft.inbox_dir() / "0-bad.json", "{ not json");
    write_text_file_atomic(ft.inbox_dir() / "1-wrong.json", R"({"type":"start_demo","payload":{},"timestamp":1})");
    drop_message(ft.inbox_dir(), "2-good.json", make_start_session("ok", json::object()));

    EXPECT_EQ(ft.poll_once(), 1u);
    EXPECT_EQ(ft.poll_once(), 0u);
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(std::filesystem::exists(ft.inbox_dir() / "0-bad.json"));
    EXPECT_TRUE(std::filesystem::exists(ft.inbox_dir() / "1-wrong.json"));
    EXPECT_FALSE(std::filesystem::exists(ft.inbox_dir() / "2-good.json"));
}

TEST(FileTransport, MissingInboxIsNotAnError)
{
    TempDir dir("ft-missing");
    FileTransport ft(dir.path, Mailbox::Controller, 60000);
    ft.connect();
    std::filesystem::remove_all(ft.inbox_dir());
    EXPECT_EQ(ft.poll_once(), 0u);

    std::filesystem::create_directories(ft.inbox_dir());
    int calls = 0;
    ft.on_message([&](const BridgeMessage&) { ++calls; });
    drop_message(ft.inbox_dir(), "1.json", make_start_session("later", json::object()));
    EXPECT_EQ(ft.poll_once(), 1u);
    EXPECT_EQ(calls, 1);
}

TEST(FileTransport, BackgroundLoopDeliversUntilDisconnect)
{
    TempDir dir("ft-loop");
    FileTransport ft(dir.path, Mailbox::Controller, 20);
    std::atomic<int> calls{0};
    ft.on_message([&](const BridgeMessage&) { ++calls; });
    ft.connect();

    drop_message(ft.inbox_dir(), "1.json", make_start_session("a", json::object()));
    EXPECT_TRUE(wait_for([&] { return calls.load() == 1; }));

    ft.disconnect();
    drop_message(ft.inbox_dir(), "2.json", make_start_session("b", json::object()));
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(calls.load(), 1);
    EXPECT_TRUE(std::filesystem::exists(ft.inbox_dir() / "2.json"));
}

TEST(FileTransport, AgentRoleMirrorsDirections)
{
    TempDir dir("ft-roles");
    FileTransport controller(dir.path, Mailbox::Controller, 60000);
    FileTransport agent(dir.path, Mailbox::Agent, 60000);
    controller.connect();
    agent.connect();

    std::vector<MessageType> at_agent;
    std::vector<MessageType> at_controller;
    agent.on_message([&](const BridgeMessage& m) { at_agent.push_back(m.type()); });
    controller.on_message([&](const BridgeMessage& m) { at_controller.push_back(m.type()); });

    controller.send(make_start_session("x", json::object()));
    EXPECT_EQ(controller.poll_once(), 0u);
    EXPECT_EQ(agent.poll_once(), 1u);

    SessionResult r;
    r.plan_id = "x";
    r.passed = true;
    agent.send(make_session_result(r));
    EXPECT_EQ(controller.poll_once(), 1u);

    EXPECT_EQ(at_agent, (std::vector<MessageType>{MessageType::StartSession}));
    EXPECT_EQ(at_controller, (std::vector<MessageType>{MessageType::SessionResult}));
}
