#include <catch2/catch_test_macros.hpp>

#include <mcp_fleet/runtime/message_distributor.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

using namespace mcp_fleet;
using namespace std::chrono_literals;

namespace {

std::shared_ptr<SessionQueue> MakeQueue(size_t capacity = 16) {
    return std::make_shared<SessionQueue>(capacity);
}

// Method of each queued notification, id key of each queued reply.
std::vector<std::string> Drain(SessionQueue& queue) {
    std::vector<std::string> labels;
    while (auto message = queue.TryPop()) {
        if (auto method = protocol::MethodOf(*message)) {
            labels.push_back(*method);
        } else {
            labels.push_back(protocol::IdKeyOf(*message).value_or("?"));
        }
    }
    return labels;
}

} // anonymous namespace

TEST_CASE("MessageDistributor: broadcasts to every subscriber", "[runtime][distributor]") {
    MessageDistributor distributor("time");
    auto a = MakeQueue();
    auto b = MakeQueue();
    distributor.Subscribe("a", a);
    distributor.Subscribe("b", b);

    distributor.OnOutputLine(R"({"jsonrpc":"2.0","method":"notifications/progress"})");

    CHECK(a->Size() == 1);
    CHECK(b->Size() == 1);
    CHECK(distributor.DeliveredMessages() == 2);
}

TEST_CASE("MessageDistributor: non-JSON lines are dropped", "[runtime][distributor]") {
    MessageDistributor distributor("time");
    auto q = MakeQueue();
    distributor.Subscribe("a", q);

    distributor.OnOutputLine("Starting server on stdio...");
    distributor.OnOutputLine(R"({"id":1,"result":{}})");

    CHECK(q->Size() == 0);
    CHECK(distributor.DroppedLines() == 2);
}

TEST_CASE("MessageDistributor: pending reply is fulfilled by id", "[runtime][distributor]") {
    MessageDistributor distributor("time");
    auto future = distributor.ExpectReply(protocol::IdKey(5));
    REQUIRE(future.IsOk());
    auto reply = std::move(future).Value();

    distributor.OnOutputLine(R"({"jsonrpc":"2.0","id":6,"result":{}})");
    CHECK(reply.wait_for(0ms) == std::future_status::timeout);

    distributor.OnOutputLine(R"({"jsonrpc":"2.0","id":5,"result":{"ok":true}})");
    REQUIRE(reply.wait_for(1s) == std::future_status::ready);
    auto message = reply.get();
    CHECK(std::get<protocol::Response>(message).result["ok"] == true);
    CHECK(distributor.PendingCount() == 0);
}

TEST_CASE("MessageDistributor: duplicate awaited id is rejected", "[runtime][distributor]") {
    MessageDistributor distributor("time");
    auto first = distributor.ExpectReply("1");
    REQUIRE(first.IsOk());
    auto second = distributor.ExpectReply("1");
    REQUIRE(second.IsErr());
    CHECK(second.Error().category == ErrorCategory::InvalidRequest);

    CHECK(distributor.CancelReply("1"));
    CHECK_FALSE(distributor.CancelReply("1"));
}

TEST_CASE("MessageDistributor: broadcast mode also copies awaited replies to sessions",
          "[runtime][distributor]") {
    MessageDistributor distributor("time", ResponseRouting::Broadcast);
    auto q = MakeQueue();
    distributor.Subscribe("a", q);
    auto future = distributor.ExpectReply(protocol::IdKey(1));
    REQUIRE(future.IsOk());

    distributor.OnOutputLine(R"({"jsonrpc":"2.0","id":1,"result":{}})");

    CHECK(q->Size() == 1);
}

TEST_CASE("MessageDistributor: owner routing sends a claimed reply to its session only",
          "[runtime][distributor]") {
    MessageDistributor distributor("time", ResponseRouting::Owner);
    auto a = MakeQueue();
    auto b = MakeQueue();
    distributor.Subscribe("a", a);
    distributor.Subscribe("b", b);
    distributor.ClaimReply(protocol::IdKey(3), "b");

    distributor.OnOutputLine(R"({"jsonrpc":"2.0","id":3,"result":{}})");
    CHECK(a->Size() == 0);
    CHECK(b->Size() == 1);

    // Unclaimed replies and notifications still go everywhere.
    distributor.OnOutputLine(R"({"jsonrpc":"2.0","id":4,"result":{}})");
    distributor.OnOutputLine(R"({"jsonrpc":"2.0","method":"notifications/message"})");
    CHECK(a->Size() == 2);
    CHECK(b->Size() == 3);
}

TEST_CASE("MessageDistributor: owner routing keeps synchronous replies private",
          "[runtime][distributor]") {
    MessageDistributor distributor("time", ResponseRouting::Owner);
    auto q = MakeQueue();
    distributor.Subscribe("a", q);
    auto future = distributor.ExpectReply(protocol::IdKey("gw-1"));
    REQUIRE(future.IsOk());

    distributor.OnOutputLine(R"({"jsonrpc":"2.0","id":"gw-1","result":{}})");

    CHECK(q->Size() == 0);
}

TEST_CASE("MessageDistributor: unsubscribed session receives nothing", "[runtime][distributor]") {
    MessageDistributor distributor("time");
    auto q = MakeQueue();
    distributor.Subscribe("a", q);
    distributor.Unsubscribe("a");

    distributor.OnOutputLine(R"({"jsonrpc":"2.0","method":"x"})");

    CHECK(q->Size() == 0);
    CHECK(distributor.SubscriberCount() == 0);
}

TEST_CASE("MessageDistributor: slow session loses oldest messages only", "[runtime][distributor]") {
    MessageDistributor distributor("time");
    auto slow = MakeQueue(2);
    auto fast = MakeQueue(16);
    distributor.Subscribe("slow", slow);
    distributor.Subscribe("fast", fast);

    for (int i = 0; i < 5; ++i) {
        distributor.Deliver(protocol::MakeNotification("n", {{"i", i}}));
    }

    CHECK(slow->Size() == 2);
    CHECK(slow->DroppedTotal() == 3);
    CHECK(fast->Size() == 5);
    auto first = slow->TryPop();
    REQUIRE(first.has_value());
    CHECK(std::get<protocol::Notification>(*first).params["i"] == 3);
}

TEST_CASE("MessageDistributor: sessions see notifications and replies in emission order",
          "[runtime][distributor]") {
    MessageDistributor distributor("time", ResponseRouting::Broadcast);
    auto a = MakeQueue();
    auto b = MakeQueue();
    distributor.Subscribe("a", a);
    distributor.Subscribe("b", b);
    auto awaited = distributor.ExpectReply(protocol::IdKey(7));
    REQUIRE(awaited.IsOk());
    auto reply = std::move(awaited).Value();

    distributor.OnOutputLine(R"({"jsonrpc":"2.0","method":"notifications/progress","params":{"n":1}})");
    distributor.OnOutputLine(R"({"jsonrpc":"2.0","method":"notifications/message","params":{"n":2}})");
    distributor.OnOutputLine(R"({"jsonrpc":"2.0","id":7,"result":{"ok":true}})");
    distributor.OnOutputLine(R"({"jsonrpc":"2.0","method":"notifications/tools/list_changed"})");
    distributor.OnOutputLine(R"({"jsonrpc":"2.0","id":"s-1","result":{}})");
    distributor.OnOutputLine(R"({"jsonrpc":"2.0","method":"notifications/progress","params":{"n":3}})");

    REQUIRE(reply.wait_for(1s) == std::future_status::ready);
    const std::vector<std::string> expected = {
        "notifications/progress",
        "notifications/message",
        protocol::IdKey(7),
        "notifications/tools/list_changed",
        protocol::IdKey("s-1"),
        "notifications/progress",
    };
    CHECK(Drain(*a) == expected);
    CHECK(Drain(*b) == expected);
}
