// SPDX-License-Identifier: Apache-2.0
#include <stream/StreamBroker.hpp>

#include <catch2/catch_test_macros.hpp>

#include <thread>
#include <type_traits>

using namespace agentshell;
using namespace std::chrono_literals;

namespace
{

auto delta(std::size_t turn, std::string text) -> StreamPayload
{
    return AssistantDelta { .turnIndex = turn, .text = std::move(text) };
}

} // namespace

TEST_CASE("StreamBroker is the only source of subscriptions", "[stream]")
{
    STATIC_CHECK(!std::is_constructible_v<Subscription, std::string, std::size_t>);
    STATIC_CHECK(!std::is_copy_constructible_v<Subscription>);

    auto broker = StreamBroker { 8 };
    auto const subscription = broker.subscribe("chat");
    REQUIRE(subscription);
    CHECK(subscription->name() == "chat");
    CHECK(subscription.use_count() == 2);
    CHECK(broker.subscriberCount() == 1);

    broker.unsubscribe(subscription);
    CHECK(subscription.use_count() == 1);
    CHECK(subscription->isClosed());
}

TEST_CASE("StreamBroker delivers events to every subscriber in publication order", "[stream]")
{
    auto broker = StreamBroker(64);
    auto first = broker.subscribe("first");
    auto second = broker.subscribe("second");
    CHECK(broker.subscriberCount() == 2);

    auto const s1 = broker.publish(1, delta(0, "a"));
    auto const s2 = broker.publish(1, RunFinished { .finalText = "a", .cycles = 0 });
    CHECK(s2 > s1);

    for (auto* subscription: { first.get(), second.get() })
    {
        auto e1 = subscription->tryNext();
        auto e2 = subscription->tryNext();
        REQUIRE(e1);
        REQUIRE(e2);
        CHECK(e1->sequence == s1);
        CHECK(e2->sequence == s2);
        CHECK(isTerminal(*e2));
        CHECK(!subscription->tryNext());
    }
}

TEST_CASE("StreamBroker coalesces the oldest adjacent deltas of a slow subscriber", "[stream]")
{
    auto broker = StreamBroker(64);
    auto slow = broker.subscribe("slow", 3);

    (void) broker.publish(1, delta(0, "a"));
    (void) broker.publish(1, delta(0, "b"));
    (void) broker.publish(1, delta(0, "c"));
    (void) broker.publish(1, delta(0, "d"));
    (void) broker.publish(1, RunFinished { .finalText = "abcd", .cycles = 0 });

    CHECK(slow->pending() == 3);
    CHECK(slow->coalescedCount() == 2);

    auto text = std::string {};
    auto sawFinish = false;
    while (auto event = slow->tryNext())
    {
        if (auto const* d = std::get_if<AssistantDelta>(&event->payload))
            text += d->text;
        else
            sawFinish = std::holds_alternative<RunFinished>(event->payload);
    }
    CHECK(text == "abcd");
    CHECK(sawFinish);
}

TEST_CASE("StreamBroker never drops non-delta events", "[stream]")
{
    auto broker = StreamBroker(2);
    auto sub = broker.subscribe("tiny");

    for (auto i = 0; i < 5; ++i)
        (void) broker.publish(1, ToolCallStarted { .call = ToolCall { .id = std::to_string(i), .name = "t", .arguments = {} } });

    CHECK(sub->pending() == 5);
    CHECK(sub->coalescedCount() == 0);
}

TEST_CASE("StreamBroker keeps deltas of different messages apart", "[stream]")
{
    auto broker = StreamBroker(1);
    auto sub = broker.subscribe("s");

    (void) broker.publish(1, delta(0, "x"));
    (void) broker.publish(1, delta(2, "y"));
    CHECK(sub->pending() == 2);
}

TEST_CASE("StreamBroker subscriber blocked in next() wakes on publish and on close", "[stream]")
{
    auto broker = StreamBroker(16);
    auto sub = broker.subscribe("reader");

    auto received = std::optional<StreamEvent> {};
    auto reader = std::jthread([&](std::stop_token stop) { received = sub->next(stop); });
    std::this_thread::sleep_for(20ms);
    (void) broker.publish(7, RunFailed { .error = Error { ErrorCode::Cancelled, "x" } });
    reader.join();
    REQUIRE(received);
    CHECK(received->runId == 7);

    auto afterClose = std::optional<StreamEvent> { StreamEvent {} };
    auto waiter = std::jthread([&](std::stop_token stop) { afterClose = sub->next(stop); });
    std::this_thread::sleep_for(20ms);
    broker.unsubscribe(sub);
    waiter.join();
    CHECK(!afterClose);
    CHECK(sub->isClosed());
    CHECK(broker.subscriberCount() == 0);
}

TEST_CASE("StreamBroker next() with a timeout returns empty when idle", "[stream]")
{
    auto broker = StreamBroker(16);
    auto sub = broker.subscribe("idle");
    CHECK(!sub->next(10ms));
}
