#include <catch2/catch.hpp>

#include <string>
#include <vector>

#include "engine/core/EventBus.hpp"
#include "engine/core/Time.hpp"

using namespace trisolar::core;

TEST_CASE("Tick rate sets the fixed step", "[core][time]")
{
    Time time;
    CHECK(time.FixedDeltaMilliseconds() == 50);

    time.SetTickRate(30);
    CHECK(time.FixedDeltaMilliseconds() == 33);

    // Out-of-range rates are clamped.
    time.SetTickRate(1);
    CHECK(time.FixedDeltaSeconds() == Approx(0.1));
    time.SetTickRate(0);
    CHECK(time.FixedDeltaSeconds() == Approx(0.1));
}

TEST_CASE("Accumulator releases one step per elapsed tick", "[core][time]")
{
    Time time;
    time.BeginFrame(10.0);
    CHECK_FALSE(time.ShouldRunFixedStep());

    time.BeginFrame(10.12);
    int steps = 0;
    while (time.ShouldRunFixedStep())
    {
        time.ConsumeFixedStep();
        ++steps;
    }
    CHECK(steps == 2);
    CHECK(time.TickIndex() == 2);

    // The 20 ms remainder carries into the next frame.
    time.BeginFrame(10.16);
    REQUIRE(time.ShouldRunFixedStep());
    time.ConsumeFixedStep();
    CHECK_FALSE(time.ShouldRunFixedStep());
}

TEST_CASE("A stalled process runs a bounded number of catch-up ticks", "[core][time]")
{
    Time time;
    time.BeginFrame(0.0);
    time.BeginFrame(3.0);

    CHECK(time.DeltaSeconds() == Approx(0.25));
    CHECK(time.DroppedSeconds() == Approx(2.75));

    int steps = 0;
    while (time.ShouldRunFixedStep())
    {
        time.ConsumeFixedStep();
        ++steps;
    }
    CHECK(steps == 5);
}

TEST_CASE("Events wait for dispatch", "[core][events]")
{
    EventBus bus;
    std::vector<std::string> seen;
    bus.Subscribe("kill", [&](const Event& event) { seen.push_back("kill:" + event.args.at(0)); });

    bus.Publish(Event{"kill", {"player_2"}, 100, ""});
    bus.Publish(Event{"door_toggled", {"door_1"}, 100, ""});
    CHECK(seen.empty());
    CHECK(bus.PendingCount() == 2);

    bus.DispatchQueued();
    REQUIRE(seen.size() == 1);
    CHECK(seen.front() == "kill:player_2");
    CHECK(bus.PendingCount() == 0);
}

TEST_CASE("Catch-all handlers run after named ones in publish order", "[core][events]")
{
    EventBus bus;
    std::vector<std::string> order;
    bus.SubscribeAll([&](const Event& event) { order.push_back("all:" + event.name); });
    bus.Subscribe("meeting_started", [&](const Event&) { order.push_back("named"); });

    bus.Publish(Event{"meeting_started", {}, 0, ""});
    bus.Publish(Event{"vote_result", {}, 0, ""});
    bus.DispatchQueued();

    const std::vector<std::string> expected{"named", "all:meeting_started", "all:vote_result"};
    CHECK(order == expected);
}

TEST_CASE("Events published by a handler are dispatched in the same pass", "[core][events]")
{
    EventBus bus;
    int deaths = 0;
    bus.Subscribe("kill", [&](const Event& event) { bus.Publish(Event{"death", event.args, event.atMs, ""}); });
    bus.Subscribe("death", [&](const Event&) { ++deaths; });

    bus.Publish(Event{"kill", {"player_3"}, 5, ""});
    bus.DispatchQueued();
    CHECK(deaths == 1);
    CHECK(bus.PendingCount() == 0);
}
