/// @file test_global_bus.cpp
/// @brief Tests for GlobalEventBus

#include <catch2/catch_test_macros.hpp>
#include <cortex/event/event_bus.hpp>
#include <atomic>
#include <thread>
#include <vector>

using namespace cortex_event;

TEST_CASE("GlobalEventBus: creation", "[event][bus]") {
    GlobalEventBus bus;
    REQUIRE(bus.pending_count() == 0);
    REQUIRE(bus.capacity() == GlobalEventBus::k_default_capacity);
    REQUIRE(bus.subscriber_count() == 0);

    GlobalEventBus tiny(0);
    REQUIRE(tiny.capacity() == 1);
}

TEST_CASE("GlobalEventBus: publish and drain", "[event][bus]") {
    GlobalEventBus bus;
    bus.publish(Event("a"));
    bus.publish(Event("b"));
    REQUIRE(bus.pending_count() == 2);

    auto events = bus.drain();
    REQUIRE(events.size() == 2);
    REQUIRE(events[0].name() == "a");
    REQUIRE(events[1].name() == "b");
    REQUIRE(bus.pending_count() == 0);
}

TEST_CASE("GlobalEventBus: capacity drops oldest", "[event][bus]") {
    GlobalEventBus bus(2);
    bus.publish(Event("first"));
    bus.publish(Event("second"));
    bus.publish(Event("third"));

    REQUIRE(bus.pending_count() == 2);
    REQUIRE(bus.dropped_count() == 1);

    auto events = bus.drain();
    REQUIRE(events[0].name() == "second");
    REQUIRE(events[1].name() == "third");
}

TEST_CASE("GlobalEventBus: subscribers", "[event][bus]") {
    GlobalEventBus bus;
    std::vector<std::string> seen;

    auto id = bus.subscribe([&seen](const Event& e) {
        seen.push_back(e.name());
    });
    REQUIRE(id.is_valid());
    REQUIRE(bus.subscriber_count() == 1);

    bus.publish(Event("x"));
    bus.publish(Event("y"));
    REQUIRE(bus.process() == 2);
    REQUIRE(seen == std::vector<std::string>{"x", "y"});
    REQUIRE(bus.pending_count() == 0);

    SECTION("unsubscribe") {
        REQUIRE(bus.unsubscribe(id));
        REQUIRE_FALSE(bus.unsubscribe(id));

        bus.publish(Event("z"));
        REQUIRE(bus.process() == 1);
        REQUIRE(seen.size() == 2);
    }

    SECTION("clear discards pending events") {
        bus.publish(Event("z"));
        bus.clear();
        REQUIRE(bus.process() == 0);
        REQUIRE(seen.size() == 2);
    }
}

TEST_CASE("GlobalEventBus: subscriber may publish", "[event][bus]") {
    GlobalEventBus bus;
    int echoes = 0;

    bus.subscribe([&bus, &echoes](const Event& e) {
        if (e.name() == "ping") {
            bus.publish(Event("pong"));
        } else {
            ++echoes;
        }
    });

    bus.publish(Event("ping"));
    REQUIRE(bus.process() == 1);
    REQUIRE(bus.pending_count() == 1);
    REQUIRE(bus.process() == 1);
    REQUIRE(echoes == 1);
}

TEST_CASE("GlobalEventBus: thread safety", "[event][bus]") {
    GlobalEventBus bus;
    std::atomic<int> count{0};

    bus.subscribe([&count](const Event&) {
        count.fetch_add(1, std::memory_order_relaxed);
    });

    constexpr int events_per_thread = 100;
    constexpr int num_threads = 4;

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&bus]() {
            for (int i = 0; i < events_per_thread; ++i) {
                bus.publish(Event("tick"));
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    REQUIRE(bus.process() == events_per_thread * num_threads);
    REQUIRE(count.load() == events_per_thread * num_threads);
}
