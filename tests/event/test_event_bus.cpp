// sim_event EntityEventBus tests

#include <catch2/catch_test_macros.hpp>
#include <simcore/event/event_bus.hpp>
#include <simcore/ecs/component_store.hpp>

#include "support/fakes.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace sim_event;
using sim_ecs::ComponentRegistry;
using sim_ecs::ComponentStore;
using sim_ecs::ComponentTypeId;
using sim_test::AlphaComponent;
using sim_test::BetaComponent;
using sim_test::LocalOnlyComponent;

namespace {

struct Ping {
    int value = 0;
};

struct Poke {
    EntityUid uid;
    int hits = 0;
};

struct BusFixture {
    ComponentRegistry registry;
    ComponentTypeId alpha;
    ComponentTypeId beta;
    ComponentStore store{registry};
    EntityEventBus bus{registry, store};

    BusFixture()
        : alpha(registry.register_component<AlphaComponent>("Alpha"))
        , beta(registry.register_component<BetaComponent>("Beta")) {
        store.set_listener(&bus);
    }

    ~BusFixture() { store.set_listener(nullptr); }

    void add(EntityUid uid, ComponentTypeId type) {
        (void)store.add(uid, type, registry.create(type)).unwrap();
    }
};

} // anonymous namespace

// =============================================================================
// Broadcast
// =============================================================================

TEST_CASE("EntityEventBus: broadcast subscribe and raise", "[event][bus]") {
    BusFixture f;
    std::vector<int> received;

    SubscriptionId id = f.bus.subscribe<Ping>([&](const Ping& p) { received.push_back(p.value); });
    REQUIRE(id.is_valid());
    REQUIRE(f.bus.subscription_count() == 1);

    f.bus.raise_event(Ping{1});
    f.bus.raise_event(Ping{2});
    REQUIRE(received == std::vector<int>{1, 2});

    REQUIRE(f.bus.unsubscribe(id).is_ok());
    f.bus.raise_event(Ping{3});
    REQUIRE(received.size() == 2);

    auto again = f.bus.unsubscribe(id);
    REQUIRE(again.is_err());
    REQUIRE(again.error().as<sim_core::EventError>()->kind == sim_core::EventError::Kind::UnknownSubscription);
}

TEST_CASE("EntityEventBus: events without subscribers are dropped", "[event][bus]") {
    BusFixture f;
    REQUIRE_NOTHROW(f.bus.raise_event(Ping{1}));
    REQUIRE(f.bus.subscription_count() == 0);
}

TEST_CASE("EntityEventBus: source filters", "[event][bus]") {
    BusFixture f;
    int local = 0;
    int network = 0;
    int any = 0;

    f.bus.subscribe<Ping>([&](const Ping&) { ++local; }, SubscribeOptions{}.from(EventSource::Local));
    f.bus.subscribe<Ping>([&](const Ping&) { ++network; }, SubscribeOptions{}.from(EventSource::Network));
    f.bus.subscribe<Ping>([&](const Ping&) { ++any; });

    f.bus.raise_event(Ping{}, EventSource::Local);
    f.bus.raise_event(Ping{}, EventSource::Network);
    f.bus.raise_event(Ping{}, EventSource::Network);

    REQUIRE(local == 1);
    REQUIRE(network == 2);
    REQUIRE(any == 3);

    REQUIRE(accepts(EventSource::All, EventSource::Network));
    REQUIRE_FALSE(accepts(EventSource::Local, EventSource::Network));
    REQUIRE(std::string(event_source_name(EventSource::Network)) == "Network");
}

// =============================================================================
// Local Events
// =============================================================================

TEST_CASE("EntityEventBus: entity-scoped subscriptions", "[event][bus][local]") {
    BusFixture f;
    EntityUid target{1};
    EntityUid other{2};

    std::vector<EntityUid> seen;
    f.bus.subscribe_local<Poke>(target, [&](EntityUid owner, Poke& ev) {
        seen.push_back(owner);
        ++ev.hits;
    });

    Poke poke{target};
    f.bus.raise_local_event(target, poke);
    Poke miss{other};
    f.bus.raise_local_event(other, miss);

    REQUIRE(seen == std::vector<EntityUid>{target});
    REQUIRE(poke.hits == 1);
    REQUIRE(miss.hits == 0);

    f.bus.on_entity_deleted(target);
    f.bus.raise_local_event(target, poke);
    REQUIRE(poke.hits == 1);
}

TEST_CASE("EntityEventBus: component-scoped subscriptions", "[event][bus][local]") {
    BusFixture f;
    EntityUid with_alpha{1};
    EntityUid without{2};
    f.add(with_alpha, f.alpha);
    f.add(without, f.beta);

    int calls = 0;
    f.bus.subscribe_local<AlphaComponent, Poke>([&](EntityUid owner, AlphaComponent& comp, Poke& ev) {
        REQUIRE(comp.owner() == owner);
        comp.value += 10;
        ++ev.hits;
        ++calls;
    });

    Poke a{with_alpha};
    f.bus.raise_local_event(with_alpha, a);
    Poke b{without};
    f.bus.raise_local_event(without, b);

    REQUIRE(calls == 1);
    REQUIRE(a.hits == 1);
    REQUIRE(f.store.try_get<AlphaComponent>(with_alpha)->value == 10);

    SECTION("cache follows component changes") {
        f.add(without, f.alpha);
        f.bus.raise_local_event(without, b);
        REQUIRE(calls == 2);

        REQUIRE(f.store.remove(with_alpha, f.alpha).is_ok());
        f.bus.raise_local_event(with_alpha, a);
        REQUIRE(calls == 2);
    }
}

TEST_CASE("EntityEventBus: dispatch cache skips entities without components", "[event][bus][local]") {
    BusFixture f;
    EntityUid uid{1};
    f.add(uid, f.alpha);

    int calls = 0;
    f.bus.subscribe_local<AlphaComponent, Poke>([&](EntityUid, AlphaComponent&, Poke&) { ++calls; });

    for (std::uint32_t raw = 100; raw < 110; ++raw) {
        Poke ev{EntityUid{raw}};
        f.bus.raise_local_event(EntityUid{raw}, ev);
    }
    REQUIRE(f.bus.dispatch_cache_size() == 0);

    Poke ev{uid};
    f.bus.raise_local_event(uid, ev);
    REQUIRE(calls == 1);
    REQUIRE(f.bus.dispatch_cache_size() == 1);

    REQUIRE(f.store.remove(uid, f.alpha).is_ok());
    f.bus.on_entity_deleted(uid);
    f.bus.raise_local_event(uid, ev);
    REQUIRE(calls == 1);
    REQUIRE(f.bus.dispatch_cache_size() == 0);
}

TEST_CASE("EntityEventBus: local dispatch order", "[event][bus][local]") {
    BusFixture f;
    EntityUid uid{3};
    f.add(uid, f.beta);
    f.add(uid, f.alpha);

    std::vector<std::string> order;
    f.bus.subscribe<Poke>([&](const Poke&) { order.push_back("broadcast"); });
    f.bus.subscribe_local<BetaComponent, Poke>([&](EntityUid, BetaComponent&, Poke&) { order.push_back("beta"); });
    f.bus.subscribe_local<AlphaComponent, Poke>([&](EntityUid, AlphaComponent&, Poke&) { order.push_back("alpha"); });
    f.bus.subscribe_local<Poke>(uid, [&](EntityUid, Poke&) { order.push_back("entity"); });

    Poke poke{uid};
    f.bus.raise_local_event(uid, poke, true);

    REQUIRE(order == std::vector<std::string>{"entity", "alpha", "beta", "broadcast"});

    order.clear();
    f.bus.raise_local_event(uid, poke);
    REQUIRE(order == std::vector<std::string>{"entity", "alpha", "beta"});
}

TEST_CASE("EntityEventBus: unregistered component scope is rejected", "[event][bus][local]") {
    BusFixture f;
    SubscriptionId id = f.bus.subscribe_local<LocalOnlyComponent, Poke>(
        [](EntityUid, LocalOnlyComponent&, Poke&) {});
    REQUIRE_FALSE(id.is_valid());
    REQUIRE(f.bus.subscription_count() == 0);
}

// =============================================================================
// Dispatch Robustness
// =============================================================================

TEST_CASE("EntityEventBus: throwing subscribers are isolated", "[event][bus]") {
    BusFixture f;
    int after = 0;

    f.bus.subscribe<Ping>([](const Ping&) { throw std::runtime_error("bad subscriber"); });
    f.bus.subscribe<Ping>([&](const Ping&) { ++after; });

    REQUIRE_NOTHROW(f.bus.raise_event(Ping{}));
    REQUIRE(after == 1);
    REQUIRE(f.bus.subscriber_failure_count() == 1);
}

TEST_CASE("EntityEventBus: subscription changes during dispatch", "[event][bus]") {
    BusFixture f;
    int second_calls = 0;
    int late_calls = 0;
    SubscriptionId second;

    SECTION("unsubscribed later handlers are skipped") {
        f.bus.subscribe<Ping>([&](const Ping&) { (void)f.bus.unsubscribe(second); });
        second = f.bus.subscribe<Ping>([&](const Ping&) { ++second_calls; });

        f.bus.raise_event(Ping{});
        REQUIRE(second_calls == 0);
    }

    SECTION("new handlers start with the next event") {
        f.bus.subscribe<Ping>([&](const Ping&) {
            if (late_calls == 0 && !second.is_valid()) {
                second = f.bus.subscribe<Ping>([&](const Ping&) { ++late_calls; });
            }
        });

        f.bus.raise_event(Ping{});
        REQUIRE(late_calls == 0);

        f.bus.raise_event(Ping{});
        REQUIRE(late_calls == 1);
    }
}

TEST_CASE("EntityEventBus: queued events", "[event][bus][queue]") {
    BusFixture f;
    std::vector<int> received;

    f.bus.subscribe<Ping>([&](const Ping& p) {
        received.push_back(p.value);
        if (p.value < 3) {
            f.bus.queue_event(Ping{p.value + 1});
        }
    });

    f.bus.queue_event(Ping{1});
    REQUIRE(f.bus.queued_count() == 1);
    REQUIRE(received.empty());

    f.bus.process_event_queue();
    REQUIRE(received == std::vector<int>{1});
    REQUIRE(f.bus.queued_count() == 1);

    f.bus.process_event_queue();
    f.bus.process_event_queue();
    REQUIRE(received == std::vector<int>{1, 2, 3});
    REQUIRE(f.bus.queued_count() == 0);
}

TEST_CASE("EntityEventBus: queued events keep their source", "[event][bus][queue]") {
    BusFixture f;
    int network = 0;
    f.bus.subscribe<Ping>([&](const Ping&) { ++network; }, SubscribeOptions{}.from(EventSource::Network));

    f.bus.queue_event(Ping{}, EventSource::Local);
    f.bus.queue_event(Ping{}, EventSource::Network);
    f.bus.process_event_queue();

    REQUIRE(network == 1);
}

TEST_CASE("EntityEventBus: clearing tables", "[event][bus]") {
    BusFixture f;
    f.bus.subscribe<Ping>([](const Ping&) {});
    f.bus.subscribe_local<Poke>(EntityUid{1}, [](EntityUid, Poke&) {});
    f.bus.queue_event(Ping{});
    REQUIRE(f.bus.calc_ordering().is_ok());

    f.bus.clear_event_tables();

    REQUIRE(f.bus.subscription_count() == 0);
    REQUIRE(f.bus.queued_count() == 0);
    REQUIRE_FALSE(f.bus.is_ordered());
}

// =============================================================================
// SubscriptionGuard
// =============================================================================

TEST_CASE("SubscriptionGuard: unsubscribes on destruction", "[event][guard]") {
    BusFixture f;
    int calls = 0;

    {
        SubscriptionGuard guard(f.bus, f.bus.subscribe<Ping>([&](const Ping&) { ++calls; }));
        f.bus.raise_event(Ping{});
        REQUIRE(calls == 1);
    }

    f.bus.raise_event(Ping{});
    REQUIRE(calls == 1);
    REQUIRE(f.bus.subscription_count() == 0);
}

TEST_CASE("SubscriptionGuard: move and release", "[event][guard]") {
    BusFixture f;

    SECTION("moved guard owns the subscription") {
        SubscriptionGuard outer;
        {
            SubscriptionGuard inner(f.bus, f.bus.subscribe<Ping>([](const Ping&) {}));
            outer = std::move(inner);
            REQUIRE_FALSE(inner.id().is_valid());
        }
        REQUIRE(f.bus.subscription_count() == 1);

        outer.reset();
        REQUIRE(f.bus.subscription_count() == 0);
    }

    SECTION("released subscription outlives the guard") {
        SubscriptionId id;
        {
            SubscriptionGuard guard(f.bus, f.bus.subscribe<Ping>([](const Ping&) {}));
            id = guard.release();
        }
        REQUIRE(f.bus.subscription_count() == 1);
        REQUIRE(f.bus.unsubscribe(id).is_ok());
    }

    SECTION("entity-scoped subscription already gone") {
        EntityUid uid{8};
        SubscriptionGuard guard(f.bus, f.bus.subscribe_local<Poke>(uid, [](EntityUid, Poke&) {}));
        f.bus.on_entity_deleted(uid);
        REQUIRE_NOTHROW(guard.reset());
    }
}
