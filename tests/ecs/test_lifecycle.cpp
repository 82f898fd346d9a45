// sim_ecs entity lifecycle tests

#include <catch2/catch_test_macros.hpp>
#include <simcore/ecs/entity_manager.hpp>
#include <simcore/ecs/events.hpp>

#include "support/fakes.hpp"

#include <string>
#include <vector>

using namespace sim_ecs;
using sim_core::EntityError;
using sim_test::AlphaComponent;
using sim_test::BetaComponent;
using sim_test::FaultyComponent;
using sim_test::LocalOnlyComponent;
using sim_test::TestWorld;
using sim_test::hook_log;

using Log = std::vector<std::string>;

TEST_CASE("Lifecycle: allocate creates metadata and transform", "[ecs][lifecycle]") {
    TestWorld world;
    auto& manager = world.manager;

    bool metadata_seen_in_added = true;
    manager.event_bus().subscribe<EntityAddedEvent>([&](const EntityAddedEvent& ev) {
        metadata_seen_in_added = manager.try_get_metadata(ev.uid) != nullptr;
    });

    EntityUid uid = manager.allocate().unwrap();

    REQUIRE_FALSE(metadata_seen_in_added);
    REQUIRE(manager.entity_exists(uid));
    REQUIRE_FALSE(manager.deleted(uid));
    REQUIRE(*manager.life_stage(uid) == EntityLifeStage::Allocated);
    REQUIRE(manager.try_get_transform(uid) != nullptr);
    REQUIRE(manager.store().component_count(uid) == 2);

    auto net = manager.get_net_entity(uid);
    REQUIRE(net.is_ok());
    REQUIRE(*manager.get_entity(*net) == uid);
    REQUIRE(manager.try_get_metadata(uid)->net_entity == *net);
}

TEST_CASE("Lifecycle: stages advance in order", "[ecs][lifecycle]") {
    TestWorld world;
    auto& manager = world.manager;
    EntityUid uid = manager.allocate().unwrap();

    int initialized_events = 0;
    manager.event_bus().subscribe<EntityInitializedEvent>([&](const EntityInitializedEvent& ev) {
        if (ev.uid == uid) ++initialized_events;
    });

    SECTION("start before initialize is rejected") {
        auto result = manager.start_entity(uid);
        REQUIRE(result.is_err());
        REQUIRE(result.error().is_entity_error(EntityError::Kind::InvalidLifecycleTransition));
        REQUIRE(*manager.life_stage(uid) == EntityLifeStage::Allocated);
    }

    SECTION("map init before start is rejected") {
        REQUIRE(manager.run_map_init(uid).is_err());
    }

    SECTION("full sequence") {
        REQUIRE(manager.initialize_entity(uid).is_ok());
        REQUIRE(*manager.life_stage(uid) == EntityLifeStage::Initialized);
        REQUIRE(initialized_events == 1);

        auto again = manager.initialize_entity(uid);
        REQUIRE(again.error().is_entity_error(EntityError::Kind::InvalidLifecycleTransition));

        REQUIRE(manager.start_entity(uid).is_ok());
        REQUIRE(*manager.life_stage(uid) == EntityLifeStage::Started);

        REQUIRE(manager.run_map_init(uid).is_ok());
        REQUIRE(*manager.life_stage(uid) == EntityLifeStage::MapInitialized);
        REQUIRE(initialized_events == 1);
    }

    SECTION("unknown entity") {
        auto result = manager.initialize_entity(EntityUid{777});
        REQUIRE(result.error().is_entity_error(EntityError::Kind::UnknownId));
    }
}

TEST_CASE("Lifecycle: hooks run in reverse safe order", "[ecs][lifecycle]") {
    TestWorld world;
    auto& manager = world.manager;
    EntityUid uid = manager.allocate().unwrap();

    REQUIRE(manager.add_component<AlphaComponent>(uid).is_ok());
    REQUIRE(manager.add_component<BetaComponent>(uid).is_ok());
    REQUIRE(hook_log() == Log{"Alpha.add"});
    hook_log().clear();

    REQUIRE(manager.initialize_entity(uid).is_ok());
    REQUIRE(hook_log() == Log{"Beta.init", "Alpha.init"});
    hook_log().clear();

    REQUIRE(manager.start_entity(uid).is_ok());
    REQUIRE(hook_log() == Log{"Beta.start", "Alpha.start"});
    hook_log().clear();

    // Teardown runs in safe order
    manager.delete_entity(uid);
    REQUIRE(hook_log() == Log{"Alpha.shutdown", "Beta.shutdown", "Alpha.remove", "Beta.remove"});
}

TEST_CASE("Lifecycle: late components catch up on missed hooks", "[ecs][lifecycle]") {
    TestWorld world;
    EntityUid uid = world.spawn();

    auto added = world.manager.add_component<AlphaComponent>(uid);
    REQUIRE(added.is_ok());
    REQUIRE(hook_log() == Log{"Alpha.add", "Alpha.init", "Alpha.start"});
    REQUIRE((*added)->running());
}

TEST_CASE("Lifecycle: map init", "[ecs][lifecycle]") {
    TestWorld world;
    auto& manager = world.manager;
    world.maps.initialized.insert(5);

    SECTION("spawning into a ready map runs map init once") {
        EntityUid uid = manager.spawn_entity(std::nullopt, Vec2{1.0f, 2.0f}, 5).unwrap();
        REQUIRE(*manager.life_stage(uid) == EntityLifeStage::MapInitialized);
        REQUIRE(manager.try_get_transform(uid)->local_position == Vec2{1.0f, 2.0f});

        int map_inits = 0;
        manager.event_bus().subscribe_local<MapInitEvent>(uid, [&](EntityUid, MapInitEvent&) { ++map_inits; });

        REQUIRE(manager.run_map_init(uid).is_ok());
        REQUIRE(map_inits == 0);
        REQUIRE(*manager.life_stage(uid) == EntityLifeStage::MapInitialized);
    }

    SECTION("map init waits for the map") {
        EntityUid uid = manager.spawn_entity(std::nullopt, Vec2::zero(), 6).unwrap();
        REQUIRE(*manager.life_stage(uid) == EntityLifeStage::Started);

        int map_inits = 0;
        manager.event_bus().subscribe_local<MapInitEvent>(uid, [&](EntityUid, MapInitEvent&) { ++map_inits; });

        REQUIRE(manager.run_map_init(uid).is_ok());
        REQUIRE(map_inits == 1);
        REQUIRE(*manager.life_stage(uid) == EntityLifeStage::MapInitialized);
    }
}

TEST_CASE("Lifecycle: prototypes and overrides", "[ecs][lifecycle]") {
    TestWorld world;
    auto& manager = world.manager;
    world.loader.prototypes["Crate"] = {"Alpha"};
    world.clock.set(sim_core::GameTick{12});

    SECTION("prototype components are loaded with cleared ticks") {
        EntityUid uid = manager.create_entity_uninitialized(std::string("Crate")).unwrap();

        auto* alpha = manager.try_get_component<AlphaComponent>(uid);
        REQUIRE(alpha != nullptr);
        REQUIRE(alpha->last_modified_tick == sim_core::GameTick::zero());
        REQUIRE(alpha->creation_tick == sim_core::GameTick::zero());
        REQUIRE(manager.try_get_metadata(uid)->prototype_id == "Crate");
        REQUIRE(*manager.life_stage(uid) == EntityLifeStage::Allocated);
    }

    SECTION("overrides add components and keep their ticks") {
        ComponentOverrides overrides{{"Beta", {}}};
        EntityUid uid = manager.spawn_entity(std::string("Crate"), Vec2::zero(), k_nullspace, &overrides).unwrap();

        REQUIRE(manager.has_component<AlphaComponent>(uid));
        auto* beta = manager.try_get_component<BetaComponent>(uid);
        REQUIRE(beta != nullptr);
        REQUIRE(beta->last_modified_tick == sim_core::GameTick{12});
        REQUIRE(*manager.life_stage(uid) == EntityLifeStage::Started);
    }

    SECTION("unknown prototype allocates nothing") {
        auto result = manager.create_entity_uninitialized(std::string("Nope"));
        REQUIRE(result.is_err());
        REQUIRE(result.error().is_entity_error(EntityError::Kind::EntityCreationFailure));
        REQUIRE(*result.error().get_context("prototype") == "Nope");
        REQUIRE(manager.entity_count() == 0);
    }
}

TEST_CASE("Lifecycle: creation failures delete the entity", "[ecs][lifecycle]") {
    TestWorld world;
    auto& manager = world.manager;

    std::vector<EntityUid> deleted;
    manager.event_bus().subscribe<EntityDeletedEvent>([&](const EntityDeletedEvent& ev) {
        deleted.push_back(ev.uid);
    });

    SECTION("prototype load failure") {
        world.loader.prototypes["Crate"] = {"Alpha"};
        world.loader.fail_next_load = true;

        auto result = manager.create_entity_uninitialized(std::string("Crate"));
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == sim_core::ErrorCode::CreationFailed);
        REQUIRE(*result.error().get_context("cause") == "ParseError");
        REQUIRE(manager.entity_count() == 0);
        REQUIRE(deleted.size() == 1);
    }

    SECTION("initialize hook throws") {
        FaultyComponent::throw_on_initialize = true;
        EntityUid uid = manager.allocate().unwrap();
        REQUIRE(manager.add_component<FaultyComponent>(uid).is_ok());

        auto result = manager.initialize_and_start_entity(uid);
        REQUIRE(result.is_err());
        REQUIRE(result.error().is_entity_error(EntityError::Kind::EntityCreationFailure));
        REQUIRE(*result.error().get_context("stage") == "Initializing");
        REQUIRE_FALSE(manager.entity_exists(uid));
        REQUIRE(deleted == std::vector<EntityUid>{uid});
    }

    SECTION("startup hook throws") {
        FaultyComponent::throw_on_startup = true;
        EntityUid uid = manager.allocate().unwrap();
        REQUIRE(manager.add_component<FaultyComponent>(uid).is_ok());

        auto result = manager.initialize_and_start_entity(uid);
        REQUIRE(result.is_err());
        REQUIRE(*result.error().get_context("stage") == "Starting");
        REQUIRE_FALSE(manager.entity_exists(uid));
    }
}

TEST_CASE("Lifecycle: dirty tracking", "[ecs][lifecycle]") {
    TestWorld world;
    auto& manager = world.manager;
    EntityUid uid = world.spawn();

    int dirtied = 0;
    manager.event_bus().subscribe<EntityDirtiedEvent>([&](const EntityDirtiedEvent& ev) {
        if (ev.uid == uid) ++dirtied;
    });

    SECTION("entity is stamped at most once per tick") {
        world.clock.advance();
        REQUIRE(manager.set_paused(uid, true).is_ok());
        REQUIRE(manager.set_paused(uid, false).is_ok());
        REQUIRE(dirtied == 1);
        REQUIRE(manager.try_get_metadata(uid)->entity_last_modified_tick == world.clock.current_tick());

        world.clock.advance();
        manager.mark_dirty(uid);
        REQUIRE(dirtied == 2);
    }

    SECTION("component stamps follow the clock") {
        auto* alpha = *manager.add_component<AlphaComponent>(uid);
        world.clock.set(sim_core::GameTick{40});
        manager.dirty(uid, *alpha);
        REQUIRE(alpha->last_modified_tick == sim_core::GameTick{40});
        REQUIRE(dirtied == 1);
    }

    SECTION("components without net sync are never stamped") {
        world.clock.advance();
        auto* local = *manager.add_component<LocalOnlyComponent>(uid);
        REQUIRE(local->last_modified_tick == sim_core::GameTick::zero());
        REQUIRE(local->creation_tick == world.clock.current_tick());
        REQUIRE(dirtied == 0);
    }

    SECTION("allocated entities are stamped silently") {
        world.clock.advance();
        EntityUid fresh = manager.allocate().unwrap();
        REQUIRE(manager.try_get_metadata(fresh)->entity_last_modified_tick == world.clock.current_tick());
        REQUIRE(dirtied == 0);
    }
}
