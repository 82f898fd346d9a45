// sim_ecs hierarchy termination tests

#include <catch2/catch_test_macros.hpp>
#include <simcore/core/fault.hpp>
#include <simcore/ecs/entity_manager.hpp>
#include <simcore/ecs/events.hpp>

#include "support/fakes.hpp"

#include <vector>

using namespace sim_ecs;
using sim_core::EntityError;
using sim_core::FaultMode;
using sim_test::AlphaComponent;
using sim_test::FaultyComponent;
using sim_test::HierarchyAccess;
using sim_test::TestWorld;
using sim_test::config_with;
using sim_test::hook_log;

TEST_CASE("Termination: deleting a root deletes its descendants", "[ecs][termination]") {
    TestWorld world;
    auto& manager = world.manager;

    EntityUid a = world.spawn();
    EntityUid b = world.spawn_child(a);
    EntityUid c = world.spawn_child(b);
    NetEntity c_net = *manager.get_net_entity(c);

    std::vector<EntityUid> terminating;
    std::vector<EntityUid> deleted;
    bool net_id_resolved_in_delete = true;

    manager.event_bus().subscribe<EntityTerminatingEvent>([&](const EntityTerminatingEvent& ev) {
        terminating.push_back(ev.uid);
    });
    manager.event_bus().subscribe<EntityDeletedEvent>([&](const EntityDeletedEvent& ev) {
        deleted.push_back(ev.uid);
        REQUIRE(ev.metadata.life_stage == EntityLifeStage::Deleted);
        net_id_resolved_in_delete = net_id_resolved_in_delete && manager.get_net_entity(ev.uid).is_ok();
    });

    manager.delete_entity(a);

    // Flagged top-down, deleted bottom-up
    REQUIRE(terminating == std::vector<EntityUid>{a, b, c});
    REQUIRE(deleted == std::vector<EntityUid>{c, b, a});
    REQUIRE(net_id_resolved_in_delete);

    for (EntityUid uid : {a, b, c}) {
        REQUIRE(manager.deleted(uid));
        REQUIRE(*manager.life_stage(uid) == EntityLifeStage::Deleted);
    }

    auto parent = manager.hierarchy().parent(c);
    REQUIRE(parent.is_err());
    REQUIRE(parent.error().is_entity_error(EntityError::Kind::UnknownId));

    auto former = manager.get_entity(c_net);
    REQUIRE(former.is_err());
    REQUIRE(former.error().is_entity_error(EntityError::Kind::UnknownId));
}

TEST_CASE("Termination: deleting a child detaches it from the parent", "[ecs][termination]") {
    TestWorld world;
    auto& manager = world.manager;
    EntityUid parent = world.spawn();
    EntityUid keep = world.spawn_child(parent);
    EntityUid drop = world.spawn_child(parent);

    manager.delete_entity(drop);

    REQUIRE(manager.entity_exists(parent));
    REQUIRE(*manager.hierarchy().children(parent) == std::vector<EntityUid>{keep});
}

TEST_CASE("Termination: unknown and deleted ids are ignored", "[ecs][termination]") {
    TestWorld world;
    auto& manager = world.manager;
    EntityUid uid = world.spawn();

    int deletions = 0;
    manager.event_bus().subscribe<EntityDeletedEvent>([&](const EntityDeletedEvent&) { ++deletions; });

    manager.delete_entity(EntityUid{5000});
    manager.delete_entity(uid);
    manager.delete_entity(uid);

    REQUIRE(deletions == 1);
    REQUIRE(manager.fault_policy().tolerated_count() == 0);
}

TEST_CASE("Termination: deletion before startup is ignored", "[ecs][termination]") {
    TestWorld world(sim_core::RuntimeConfig{}, false);
    EntityUid uid = world.manager.allocate().unwrap();

    world.manager.delete_entity(uid);
    REQUIRE(world.manager.entity_exists(uid));
}

TEST_CASE("Termination: dangling child references are repaired", "[ecs][termination]") {
    TestWorld world;
    auto& manager = world.manager;
    EntityUid parent = world.spawn();
    EntityUid ghost = world.spawn();
    manager.delete_entity(ghost);

    // Hierarchy state applied from elsewhere may name a child that is gone
    REQUIRE(HierarchyAccess::attach_unchecked(manager.hierarchy(), parent, ghost).is_ok());

    const auto structural_before = sim_core::debug::structural_error_count();
    manager.delete_entity(parent);

    REQUIRE(manager.deleted(parent));
    REQUIRE(sim_core::debug::structural_error_count() == structural_before + 1);

    auto repairs = manager.take_structural_repairs();
    REQUIRE(repairs.size() == 1);
    REQUIRE(repairs.front().is_entity_error(EntityError::Kind::StructuralInconsistency));
    REQUIRE(*repairs.front().get_context("child") == ghost.to_string());
    REQUIRE(manager.take_structural_repairs().empty());
}

TEST_CASE("Termination: re-entrant delete of a terminating entity", "[ecs][termination]") {
    SECTION("tolerant mode finishes the deletion") {
        TestWorld world(config_with(FaultMode::Tolerant));
        auto& manager = world.manager;
        EntityUid uid = world.spawn();
        EntityUid child = world.spawn_child(uid);

        int deletions = 0;
        int child_terminating = 0;
        bool child_flagged_before_delete = true;
        manager.event_bus().subscribe<EntityDeletedEvent>([&](const EntityDeletedEvent&) { ++deletions; });
        manager.event_bus().subscribe_local<EntityTerminatingEvent>(uid,
            [&](EntityUid owner, EntityTerminatingEvent&) { manager.delete_entity(owner); });
        manager.event_bus().subscribe_local<EntityTerminatingEvent>(child,
            [&](EntityUid owner, EntityTerminatingEvent&) {
                ++child_terminating;
                child_flagged_before_delete = child_flagged_before_delete &&
                    *manager.life_stage(owner) == EntityLifeStage::Terminating;
            });

        REQUIRE_NOTHROW(manager.delete_entity(uid));

        REQUIRE(manager.deleted(uid));
        REQUIRE(manager.deleted(child));
        REQUIRE(deletions == 2);
        REQUIRE(child_terminating == 1);
        REQUIRE(child_flagged_before_delete);
        REQUIRE(manager.fault_policy().tolerated_count() == 1);
    }

    SECTION("strict mode throws") {
        TestWorld world(config_with(FaultMode::Strict));
        auto& manager = world.manager;
        EntityUid uid = world.spawn();

        manager.event_bus().subscribe_local<EntityTerminatingEvent>(uid,
            [&](EntityUid owner, EntityTerminatingEvent&) { manager.delete_entity(owner); });

        REQUIRE_THROWS_AS(manager.delete_entity(uid), sim_core::Fault);
        REQUIRE(*manager.life_stage(uid) == EntityLifeStage::Terminating);
    }
}

TEST_CASE("Termination: throwing shutdown hooks do not stop deletion", "[ecs][termination]") {
    TestWorld world;
    auto& manager = world.manager;
    EntityUid uid = world.spawn();
    REQUIRE(manager.add_component<AlphaComponent>(uid).is_ok());
    REQUIRE(manager.add_component<FaultyComponent>(uid).is_ok());
    hook_log().clear();

    FaultyComponent::throw_on_shutdown = true;
    manager.delete_entity(uid);

    REQUIRE(manager.deleted(uid));
    REQUIRE(hook_log() == std::vector<std::string>{"Alpha.shutdown", "Faulty.shutdown", "Alpha.remove"});
}

TEST_CASE("Termination: entity-scoped subscriptions die with the entity", "[ecs][termination]") {
    TestWorld world;
    auto& manager = world.manager;
    auto& bus = manager.event_bus();
    EntityUid uid = world.spawn();

    const auto before = bus.subscription_count();
    bus.subscribe_local<MapInitEvent>(uid, [](EntityUid, MapInitEvent&) {});
    REQUIRE(bus.subscription_count() == before + 1);

    manager.delete_entity(uid);
    REQUIRE(bus.subscription_count() == before);
}

TEST_CASE("Termination: components are unavailable once deletion ends", "[ecs][termination]") {
    TestWorld world;
    auto& manager = world.manager;
    EntityUid uid = world.spawn();
    REQUIRE(manager.add_component<AlphaComponent>(uid).is_ok());

    manager.delete_entity(uid);

    REQUIRE_FALSE(manager.has_component<AlphaComponent>(uid));
    REQUIRE(manager.get_component<AlphaComponent>(uid).is_err());
    REQUIRE(manager.add_component<AlphaComponent>(uid).is_err());

    // Metadata stays readable until the cull
    REQUIRE(manager.life_stage(uid).is_ok());
    manager.tick_update();
    REQUIRE(manager.life_stage(uid).is_err());
}
