// sim_core Error and Result tests

#include <catch2/catch_test_macros.hpp>
#include <simcore/core/error.hpp>
#include <string>

using namespace sim_core;

// =============================================================================
// Error Tests
// =============================================================================

TEST_CASE("Error construction", "[core][error]") {
    SECTION("from string") {
        Error err("Test error");
        REQUIRE(err.message() == "Test error");
        REQUIRE(err.code() == ErrorCode::Unknown);
    }

    SECTION("from code and message") {
        Error err(ErrorCode::InvalidArgument, "Bad argument");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.message() == "Bad argument");
    }

    SECTION("with context") {
        Error err = Error("Base error").with_context("key", "value");
        auto* ctx = err.get_context("key");
        REQUIRE(ctx != nullptr);
        REQUIRE(*ctx == "value");
        REQUIRE(err.get_context("missing") == nullptr);
    }
}

TEST_CASE("Error factory methods", "[core][error]") {
    SECTION("EntityError::unknown_id") {
        Error err = EntityError::unknown_id("42");
        REQUIRE(err.code() == ErrorCode::NotFound);
        REQUIRE(err.is_entity_error(EntityError::Kind::UnknownId));
        REQUIRE(err.message().find("42") != std::string::npos);
    }

    SECTION("EntityError::duplicate_component") {
        Error err = EntityError::duplicate_component("7/n3", "Alpha");
        REQUIRE(err.code() == ErrorCode::AlreadyExists);
        REQUIRE(err.as<EntityError>()->component == "Alpha");
    }

    SECTION("EntityError::invalid_transition") {
        Error err = EntityError::invalid_transition("7/n3", "Allocated", "Started");
        REQUIRE(err.code() == ErrorCode::InvalidState);
        REQUIRE(err.message().find("Started") != std::string::npos);
    }

    SECTION("EntityError::structural_inconsistency") {
        Error err = EntityError::structural_inconsistency("7/n3", "dangling child");
        REQUIRE(err.code() == ErrorCode::Inconsistent);
        REQUIRE_FALSE(err.is_entity_error(EntityError::Kind::NotFound));
    }

    SECTION("EventError::cyclic_ordering") {
        Error err = EventError::cyclic_ordering("Damage");
        REQUIRE(err.is<EventError>());
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
    }

    SECTION("SessionError::unknown_session") {
        Error err = SessionError::unknown_session(9);
        REQUIRE(err.code() == ErrorCode::NotFound);
        REQUIRE(err.as<SessionError>()->session == 9);
    }

    SECTION("ConfigError::invalid_value") {
        Error err = ConfigError::invalid_value("fault_mode", "loud");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.as<ConfigError>()->key == "fault_mode");
    }
}

TEST_CASE("Error chain formatting", "[core][error]") {
    Error err = EntityError::creation_failure("crate (4/n2)", "load failed");
    err.with_context("cause", "ParseError");

    std::string chain = build_error_chain(err);
    REQUIRE(chain.find("CreationFailed") != std::string::npos);
    REQUIRE(chain.find("load failed") != std::string::npos);
    REQUIRE(chain.find("cause: ParseError") != std::string::npos);
}

// =============================================================================
// Result<T> Tests
// =============================================================================

TEST_CASE("Result construction", "[core][result]") {
    SECTION("Ok with value") {
        Result<int> r = Ok(42);
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
        REQUIRE(r.value() == 42);
    }

    SECTION("Ok void") {
        Result<void> r = Ok();
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
    }

    SECTION("Err with Error object") {
        Error err(ErrorCode::NotFound, "Not found");
        Result<int> r = Err<int>(err);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::NotFound);
    }

    SECTION("Err void from domain error") {
        Result<void> r = Err(EntityError::not_found("3/n1", "Beta"));
        REQUIRE_FALSE(r);
        REQUIRE(r.error().is_entity_error(EntityError::Kind::NotFound));
    }
}

TEST_CASE("Result value access", "[core][result]") {
    SECTION("value_or on Err") {
        Result<int> r = Err<int>(Error("error"));
        REQUIRE(r.value_or(7) == 7);
    }

    SECTION("unwrap on Err throws") {
        Result<int> r = Err<int>(Error("broken"));
        REQUIRE_THROWS_AS(r.unwrap(), std::runtime_error);
    }

    SECTION("map and and_then") {
        Result<int> r = Ok(20);
        auto doubled = r.map([](int v) { return v * 2; });
        REQUIRE(doubled.value() == 40);

        Result<int> chained = Ok(1);
        auto next = chained.and_then([](int v) -> Result<int> { return Err<int>(Error(std::to_string(v))); });
        REQUIRE(next.is_err());
        REQUIRE(next.error().message() == "1");
    }
}

// =============================================================================
// Statistics
// =============================================================================

TEST_CASE("Error statistics", "[core][error]") {
    debug::reset_error_stats();

    debug::record_error(EntityError::structural_inconsistency("1/n1", "dangling"));
    debug::record_error(EntityError::unknown_id("2"));

    REQUIRE(debug::total_error_count() == 2);
    REQUIRE(debug::structural_error_count() == 1);
    REQUIRE_FALSE(debug::error_stats_summary().empty());

    debug::reset_error_stats();
    REQUIRE(debug::total_error_count() == 0);
}
