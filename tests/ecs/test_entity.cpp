// strata_ecs Entity tests

#include <catch2/catch_test_macros.hpp>
#include <strata/ecs/entity.hpp>

#include <nlohmann/json.hpp>

#include <sstream>
#include <stdexcept>
#include <unordered_set>

using namespace strata_ecs;

// =============================================================================
// Entity Tests
// =============================================================================

TEST_CASE("Entity construction", "[ecs][entity]") {
    SECTION("default is null") {
        Entity e;
        REQUIRE(e.is_null());
        REQUIRE_FALSE(e.is_valid());
        REQUIRE_FALSE(static_cast<bool>(e));
    }

    SECTION("null factory") {
        REQUIRE(Entity::null().is_null());
        REQUIRE(Entity::null() == Entity{});
    }

    SECTION("explicit construction") {
        Entity e(42);
        REQUIRE(e.value() == 42);
        REQUIRE(e.is_valid());
    }

    SECTION("allocation starts at 1") {
        strata_core::IdAllocator ids;
        REQUIRE(Entity::allocate(ids).value() == 1);
        REQUIRE(Entity::allocate(ids).value() == 2);
    }
}

TEST_CASE("Entity comparison and hashing", "[ecs][entity]") {
    Entity a(1);
    Entity b(1);
    Entity c(2);

    REQUIRE(a == b);
    REQUIRE(a != c);
    REQUIRE(a < c);

    std::unordered_set<Entity> set{a, b, c};
    REQUIRE(set.size() == 2);
}

TEST_CASE("Entity text form", "[ecs][entity]") {
    Entity e(1234);
    REQUIRE(e.to_string() == "1234");
    REQUIRE(Entity::null().to_string() == "0");

    std::ostringstream oss;
    oss << e;
    REQUIRE(oss.str() == "1234");
}

TEST_CASE("Entity JSON conversion", "[ecs][entity]") {
    nlohmann::json j = Entity(77);
    REQUIRE(j == 77);
    REQUIRE(j.get<Entity>() == Entity(77));

    SECTION("rejects zero") {
        REQUIRE_THROWS_AS(nlohmann::json(0).get<Entity>(), std::invalid_argument);
    }

    SECTION("rejects negative and non-integer") {
        REQUIRE_THROWS_AS(nlohmann::json(-5).get<Entity>(), std::invalid_argument);
        REQUIRE_THROWS_AS(nlohmann::json(2.5).get<Entity>(), std::invalid_argument);
        REQUIRE_THROWS_AS(nlohmann::json("3").get<Entity>(), std::invalid_argument);
    }
}
