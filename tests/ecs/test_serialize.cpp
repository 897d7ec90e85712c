// strata_ecs SparseSet JSON persistence tests

#include <catch2/catch_test_macros.hpp>
#include <strata/ecs/sparse_set.hpp>

#include <nlohmann/json.hpp>

#include <string>

using namespace strata_ecs;
using nlohmann::json;

namespace {

struct Position {
    float x = 0.0f;
    float y = 0.0f;
};

void to_json(json& j, const Position& p) {
    j = json{{"x", p.x}, {"y", p.y}};
}

void from_json(const json& j, Position& p) {
    j.at("x").get_to(p.x);
    j.at("y").get_to(p.y);
}

struct Opaque {
    int secret = 0;
};

} // namespace

static_assert(JsonSerializable<int>);
static_assert(JsonSerializable<std::string>);
static_assert(JsonSerializable<Position>);
static_assert(!JsonSerializable<Opaque>);

// =============================================================================
// Save
// =============================================================================

TEST_CASE("SparseSet to_json keys by decimal id", "[ecs][serialize]") {
    SparseSet<Position> set;
    set.add(Entity(3), Position{1.0f, 2.0f});
    set.add(Entity(12), Position{-4.5f, 0.0f});

    json out = set.to_json();
    REQUIRE(out.is_object());
    REQUIRE(out.size() == 2);
    REQUIRE(out["3"]["x"] == 1.0f);
    REQUIRE(out["12"]["x"] == -4.5f);

    SECTION("empty set saves an empty object") {
        SparseSet<int> empty;
        REQUIRE(empty.to_json() == json::object());
    }

    SECTION("ADL to_json matches the member") {
        json via_adl = set;
        REQUIRE(via_adl == out);
    }
}

// =============================================================================
// Load
// =============================================================================

TEST_CASE("SparseSet from_json", "[ecs][serialize]") {
    SECTION("object form") {
        auto result = SparseSet<std::string>::from_json(json{{"1", "one"}, {"42", "forty-two"}});
        REQUIRE(result.is_ok());
        auto& set = result.value();
        REQUIRE(set.size() == 2);
        REQUIRE(*set.get(Entity(42)) == "forty-two");
        REQUIRE(set.verify_invariants());
    }

    SECTION("array of pairs") {
        json input = json::array({json::array({5, 50}), json::array({6, 60})});
        auto result = SparseSet<int>::from_json(input);
        REQUIRE(result.is_ok());
        REQUIRE(*result.value().get(Entity(5)) == 50);
        REQUIRE(*result.value().get(Entity(6)) == 60);
    }

    SECTION("later duplicates overwrite") {
        json input = json::array({json::array({5, 1}), json::array({5, 2})});
        auto result = SparseSet<int>::from_json(input);
        REQUIRE(result.is_ok());
        REQUIRE(result.value().size() == 1);
        REQUIRE(*result.value().get(Entity(5)) == 2);
    }

    SECTION("saved sets load back") {
        SparseSet<Position> original;
        original.add(Entity(9), Position{3.0f, 4.0f});
        auto result = SparseSet<Position>::from_json(original.to_json());
        REQUIRE(result.is_ok());
        REQUIRE(result.value().get(Entity(9))->y == 4.0f);
    }
}

TEST_CASE("SparseSet from_json rejects bad input", "[ecs][serialize]") {
    using strata_core::ErrorCode;
    using strata_core::StoreError;

    auto kind_of = [](const strata_core::Error& error) {
        REQUIRE(error.is<StoreError>());
        return error.as<StoreError>()->kind;
    };

    SECTION("zero id") {
        auto result = SparseSet<int>::from_json(json{{"0", 1}});
        REQUIRE(result.is_err());
        REQUIRE(kind_of(result.error()) == StoreError::Kind::InvalidEntity);
        REQUIRE(result.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("negative id") {
        auto result = SparseSet<int>::from_json(json{{"-3", 1}});
        REQUIRE(result.is_err());
        REQUIRE(kind_of(result.error()) == StoreError::Kind::InvalidEntity);
    }

    SECTION("non-integer id") {
        REQUIRE(SparseSet<int>::from_json(json{{"abc", 1}}).is_err());
        REQUIRE(SparseSet<int>::from_json(json{{"1.5", 1}}).is_err());
        REQUIRE(SparseSet<int>::from_json(json{{"", 1}}).is_err());
    }

    SECTION("non-integer id in pair form") {
        json input = json::array({json::array({"7", 1})});
        auto result = SparseSet<int>::from_json(input);
        REQUIRE(result.is_err());
        REQUIRE(kind_of(result.error()) == StoreError::Kind::InvalidEntity);
    }

    SECTION("malformed pair") {
        json input = json::array({json::array({1, 2, 3})});
        auto result = SparseSet<int>::from_json(input);
        REQUIRE(result.is_err());
        REQUIRE(kind_of(result.error()) == StoreError::Kind::MalformedData);
    }

    SECTION("wrong top-level type") {
        auto result = SparseSet<int>::from_json(json("text"));
        REQUIRE(result.is_err());
        REQUIRE(kind_of(result.error()) == StoreError::Kind::MalformedData);
    }

    SECTION("component value of the wrong shape") {
        auto result = SparseSet<Position>::from_json(json{{"4", {{"x", 1.0}}}});
        REQUIRE(result.is_err());
        REQUIRE(kind_of(result.error()) == StoreError::Kind::ComponentDecode);
        REQUIRE(result.error().as<StoreError>()->key == "4");
    }
}
