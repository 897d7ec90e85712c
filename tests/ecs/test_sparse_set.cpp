// strata_ecs SparseSet tests

#include <catch2/catch_test_macros.hpp>
#include <strata/ecs/sparse_set.hpp>

#include "support/test_support.hpp"

#include <map>
#include <random>
#include <set>
#include <string>
#include <vector>

using namespace strata_ecs;
using strata_test::FatalException;
using strata_test::Marker;
using strata_test::ScopedFatalHandler;
using strata_test::Tracked;

namespace {

struct Health {
    int current;
    int max;
};

} // namespace

// =============================================================================
// Basic Operations
// =============================================================================

TEST_CASE("SparseSet add and lookup", "[ecs][sparse_set]") {
    SparseSet<Health> set;
    const Entity a(1);
    const Entity b(2);

    REQUIRE(set.empty());
    REQUIRE_FALSE(set.contains(a));
    REQUIRE(set.get(a) == nullptr);

    REQUIRE_FALSE(set.add(a, Health{10, 20}).has_value());
    REQUIRE(set.contains(a));
    REQUIRE(set.has(a));
    REQUIRE_FALSE(set.contains(b));
    REQUIRE(set.size() == 1);

    const Health* h = set.get(a);
    REQUIRE(h != nullptr);
    REQUIRE(h->current == 10);
    REQUIRE(h->max == 20);

    SECTION("get_mut writes through") {
        set.get_mut(a)->current = 5;
        REQUIRE(set.get(a)->current == 5);
    }

    SECTION("add on a present entity replaces") {
        auto previous = set.add(a, Health{1, 2});
        REQUIRE(previous.has_value());
        REQUIRE(previous->current == 10);
        REQUIRE(set.get(a)->current == 1);
        REQUIRE(set.size() == 1);
    }

    SECTION("remove of an absent entity is a no-op") {
        REQUIRE_FALSE(set.remove(b));
        REQUIRE(set.size() == 1);
    }
}

TEST_CASE("SparseSet removal compacts", "[ecs][sparse_set]") {
    SparseSet<std::string> set;
    const Entity a(10);
    const Entity b(11);
    const Entity c(12);

    set.add(a, "A");
    set.add(b, "B");
    set.add(c, "C");

    REQUIRE(set.index_of(a) == 0u);
    REQUIRE(set.index_of(b) == 1u);
    REQUIRE(set.index_of(c) == 2u);

    REQUIRE(set.remove(b));

    REQUIRE(set.index_of(a) == 0u);
    REQUIRE(set.index_of(c) == 1u);
    REQUIRE_FALSE(set.index_of(b).has_value());
    REQUIRE_FALSE(set.contains(b));
    REQUIRE(*set.get(c) == "C");

    std::set<Entity> seen;
    for (auto [entity, value] : set.iter()) {
        seen.insert(entity);
        REQUIRE(value == (entity == a ? "A" : "C"));
    }
    REQUIRE(seen == std::set<Entity>{a, c});
    REQUIRE(set.verify_invariants());

    SECTION("removing the last dense slot needs no remap") {
        REQUIRE(set.remove(c));
        REQUIRE(set.index_of(a) == 0u);
        REQUIRE(set.size() == 1);
        REQUIRE(set.verify_invariants());
    }
}

TEST_CASE("SparseSet invariants under random operations", "[ecs][sparse_set]") {
    SparseSet<int> set;
    std::map<std::uint64_t, int> model;
    std::mt19937 rng(12345);
    std::uniform_int_distribution<std::uint64_t> pick_entity(1, 64);
    std::uniform_int_distribution<int> pick_op(0, 2);

    for (int step = 0; step < 2000; ++step) {
        const Entity e(pick_entity(rng));
        if (pick_op(rng) == 0) {
            REQUIRE(set.remove(e) == (model.erase(e.value()) == 1));
        } else {
            const int value = step;
            auto previous = set.add(e, value);
            auto it = model.find(e.value());
            REQUIRE(previous.has_value() == (it != model.end()));
            if (previous) {
                REQUIRE(*previous == it->second);
            }
            model[e.value()] = value;
        }
    }

    REQUIRE(set.verify_invariants());
    REQUIRE(set.size() == model.size());

    std::set<std::size_t> indices;
    for (const auto& [id, value] : model) {
        auto index = set.index_of(Entity(id));
        REQUIRE(index.has_value());
        REQUIRE(indices.insert(*index).second);
        REQUIRE(*set.get(Entity(id)) == value);
    }
}

// =============================================================================
// Iteration
// =============================================================================

TEST_CASE("SparseSet iteration", "[ecs][sparse_set]") {
    SparseSet<int> set;
    for (std::uint64_t id = 1; id <= 5; ++id) {
        set.add(Entity(id), static_cast<int>(id) * 10);
    }

    SECTION("visits dense order once") {
        std::vector<Entity> order;
        for (auto entry : set.iter()) {
            order.push_back(entry.entity);
        }
        auto entities = set.entities();
        REQUIRE(order == std::vector<Entity>(entities.begin(), entities.end()));
    }

    SECTION("mutable pass writes through") {
        for (auto [entity, value] : set.iter_mut()) {
            value += static_cast<int>(entity.value());
        }
        REQUIRE(*set.get(Entity(3)) == 33);
        REQUIRE(*set.get(Entity(5)) == 55);
    }

    SECTION("values view follows entities") {
        auto values = set.values();
        auto entities = set.entities();
        REQUIRE(values.size() == entities.size());
        for (std::size_t i = 0; i < values.size(); ++i) {
            REQUIRE(values[i] == static_cast<int>(entities[i].value()) * 10);
        }
    }

    SECTION("empty set yields nothing") {
        SparseSet<int> empty;
        REQUIRE(empty.iter().empty());
        REQUIRE(empty.iter_mut().empty());
    }
}

// =============================================================================
// Bulk Operations
// =============================================================================

TEST_CASE("SparseSet take_all", "[ecs][sparse_set]") {
    SparseSet<std::string> set;
    set.add(Entity(1), "one");
    set.add(Entity(2), "two");
    set.add(Entity(3), "three");
    set.remove(Entity(1));

    auto drained = set.take_all();
    REQUIRE(drained.size() == 2);
    REQUIRE(drained.values.size() == 2);
    for (std::size_t i = 0; i < drained.size(); ++i) {
        REQUIRE(drained.values[i] == (drained.entities[i] == Entity(2) ? "two" : "three"));
    }

    REQUIRE(set.empty());
    REQUIRE_FALSE(set.contains(Entity(2)));
    REQUIRE(set.verify_invariants());

    set.add(Entity(4), "four");
    REQUIRE(set.index_of(Entity(4)) == 0u);
}

TEST_CASE("SparseSet get_any", "[ecs][sparse_set]") {
    SparseSet<int> set;
    REQUIRE_FALSE(set.get_any().has_value());

    set.add(Entity(7), 70);
    auto any = set.get_any();
    REQUIRE(any.has_value());
    REQUIRE(any->first == Entity(7));
    REQUIRE(*any->second == 70);

    *set.get_any_mut()->second = 71;
    REQUIRE(*set.get(Entity(7)) == 71);
}

TEST_CASE("SparseSet clear finalizes values", "[ecs][sparse_set]") {
    Tracked::reset();
    {
        SparseSet<Tracked> set;
        set.add(Entity(1), Tracked{1});
        set.add(Entity(2), Tracked{2});
        set.add(Entity(3), Tracked{3});
        REQUIRE(Tracked::live == 3);

        set.remove(Entity(2));
        REQUIRE(Tracked::destroyed == 1);

        set.clear();
        REQUIRE(Tracked::destroyed == 3);
        REQUIRE(set.empty());
        REQUIRE(set.verify_invariants());
    }
    REQUIRE(Tracked::live == 0);
}

TEST_CASE("SparseSet of zero-sized components", "[ecs][sparse_set]") {
    SparseSet<Marker> set;
    set.add(Entity(1), Marker{});
    set.add(Entity(2), Marker{});
    set.add(Entity(3), Marker{});

    REQUIRE(set.size() == 3);
    REQUIRE(set.column().data() == nullptr);

    REQUIRE(set.remove(Entity(1)));
    REQUIRE(set.contains(Entity(3)));
    REQUIRE(set.get(Entity(3)) != nullptr);
    REQUIRE(set.verify_invariants());
}

TEST_CASE("SparseSet rejects the null entity", "[ecs][sparse_set][fatal]") {
    ScopedFatalHandler handler;
    SparseSet<int> set;

    REQUIRE_THROWS_AS(set.add(Entity::null(), 1), FatalException);
    REQUIRE(set.empty());
    REQUIRE_FALSE(set.remove(Entity::null()));
}
