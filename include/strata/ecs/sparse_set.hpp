#pragma once

/// @file sparse_set.hpp
/// @brief Entity to dense slot mapping over a Column
///
/// SparseSet<T> keeps three parallel structures:
///   - index_by_entity: Entity -> dense index
///   - dense_entities:  dense index -> Entity
///   - dense:           Column of T, one element per dense index
///
/// Insert, remove and lookup are O(1). Removal swap-compacts the column and
/// remaps the entity that used to sit in the last slot, so dense indices stay
/// contiguous. Element order is unspecified once anything has been removed.

#include "fwd.hpp"
#include "entity.hpp"
#include "column.hpp"

#include <strata/core/error.hpp>
#include <strata/core/fatal.hpp>
#include <strata/core/id.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <exception>
#include <iterator>
#include <optional>
#include <span>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace strata_ecs {

// =============================================================================
// Concepts
// =============================================================================

/// Component types that round-trip through nlohmann::json
template<typename T>
concept JsonSerializable =
    std::is_constructible_v<nlohmann::json, const T&> &&
    requires(const nlohmann::json& j) {
        { j.template get<T>() };
    };

// =============================================================================
// Entry / Drained
// =============================================================================

/// One live (entity, value) pair yielded by iteration
template<typename T>
struct Entry {
    Entity entity;
    T& value;
};

/// Result of SparseSet::take_all, positioned by former dense index
template<typename T>
struct Drained {
    std::vector<Entity> entities;
    std::vector<T> values;

    [[nodiscard]] std::size_t size() const noexcept { return entities.size(); }
    [[nodiscard]] bool empty() const noexcept { return entities.empty(); }
};

// =============================================================================
// EntryRange
// =============================================================================

/// Range over the live entries of a sparse set, in increasing dense order
template<typename T>
class EntryRange {
public:
    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = Entry<T>;
        using difference_type = std::ptrdiff_t;

        iterator() noexcept = default;
        iterator(const EntryRange* range, std::size_t index) noexcept
            : m_range(range), m_index(index) {}

        [[nodiscard]] Entry<T> operator*() const {
            return Entry<T>{m_range->m_entities[m_index], m_range->m_values[m_index]};
        }

        iterator& operator++() noexcept {
            ++m_index;
            return *this;
        }

        iterator operator++(int) noexcept {
            iterator tmp = *this;
            ++m_index;
            return tmp;
        }

        [[nodiscard]] bool operator==(const iterator& other) const noexcept {
            return m_index == other.m_index;
        }

        [[nodiscard]] bool operator!=(const iterator& other) const noexcept {
            return m_index != other.m_index;
        }

    private:
        const EntryRange* m_range = nullptr;
        std::size_t m_index = 0;
    };

    EntryRange(std::span<const Entity> entities, ColumnView<T> values) noexcept
        : m_entities(entities), m_values(values) {}

    [[nodiscard]] iterator begin() const noexcept { return iterator(this, 0); }
    [[nodiscard]] iterator end() const noexcept { return iterator(this, m_entities.size()); }
    [[nodiscard]] std::size_t size() const noexcept { return m_entities.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_entities.empty(); }

private:
    std::span<const Entity> m_entities;
    ColumnView<T> m_values;
};

// =============================================================================
// SparseSet
// =============================================================================

template<typename T>
class SparseSet {
    static_assert(Component<T>, "SparseSet elements must satisfy Component");

public:
    using value_type = T;
    using size_type = std::size_t;

    explicit SparseSet(size_type initial_capacity = 0,
                       strata_memory::IAllocator& allocator = strata_memory::default_allocator())
        : m_dense(Column::of<T>(initial_capacity, allocator))
    {
        m_index.reserve(initial_capacity);
        m_entities.reserve(initial_capacity);
    }

    /// Create a set whose column carries a display name
    SparseSet(std::string name,
              size_type initial_capacity,
              strata_memory::IAllocator& allocator = strata_memory::default_allocator())
        : m_dense(ColumnLayout::named<T>(std::move(name)), initial_capacity, allocator)
    {
        m_index.reserve(initial_capacity);
        m_entities.reserve(initial_capacity);
    }

    SparseSet(const SparseSet&) = delete;
    SparseSet& operator=(const SparseSet&) = delete;
    SparseSet(SparseSet&&) noexcept = default;
    SparseSet& operator=(SparseSet&&) noexcept = default;

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] bool contains(Entity entity) const {
        return m_index.find(entity) != m_index.end();
    }

    [[nodiscard]] bool has(Entity entity) const {
        return contains(entity);
    }

    [[nodiscard]] size_type size() const noexcept { return m_entities.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_entities.empty(); }

    /// Dense index of an entity, if present
    [[nodiscard]] std::optional<size_type> index_of(Entity entity) const {
        auto it = m_index.find(entity);
        if (it == m_index.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    /// Entities in dense order
    [[nodiscard]] std::span<const Entity> entities() const noexcept {
        return m_entities;
    }

    /// Values in dense order
    [[nodiscard]] ColumnView<const T> values() const {
        return m_dense.view<T>();
    }

    [[nodiscard]] ColumnView<T> values_mut() {
        return m_dense.view_mut<T>();
    }

    [[nodiscard]] const Column& column() const noexcept { return m_dense; }

    // =========================================================================
    // Mutation
    // =========================================================================

    /// Insert or replace the value for an entity
    /// @return The previous value when the entity was already present
    std::optional<T> add(Entity entity, T value) {
        STRATA_VERIFY(entity.is_valid(), "SparseSet::add called with the null entity");

        auto it = m_index.find(entity);
        if (it != m_index.end()) {
            return m_dense.replace<T>(it->second, std::move(value));
        }

        const size_type index = m_entities.size();
        m_dense.push<T>(std::move(value));
        m_entities.push_back(entity);
        m_index.emplace(entity, index);
        return std::nullopt;
    }

    /// Remove an entity's value
    /// @return false if the entity was not present
    bool remove(Entity entity) {
        auto it = m_index.find(entity);
        if (it == m_index.end()) {
            return false;
        }

        const size_type index = it->second;
        const size_type last = m_entities.size() - 1;
        m_index.erase(it);

        m_dense.swap_remove(index);

        if (index != last) {
            const Entity moved = m_entities[last];
            m_entities[index] = moved;
            m_index.find(moved)->second = index;
        }
        m_entities.pop_back();
        return true;
    }

    [[nodiscard]] const T* get(Entity entity) const {
        auto it = m_index.find(entity);
        return it != m_index.end() ? &m_dense.get<T>(it->second) : nullptr;
    }

    [[nodiscard]] T* get_mut(Entity entity) {
        auto it = m_index.find(entity);
        return it != m_index.end() ? &m_dense.get<T>(it->second) : nullptr;
    }

    /// Any single live entry (the one at dense index 0)
    [[nodiscard]] std::optional<std::pair<Entity, const T*>> get_any() const {
        if (empty()) {
            return std::nullopt;
        }
        return std::make_pair(m_entities.front(), &m_dense.get<T>(0));
    }

    [[nodiscard]] std::optional<std::pair<Entity, T*>> get_any_mut() {
        if (empty()) {
            return std::nullopt;
        }
        return std::make_pair(m_entities.front(), &m_dense.get<T>(0));
    }

    /// Move every entry out, leaving the set empty
    [[nodiscard]] Drained<T> take_all() {
        Drained<T> drained;
        drained.values = m_dense.drain<T>();
        drained.entities = std::move(m_entities);
        m_entities.clear();
        m_index.clear();
        return drained;
    }

    void clear() {
        m_dense.clear();
        m_entities.clear();
        m_index.clear();
    }

    void reserve(size_type capacity) {
        m_dense.reserve(capacity);
        m_entities.reserve(capacity);
        m_index.reserve(capacity);
    }

    // =========================================================================
    // Iteration
    // =========================================================================

    [[nodiscard]] EntryRange<const T> iter() const {
        return EntryRange<const T>(m_entities, m_dense.view<T>());
    }

    /// Mutable pass; each dense slot is yielded exactly once
    [[nodiscard]] EntryRange<T> iter_mut() {
        STRATA_VERIFY(m_dense.size() == m_entities.size() && m_index.size() == m_entities.size(),
            "SparseSet density invariant broken");
        return EntryRange<T>(m_entities, m_dense.view_mut<T>());
    }

    /// Full consistency check of the three parallel structures
    [[nodiscard]] bool verify_invariants() const {
        if (m_dense.size() != m_entities.size() || m_index.size() != m_entities.size()) {
            return false;
        }
        for (const auto& [entity, index] : m_index) {
            if (index >= m_entities.size() || m_entities[index] != entity) {
                return false;
            }
        }
        return true;
    }

    // =========================================================================
    // Serialization
    // =========================================================================

    /// Object keyed by decimal entity id
    [[nodiscard]] nlohmann::json to_json() const requires JsonSerializable<T> {
        nlohmann::json out = nlohmann::json::object();
        auto values = m_dense.view<T>();
        for (size_type i = 0; i < m_entities.size(); ++i) {
            out[m_entities[i].to_string()] = nlohmann::json(values[i]);
        }
        return out;
    }

    /// Decode a set from an object keyed by entity id, or an array of
    /// [id, value] pairs. Later duplicates overwrite earlier ones.
    [[nodiscard]] static strata_core::Result<SparseSet> from_json(
        const nlohmann::json& json,
        size_type initial_capacity = 0,
        strata_memory::IAllocator& allocator = strata_memory::default_allocator())
        requires JsonSerializable<T>
    {
        using strata_core::StoreError;

        SparseSet set(initial_capacity, allocator);

        if (json.is_object()) {
            for (auto it = json.begin(); it != json.end(); ++it) {
                auto id = strata_core::parse_id(it.key());
                if (!id) {
                    return strata_core::Err<SparseSet>(StoreError::invalid_entity(it.key()));
                }
                if (auto err = set.decode_into(Entity{*id}, it.key(), it.value())) {
                    return strata_core::Err<SparseSet>(std::move(*err));
                }
            }
        } else if (json.is_array()) {
            for (const auto& pair : json) {
                if (!pair.is_array() || pair.size() != 2) {
                    return strata_core::Err<SparseSet>(
                        StoreError::malformed("expected [id, value] pair, got " + pair.dump()));
                }
                Entity entity;
                try {
                    entity = pair[0].template get<Entity>();
                } catch (const std::exception&) {
                    return strata_core::Err<SparseSet>(StoreError::invalid_entity(pair[0].dump()));
                }
                if (auto err = set.decode_into(entity, entity.to_string(), pair[1])) {
                    return strata_core::Err<SparseSet>(std::move(*err));
                }
            }
        } else {
            return strata_core::Err<SparseSet>(
                StoreError::malformed(std::string("expected object or array, got ") + json.type_name()));
        }

        return set;
    }

private:
    std::optional<strata_core::StoreError> decode_into(Entity entity, const std::string& key,
                                                       const nlohmann::json& value) {
        try {
            add(entity, value.template get<T>());
        } catch (const std::exception& e) {
            return strata_core::StoreError::component_decode(key, e.what());
        }
        return std::nullopt;
    }

    std::unordered_map<Entity, size_type> m_index;
    std::vector<Entity> m_entities;
    Column m_dense;
};

// =============================================================================
// nlohmann ADL hook
// =============================================================================

template<JsonSerializable T>
void to_json(nlohmann::json& j, const SparseSet<T>& set) {
    j = set.to_json();
}

} // namespace strata_ecs
