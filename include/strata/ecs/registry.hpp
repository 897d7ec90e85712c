#pragma once

/// @file registry.hpp
/// @brief Component registry: one locked sparse set per component kind
///
/// The registry owns the entity id allocator and a table of component
/// slots keyed by type. Each slot holds a SparseSet<T> behind its own
/// reader/writer lock, so readers of one kind never wait on writers of
/// another. The kind table has a separate lock held only while a slot is
/// looked up or created.
///
/// @code
/// strata_ecs::Registry registry;
/// auto e = registry.create_entity();
/// registry.write<Position>()->add(e, Position{1.0f, 2.0f});
///
/// auto positions = registry.read<Position>();
/// for (auto [entity, pos] : positions->iter()) { ... }
/// @endcode

#include "fwd.hpp"
#include "entity.hpp"
#include "sparse_set.hpp"

#include <strata/core/config.hpp>
#include <strata/core/error.hpp>
#include <strata/core/id.hpp>
#include <strata/core/log.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace strata_ecs {

// =============================================================================
// ComponentSlotBase
// =============================================================================

/// Type-erased registry slot
///
/// Virtuals that touch the live set take the slot's own lock, so callers
/// must not hold it. Staging is serialized by the registry's load lock.
class ComponentSlotBase {
public:
    ComponentSlotBase(std::string name, std::type_index type)
        : m_name(std::move(name)), m_type(type) {}

    virtual ~ComponentSlotBase() = default;

    ComponentSlotBase(const ComponentSlotBase&) = delete;
    ComponentSlotBase& operator=(const ComponentSlotBase&) = delete;

    [[nodiscard]] const std::string& name() const noexcept { return m_name; }
    [[nodiscard]] std::type_index type() const noexcept { return m_type; }
    [[nodiscard]] std::shared_mutex& mutex() const noexcept { return m_mutex; }

    /// Remove an entity's value (exclusive lock)
    virtual bool remove_entity(Entity entity) = 0;

    /// Live entries (shared lock)
    [[nodiscard]] virtual std::size_t size() const = 0;

    /// Whether the component type round-trips through JSON
    [[nodiscard]] virtual bool serializable() const noexcept = 0;

    /// Snapshot of the set (shared lock); null for non-serializable kinds
    [[nodiscard]] virtual nlohmann::json save() const = 0;

    /// Decode a snapshot into a staging set without touching live data
    [[nodiscard]] virtual strata_core::Result<void> stage(const nlohmann::json& json) = 0;

    /// Largest entity id in the staged set (0 if none)
    [[nodiscard]] virtual std::uint64_t staged_max_id() const = 0;

    /// Swap the staged set in (exclusive lock); no-op when nothing is staged
    virtual void commit() = 0;

    /// Drop the staged set
    virtual void discard() noexcept = 0;

private:
    std::string m_name;
    std::type_index m_type;
    mutable std::shared_mutex m_mutex;
};

// =============================================================================
// ComponentSlot<T>
// =============================================================================

template<typename T>
class ComponentSlot final : public ComponentSlotBase {
public:
    ComponentSlot(std::string name, std::size_t initial_capacity, strata_memory::IAllocator& allocator)
        : ComponentSlotBase(name, std::type_index(typeid(T)))
        , m_set(std::move(name), initial_capacity, allocator)
        , m_initial_capacity(initial_capacity)
        , m_allocator(&allocator) {}

    /// The set itself; callers synchronize through mutex()
    [[nodiscard]] SparseSet<T>& set() noexcept { return m_set; }
    [[nodiscard]] const SparseSet<T>& set() const noexcept { return m_set; }

    bool remove_entity(Entity entity) override {
        std::unique_lock lock(mutex());
        return m_set.remove(entity);
    }

    [[nodiscard]] std::size_t size() const override {
        std::shared_lock lock(mutex());
        return m_set.size();
    }

    [[nodiscard]] bool serializable() const noexcept override {
        return JsonSerializable<T>;
    }

    [[nodiscard]] nlohmann::json save() const override {
        if constexpr (JsonSerializable<T>) {
            std::shared_lock lock(mutex());
            return m_set.to_json();
        } else {
            return nullptr;
        }
    }

    [[nodiscard]] strata_core::Result<void> stage(const nlohmann::json& json) override {
        if constexpr (JsonSerializable<T>) {
            auto decoded = SparseSet<T>::from_json(json, m_initial_capacity, *m_allocator);
            if (!decoded) {
                return strata_core::Err(std::move(decoded.error()));
            }
            m_staged.emplace(std::move(decoded).value());
            return strata_core::Ok();
        } else {
            return strata_core::Err(strata_core::StoreError::component_decode(
                name(), "component type has no JSON representation"));
        }
    }

    [[nodiscard]] std::uint64_t staged_max_id() const override {
        std::uint64_t max_id = strata_core::IdAllocator::NULL_ID;
        if (m_staged) {
            for (Entity e : m_staged->entities()) {
                if (e.value() > max_id) {
                    max_id = e.value();
                }
            }
        }
        return max_id;
    }

    void commit() override {
        if (!m_staged) {
            return;
        }
        std::unique_lock lock(mutex());
        m_set = std::move(*m_staged);
        m_staged.reset();
    }

    void discard() noexcept override {
        m_staged.reset();
    }

private:
    SparseSet<T> m_set;
    std::optional<SparseSet<T>> m_staged;
    std::size_t m_initial_capacity;
    strata_memory::IAllocator* m_allocator;
};

// =============================================================================
// Guards
// =============================================================================

/// Shared access to one component kind; the lock is held for the guard's lifetime
template<typename T>
class ReadGuard {
public:
    explicit ReadGuard(const ComponentSlot<T>& slot)
        : m_lock(slot.mutex()), m_set(&slot.set()) {}

    [[nodiscard]] const SparseSet<T>& get() const noexcept { return *m_set; }
    [[nodiscard]] const SparseSet<T>& operator*() const noexcept { return *m_set; }
    [[nodiscard]] const SparseSet<T>* operator->() const noexcept { return m_set; }

private:
    std::shared_lock<std::shared_mutex> m_lock;
    const SparseSet<T>* m_set;
};

/// Exclusive access to one component kind; the lock is held for the guard's lifetime
template<typename T>
class WriteGuard {
public:
    explicit WriteGuard(ComponentSlot<T>& slot)
        : m_lock(slot.mutex()), m_set(&slot.set()) {}

    [[nodiscard]] SparseSet<T>& get() const noexcept { return *m_set; }
    [[nodiscard]] SparseSet<T>& operator*() const noexcept { return *m_set; }
    [[nodiscard]] SparseSet<T>* operator->() const noexcept { return m_set; }

private:
    std::unique_lock<std::shared_mutex> m_lock;
    SparseSet<T>* m_set;
};

// =============================================================================
// Registry
// =============================================================================

class Registry {
public:
    /// Snapshot format version written by save()
    static constexpr std::uint32_t SNAPSHOT_VERSION = 1;

    Registry();
    explicit Registry(strata_core::StoreConfig config,
                      strata_memory::IAllocator& allocator = strata_memory::default_allocator());
    ~Registry();

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;
    Registry(Registry&&) = delete;
    Registry& operator=(Registry&&) = delete;

    // =========================================================================
    // Entities
    // =========================================================================

    /// Allocate a fresh entity (thread-safe)
    [[nodiscard]] Entity create_entity();

    /// Allocate count consecutive entities in one atomic step
    [[nodiscard]] std::vector<Entity> create_entities(std::size_t count);

    /// Remove an entity from every component set, one kind at a time
    /// @return Number of sets that held the entity
    std::size_t destroy_entity(Entity entity);

    [[nodiscard]] strata_core::IdAllocator& ids() noexcept { return m_ids; }
    [[nodiscard]] const strata_core::IdAllocator& ids() const noexcept { return m_ids; }

    // =========================================================================
    // Component Kinds
    // =========================================================================

    /// Register a component kind under a stable name
    ///
    /// Registering a type again is a no-op that keeps the first name. Using
    /// a name already taken by another type fails with NameConflict.
    template<Component T>
    strata_core::Result<void> register_component(std::string name) {
        std::unique_lock lock(m_slots_mutex);
        auto inserted = insert_slot<T>(std::move(name));
        if (!inserted) {
            return strata_core::Err(std::move(inserted.error()));
        }
        return strata_core::Ok();
    }

    template<Component T>
    [[nodiscard]] bool has_component() const {
        std::shared_lock lock(m_slots_mutex);
        return m_slots.find(std::type_index(typeid(T))) != m_slots.end();
    }

    /// Registered names in lexicographic order
    [[nodiscard]] std::vector<std::string> component_names() const;

    [[nodiscard]] std::size_t component_count() const;

    // =========================================================================
    // Access
    // =========================================================================

    /// Shared access to the set for T (registers T on first use)
    template<Component T>
    [[nodiscard]] ReadGuard<T> read() {
        return ReadGuard<T>(slot<T>());
    }

    /// Exclusive access to the set for T (registers T on first use)
    template<Component T>
    [[nodiscard]] WriteGuard<T> write() {
        return WriteGuard<T>(slot<T>());
    }

    // =========================================================================
    // Persistence
    // =========================================================================

    /// Snapshot every serializable kind
    [[nodiscard]] nlohmann::json save() const;

    /// Replace the contents of registered kinds from a snapshot
    ///
    /// All-or-nothing: every named kind is decoded first, and nothing is
    /// swapped in unless all of them decode. Names must already be
    /// registered. The id allocator is advanced past the largest loaded id.
    [[nodiscard]] strata_core::Result<void> load(const nlohmann::json& snapshot);

private:
    template<Component T>
    ComponentSlot<T>& slot() {
        const std::type_index key(typeid(T));
        {
            std::shared_lock lock(m_slots_mutex);
            auto it = m_slots.find(key);
            if (it != m_slots.end()) {
                return static_cast<ComponentSlot<T>&>(*it->second);
            }
        }

        std::unique_lock lock(m_slots_mutex);
        auto inserted = insert_slot<T>(type_display_name(typeid(T)));
        if (!inserted) {
            STRATA_FATAL("cannot register component " + type_display_name(typeid(T)) + ": " +
                inserted.error().message());
        }
        return **inserted;
    }

    /// Find or create the slot for T; caller holds m_slots_mutex exclusively
    template<Component T>
    strata_core::Result<ComponentSlot<T>*> insert_slot(std::string name) {
        const std::type_index key(typeid(T));

        auto it = m_slots.find(key);
        if (it != m_slots.end()) {
            return static_cast<ComponentSlot<T>*>(it->second.get());
        }

        if (m_by_name.find(name) != m_by_name.end()) {
            strata_core::Error error(strata_core::StoreError::name_conflict(name));
            strata_core::debug::record_error(error);
            return strata_core::Err<ComponentSlot<T>*>(std::move(error));
        }

        auto slot = std::make_unique<ComponentSlot<T>>(name, m_config.initial_capacity, *m_allocator);
        ComponentSlot<T>* raw = slot.get();
        m_by_name.emplace(name, raw);
        m_slots.emplace(key, std::move(slot));

        strata_core::ecs_logger()->debug("Registered component '{}'", name);
        return raw;
    }

    [[nodiscard]] static std::string type_display_name(const std::type_info& info);

    strata_core::StoreConfig m_config;
    strata_memory::IAllocator* m_allocator;
    strata_core::IdAllocator m_ids;

    std::mutex m_load_mutex;
    mutable std::shared_mutex m_slots_mutex;
    std::unordered_map<std::type_index, std::unique_ptr<ComponentSlotBase>> m_slots;
    std::map<std::string, ComponentSlotBase*> m_by_name;
};

} // namespace strata_ecs
