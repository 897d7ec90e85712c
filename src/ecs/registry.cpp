/// @file registry.cpp
/// @brief Registry entity, naming and snapshot operations

#include <strata/ecs/registry.hpp>

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#if defined(__GNUG__)
#include <cxxabi.h>
#include <cstdlib>
#endif

namespace strata_ecs {

namespace {

bool is_non_negative_integer(const nlohmann::json& value) {
    if (value.is_number_unsigned()) {
        return true;
    }
    return value.is_number_integer() && value.get<std::int64_t>() >= 0;
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

Registry::Registry()
    : Registry(strata_core::StoreConfig{}) {}

Registry::Registry(strata_core::StoreConfig config, strata_memory::IAllocator& allocator)
    : m_config(std::move(config))
    , m_allocator(&allocator) {}

Registry::~Registry() = default;

// =============================================================================
// Entities
// =============================================================================

Entity Registry::create_entity() {
    return Entity::allocate(m_ids);
}

std::vector<Entity> Registry::create_entities(std::size_t count) {
    std::vector<Entity> out;
    if (count == 0) {
        return out;
    }

    const std::uint64_t first = m_ids.next_batch(count);
    out.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        out.emplace_back(first + i);
    }
    return out;
}

std::size_t Registry::destroy_entity(Entity entity) {
    if (entity.is_null()) {
        return 0;
    }

    std::vector<ComponentSlotBase*> slots;
    {
        std::shared_lock lock(m_slots_mutex);
        slots.reserve(m_slots.size());
        for (const auto& [type, slot] : m_slots) {
            slots.push_back(slot.get());
        }
    }

    // Slots are never removed, so the pointers outlive the table lock
    std::size_t removed = 0;
    for (ComponentSlotBase* slot : slots) {
        if (slot->remove_entity(entity)) {
            ++removed;
        }
    }
    return removed;
}

// =============================================================================
// Component Kinds
// =============================================================================

std::vector<std::string> Registry::component_names() const {
    std::shared_lock lock(m_slots_mutex);
    std::vector<std::string> names;
    names.reserve(m_by_name.size());
    for (const auto& [name, slot] : m_by_name) {
        names.push_back(name);
    }
    return names;
}

std::size_t Registry::component_count() const {
    std::shared_lock lock(m_slots_mutex);
    return m_slots.size();
}

std::string Registry::type_display_name(const std::type_info& info) {
#if defined(__GNUG__)
    int status = 0;
    char* demangled = abi::__cxa_demangle(info.name(), nullptr, nullptr, &status);
    if (status == 0 && demangled) {
        std::string name(demangled);
        std::free(demangled);
        return name;
    }
#endif
    return info.name();
}

// =============================================================================
// Persistence
// =============================================================================

nlohmann::json Registry::save() const {
    std::vector<std::pair<std::string, ComponentSlotBase*>> slots;
    {
        std::shared_lock lock(m_slots_mutex);
        slots.assign(m_by_name.begin(), m_by_name.end());
    }

    // Each slot is locked on its own, never under the table lock
    nlohmann::json components = nlohmann::json::object();
    for (const auto& [name, slot] : slots) {
        if (!slot->serializable()) {
            strata_core::ecs_logger()->debug("Skipping non-serializable component '{}' in snapshot", name);
            continue;
        }
        components[name] = slot->save();
    }

    return nlohmann::json{
        {"version", SNAPSHOT_VERSION},
        {"next_entity", m_ids.peek()},
        {"components", std::move(components)},
    };
}

strata_core::Result<void> Registry::load(const nlohmann::json& snapshot) {
    using strata_core::StoreError;
    strata_core::LogScope scope(strata_core::ecs_logger(), "Registry::load");

    auto fail = [](strata_core::Error error) {
        strata_core::ecs_logger()->warn("Snapshot load failed: {}", strata_core::build_error_chain(error));
        strata_core::debug::record_error(error);
        return strata_core::Err(std::move(error));
    };

    if (!snapshot.is_object()) {
        return fail(StoreError::malformed("snapshot must be an object"));
    }

    auto version_it = snapshot.find("version");
    if (version_it == snapshot.end() || !is_non_negative_integer(*version_it)) {
        return fail(StoreError::malformed("snapshot is missing an unsigned 'version'"));
    }
    const auto version = version_it->get<std::uint64_t>();
    if (version != SNAPSHOT_VERSION) {
        return fail(StoreError::incompatible_version(SNAPSHOT_VERSION, version));
    }

    auto components_it = snapshot.find("components");
    if (components_it == snapshot.end() || !components_it->is_object()) {
        return fail(StoreError::malformed("snapshot is missing a 'components' object"));
    }

    std::uint64_t next_entity = strata_core::IdAllocator::FIRST_ID;
    if (auto next_it = snapshot.find("next_entity"); next_it != snapshot.end()) {
        if (!is_non_negative_integer(*next_it)) {
            return fail(StoreError::malformed("'next_entity' must be an unsigned integer"));
        }
        next_entity = next_it->get<std::uint64_t>();
    }

    std::lock_guard load_lock(m_load_mutex);

    // Resolve every name before decoding anything
    std::vector<std::pair<ComponentSlotBase*, const nlohmann::json*>> work;
    {
        std::shared_lock lock(m_slots_mutex);
        for (auto it = components_it->begin(); it != components_it->end(); ++it) {
            auto slot_it = m_by_name.find(it.key());
            if (slot_it == m_by_name.end()) {
                return fail(StoreError::unknown_component(it.key()));
            }
            work.emplace_back(slot_it->second, &it.value());
        }
    }

    std::uint64_t max_id = strata_core::IdAllocator::NULL_ID;
    for (const auto& [slot, data] : work) {
        auto staged = slot->stage(*data);
        if (!staged) {
            for (auto& entry : work) {
                entry.first->discard();
            }
            staged.error().with_context("component", slot->name());
            return fail(std::move(staged.error()));
        }
        max_id = std::max(max_id, slot->staged_max_id());
    }

    for (auto& entry : work) {
        entry.first->commit();
    }

    if (max_id != strata_core::IdAllocator::NULL_ID) {
        m_ids.advance_past(max_id);
    }
    if (next_entity > strata_core::IdAllocator::FIRST_ID) {
        m_ids.advance_past(next_entity - 1);
    }

    strata_core::ecs_logger()->debug("Loaded snapshot with {} component kinds (next entity {})",
        work.size(), m_ids.peek());
    return strata_core::Ok();
}

} // namespace strata_ecs
