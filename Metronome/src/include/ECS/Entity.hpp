#pragma once

#include <ECS/IdAllocator.hpp>

#include <any>
#include <string>
#include <unordered_map>
#include <vector>

namespace Metronome::ECS {

class Registry;
class System;
namespace detail { struct Membership; }

// ---------------------------------------------------------------------------
// Entity — a bag of named components identified by a unique id.
//
// Components
// ----------
//   Keyed by name; the payload is an opaque std::any that the ECS core never
//   inspects. Systems only ever ask "does this entity have component X".
//
// Membership
// ----------
//   Systems() lists every System currently tracking this entity, in
//   attachment order. The list is maintained exclusively by the Registry and
//   is NOT recomputed when components change: adding or removing a component
//   on a live entity leaves its system membership as it was when the entity
//   (or the system) was last registered.
//
// Lifecycle
// ---------
//   Built on its own, becomes live once passed to Registry::AddEntity, and is
//   disposed (detached from every system) by Registry::RemoveEntity.
// ---------------------------------------------------------------------------
class Entity {
public:
    explicit Entity(EntityId id) noexcept : m_id(id) {}
    explicit Entity(IdAllocator& ids) noexcept : m_id(ids.Next()) {}
    ~Entity() = default;

    // Identity is the object itself; never copy or move a live entity.
    Entity(const Entity&)            = delete;
    Entity& operator=(const Entity&) = delete;

    [[nodiscard]] EntityId Id() const noexcept { return m_id; }

    // -----------------------------------------------------------------------
    // Component storage
    // -----------------------------------------------------------------------

    // Attach (or replace) the component `name` with the given payload.
    void AddComponent(const std::string& name, std::any data = {});

    // Returns false if the entity did not own `name`.
    bool RemoveComponent(const std::string& name);

    [[nodiscard]] bool HasComponent(const std::string& name) const;

    // Raw payload, or nullptr if the component is absent.
    [[nodiscard]] std::any*       GetComponentData(const std::string& name);
    [[nodiscard]] const std::any* GetComponentData(const std::string& name) const;

    // Typed payload, or nullptr if the component is absent or holds another type.
    template<typename T>
    [[nodiscard]] T* GetComponent(const std::string& name) {
        std::any* data = GetComponentData(name);
        return data ? std::any_cast<T>(data) : nullptr;
    }
    template<typename T>
    [[nodiscard]] const T* GetComponent(const std::string& name) const {
        const std::any* data = GetComponentData(name);
        return data ? std::any_cast<T>(data) : nullptr;
    }

    // Component names in unspecified order.
    [[nodiscard]] std::vector<std::string> ComponentNames() const;
    [[nodiscard]] size_t ComponentCount() const noexcept { return m_components.size(); }

    // -----------------------------------------------------------------------
    // Membership
    // -----------------------------------------------------------------------

    [[nodiscard]] const std::vector<System*>& Systems() const noexcept { return m_systems; }
    [[nodiscard]] bool IsTrackedBy(const System& system) const;

    // The Registry this entity is registered with, or nullptr.
    [[nodiscard]] Registry* GetRegistry() const noexcept { return m_registry; }

    // Detach from every system in the membership cache. The cache is empty
    // afterwards; the component map is left untouched.
    void Dispose();

private:
    friend class Registry;
    friend struct detail::Membership;

    const EntityId                            m_id;
    std::unordered_map<std::string, std::any> m_components;
    std::vector<System*>                      m_systems;  // attachment order
    Registry*                                 m_registry = nullptr;
};

} // namespace Metronome::ECS
