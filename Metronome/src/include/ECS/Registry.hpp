#pragma once

#include <ECS/Clock.hpp>
#include <ECS/Entity.hpp>
#include <ECS/IdAllocator.hpp>
#include <ECS/System.hpp>

#include <cstdint>
#include <memory>
#include <vector>

namespace Metronome::ECS {

using EntityPtr = std::shared_ptr<Entity>;
using SystemPtr = std::shared_ptr<System>;

// Construction-time options. Fixed for the lifetime of the Registry.
struct RegistryOptions {
    // Dispatch systems-outer / entities-inner instead of the default
    // entities-outer / systems-inner order.
    bool systemsFirst = false;
};

// ---------------------------------------------------------------------------
// Registry — the central ECS world object.
//
// Responsibilities
// ----------------
//  • Entity list   : AddEntity / RemoveEntity / GetEntityById
//  • System list   : AddSystem / RemoveSystem
//  • Membership    : the only code that attaches an entity to a system. The
//                    system predicate is evaluated when the entity is added
//                    (against every system) and when the system is added
//                    (against every entity), never on component changes.
//  • Dispatch      : Update() runs one tick.
//
// Usage example
// -------------
//   Registry reg;
//   reg.AddSystem(std::make_shared<MovementSystem>());
//
//   auto e = reg.CreateEntity();
//   e->AddComponent("position", Vec2{0, 0});
//   e->AddComponent("velocity", Vec2{1, 0});
//   reg.AddEntity(e);           // attached to MovementSystem here
//
//   for (;;) reg.Update();
//
// Duplicates
// ----------
//   Registering an entity or system that already belongs to a Registry is
//   rejected: the call logs a warning, returns false and changes nothing.
//
// Mutation during Update
// ----------------------
//   Update callbacks may add or remove entities and systems. Loops walk the
//   lists by index with the bound captured when the loop starts (and the live
//   size re-checked on every step), so additions made during a tick are not
//   visited that tick and removals may reorder what is left. Objects removed
//   mid-tick are kept alive until the tick finishes.
//
// Thread safety
// -------------
//   The Registry is NOT thread-safe and Update is not reentrant.
// ---------------------------------------------------------------------------
class Registry {
public:
    explicit Registry(RegistryOptions options = {}, Clock* clock = nullptr);
    ~Registry();

    // Entities and systems point back at their Registry, so it never moves.
    Registry(const Registry&)            = delete;
    Registry& operator=(const Registry&) = delete;
    Registry(Registry&&)                 = delete;
    Registry& operator=(Registry&&)      = delete;

    // -----------------------------------------------------------------------
    // Entities
    // -----------------------------------------------------------------------

    // Build a new, unregistered entity carrying a fresh id from this
    // Registry's allocator.
    [[nodiscard]] EntityPtr CreateEntity();

    // Append the entity and attach it to every system whose predicate it
    // satisfies. Returns false for null or already-registered entities.
    bool AddEntity(EntityPtr entity);

    // Dispose the entity (detaching it from all systems) and unordered-remove
    // it from the entity list. Returns the argument; a no-op if the entity is
    // not registered here.
    EntityPtr RemoveEntity(const EntityPtr& entity);

    // Linear scan; nullptr when no entity carries the id.
    [[nodiscard]] EntityPtr GetEntityById(EntityId id) const;

    [[nodiscard]] bool HasEntity(const Entity& entity) const noexcept { return entity.m_registry == this; }
    [[nodiscard]] const std::vector<EntityPtr>& Entities() const noexcept { return m_entities; }
    [[nodiscard]] size_t EntityCount() const noexcept { return m_entities.size(); }

    // -----------------------------------------------------------------------
    // Systems
    // -----------------------------------------------------------------------

    // Append the system, call Initialize(), then attach every registered
    // entity the system accepts. Returns false for null or already-registered
    // systems.
    bool AddSystem(SystemPtr system);

    // Unordered-remove the system, call Dispose(), then detach whatever it
    // still tracks. Returns the argument; a no-op if not registered here.
    SystemPtr RemoveSystem(const SystemPtr& system);

    [[nodiscard]] bool HasSystem(const System& system) const noexcept { return system.m_registry == this; }
    [[nodiscard]] const std::vector<SystemPtr>& Systems() const noexcept { return m_systems; }
    [[nodiscard]] size_t SystemCount() const noexcept { return m_systems.size(); }

    // -----------------------------------------------------------------------
    // Dispatch
    // -----------------------------------------------------------------------

    // Run one tick: call Update(entity, elapsed) for every (system, entity)
    // edge whose system is due on the current tick counter, then advance the
    // counter. Ignored (with a warning) when called from inside a tick.
    void Update();

    // Number of completed ticks; the tick in progress uses this value.
    [[nodiscard]] uint64_t TickCount() const noexcept { return m_tick; }
    [[nodiscard]] bool IsSystemsFirst() const noexcept { return m_options.systemsFirst; }
    [[nodiscard]] bool IsUpdating() const noexcept { return m_updating; }

    // -----------------------------------------------------------------------
    // Housekeeping
    // -----------------------------------------------------------------------

    // Remove every entity, then every system, last to first.
    void Clear();

    // True if every entity's membership cache mirrors the tracked lists of
    // the systems it names, and no edge involves an unregistered object.
    [[nodiscard]] bool CheckMembership() const;

private:
    void UpdateEntitiesFirst(float elapsed);
    void UpdateSystemsFirst(float elapsed);

    RegistryOptions m_options;
    Clock*          m_clock;
    IdAllocator     m_ids;

    std::vector<EntityPtr> m_entities;  // insertion order until a removal swaps
    std::vector<SystemPtr> m_systems;   // insertion order until a removal swaps

    uint64_t m_tick       = 0;
    double   m_lastUpdate = 0.0;
    bool     m_updating   = false;

    // Objects removed while a tick is running; released when the tick ends.
    std::vector<EntityPtr> m_retiredEntities;
    std::vector<SystemPtr> m_retiredSystems;
};

} // namespace Metronome::ECS
