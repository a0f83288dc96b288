#include <ECS/Registry.hpp>
#include <ECS/FastRemove.hpp>
#include <ECS/Membership.hpp>

#include <raylib.h>

#include <algorithm>
#include <utility>

namespace Metronome::ECS {

namespace {

// Clears the in-tick state even if a system's Update throws.
struct TickScope {
    bool&                   updating;
    std::vector<EntityPtr>& retiredEntities;
    std::vector<SystemPtr>& retiredSystems;

    ~TickScope() {
        updating = false;
        retiredEntities.clear();
        retiredSystems.clear();
    }
};

template<typename T>
size_t IndexOf(const std::vector<std::shared_ptr<T>>& items, const T* item)
{
    const auto it = std::find_if(items.begin(), items.end(),
        [item](const std::shared_ptr<T>& p) { return p.get() == item; });
    return static_cast<size_t>(it - items.begin());
}

} // anonymous namespace

Registry::Registry(RegistryOptions options, Clock* clock)
    : m_options(options)
    , m_clock(clock ? clock : &SteadyClock::Instance())
    , m_lastUpdate(m_clock->Now())
{
}

Registry::~Registry()
{
    Clear();
}

// ── Entities ──────────────────────────────────────────────────────────────────

EntityPtr Registry::CreateEntity()
{
    return std::make_shared<Entity>(m_ids.Next());
}

bool Registry::AddEntity(EntityPtr entity)
{
    if (!entity) {
        TraceLog(LOG_WARNING, "[ecs] AddEntity called with a null entity — ignored");
        return false;
    }
    if (entity->m_registry) {
        TraceLog(LOG_WARNING, "[ecs] Entity %u is already registered — ignored", entity->Id());
        return false;
    }

    m_entities.push_back(entity);
    entity->m_registry = this;

    const size_t count = m_systems.size();
    for (size_t i = 0; i < count && i < m_systems.size(); ++i) {
        // An OnEntityAdded hook may have removed the entity again.
        if (entity->m_registry != this) break;

        const SystemPtr system = m_systems[i];
        if (system->Test(*entity))
            detail::Membership::Attach(*entity, *system);
    }

    TraceLog(LOG_DEBUG, "[ecs] Entity %u added (tracked by %zu systems)",
             entity->Id(), entity->m_systems.size());
    return true;
}

EntityPtr Registry::RemoveEntity(const EntityPtr& entity)
{
    // Copy first: the argument may alias a slot of m_entities.
    EntityPtr removed = entity;
    if (!removed || removed->m_registry != this) return removed;

    removed->Dispose();

    const size_t index = IndexOf(m_entities, removed.get());
    if (index < m_entities.size())
        FastRemove(m_entities, index);
    removed->m_registry = nullptr;

    if (m_updating) m_retiredEntities.push_back(removed);

    TraceLog(LOG_DEBUG, "[ecs] Entity %u removed", removed->Id());
    return removed;
}

EntityPtr Registry::GetEntityById(EntityId id) const
{
    for (const auto& entity : m_entities) {
        if (entity->Id() == id) return entity;
    }
    return nullptr;
}

// ── Systems ───────────────────────────────────────────────────────────────────

bool Registry::AddSystem(SystemPtr system)
{
    if (!system) {
        TraceLog(LOG_WARNING, "[ecs] AddSystem called with a null system — ignored");
        return false;
    }
    if (system->m_registry) {
        TraceLog(LOG_WARNING, "[ecs] System is already registered — ignored");
        return false;
    }

    m_systems.push_back(system);
    system->m_registry = this;
    system->Initialize();

    const size_t count = m_entities.size();
    for (size_t i = 0; i < count && i < m_entities.size(); ++i) {
        if (system->m_registry != this) break;

        const EntityPtr entity = m_entities[i];
        if (system->Test(*entity))
            detail::Membership::Attach(*entity, *system);
    }

    TraceLog(LOG_DEBUG, "[ecs] System added (frequency %u, tracking %zu entities)",
             system->Frequency(), system->m_entities.size());
    return true;
}

SystemPtr Registry::RemoveSystem(const SystemPtr& system)
{
    SystemPtr removed = system;
    if (!removed || removed->m_registry != this) return removed;

    const size_t index = IndexOf(m_systems, removed.get());
    if (index < m_systems.size())
        FastRemove(m_systems, index);

    if (m_updating) m_retiredSystems.push_back(removed);

    removed->Dispose();

    // Nothing may keep pointing at a disposed system.
    while (!removed->m_entities.empty())
        detail::Membership::Detach(*removed->m_entities.back(), *removed);
    removed->m_registry = nullptr;

    TraceLog(LOG_DEBUG, "[ecs] System removed");
    return removed;
}

// ── Dispatch ──────────────────────────────────────────────────────────────────

void Registry::Update()
{
    if (m_updating) {
        TraceLog(LOG_WARNING, "[ecs] Registry::Update called during a tick — ignored");
        return;
    }

    const double now     = m_clock->Now();
    const float  elapsed = static_cast<float>(now - m_lastUpdate);

    m_updating = true;
    {
        TickScope scope{ m_updating, m_retiredEntities, m_retiredSystems };

        if (m_options.systemsFirst)
            UpdateSystemsFirst(elapsed);
        else
            UpdateEntitiesFirst(elapsed);
    }

    ++m_tick;
    m_lastUpdate = now;
}

void Registry::UpdateEntitiesFirst(float elapsed)
{
    const size_t entityCount = m_entities.size();
    for (size_t i = 0; i < entityCount && i < m_entities.size(); ++i) {
        const EntityPtr entity = m_entities[i];

        const size_t systemCount = entity->m_systems.size();
        for (size_t j = 0; j < systemCount && j < entity->m_systems.size(); ++j) {
            System& system = *entity->m_systems[j];
            if (!system.IsDue(m_tick)) continue;
            system.Update(*entity, elapsed);
        }
    }
}

void Registry::UpdateSystemsFirst(float elapsed)
{
    const size_t systemCount = m_systems.size();
    for (size_t i = 0; i < systemCount && i < m_systems.size(); ++i) {
        const SystemPtr system = m_systems[i];

        const size_t entityCount = system->m_entities.size();
        for (size_t j = 0; j < entityCount && j < system->m_entities.size(); ++j) {
            if (!system->IsDue(m_tick)) continue;
            system->Update(*system->m_entities[j], elapsed);
        }
    }
}

// ── Housekeeping ──────────────────────────────────────────────────────────────

void Registry::Clear()
{
    while (!m_entities.empty()) RemoveEntity(m_entities.back());
    while (!m_systems.empty())  RemoveSystem(m_systems.back());
}

bool Registry::CheckMembership() const
{
    for (const auto& entity : m_entities) {
        if (entity->m_registry != this) return false;
        for (const System* system : entity->m_systems) {
            if (!system || system->m_registry != this) return false;
            if (std::count(entity->m_systems.begin(), entity->m_systems.end(), system) != 1)
                return false;
            if (!system->Tracks(*entity)) return false;
        }
    }

    for (const auto& system : m_systems) {
        if (system->m_registry != this) return false;
        for (const Entity* entity : system->m_entities) {
            if (!entity || entity->m_registry != this) return false;
            if (std::count(system->m_entities.begin(), system->m_entities.end(), entity) != 1)
                return false;
            if (!entity->IsTrackedBy(*system)) return false;
        }
    }
    return true;
}

} // namespace Metronome::ECS
