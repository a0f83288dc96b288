#include <ECS/Membership.hpp>
#include <ECS/Entity.hpp>
#include <ECS/FastRemove.hpp>
#include <ECS/System.hpp>

#include <cassert>

namespace Metronome::ECS::detail {

void Membership::Attach(Entity& entity, System& system)
{
    assert(!entity.IsTrackedBy(system) && "Membership::Attach — pair already attached");

    entity.m_systems.push_back(&system);
    system.m_entities.push_back(&entity);
    system.OnEntityAdded(entity);
}

void Membership::Detach(Entity& entity, System& system)
{
    const bool inCache  = FastRemoveValue(entity.m_systems, &system);
    const bool inSystem = FastRemoveValue(system.m_entities, &entity);
    assert(inCache && inSystem && "Membership::Detach — pair was not attached");
    (void)inCache;

    if (inSystem) system.OnEntityRemoved(entity);
}

} // namespace Metronome::ECS::detail
