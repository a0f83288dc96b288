#include <ECS/System.hpp>
#include <ECS/Entity.hpp>

#include <raylib.h>

#include <algorithm>
#include <utility>

namespace Metronome::ECS {

System::System(std::vector<std::string> required, uint32_t frequency)
    : m_required(std::move(required))
{
    SetFrequency(frequency);
}

bool System::Test(const Entity& entity) const
{
    return std::all_of(m_required.begin(), m_required.end(),
        [&entity](const std::string& name) { return entity.HasComponent(name); });
}

void System::SetFrequency(uint32_t frequency)
{
    if (frequency == 0u) {
        TraceLog(LOG_WARNING, "[ecs] System frequency 0 is invalid — using 1");
        frequency = 1u;
    }
    m_frequency = frequency;
}

bool System::Tracks(const Entity& entity) const
{
    return std::find(m_entities.begin(), m_entities.end(), &entity) != m_entities.end();
}

// ── LambdaSystem ──────────────────────────────────────────────────────────────

LambdaSystem::LambdaSystem(std::vector<std::string> required, UpdateFn update,
                           uint32_t frequency, PredicateFn predicate)
    : System(std::move(required), frequency)
    , m_update(std::move(update))
    , m_predicate(std::move(predicate))
{
}

void LambdaSystem::Update(Entity& entity, float elapsed)
{
    if (m_update) m_update(entity, elapsed);
}

bool LambdaSystem::Test(const Entity& entity) const
{
    return m_predicate ? m_predicate(entity) : System::Test(entity);
}

} // namespace Metronome::ECS
