#include <ECS/Entity.hpp>
#include <ECS/Membership.hpp>
#include <ECS/System.hpp>

#include <algorithm>
#include <utility>

namespace Metronome::ECS {

// ── Component storage ─────────────────────────────────────────────────────────

void Entity::AddComponent(const std::string& name, std::any data)
{
    m_components[name] = std::move(data);
}

bool Entity::RemoveComponent(const std::string& name)
{
    return m_components.erase(name) > 0;
}

bool Entity::HasComponent(const std::string& name) const
{
    return m_components.find(name) != m_components.end();
}

std::any* Entity::GetComponentData(const std::string& name)
{
    const auto it = m_components.find(name);
    return it != m_components.end() ? &it->second : nullptr;
}

const std::any* Entity::GetComponentData(const std::string& name) const
{
    const auto it = m_components.find(name);
    return it != m_components.end() ? &it->second : nullptr;
}

std::vector<std::string> Entity::ComponentNames() const
{
    std::vector<std::string> names;
    names.reserve(m_components.size());
    for (const auto& [name, data] : m_components)
        names.push_back(name);
    return names;
}

// ── Membership ────────────────────────────────────────────────────────────────

bool Entity::IsTrackedBy(const System& system) const
{
    return std::find(m_systems.begin(), m_systems.end(), &system) != m_systems.end();
}

void Entity::Dispose()
{
    // Detach swaps the last cache entry into the hole, so always take the back.
    while (!m_systems.empty())
        detail::Membership::Detach(*this, *m_systems.back());
}

} // namespace Metronome::ECS
