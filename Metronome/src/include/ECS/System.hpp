#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace Metronome::ECS {

class Entity;
class Registry;
namespace detail { struct Membership; }

// ---------------------------------------------------------------------------
// System — base class for all ECS systems.
//
// A System declares the component names an entity must carry to be tracked
// by it, and receives one Update call per tracked entity on every tick where
// it is due.
//
// Usage
// -----
//   class MovementSystem : public System {
//   public:
//       MovementSystem() : System({"position", "velocity"}) {}
//
//       void Update(Entity& e, float dt) override {
//           auto* p = e.GetComponent<Vec2>("position");
//           auto* v = e.GetComponent<Vec2>("velocity");
//           if (p && v) { p->x += v->x * dt; p->y += v->y * dt; }
//       }
//   };
//
//   registry.AddSystem(std::make_shared<MovementSystem>());
//
// Scheduling
// ----------
//   A system with frequency n runs on ticks where (tick % n == 0), counted on
//   the Registry's global tick counter; a system added mid-run does not get
//   its own phase. Disabled systems are skipped entirely.
//
// Tracked entities
// ----------------
//   Entities() is written only by the Registry. Never call Update-time
//   bookkeeping yourself; override OnEntityAdded / OnEntityRemoved instead.
// ---------------------------------------------------------------------------
class System {
public:
    explicit System(std::vector<std::string> required = {}, uint32_t frequency = 1u);
    virtual ~System() = default;

    System(const System&)            = delete;
    System& operator=(const System&) = delete;

    // Called once per due tick for every tracked entity.
    // elapsed: seconds since the previous Registry::Update.
    virtual void Update(Entity& entity, float elapsed) = 0;

    // True iff the entity carries every required component. Must be free of
    // side effects; the Registry calls it only when the entity or the system
    // is registered.
    [[nodiscard]] virtual bool Test(const Entity& entity) const;

    // Optional: called once when the system is registered, before any entity
    // is attached to it.
    virtual void Initialize() {}

    // Optional: called once when the system is removed from a Registry. The
    // tracked entities are still attached while this runs.
    virtual void Dispose() {}

    // Optional: called right after an entity is attached / detached.
    virtual void OnEntityAdded(Entity& /*entity*/) {}
    virtual void OnEntityRemoved(Entity& /*entity*/) {}

    // Systems can be individually paused without removing them.
    void  SetEnabled(bool enabled) noexcept { m_enabled = enabled; }
    [[nodiscard]] bool IsEnabled() const noexcept { return m_enabled; }

    // Frequencies below 1 are clamped to 1.
    void SetFrequency(uint32_t frequency);
    [[nodiscard]] uint32_t Frequency() const noexcept { return m_frequency; }

    // Enabled and aligned with the global tick counter.
    [[nodiscard]] bool IsDue(uint64_t tick) const noexcept {
        return m_enabled && tick % m_frequency == 0u;
    }

    [[nodiscard]] const std::vector<std::string>& RequiredComponents() const noexcept { return m_required; }
    [[nodiscard]] const std::vector<Entity*>& Entities() const noexcept { return m_entities; }
    [[nodiscard]] bool Tracks(const Entity& entity) const;

    // The Registry this system is registered with, or nullptr.
    [[nodiscard]] Registry* GetRegistry() const noexcept { return m_registry; }

private:
    friend class Registry;
    friend struct detail::Membership;

    const std::vector<std::string> m_required;
    std::vector<Entity*>           m_entities;  // attachment order until a removal swaps
    uint32_t                       m_frequency = 1u;
    bool                           m_enabled   = true;
    Registry*                      m_registry  = nullptr;
};

// ---------------------------------------------------------------------------
// LambdaSystem — a System whose behaviour is supplied as function values.
//
// Handy for small systems and tools that do not warrant a class. The
// predicate defaults to the required-component test.
// ---------------------------------------------------------------------------
class LambdaSystem final : public System {
public:
    using UpdateFn    = std::function<void(Entity&, float)>;
    using PredicateFn = std::function<bool(const Entity&)>;

    LambdaSystem(std::vector<std::string> required, UpdateFn update,
                 uint32_t frequency = 1u, PredicateFn predicate = {});

    void Update(Entity& entity, float elapsed) override;
    [[nodiscard]] bool Test(const Entity& entity) const override;

private:
    UpdateFn    m_update;
    PredicateFn m_predicate;
};

} // namespace Metronome::ECS
