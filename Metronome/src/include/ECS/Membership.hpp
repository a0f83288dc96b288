#pragma once

namespace Metronome::ECS {

class Entity;
class System;

namespace detail {

// ---------------------------------------------------------------------------
// Membership — the attach / detach primitive.
//
// Both sides of an (entity, system) edge are written here and nowhere else:
// Entity::Systems() and System::Entities() always mirror each other once a
// call returns.
// ---------------------------------------------------------------------------
struct Membership {
    // Append system to the entity's cache and entity to the system's tracked
    // list, then run System::OnEntityAdded. The pair must not be attached.
    static void Attach(Entity& entity, System& system);

    // Unordered-remove both sides, then run System::OnEntityRemoved.
    // The pair must be attached.
    static void Detach(Entity& entity, System& system);
};

} // namespace detail
} // namespace Metronome::ECS
