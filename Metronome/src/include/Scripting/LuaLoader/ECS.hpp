#pragma once

struct lua_State;

namespace Metronome::ECS { class Registry; }

namespace Metronome::Scripting::LuaLoader {

// ── Lifetime setters ─────────────────────────────────────────────────────────
// Call this whenever the active world changes.
// Safe to call before or after registerECS().

/// Set the ECS Registry the `ecs.*` Lua functions operate on.
/// Pass nullptr to disable ECS calls (e.g. during teardown). Either way the
/// system handles issued so far are forgotten; the systems themselves stay
/// registered with whichever Registry they were added to.
///
/// Systems defined from Lua call back into the Lua state that created them,
/// so clear (or destroy) the Registry before closing that state.
void setECSRegistry(ECS::Registry* reg);

// ── Registration ─────────────────────────────────────────────────────────────
/// Register the `ecs` global table into the given Lua state.
///
/// Entity management
/// -----------------
///   ecs.create([components])        → id    -- new entity, already registered
///                                             -- components: { name = value }
///   ecs.destroy(id)                         -- unregister + detach from systems
///   ecs.isAlive(id)                 → bool
///   ecs.count()                     → number of registered entities
///
/// Components  (values: number, string, boolean or nil)
/// ----------
///   ecs.addComponent(id, name [, value])    -- add or replace
///   ecs.removeComponent(id, name)   → bool
///   ecs.hasComponent(id, name)      → bool
///   ecs.getComponent(id, name)      → value (nil if absent or no data)
///
///   System membership is decided when an entity or a system is registered.
///   Components added to an entity that is already registered do NOT attach
///   it to further systems; pass them to ecs.create{...} instead, so they
///   are in place when the entity is tested against every system.
///
/// Systems
/// -------
///   ecs.addSystem{                  → handle
///       requires  = { "pos", "vel" },         -- component names (optional)
///       frequency = 1,                        -- run every nth tick (optional)
///       update    = function(id, dt) end,     -- required
///       init      = function() end,           -- optional
///       dispose   = function() end,           -- optional
///       enter     = function(id) end,         -- optional
///       exit      = function(id) end,         -- optional
///   }
///   ecs.removeSystem(handle)
///   ecs.setEnabled(handle, enabled)
///   ecs.systemSize(handle)          → number of tracked entities
///
/// Ticking
/// -------
///   ecs.update()                            -- run one tick
///   ecs.tick()                      → tick counter
void registerECS(lua_State* L);

} // namespace Metronome::Scripting::LuaLoader
