#include <lua.hpp>
#include <raylib.h>
#include <ECS/ECS.hpp>
#include <Scripting/LuaSystem.hpp>
#include "../../include/Scripting/LuaLoader/ECS.hpp"

#include <any>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <vector>

// ── Module-level state ────────────────────────────────────────────────────────
// The registry pointer is set by the host before running scripts / every time
// the active world changes.  All Lua bindings below check for nullptr.

namespace Metronome::Scripting::LuaLoader {

namespace {
    static ECS::Registry* g_registry = nullptr;
    // System handles issued to Lua: handle = index + 1, nullptr once removed.
    static std::vector<std::shared_ptr<LuaSystem>> g_systems;
} // anonymous namespace

void setECSRegistry(ECS::Registry* reg)
{
    // Forget the handles of the previous world and make its Lua systems inert,
    // so nothing calls into a Lua state after the host has moved on.
    for (auto& system : g_systems)
        if (system) system->Release();
    g_systems.clear();
    g_registry = reg;
}

// ── Helpers ───────────────────────────────────────────────────────────────────

static inline bool registryReady()
{
    if (g_registry) return true;
    TraceLog(LOG_WARNING, "[ecs] Registry not set — call ignored");
    return false;
}

static inline ECS::EntityId toEntityId(lua_State* L, int idx)
{
    return static_cast<ECS::EntityId>(luaL_checkinteger(L, idx));
}

static ECS::EntityPtr findEntity(lua_State* L, int idx)
{
    return g_registry ? g_registry->GetEntityById(toEntityId(L, idx)) : nullptr;
}

// Resolve a system handle; nullptr for unknown or removed handles.
static std::shared_ptr<LuaSystem> findSystem(lua_State* L, int idx)
{
    const lua_Integer handle = luaL_checkinteger(L, idx);
    if (handle < 1 || static_cast<size_t>(handle) > g_systems.size()) return nullptr;
    return g_systems[static_cast<size_t>(handle) - 1];
}

// Raise a Lua error unless the value at idx can be stored as a component.
// Called before any C++ object is created: Lua errors unwind with longjmp.
static void checkComponentValue(lua_State* L, int idx)
{
    switch (lua_type(L, idx)) {
        case LUA_TNONE: case LUA_TNIL: case LUA_TNUMBER:
        case LUA_TBOOLEAN: case LUA_TSTRING:
            return;
        default:
            luaL_argerror(L, idx, "component value must be a number, string, boolean or nil");
    }
}

// Lua value → component payload.  Numbers are always stored as double.
static std::any toComponentValue(lua_State* L, int idx)
{
    switch (lua_type(L, idx)) {
        case LUA_TNUMBER:  return static_cast<double>(lua_tonumber(L, idx));
        case LUA_TBOOLEAN: return lua_toboolean(L, idx) != 0;
        case LUA_TSTRING:  return std::string(lua_tostring(L, idx));
        default:           return {};
    }
}

// Component payload → Lua value.  Payloads Lua cannot represent push nil.
static void pushComponentValue(lua_State* L, const std::any& value)
{
    if (const auto* d = std::any_cast<double>(&value))            lua_pushnumber(L, *d);
    else if (const auto* f = std::any_cast<float>(&value))        lua_pushnumber(L, *f);
    else if (const auto* i = std::any_cast<int>(&value))          lua_pushinteger(L, *i);
    else if (const auto* b = std::any_cast<bool>(&value))         lua_pushboolean(L, *b ? 1 : 0);
    else if (const auto* s = std::any_cast<std::string>(&value))  lua_pushlstring(L, s->data(), s->size());
    else                                                           lua_pushnil(L);
}

// Registry reference to t[field], or LUA_NOREF if the field is nil.
// The field must already be known to be a function or nil.
static int refCallback(lua_State* L, int tableIdx, const char* field)
{
    lua_getfield(L, tableIdx, field);
    if (lua_isnil(L, -1)) { lua_pop(L, 1); return LUA_NOREF; }
    return luaL_ref(L, LUA_REGISTRYINDEX);
}

// ── Entity management ─────────────────────────────────────────────────────────

// ecs.create([components]) → id
static int l_create(lua_State* L)
{
    const bool hasComponents = !lua_isnoneornil(L, 1);
    if (hasComponents) {
        luaL_checktype(L, 1, LUA_TTABLE);
        lua_pushnil(L);
        while (lua_next(L, 1) != 0) {
            checkComponentValue(L, lua_gettop(L));
            lua_pop(L, 1);
        }
    }
    if (!registryReady()) { lua_pushinteger(L, ECS::INVALID_ENTITY); return 1; }

    auto entity = g_registry->CreateEntity();
    if (hasComponents) {
        lua_pushnil(L);
        while (lua_next(L, 1) != 0) {
            // Only string keys name components; the value sits on top.
            if (lua_type(L, -2) == LUA_TSTRING)
                entity->AddComponent(lua_tostring(L, -2), toComponentValue(L, lua_gettop(L)));
            lua_pop(L, 1);
        }
    }

    g_registry->AddEntity(entity);
    lua_pushinteger(L, static_cast<lua_Integer>(entity->Id()));
    return 1;
}

// ecs.destroy(id)
static int l_destroy(lua_State* L)
{
    if (!registryReady()) return 0;
    if (auto entity = findEntity(L, 1)) g_registry->RemoveEntity(entity);
    return 0;
}

// ecs.isAlive(id) → bool
static int l_isAlive(lua_State* L)
{
    lua_pushboolean(L, findEntity(L, 1) ? 1 : 0);
    return 1;
}

// ecs.count() → number of registered entities
static int l_count(lua_State* L)
{
    lua_pushinteger(L, g_registry ? static_cast<lua_Integer>(g_registry->EntityCount()) : 0);
    return 1;
}

// ── Components ────────────────────────────────────────────────────────────────

// ecs.addComponent(id, name [, value])
static int l_addComponent(lua_State* L)
{
    const auto  id   = toEntityId(L, 1);
    const char* name = luaL_checkstring(L, 2);
    checkComponentValue(L, 3);
    if (!registryReady()) return 0;
    if (auto entity = g_registry->GetEntityById(id))
        entity->AddComponent(name, toComponentValue(L, 3));
    return 0;
}

// ecs.removeComponent(id, name) → bool
static int l_removeComponent(lua_State* L)
{
    const char* name   = luaL_checkstring(L, 2);
    auto        entity = findEntity(L, 1);
    lua_pushboolean(L, entity && entity->RemoveComponent(name) ? 1 : 0);
    return 1;
}

// ecs.hasComponent(id, name) → bool
static int l_hasComponent(lua_State* L)
{
    const char* name   = luaL_checkstring(L, 2);
    auto        entity = findEntity(L, 1);
    lua_pushboolean(L, entity && entity->HasComponent(name) ? 1 : 0);
    return 1;
}

// ecs.getComponent(id, name) → value  (nil if absent)
static int l_getComponent(lua_State* L)
{
    const char* name   = luaL_checkstring(L, 2);
    auto        entity = findEntity(L, 1);
    const std::any* data = entity ? entity->GetComponentData(name) : nullptr;
    if (data) pushComponentValue(L, *data);
    else      lua_pushnil(L);
    return 1;
}

// ── Systems ───────────────────────────────────────────────────────────────────

// ecs.addSystem{ requires=, frequency=, update=, init=, dispose=, enter=, exit= } → handle
static int l_addSystem(lua_State* L)
{
    luaL_checktype(L, 1, LUA_TTABLE);

    // Validate everything before creating C++ objects or taking references:
    // a Lua error here unwinds with longjmp.
    lua_getfield(L, 1, "requires");
    const bool hasRequires = !lua_isnil(L, -1);
    if (hasRequires) {
        luaL_argcheck(L, lua_istable(L, -1), 1, "'requires' must be a list of component names");
        const lua_Integer n = static_cast<lua_Integer>(lua_rawlen(L, -1));
        for (lua_Integer i = 1; i <= n; ++i) {
            lua_rawgeti(L, -1, i);
            if (lua_type(L, -1) != LUA_TSTRING)
                return luaL_error(L, "ecs.addSystem: requires[%d] must be a string", static_cast<int>(i));
            lua_pop(L, 1);
        }
    }
    lua_pop(L, 1);

    lua_Integer frequency = 1;
    lua_getfield(L, 1, "frequency");
    if (!lua_isnil(L, -1)) {
        int isInteger = 0;
        frequency = lua_tointegerx(L, -1, &isInteger);
        luaL_argcheck(L, isInteger, 1, "'frequency' must be an integer");
        luaL_argcheck(L, frequency >= 1 && frequency <= std::numeric_limits<uint32_t>::max(),
                      1, "'frequency' must be between 1 and 2^32-1");
    }
    lua_pop(L, 1);

    lua_getfield(L, 1, "update");
    luaL_argcheck(L, lua_isfunction(L, -1), 1, "'update' must be a function");
    lua_pop(L, 1);

    for (const char* hook : { "init", "dispose", "enter", "exit" }) {
        lua_getfield(L, 1, hook);
        if (!lua_isnil(L, -1) && !lua_isfunction(L, -1))
            return luaL_error(L, "ecs.addSystem: '%s' must be a function", hook);
        lua_pop(L, 1);
    }

    if (!registryReady()) { lua_pushnil(L); return 1; }

    std::vector<std::string> required;
    if (hasRequires) {
        lua_getfield(L, 1, "requires");
        const lua_Integer n = static_cast<lua_Integer>(lua_rawlen(L, -1));
        for (lua_Integer i = 1; i <= n; ++i) {
            lua_rawgeti(L, -1, i);
            required.emplace_back(lua_tostring(L, -1));
            lua_pop(L, 1);
        }
        lua_pop(L, 1);
    }

    LuaSystem::Callbacks callbacks;
    callbacks.update  = refCallback(L, 1, "update");
    callbacks.init    = refCallback(L, 1, "init");
    callbacks.dispose = refCallback(L, 1, "dispose");
    callbacks.enter   = refCallback(L, 1, "enter");
    callbacks.exit    = refCallback(L, 1, "exit");

    // Hooks must run on the main thread even if addSystem came from a coroutine.
    lua_rawgeti(L, LUA_REGISTRYINDEX, LUA_RIDX_MAINTHREAD);
    lua_State* mainThread = lua_tothread(L, -1);
    lua_pop(L, 1);

    auto system = std::make_shared<LuaSystem>(
        mainThread, std::move(required), static_cast<uint32_t>(frequency), callbacks);
    g_systems.push_back(system);
    const auto handle = static_cast<lua_Integer>(g_systems.size());

    g_registry->AddSystem(system);
    lua_pushinteger(L, handle);
    return 1;
}

// ecs.removeSystem(handle)
static int l_removeSystem(lua_State* L)
{
    const lua_Integer handle = luaL_checkinteger(L, 1);
    if (!registryReady()) return 0;
    auto system = findSystem(L, 1);
    if (!system) return 0;

    g_registry->RemoveSystem(system);
    system->Release();
    g_systems[static_cast<size_t>(handle) - 1].reset();
    return 0;
}

// ecs.setEnabled(handle, enabled)
static int l_setEnabled(lua_State* L)
{
    const bool enabled = lua_toboolean(L, 2) != 0;
    if (auto system = findSystem(L, 1)) system->SetEnabled(enabled);
    return 0;
}

// ecs.systemSize(handle) → tracked entity count  (0 for unknown handles)
static int l_systemSize(lua_State* L)
{
    auto system = findSystem(L, 1);
    lua_pushinteger(L, system ? static_cast<lua_Integer>(system->Entities().size()) : 0);
    return 1;
}

// ── Ticking ───────────────────────────────────────────────────────────────────

// ecs.update()
static int l_update(lua_State* L)
{
    (void)L;
    if (!registryReady()) return 0;
    g_registry->Update();
    return 0;
}

// ecs.tick() → tick counter
static int l_tick(lua_State* L)
{
    lua_pushinteger(L, g_registry ? static_cast<lua_Integer>(g_registry->TickCount()) : 0);
    return 1;
}

// ── Registration ─────────────────────────────────────────────────────────────

void registerECS(lua_State* L)
{
    static const luaL_Reg funcs[] = {
        // Entity lifecycle
        {"create",          l_create},
        {"destroy",         l_destroy},
        {"isAlive",         l_isAlive},
        {"count",           l_count},
        // Components
        {"addComponent",    l_addComponent},
        {"removeComponent", l_removeComponent},
        {"hasComponent",    l_hasComponent},
        {"getComponent",    l_getComponent},
        // Systems
        {"addSystem",       l_addSystem},
        {"removeSystem",    l_removeSystem},
        {"setEnabled",      l_setEnabled},
        {"systemSize",      l_systemSize},
        // Ticking
        {"update",          l_update},
        {"tick",            l_tick},
        {nullptr, nullptr}
    };

    luaL_newlib(L, funcs);
    lua_setglobal(L, "ecs");
}

} // namespace Metronome::Scripting::LuaLoader
