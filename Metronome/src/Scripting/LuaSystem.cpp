#include <Scripting/LuaSystem.hpp>
#include <ECS/Entity.hpp>

#include <raylib.h>

#include <utility>

namespace Metronome::Scripting {

LuaSystem::LuaSystem(lua_State* L, std::vector<std::string> required,
                     uint32_t frequency, Callbacks callbacks)
    : ECS::System(std::move(required), frequency)
    , m_L(L)
    , m_callbacks(callbacks)
{
}

bool LuaSystem::PushCallback(int ref)
{
    if (!m_L || ref == LUA_NOREF || ref == LUA_REFNIL) return false;
    lua_rawgeti(m_L, LUA_REGISTRYINDEX, ref);
    return true;
}

void LuaSystem::Call(const char* hook, int nargs)
{
    if (lua_pcall(m_L, nargs, 0, 0) != LUA_OK) {
        const char* msg = lua_tostring(m_L, -1);
        TraceLog(LOG_WARNING, "[lua] system %s callback failed: %s", hook, msg ? msg : "(no message)");
        lua_pop(m_L, 1);
    }
}

void LuaSystem::Update(ECS::Entity& entity, float elapsed)
{
    if (!PushCallback(m_callbacks.update)) return;
    lua_pushinteger(m_L, static_cast<lua_Integer>(entity.Id()));
    lua_pushnumber(m_L, static_cast<lua_Number>(elapsed));
    Call("update", 2);
}

void LuaSystem::Initialize()
{
    if (!PushCallback(m_callbacks.init)) return;
    Call("init", 0);
}

void LuaSystem::Dispose()
{
    if (!PushCallback(m_callbacks.dispose)) return;
    Call("dispose", 0);
}

void LuaSystem::OnEntityAdded(ECS::Entity& entity)
{
    if (!PushCallback(m_callbacks.enter)) return;
    lua_pushinteger(m_L, static_cast<lua_Integer>(entity.Id()));
    Call("enter", 1);
}

void LuaSystem::OnEntityRemoved(ECS::Entity& entity)
{
    if (!PushCallback(m_callbacks.exit)) return;
    lua_pushinteger(m_L, static_cast<lua_Integer>(entity.Id()));
    Call("exit", 1);
}

void LuaSystem::Release()
{
    if (!m_L) return;
    for (int* ref : { &m_callbacks.update, &m_callbacks.init, &m_callbacks.dispose,
                      &m_callbacks.enter, &m_callbacks.exit }) {
        luaL_unref(m_L, LUA_REGISTRYINDEX, *ref);
        *ref = LUA_NOREF;
    }
    m_L = nullptr;
}

} // namespace Metronome::Scripting
