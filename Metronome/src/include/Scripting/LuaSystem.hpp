#pragma once

#include <ECS/System.hpp>

#include <lua.hpp>

#include <string>
#include <vector>

namespace Metronome::Scripting {

// ---------------------------------------------------------------------------
// LuaSystem — an ECS System whose hooks are Lua functions.
//
// Each hook is held as a reference in the Lua registry (LUA_NOREF when the
// script did not supply one). Callback errors are logged and swallowed so a
// faulty script cannot abort a tick.
//
// Release() drops the references while the owning Lua state is still open;
// afterwards every hook is a no-op, so a released system may safely outlive
// the state.
// ---------------------------------------------------------------------------
class LuaSystem final : public ECS::System {
public:
    struct Callbacks {
        int update  = LUA_NOREF;  // function(id, dt)
        int init    = LUA_NOREF;  // function()
        int dispose = LUA_NOREF;  // function()
        int enter   = LUA_NOREF;  // function(id)
        int exit    = LUA_NOREF;  // function(id)
    };

    LuaSystem(lua_State* L, std::vector<std::string> required,
              uint32_t frequency, Callbacks callbacks);

    void Update(ECS::Entity& entity, float elapsed) override;
    void Initialize() override;
    void Dispose() override;
    void OnEntityAdded(ECS::Entity& entity) override;
    void OnEntityRemoved(ECS::Entity& entity) override;

    void Release();
    [[nodiscard]] bool IsReleased() const noexcept { return m_L == nullptr; }

private:
    // Pushes the referenced function; false if there is nothing to call.
    bool PushCallback(int ref);
    // lua_pcall the pushed function with nargs arguments, logging failures.
    void Call(const char* hook, int nargs);

    lua_State* m_L;
    Callbacks  m_callbacks;
};

} // namespace Metronome::Scripting
