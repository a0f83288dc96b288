// metronome — headless runner for Lua-scripted ECS worlds.
//
//   metronome <script.lua> [--ticks N] [--step SECONDS] [--systems-first] [--verbose]
//
// The script is executed once against a fresh Registry (with the `ecs` table
// bound to it) and is expected to create its systems and entities. The runner
// then performs N fixed-step ticks, calling the script's global
// onTick(counter) after each one when it is defined.

#include <ECS/ECS.hpp>
#include <Scripting/LuaLoader/ECS.hpp>

#include <lua.hpp>
#include <raylib.h>

#include <cstdint>
#include <cstdlib>
#include <cstring>

namespace {

struct RunnerOptions {
    const char* script       = nullptr;
    long        ticks        = 60;
    double      step         = 1.0 / 60.0;
    bool        systemsFirst = false;
    bool        verbose      = false;
};

void PrintUsage()
{
    TraceLog(LOG_INFO, "usage: metronome <script.lua> [--ticks N] [--step SECONDS] [--systems-first] [--verbose]");
}

bool ParseArgs(int argc, char** argv, RunnerOptions& out)
{
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (std::strcmp(arg, "--ticks") == 0 && i + 1 < argc) {
            char* end = nullptr;
            out.ticks = std::strtol(argv[++i], &end, 10);
            if (!end || *end != '\0' || out.ticks < 0) {
                TraceLog(LOG_ERROR, "[metronome] --ticks expects a non-negative integer, got '%s'", argv[i]);
                return false;
            }
        } else if (std::strcmp(arg, "--step") == 0 && i + 1 < argc) {
            char* end = nullptr;
            out.step = std::strtod(argv[++i], &end);
            if (!end || *end != '\0' || !(out.step >= 0.0)) {
                TraceLog(LOG_ERROR, "[metronome] --step expects a non-negative number of seconds, got '%s'", argv[i]);
                return false;
            }
        } else if (std::strcmp(arg, "--systems-first") == 0) {
            out.systemsFirst = true;
        } else if (std::strcmp(arg, "--verbose") == 0) {
            out.verbose = true;
        } else if (arg[0] == '-') {
            TraceLog(LOG_ERROR, "[metronome] unknown option '%s'", arg);
            return false;
        } else if (!out.script) {
            out.script = arg;
        } else {
            TraceLog(LOG_ERROR, "[metronome] unexpected argument '%s'", arg);
            return false;
        }
    }
    return out.script != nullptr;
}

// Call the script's global onTick(counter) if it exists.
bool CallOnTick(lua_State* L, uint64_t counter)
{
    lua_getglobal(L, "onTick");
    if (!lua_isfunction(L, -1)) { lua_pop(L, 1); return true; }

    lua_pushinteger(L, static_cast<lua_Integer>(counter));
    if (lua_pcall(L, 1, 0, 0) != LUA_OK) {
        TraceLog(LOG_ERROR, "[metronome] onTick failed: %s", lua_tostring(L, -1));
        lua_pop(L, 1);
        return false;
    }
    return true;
}

} // anonymous namespace

int main(int argc, char** argv)
{
    using namespace Metronome;

    RunnerOptions opts;
    if (!ParseArgs(argc, argv, opts)) {
        PrintUsage();
        return EXIT_FAILURE;
    }
    SetTraceLogLevel(opts.verbose ? LOG_DEBUG : LOG_INFO);

    // Fixed step: every tick sees exactly opts.step seconds elapsed.
    ECS::ManualClock clock;
    ECS::Registry    registry(ECS::RegistryOptions{ opts.systemsFirst }, &clock);

    lua_State* L = luaL_newstate();
    if (!L) {
        TraceLog(LOG_ERROR, "[metronome] could not create a Lua state");
        return EXIT_FAILURE;
    }
    luaL_openlibs(L);
    Scripting::LuaLoader::registerECS(L);
    Scripting::LuaLoader::setECSRegistry(&registry);

    int status = EXIT_SUCCESS;
    if (luaL_dofile(L, opts.script) != LUA_OK) {
        TraceLog(LOG_ERROR, "[metronome] failed to load '%s': %s", opts.script, lua_tostring(L, -1));
        lua_pop(L, 1);
        status = EXIT_FAILURE;
    } else {
        TraceLog(LOG_INFO, "[metronome] '%s': %zu entities, %zu systems, %s dispatch",
                 opts.script, registry.EntityCount(), registry.SystemCount(),
                 registry.IsSystemsFirst() ? "systems-first" : "entities-first");

        for (long i = 0; i < opts.ticks; ++i) {
            clock.Advance(opts.step);
            registry.Update();
            if (!CallOnTick(L, registry.TickCount())) { status = EXIT_FAILURE; break; }
        }

        TraceLog(LOG_INFO, "[metronome] ran %llu ticks, %zu entities left",
                 static_cast<unsigned long long>(registry.TickCount()), registry.EntityCount());
    }

    // Lua systems call back into L, so tear the world down before closing it.
    registry.Clear();
    Scripting::LuaLoader::setECSRegistry(nullptr);
    lua_close(L);
    return status;
}
