#pragma once

// ---------------------------------------------------------------------------
// ECS.hpp — single convenience include for the Metronome ECS core.
//
//   #include <ECS/ECS.hpp>
//
//   using namespace Metronome::ECS;
//
// Overview
// --------
//
//   Entity      — named components + the systems tracking it
//   System      — required-component predicate, frequency, per-entity Update
//   Registry    — owns entities and systems, keeps membership, runs ticks
//   Clock       — time source (SteadyClock by default, ManualClock for tests)
//   IdAllocator — hands out unique EntityIds
//   FastRemove  — swap-with-last vector erase used for every list removal
//
// Quick-start
// -----------
//
//   Registry reg;                                  // entities-first dispatch
//   Registry reg2({ /*systemsFirst*/ true });      // systems-first dispatch
//
//   auto gravity = std::make_shared<LambdaSystem>(
//       std::vector<std::string>{"velocity"},
//       [](Entity& e, float dt) {
//           if (auto* v = e.GetComponent<float>("velocity")) *v -= 9.8f * dt;
//       });
//   reg.AddSystem(gravity);
//
//   auto e = reg.CreateEntity();
//   e->AddComponent("velocity", 0.0f);
//   reg.AddEntity(e);
//
//   reg.Update();                                  // one tick
//   reg.RemoveEntity(e);                           // detached from gravity
//
// ---------------------------------------------------------------------------

#include <ECS/IdAllocator.hpp>
#include <ECS/FastRemove.hpp>
#include <ECS/Clock.hpp>
#include <ECS/Entity.hpp>
#include <ECS/System.hpp>
#include <ECS/Registry.hpp>
