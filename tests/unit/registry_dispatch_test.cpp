#include <gtest/gtest.h>
#include <helpers/recording_system.hpp>

#include <algorithm>
#include <memory>
#include <set>
#include <utility>
#include <vector>

using namespace Metronome::ECS;
using Metronome::Testing::MakeEntity;
using Metronome::Testing::RecordingSystem;

// Parameterised over the traversal order so every scenario runs both ways.
class RegistryDispatchTest : public ::testing::TestWithParam<bool> {
protected:
    ManualClock clock;
    Registry    registry{ RegistryOptions{ GetParam() }, &clock };

    std::shared_ptr<RecordingSystem> AddRecording(std::vector<std::string> required, uint32_t frequency = 1u) {
        auto sys = std::make_shared<RecordingSystem>(std::move(required), frequency);
        registry.AddSystem(sys);
        return sys;
    }

    EntityPtr AddEntity(std::initializer_list<const char*> components) {
        auto e = MakeEntity(registry, components);
        registry.AddEntity(e);
        return e;
    }

    void Tick(double seconds = 0.1) {
        clock.Advance(seconds);
        registry.Update();
    }

    static std::vector<uint64_t> Ticks(const RecordingSystem& sys) {
        std::vector<uint64_t> ticks;
        for (const auto& c : sys.calls) ticks.push_back(c.tick);
        return ticks;
    }
};

INSTANTIATE_TEST_SUITE_P(Traversal, RegistryDispatchTest, ::testing::Values(false, true),
    [](const ::testing::TestParamInfo<bool>& info) {
        return info.param ? "SystemsFirst" : "EntitiesFirst";
    });

// ---------------------------------------------------------------------------
// Gating
// ---------------------------------------------------------------------------

TEST_P(RegistryDispatchTest, EverySystemSeesEveryTrackedEntity)
{
    auto sys = AddRecording({ "pos" });
    auto e1  = AddEntity({ "pos" });
    auto e2  = AddEntity({ "pos" });
    AddEntity({ "vel" });

    Tick();

    auto ids = sys->CallsOnTick(0);
    std::sort(ids.begin(), ids.end());
    EXPECT_EQ(ids, (std::vector<EntityId>{ e1->Id(), e2->Id() }));
}

TEST_P(RegistryDispatchTest, FrequencyGatesOnTheGlobalCounter)
{
    auto sys = AddRecording({}, 2u);
    AddEntity({});

    Tick();
    Tick();
    Tick();

    EXPECT_EQ(Ticks(*sys), (std::vector<uint64_t>{ 0u, 2u }));
    EXPECT_EQ(registry.TickCount(), 3u);
}

TEST_P(RegistryDispatchTest, SystemAddedMidRunKeepsTheGlobalPhase)
{
    AddEntity({});
    Tick();
    Tick();
    Tick();  // counter is now 3

    auto sys = AddRecording({}, 2u);
    for (int i = 0; i < 4; ++i) Tick();  // ticks 3, 4, 5, 6

    EXPECT_EQ(Ticks(*sys), (std::vector<uint64_t>{ 4u, 6u }));
}

TEST_P(RegistryDispatchTest, DisabledSystemNeverRuns)
{
    auto off = AddRecording({});
    auto on  = AddRecording({});
    AddEntity({});

    off->SetEnabled(false);
    for (int i = 0; i < 3; ++i) Tick();

    EXPECT_TRUE(off->calls.empty());
    EXPECT_EQ(on->calls.size(), 3u);

    off->SetEnabled(true);
    Tick();
    EXPECT_EQ(Ticks(*off), (std::vector<uint64_t>{ 3u }));
}

TEST_P(RegistryDispatchTest, TickAdvancesWithoutEntitiesOrSystems)
{
    Tick();
    Tick();
    EXPECT_EQ(registry.TickCount(), 2u);
    EXPECT_FALSE(registry.IsUpdating());
}

// ---------------------------------------------------------------------------
// Elapsed time
// ---------------------------------------------------------------------------

TEST_P(RegistryDispatchTest, ElapsedIsMeasuredFromThePreviousUpdate)
{
    auto sys = AddRecording({});
    AddEntity({});

    Tick(0.5);   // measured from construction
    Tick(0.25);
    Tick(0.0);

    ASSERT_EQ(sys->calls.size(), 3u);
    EXPECT_FLOAT_EQ(sys->calls[0].elapsed, 0.5f);
    EXPECT_FLOAT_EQ(sys->calls[1].elapsed, 0.25f);
    EXPECT_FLOAT_EQ(sys->calls[2].elapsed, 0.0f);
}

TEST_P(RegistryDispatchTest, SkippedTicksStillConsumeTime)
{
    auto sys = AddRecording({}, 2u);
    AddEntity({});

    Tick(1.0);  // tick 0, runs
    Tick(1.0);  // tick 1, skipped
    Tick(1.0);  // tick 2, runs

    ASSERT_EQ(sys->calls.size(), 2u);
    // Elapsed is per Registry::Update, not per system run.
    EXPECT_FLOAT_EQ(sys->calls[1].elapsed, 1.0f);
}

// ---------------------------------------------------------------------------
// Mutation during a tick
// ---------------------------------------------------------------------------

TEST_P(RegistryDispatchTest, EntityRemovedDuringItsOwnUpdateStaysAlive)
{
    auto sys = AddRecording({});
    auto e   = AddEntity({ "doomed" });
    const EntityId id = e->Id();
    e.reset();  // the registry holds the only reference now

    bool sawComponentAfterRemoval = false;
    sys->onUpdate = [&](Entity& self) {
        registry.RemoveEntity(registry.GetEntityById(self.Id()));
        sawComponentAfterRemoval = self.HasComponent("doomed");
    };

    Tick();

    EXPECT_TRUE(sawComponentAfterRemoval);
    EXPECT_EQ(registry.GetEntityById(id), nullptr);
    EXPECT_TRUE(sys->Entities().empty());
    EXPECT_TRUE(registry.CheckMembership());
}

TEST_P(RegistryDispatchTest, RemovingAnEntityMidTickIsSafe)
{
    auto sys = AddRecording({});
    auto e1  = AddEntity({ "doomed" });
    auto e2  = AddEntity({});
    auto e3  = AddEntity({});

    sys->onUpdate = [&](Entity& self) {
        if (self.HasComponent("doomed"))
            registry.RemoveEntity(registry.GetEntityById(self.Id()));
    };

    Tick();

    // e3 is swapped into e1's already-visited slot and is not reached this tick.
    EXPECT_EQ(sys->CallsOnTick(0), (std::vector<EntityId>{ e1->Id(), e2->Id() }));
    EXPECT_EQ(registry.EntityCount(), 2u);
    EXPECT_TRUE(registry.CheckMembership());

    Tick();
    auto next = sys->CallsOnTick(1);
    std::sort(next.begin(), next.end());
    EXPECT_EQ(next, (std::vector<EntityId>{ e2->Id(), e3->Id() }));
}

TEST_P(RegistryDispatchTest, RemovedEntityIsNotUpdatedBySystemsLaterInTheTick)
{
    auto killer = AddRecording({});
    auto after  = AddRecording({});
    auto e      = AddEntity({});

    killer->onUpdate = [&](Entity& self) {
        registry.RemoveEntity(registry.GetEntityById(self.Id()));
    };

    Tick();

    EXPECT_EQ(killer->calls.size(), 1u);
    EXPECT_TRUE(after->calls.empty());
    EXPECT_TRUE(registry.CheckMembership());
}

TEST_P(RegistryDispatchTest, RemovingASystemMidTickIsSafe)
{
    auto remover = AddRecording({});
    auto victim  = AddRecording({});
    AddEntity({});
    AddEntity({});

    // Only the registry owns the victim from here on.
    std::weak_ptr<System> watch = victim;
    victim.reset();

    remover->onUpdate = [&](Entity&) {
        if (auto s = watch.lock()) registry.RemoveSystem(s);
    };

    Tick();

    EXPECT_EQ(registry.SystemCount(), 1u);
    EXPECT_EQ(remover->calls.size(), 2u);
    EXPECT_TRUE(watch.expired());
    EXPECT_TRUE(registry.CheckMembership());
}

TEST_P(RegistryDispatchTest, EntityAddedMidTickWaitsForTheNextTick)
{
    auto sys   = AddRecording({ "pos" });
    auto first = AddEntity({ "pos" });

    EntityPtr spawned;
    sys->onUpdate = [&](Entity&) {
        if (spawned) return;
        spawned = MakeEntity(registry, { "pos" });
        registry.AddEntity(spawned);
    };

    Tick();
    EXPECT_EQ(sys->CallsOnTick(0), (std::vector<EntityId>{ first->Id() }));
    ASSERT_NE(spawned, nullptr);
    EXPECT_TRUE(sys->Tracks(*spawned));

    Tick();
    auto next = sys->CallsOnTick(1);
    std::sort(next.begin(), next.end());
    EXPECT_EQ(next, (std::vector<EntityId>{ first->Id(), spawned->Id() }));
}

TEST_P(RegistryDispatchTest, NestedUpdateIsIgnored)
{
    auto sys = AddRecording({});
    AddEntity({});

    sys->onUpdate = [&](Entity&) { registry.Update(); };

    Tick();

    EXPECT_EQ(sys->calls.size(), 1u);
    EXPECT_EQ(registry.TickCount(), 1u);
}

// ---------------------------------------------------------------------------
// Traversal equivalence
// ---------------------------------------------------------------------------

namespace {

// (system index, entity id) edges updated on each tick of a fixed scenario.
std::vector<std::set<std::pair<int, EntityId>>> RunScenario(bool systemsFirst)
{
    ManualClock clock;
    Registry registry{ RegistryOptions{ systemsFirst }, &clock };

    std::vector<std::shared_ptr<RecordingSystem>> systems{
        std::make_shared<RecordingSystem>(std::vector<std::string>{ "pos" }, 1u),
        std::make_shared<RecordingSystem>(std::vector<std::string>{ "pos", "vel" }, 2u),
        std::make_shared<RecordingSystem>(std::vector<std::string>{ "vel" }, 3u),
        std::make_shared<RecordingSystem>(std::vector<std::string>{}, 1u),
    };
    for (const auto& s : systems) registry.AddSystem(s);
    systems[3]->SetEnabled(false);

    for (int i = 0; i < 10; ++i) {
        auto e = registry.CreateEntity();
        if (i % 2 == 0) e->AddComponent("pos");
        if (i % 3 == 0) e->AddComponent("vel");
        registry.AddEntity(e);
    }

    constexpr int kTicks = 6;
    for (int t = 0; t < kTicks; ++t) {
        clock.Advance(0.1);
        registry.Update();
    }

    std::vector<std::set<std::pair<int, EntityId>>> edges(kTicks);
    for (int s = 0; s < static_cast<int>(systems.size()); ++s)
        for (const auto& c : systems[s]->calls)
            edges[c.tick].insert({ s, c.entity });
    return edges;
}

} // anonymous namespace

TEST(RegistryTraversalTest, BothOrdersUpdateTheSameEdges)
{
    const auto entitiesFirst = RunScenario(false);
    const auto systemsFirst  = RunScenario(true);
    EXPECT_EQ(entitiesFirst, systemsFirst);

    // Sanity: the scenario does something on tick 0 and gates later ticks.
    EXPECT_FALSE(entitiesFirst[0].empty());
    EXPECT_LT(entitiesFirst[1].size(), entitiesFirst[0].size());
}

TEST(RegistryTraversalTest, OptionIsReported)
{
    Registry entitiesFirst;
    Registry systemsFirst{ RegistryOptions{ true } };
    EXPECT_FALSE(entitiesFirst.IsSystemsFirst());
    EXPECT_TRUE(systemsFirst.IsSystemsFirst());
}

TEST(RegistryClockTest, DefaultClockProducesNonNegativeElapsed)
{
    Registry registry;
    float elapsed = -1.0f;
    registry.AddSystem(std::make_shared<LambdaSystem>(std::vector<std::string>{},
        [&](Entity&, float dt) { elapsed = dt; }));
    registry.AddEntity(registry.CreateEntity());

    registry.Update();
    EXPECT_GE(elapsed, 0.0f);
}

TEST(ManualClockTest, AdvanceAccumulates)
{
    ManualClock clock(2.0);
    EXPECT_DOUBLE_EQ(clock.Now(), 2.0);
    clock.Advance(0.5);
    clock.Advance(0.25);
    EXPECT_DOUBLE_EQ(clock.Now(), 2.75);
}
