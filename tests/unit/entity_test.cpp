#include <gtest/gtest.h>
#include <ECS/Entity.hpp>
#include <ECS/IdAllocator.hpp>

#include <algorithm>
#include <string>
#include <vector>

using namespace Metronome::ECS;

// ---------------------------------------------------------------------------
// IdAllocator
// ---------------------------------------------------------------------------

TEST(IdAllocatorTest, StartsAtOneAndIncrements)
{
    IdAllocator ids;
    EXPECT_EQ(ids.Peek(), 1u);
    EXPECT_EQ(ids.Next(), 1u);
    EXPECT_EQ(ids.Next(), 2u);
    EXPECT_EQ(ids.Peek(), 3u);
}

TEST(IdAllocatorTest, CustomFirstId)
{
    IdAllocator ids(100u);
    EXPECT_EQ(ids.Next(), 100u);
    EXPECT_EQ(ids.Next(), 101u);
}

TEST(IdAllocatorTest, NeverHandsOutInvalidEntity)
{
    IdAllocator ids(INVALID_ENTITY - 3u);
    for (int i = 0; i < 3; ++i)
        EXPECT_NE(ids.Next(), INVALID_ENTITY);
}

// ---------------------------------------------------------------------------
// Entity components
// ---------------------------------------------------------------------------

class EntityTest : public ::testing::Test {
protected:
    IdAllocator ids;
};

TEST_F(EntityTest, IdsComeFromTheAllocator)
{
    Entity a(ids);
    Entity b(ids);
    EXPECT_EQ(a.Id(), 1u);
    EXPECT_EQ(b.Id(), 2u);
}

TEST_F(EntityTest, FreshEntityIsEmptyAndUnregistered)
{
    Entity e(ids);
    EXPECT_EQ(e.ComponentCount(), 0u);
    EXPECT_TRUE(e.Systems().empty());
    EXPECT_EQ(e.GetRegistry(), nullptr);
}

TEST_F(EntityTest, AddAndQueryComponents)
{
    Entity e(ids);
    e.AddComponent("position", 3.5);
    e.AddComponent("tag");

    EXPECT_TRUE(e.HasComponent("position"));
    EXPECT_TRUE(e.HasComponent("tag"));
    EXPECT_FALSE(e.HasComponent("velocity"));
    EXPECT_EQ(e.ComponentCount(), 2u);

    const double* pos = e.GetComponent<double>("position");
    ASSERT_NE(pos, nullptr);
    EXPECT_DOUBLE_EQ(*pos, 3.5);

    // Payload-less component: present, but the payload is empty.
    const std::any* tag = e.GetComponentData("tag");
    ASSERT_NE(tag, nullptr);
    EXPECT_FALSE(tag->has_value());
}

TEST_F(EntityTest, GetComponentWithWrongTypeReturnsNull)
{
    Entity e(ids);
    e.AddComponent("hp", 10);
    EXPECT_EQ(e.GetComponent<float>("hp"), nullptr);
    EXPECT_EQ(e.GetComponent<int>("missing"), nullptr);
    ASSERT_NE(e.GetComponent<int>("hp"), nullptr);
}

TEST_F(EntityTest, ComponentPayloadIsMutableInPlace)
{
    Entity e(ids);
    e.AddComponent("hp", 10);
    *e.GetComponent<int>("hp") -= 3;

    const Entity& view = e;
    ASSERT_NE(view.GetComponent<int>("hp"), nullptr);
    EXPECT_EQ(*view.GetComponent<int>("hp"), 7);
}

TEST_F(EntityTest, AddComponentReplacesExistingPayload)
{
    Entity e(ids);
    e.AddComponent("name", std::string("crate"));
    e.AddComponent("name", std::string("barrel"));

    EXPECT_EQ(e.ComponentCount(), 1u);
    ASSERT_NE(e.GetComponent<std::string>("name"), nullptr);
    EXPECT_EQ(*e.GetComponent<std::string>("name"), "barrel");
}

TEST_F(EntityTest, RemoveComponent)
{
    Entity e(ids);
    e.AddComponent("a");
    e.AddComponent("b");

    EXPECT_TRUE(e.RemoveComponent("a"));
    EXPECT_FALSE(e.HasComponent("a"));
    EXPECT_TRUE(e.HasComponent("b"));

    // Removing an absent component reports false and changes nothing.
    EXPECT_FALSE(e.RemoveComponent("a"));
    EXPECT_EQ(e.ComponentCount(), 1u);
}

TEST_F(EntityTest, ComponentNamesListsEveryComponent)
{
    Entity e(ids);
    e.AddComponent("x");
    e.AddComponent("y");
    e.AddComponent("z");

    std::vector<std::string> names = e.ComponentNames();
    std::sort(names.begin(), names.end());
    EXPECT_EQ(names, (std::vector<std::string>{ "x", "y", "z" }));
}

TEST_F(EntityTest, DisposeOnUnregisteredEntityIsHarmless)
{
    Entity e(ids);
    e.AddComponent("a");
    e.Dispose();
    EXPECT_TRUE(e.Systems().empty());
    EXPECT_TRUE(e.HasComponent("a"));
}
