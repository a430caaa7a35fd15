#include "CreatureTestUtils.h"
#include "core/organisms/Combat.h"
#include "core/organisms/Creature.h"
#include "core/physics/PhysicsWorld.h"

#include <gtest/gtest.h>

using namespace Biomorph;

class CombatTest : public ::testing::Test {
protected:
    PhysicsWorld world;
    Creature a{ CreatureId{ 0 }, makeTwoSegmentGenome(), world, Vector2d{ 100.0, 100.0 } };
    Creature b{ CreatureId{ 1 }, makeTwoSegmentGenome(), world, Vector2d{ 600.0, 100.0 } };

    void placeMouthOnHeart(const Creature& attacker, const Creature& victim)
    {
        const Body* heart = world.getBody(*victim.getHeartBody());
        ASSERT_NE(heart, nullptr);
        world.setPosition(*attacker.getMouthBody(), heart->position + Vector2d{ 5.0, 0.0 });
    }
};

TEST_F(CombatTest, AgeMultipliers)
{
    EXPECT_DOUBLE_EQ(Combat::attackMultiplier(0.0), 1.0);
    EXPECT_DOUBLE_EQ(Combat::attackMultiplier(7200.0), 1.5);
    EXPECT_DOUBLE_EQ(Combat::attackMultiplier(14400.0), 2.0);
    EXPECT_DOUBLE_EQ(Combat::attackMultiplier(100000.0), 2.0);

    EXPECT_DOUBLE_EQ(Combat::defenseMultiplier(0.0), 1.0);
    EXPECT_DOUBLE_EQ(Combat::defenseMultiplier(14400.0), 0.5);
    EXPECT_DOUBLE_EQ(Combat::defenseMultiplier(100000.0), 0.5);
}

TEST_F(CombatTest, ImpactSpeedIsPerFrame)
{
    EXPECT_DOUBLE_EQ(Combat::impactSpeed(Vector2d{ 300.0, 0.0 }), 5.0);
    EXPECT_DOUBLE_EQ(Combat::impactSpeed(Vector2d{ 180.0, 240.0 }), 5.0);
}

TEST_F(CombatTest, NoDamageAtOrBelowThreshold)
{
    EXPECT_EQ(Combat::baseImpactDamage(2.0, 10.0), 0.0);
    EXPECT_EQ(Combat::baseImpactDamage(0.5, 10.0), 0.0);
    EXPECT_DOUBLE_EQ(Combat::baseImpactDamage(5.0, 2.0), 0.9);
}

TEST_F(CombatTest, BluntImpactSplitsDamageEvenlyBetweenNewborns)
{
    Combat::resolveContact(a, b, Vector2d{ 300.0, 0.0 }, 2.0);

    EXPECT_NEAR(a.getHealth(), 100.0 - 0.45, 1e-9);
    EXPECT_NEAR(b.getHealth(), 100.0 - 0.45, 1e-9);
    EXPECT_NEAR(a.getDamageDealt(), 0.45, 1e-9);
    EXPECT_NEAR(b.getDamageDealt(), 0.45, 1e-9);
    EXPECT_TRUE(a.isAlive());
    EXPECT_TRUE(b.isAlive());
}

TEST_F(CombatTest, SlowContactDealsNoDamage)
{
    Combat::resolveContact(a, b, Vector2d{ 100.0, 0.0 }, 2.0);

    EXPECT_EQ(a.getHealth(), 100.0);
    EXPECT_EQ(b.getHealth(), 100.0);
}

TEST_F(CombatTest, MatureAttackerHitsHarder)
{
    a.setAge(Combat::MaturityAge);

    Combat::resolveContact(a, b, Vector2d{ 300.0, 0.0 }, 2.0);

    // a hits b at 2x; b hits a at 1x, halved by a's mature defense.
    EXPECT_NEAR(b.getHealth(), 100.0 - 0.9, 1e-9);
    EXPECT_NEAR(a.getHealth(), 100.0 - 0.225, 1e-9);
}

TEST_F(CombatTest, RepeatedImpactsKill)
{
    a.setHealth(Creature::MaxVitals);

    for (int i = 0; i < 100 && b.isAlive(); i++) {
        Combat::resolveContact(a, b, Vector2d{ 1200.0, 0.0 }, 4.0);
    }

    EXPECT_FALSE(b.isAlive());
    EXPECT_EQ(b.getDeathCause(), DeathCause::Combat);
    EXPECT_TRUE(a.isAlive());
    EXPECT_EQ(a.getKills(), 1);
}

TEST_F(CombatTest, MouthOnHeartIsAnInstantKill)
{
    a.setFood(40.0);
    placeMouthOnHeart(a, b);

    EXPECT_TRUE(Combat::tryEat(a, b));

    EXPECT_FALSE(b.isAlive());
    EXPECT_EQ(b.getDeathCause(), DeathCause::Eaten);
    EXPECT_EQ(a.getKills(), 1);
    EXPECT_EQ(a.getFood(), Creature::MaxVitals);
    EXPECT_EQ(a.getHealth(), Creature::MaxVitals);
}

TEST_F(CombatTest, MouthAwayFromHeartDoesNotEat)
{
    EXPECT_FALSE(Combat::tryEat(a, b));
    EXPECT_TRUE(b.isAlive());
}

TEST_F(CombatTest, EatingSkipsBluntDamage)
{
    placeMouthOnHeart(a, b);

    Combat::resolveContact(a, b, Vector2d{ 1200.0, 0.0 }, 2.0);

    EXPECT_FALSE(b.isAlive());
    EXPECT_EQ(a.getHealth(), Creature::MaxVitals);
    EXPECT_EQ(a.getDamageTaken(), 0.0);
}

TEST_F(CombatTest, EitherSideCanEat)
{
    placeMouthOnHeart(b, a);

    Combat::resolveContact(a, b, Vector2d{ 0.0, 0.0 }, 2.0);

    EXPECT_FALSE(a.isAlive());
    EXPECT_EQ(a.getDeathCause(), DeathCause::Eaten);
    EXPECT_EQ(b.getKills(), 1);
}

TEST_F(CombatTest, MutualBiteResolvesAsOneEat)
{
    placeMouthOnHeart(a, b);
    placeMouthOnHeart(b, a);

    Combat::resolveContact(a, b, Vector2d{ 0.0, 0.0 }, 2.0);

    EXPECT_TRUE(a.isAlive());
    EXPECT_EQ(a.getKills(), 1);
    EXPECT_DOUBLE_EQ(a.getHealth(), Creature::MaxVitals);
    EXPECT_FALSE(b.isAlive());
    EXPECT_EQ(b.getDeathCause(), DeathCause::Eaten);
    EXPECT_EQ(b.getKills(), 0);
}

TEST_F(CombatTest, MouthHeartRadiusBoundary)
{
    EXPECT_TRUE(Combat::isMouthOnHeart(Vector2d{ 0.0, 0.0 }, Vector2d{ 24.9, 0.0 }));
    EXPECT_FALSE(Combat::isMouthOnHeart(Vector2d{ 0.0, 0.0 }, Vector2d{ 25.0, 0.0 }));
}
