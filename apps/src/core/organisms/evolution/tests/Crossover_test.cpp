#include "core/organisms/evolution/Crossover.h"
#include "core/organisms/genetics/Genome.h"

#include <gtest/gtest.h>

using namespace Biomorph;

class CrossoverTest : public ::testing::Test {
protected:
    std::mt19937 rng{ 42 };

    Genome makeParent(int segments, double hue)
    {
        GenomeOptions options;
        options.minSegments = segments;
        options.maxSegments = segments;
        options.baseHue = hue;
        return Genome::random(rng, options);
    }
};

TEST_F(CrossoverTest, ChildTakesOneParentsBodyPlan)
{
    const Genome a = makeParent(2, 40.0);
    const Genome b = makeParent(5, 80.0);

    for (int i = 0; i < 20; i++) {
        const Genome child = crossover(a, b, rng);
        const Genome& base = child.segments.size() == a.segments.size() ? a : b;

        EXPECT_EQ(child.segments, base.segments);
        EXPECT_EQ(child.sensors, base.sensors);
        EXPECT_EQ(child.sensorMotorWeights, base.sensorMotorWeights);
        EXPECT_EQ(child.joints.size(), base.joints.size());
        EXPECT_TRUE(child.hasConsistentWeights());
    }
}

TEST_F(CrossoverTest, SharedJointsDrawMotorsFromEitherParent)
{
    const Genome a = makeParent(4, 0.0);
    const Genome b = makeParent(4, 0.0);
    bool sawA = false;
    bool sawB = false;

    for (int i = 0; i < 50; i++) {
        const Genome child = crossover(a, b, rng);
        for (size_t j = 0; j < child.joints.size(); j++) {
            const MotorPattern& motor = child.joints[j].motorPattern;
            const bool fromA = motor == a.joints[j].motorPattern;
            const bool fromB = motor == b.joints[j].motorPattern;
            EXPECT_TRUE(fromA || fromB);
            sawA = sawA || fromA;
            sawB = sawB || fromB;
        }
    }

    EXPECT_TRUE(sawA);
    EXPECT_TRUE(sawB);
}

TEST_F(CrossoverTest, ExtraJointsKeepBaseMotors)
{
    const Genome small = makeParent(2, 0.0);
    const Genome large = makeParent(5, 0.0);

    for (int i = 0; i < 20; i++) {
        const Genome child = crossover(small, large, rng);
        if (child.joints.size() == large.joints.size()) {
            for (size_t j = small.joints.size(); j < child.joints.size(); j++) {
                EXPECT_EQ(child.joints[j].motorPattern, large.joints[j].motorPattern);
            }
        }
    }
}

TEST_F(CrossoverTest, HueNearParentsMidpoint)
{
    const Genome a = makeParent(3, 100.0);
    const Genome b = makeParent(3, 200.0);

    for (int i = 0; i < 50; i++) {
        const Genome child = crossover(a, b, rng);
        EXPECT_GE(child.baseHue, 135.0);
        EXPECT_LE(child.baseHue, 165.0);
    }
}

TEST_F(CrossoverTest, ParentsAreUnchanged)
{
    const Genome a = makeParent(3, 10.0);
    const Genome b = makeParent(4, 20.0);
    const Genome aCopy = a.clone();
    const Genome bCopy = b.clone();

    crossover(a, b, rng);

    EXPECT_EQ(a, aCopy);
    EXPECT_EQ(b, bCopy);
}
