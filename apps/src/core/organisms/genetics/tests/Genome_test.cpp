#include "core/organisms/genetics/Genome.h"

#include <gtest/gtest.h>
#include <set>

using namespace Biomorph;

class GenomeTest : public ::testing::Test {
protected:
    std::mt19937 rng{ 42 };
};

TEST_F(GenomeTest, RandomGenomeIsALinearChain)
{
    for (int trial = 0; trial < 50; trial++) {
        const Genome genome = Genome::random(rng);

        ASSERT_GE(genome.segments.size(), 2u);
        ASSERT_LE(genome.segments.size(), 5u);
        EXPECT_EQ(genome.joints.size(), genome.segments.size() - 1);

        EXPECT_FALSE(genome.segments.front().parentId.has_value());
        for (size_t i = 1; i < genome.segments.size(); i++) {
            ASSERT_TRUE(genome.segments[i].parentId.has_value());
            EXPECT_EQ(*genome.segments[i].parentId, static_cast<int>(i) - 1);
        }
        for (size_t j = 0; j < genome.joints.size(); j++) {
            EXPECT_EQ(genome.joints[j].segA, static_cast<int>(j));
            EXPECT_EQ(genome.joints[j].segB, static_cast<int>(j) + 1);
        }
    }
}

TEST_F(GenomeTest, HeartFirstMouthLast)
{
    const Genome genome = Genome::random(rng);

    EXPECT_TRUE(genome.segments.front().isHeart);
    EXPECT_TRUE(genome.segments.back().isMouth);
    for (size_t i = 1; i < genome.segments.size(); i++) {
        EXPECT_FALSE(genome.segments[i].isHeart);
    }
}

TEST_F(GenomeTest, SensorsAndWeightsAreConsistent)
{
    for (int trial = 0; trial < 50; trial++) {
        const Genome genome = Genome::random(rng);

        EXPECT_GE(genome.sensors.size(), 1u);
        EXPECT_LE(genome.sensors.size(), 3u);
        EXPECT_TRUE(genome.hasConsistentWeights());

        for (const Sensor& sensor : genome.sensors) {
            EXPECT_GE(sensor.segmentId, 0);
            EXPECT_LT(sensor.segmentId, static_cast<int>(genome.segments.size()));
            if (sensor.type == SensorType::Feeler) {
                EXPECT_EQ(sensor.fov, 0.0);
            }
            else {
                EXPECT_GT(sensor.fov, 0.0);
            }
        }
    }
}

TEST_F(GenomeTest, ScalarsStartInRange)
{
    const Genome genome = Genome::random(rng);

    EXPECT_GE(genome.beauty, 0.0);
    EXPECT_LE(genome.beauty, 1.0);
    EXPECT_EQ(genome.memorySize, 2);
    EXPECT_EQ(genome.generation, 0);
    EXPECT_EQ(genome.fitness, 0.0);
}

TEST_F(GenomeTest, SameSeedSameGenome)
{
    std::mt19937 a{ 7 };
    std::mt19937 b{ 7 };

    EXPECT_EQ(Genome::random(a), Genome::random(b));
}

TEST_F(GenomeTest, OptionsPinHueAndGeneration)
{
    GenomeOptions options;
    options.baseHue = 120.0;
    options.generation = 4;
    options.minSegments = 3;
    options.maxSegments = 3;

    const Genome genome = Genome::random(rng, options);

    EXPECT_EQ(genome.baseHue, 120.0);
    EXPECT_EQ(genome.generation, 4);
    EXPECT_EQ(genome.segments.size(), 3u);
}

TEST_F(GenomeTest, CloneIsIndependent)
{
    const Genome original = Genome::random(rng);
    Genome copy = original.clone();

    ASSERT_EQ(copy, original);
    copy.segments[0].mass += 1.0;
    copy.joints[0].motorPattern.amplitude += 1.0;
    copy.sensorMotorWeights[0][0].amplitudeMod += 1.0;

    EXPECT_NE(copy, original);
    EXPECT_NE(copy.segments[0].mass, original.segments[0].mass);
    EXPECT_NE(
        copy.sensorMotorWeights[0][0].amplitudeMod,
        original.sensorMotorWeights[0][0].amplitudeMod);
}

TEST_F(GenomeTest, NormalizePadsAndTruncatesWeights)
{
    Genome genome = Genome::random(rng);
    genome.sensorMotorWeights.pop_back();
    genome.sensorMotorWeights.front().push_back(SensorMotorWeight{ 1.0, 1.0, 1.0 });

    ASSERT_FALSE(genome.hasConsistentWeights());
    EXPECT_TRUE(genome.normalizeSensorMotorWeights());
    EXPECT_TRUE(genome.hasConsistentWeights());
    EXPECT_FALSE(genome.normalizeSensorMotorWeights());
}

TEST_F(GenomeTest, ZeroJointsHaveEmptyWeightRows)
{
    Genome genome = Genome::random(rng);
    genome.joints.clear();

    genome.normalizeSensorMotorWeights();

    for (const auto& row : genome.sensorMotorWeights) {
        EXPECT_TRUE(row.empty());
    }
}

TEST_F(GenomeTest, HslToRgbPrimaries)
{
    EXPECT_EQ(hslToRgb(0.0, 1.0, 0.5), (Rgb{ 255, 0, 0 }));
    EXPECT_EQ(hslToRgb(120.0, 1.0, 0.5), (Rgb{ 0, 255, 0 }));
    EXPECT_EQ(hslToRgb(240.0, 1.0, 0.5), (Rgb{ 0, 0, 255 }));
    EXPECT_EQ(hslToRgb(360.0, 1.0, 0.5), (Rgb{ 255, 0, 0 }));
    EXPECT_EQ(hslToRgb(0.0, 0.0, 1.0), (Rgb{ 255, 255, 255 }));
}

TEST_F(GenomeTest, SegmentHalfLengthFollowsShape)
{
    Segment circle;
    circle.shape = CircleSegment{ .radius = 12.0 };
    Segment rect;
    rect.shape = RectangleSegment{ .length = 40.0, .width = 10.0 };

    EXPECT_EQ(segmentHalfLength(circle), 12.0);
    EXPECT_EQ(segmentHalfLength(rect), 20.0);
}
