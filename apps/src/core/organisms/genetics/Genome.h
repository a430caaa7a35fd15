#pragma once

#include "core/Vector2.h"

#include <array>
#include <optional>
#include <random>
#include <variant>
#include <vector>

namespace Biomorph {

struct CircleSegment {
    double radius = 15.0;

    bool operator==(const CircleSegment& other) const { return radius == other.radius; }
};

struct RectangleSegment {
    double length = 40.0;
    double width = 12.0;

    bool operator==(const RectangleSegment& other) const
    {
        return length == other.length && width == other.width;
    }
};

using SegmentShape = std::variant<CircleSegment, RectangleSegment>;
using Rgb = std::array<int, 3>;

/**
 * One rigid body part. Segments form a tree through parentId; the root has none.
 */
struct Segment {
    int id = 0;
    std::optional<int> parentId;
    double attachAngle = 0.0; // Radians, relative to the parent's axis.
    SegmentShape shape;
    double mass = 1.0;
    Rgb color = { 128, 128, 128 };
    bool isHeart = false;
    bool isMouth = false;
    bool isGripper = false;

    bool operator==(const Segment& other) const;
};

struct MotorPattern {
    double amplitude = 0.0;
    double frequency = 1.0; // Hz.
    double phase = 0.0;     // Radians.

    bool operator==(const MotorPattern& other) const;
};

/**
 * Distance joint between two segments (indices into Genome::segments) with an
 * oscillating motor that drives its target length.
 */
struct Joint {
    int segA = 0;
    int segB = 1;
    Vector2d attachPointA;
    Vector2d attachPointB;
    double restLength = 20.0;
    double minLength = 10.0;
    double maxLength = 50.0;
    double stiffness = 0.5;
    MotorPattern motorPattern;

    bool operator==(const Joint& other) const;
};

enum class SensorType { Eye, Feeler };

struct Sensor {
    int id = 0;
    SensorType type = SensorType::Feeler;
    int segmentId = 0;
    double angle = 0.0; // Radians, relative to the segment's axis.
    double range = 50.0;
    double fov = 0.0; // Degrees, eyes only.

    bool operator==(const Sensor& other) const;
};

struct SensorMotorWeight {
    double amplitudeMod = 0.0;
    double frequencyMod = 0.0;
    double phaseMod = 0.0;

    bool operator==(const SensorMotorWeight& other) const;
};

struct GenomeOptions {
    int minSegments = 2;
    int maxSegments = 5;
    int minSensors = 1;
    int maxSensors = 3;
    std::optional<double> baseHue; // Random when unset.
    int generation = 0;
};

/**
 * Heritable blueprint of one creature: body tree, joints with motors, sensors
 * and the sensor-to-motor controller.
 *
 * sensorMotorWeights has one row per sensor and one column per joint. Every
 * operator that adds a sensor or a joint extends it to match.
 */
struct Genome {
    std::vector<Segment> segments;
    std::vector<Joint> joints;
    std::vector<Sensor> sensors;
    std::vector<std::vector<SensorMotorWeight>> sensorMotorWeights;
    int generation = 0;
    double fitness = 0.0;
    double baseHue = 0.0;
    double beauty = 0.5;
    int memorySize = 2;

    static constexpr int MaxSensors = 5;
    static constexpr int MaxSegments = 8;
    static constexpr int MaxMemorySize = 64;

    /**
     * Random linear chain: segment 0 is the heart, the last segment the mouth.
     */
    static Genome random(std::mt19937& rng, const GenomeOptions& options = {});

    // Deep copy. Genomes hold no shared state, so this is a plain value copy.
    Genome clone() const { return *this; }

    bool hasConsistentWeights() const;

    // Pad missing rows/columns with zero weights and drop extras.
    // Returns true if anything changed.
    bool normalizeSensorMotorWeights();

    bool operator==(const Genome& other) const;
    bool operator!=(const Genome& other) const { return !(*this == other); }
};

// Distance from a segment's center to its attach end along its axis.
double segmentHalfLength(const Segment& segment);

Rgb hslToRgb(double hue, double saturation, double lightness);

// Color near baseHue (within +-30 degrees).
Rgb randomFamilyColor(double baseHue, std::mt19937& rng);

SensorMotorWeight randomSensorMotorWeight(std::mt19937& rng);

const char* toString(SensorType type);

} // namespace Biomorph
