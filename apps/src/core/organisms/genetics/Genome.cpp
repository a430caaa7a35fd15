#include "Genome.h"

#include "core/Random.h"

#include <algorithm>
#include <cmath>
#include <type_traits>

namespace Biomorph {

bool Segment::operator==(const Segment& other) const
{
    return id == other.id && parentId == other.parentId && attachAngle == other.attachAngle
        && shape == other.shape && mass == other.mass && color == other.color
        && isHeart == other.isHeart && isMouth == other.isMouth && isGripper == other.isGripper;
}

bool MotorPattern::operator==(const MotorPattern& other) const
{
    return amplitude == other.amplitude && frequency == other.frequency && phase == other.phase;
}

bool Joint::operator==(const Joint& other) const
{
    return segA == other.segA && segB == other.segB && attachPointA == other.attachPointA
        && attachPointB == other.attachPointB && restLength == other.restLength
        && minLength == other.minLength && maxLength == other.maxLength
        && stiffness == other.stiffness && motorPattern == other.motorPattern;
}

bool Sensor::operator==(const Sensor& other) const
{
    return id == other.id && type == other.type && segmentId == other.segmentId
        && angle == other.angle && range == other.range && fov == other.fov;
}

bool SensorMotorWeight::operator==(const SensorMotorWeight& other) const
{
    return amplitudeMod == other.amplitudeMod && frequencyMod == other.frequencyMod
        && phaseMod == other.phaseMod;
}

bool Genome::operator==(const Genome& other) const
{
    return segments == other.segments && joints == other.joints && sensors == other.sensors
        && sensorMotorWeights == other.sensorMotorWeights && generation == other.generation
        && fitness == other.fitness && baseHue == other.baseHue && beauty == other.beauty
        && memorySize == other.memorySize;
}

double segmentHalfLength(const Segment& segment)
{
    return std::visit(
        [](auto&& shape) -> double {
            using T = std::decay_t<decltype(shape)>;
            if constexpr (std::is_same_v<T, CircleSegment>) {
                return shape.radius;
            }
            else {
                return shape.length / 2.0;
            }
        },
        segment.shape);
}

Rgb hslToRgb(double hue, double saturation, double lightness)
{
    hue = std::fmod(hue, 360.0);
    if (hue < 0.0) {
        hue += 360.0;
    }

    const double c = (1.0 - std::abs(2.0 * lightness - 1.0)) * saturation;
    const double x = c * (1.0 - std::abs(std::fmod(hue / 60.0, 2.0) - 1.0));
    const double m = lightness - c / 2.0;

    double r = 0.0;
    double g = 0.0;
    double b = 0.0;
    if (hue < 60.0) {
        r = c;
        g = x;
    }
    else if (hue < 120.0) {
        r = x;
        g = c;
    }
    else if (hue < 180.0) {
        g = c;
        b = x;
    }
    else if (hue < 240.0) {
        g = x;
        b = c;
    }
    else if (hue < 300.0) {
        r = x;
        b = c;
    }
    else {
        r = c;
        b = x;
    }

    const auto channel = [m](double v) {
        return std::clamp(static_cast<int>(std::lround((v + m) * 255.0)), 0, 255);
    };
    return Rgb{ channel(r), channel(g), channel(b) };
}

Rgb randomFamilyColor(double baseHue, std::mt19937& rng)
{
    const double hue = baseHue + uniform(rng, -30.0, 30.0);
    const double saturation = uniform(rng, 0.6, 0.9);
    const double lightness = uniform(rng, 0.5, 0.7);
    return hslToRgb(hue, saturation, lightness);
}

SensorMotorWeight randomSensorMotorWeight(std::mt19937& rng)
{
    return SensorMotorWeight{ .amplitudeMod = uniform(rng, -1.0, 1.0),
                              .frequencyMod = uniform(rng, -0.5, 0.5),
                              .phaseMod = uniform(rng, -0.25, 0.25) };
}

const char* toString(SensorType type)
{
    switch (type) {
        case SensorType::Eye:
            return "eye";
        case SensorType::Feeler:
            return "feeler";
    }
    return "feeler";
}

Genome Genome::random(std::mt19937& rng, const GenomeOptions& options)
{
    Genome genome;
    genome.generation = options.generation;
    genome.baseHue = options.baseHue.value_or(uniform(rng, 0.0, 360.0));

    const int segmentCount =
        uniformInt(rng, options.minSegments, std::max(options.minSegments, options.maxSegments));

    for (int i = 0; i < segmentCount; i++) {
        Segment segment;
        segment.id = i;
        if (i > 0) {
            segment.parentId = i - 1;
        }
        if (chance(rng, 0.3)) {
            segment.shape = CircleSegment{ .radius = uniform(rng, 10.0, 25.0) };
        }
        else {
            segment.shape = RectangleSegment{ .length = uniform(rng, 25.0, 60.0),
                                              .width = uniform(rng, 8.0, 20.0) };
        }
        segment.mass = uniform(rng, 0.8, 2.3);
        segment.color = randomFamilyColor(genome.baseHue, rng);
        segment.isHeart = i == 0;
        segment.isMouth = i == segmentCount - 1;
        segment.isGripper = chance(rng, 0.2);
        genome.segments.push_back(segment);
    }

    // Chain: the head end of segment i+1 attaches to the tail end of segment i.
    for (int i = 0; i + 1 < segmentCount; i++) {
        Joint joint;
        joint.segA = i;
        joint.segB = i + 1;
        joint.attachPointA = Vector2d{ 0.0, -segmentHalfLength(genome.segments[i]) };
        joint.attachPointB = Vector2d{ 0.0, segmentHalfLength(genome.segments[i + 1]) };
        joint.restLength = uniform(rng, 15.0, 35.0);
        joint.minLength = 10.0;
        joint.maxLength = 50.0;
        joint.stiffness = uniform(rng, 0.3, 0.8);
        joint.motorPattern = MotorPattern{ .amplitude = uniform(rng, 3.0, 11.0),
                                           .frequency = uniform(rng, 0.5, 3.0),
                                           .phase = uniform(rng, 0.0, 2.0 * M_PI) };
        genome.joints.push_back(joint);
    }

    const int sensorCount =
        uniformInt(rng, options.minSensors, std::max(options.minSensors, options.maxSensors));
    for (int i = 0; i < sensorCount; i++) {
        Sensor sensor;
        sensor.id = i;
        sensor.type = chance(rng, 0.6) ? SensorType::Eye : SensorType::Feeler;
        sensor.segmentId = uniformInt(rng, 0, segmentCount - 1);
        sensor.angle = uniform(rng, -M_PI / 2.0, M_PI / 2.0);
        if (sensor.type == SensorType::Eye) {
            sensor.range = uniform(rng, 100.0, 250.0);
            sensor.fov = uniform(rng, 30.0, 90.0);
        }
        else {
            sensor.range = uniform(rng, 30.0, 70.0);
            sensor.fov = 0.0;
        }
        genome.sensors.push_back(sensor);
    }

    for (int s = 0; s < sensorCount; s++) {
        std::vector<SensorMotorWeight> row;
        row.reserve(genome.joints.size());
        for (size_t j = 0; j < genome.joints.size(); j++) {
            row.push_back(randomSensorMotorWeight(rng));
        }
        genome.sensorMotorWeights.push_back(std::move(row));
    }

    genome.beauty = uniform(rng, 0.0, 1.0);
    genome.memorySize = 2;
    genome.fitness = 0.0;

    return genome;
}

bool Genome::hasConsistentWeights() const
{
    if (sensorMotorWeights.size() != sensors.size()) {
        return false;
    }
    return std::all_of(sensorMotorWeights.begin(), sensorMotorWeights.end(), [this](const auto& row) {
        return row.size() == joints.size();
    });
}

bool Genome::normalizeSensorMotorWeights()
{
    bool changed = false;
    if (sensorMotorWeights.size() != sensors.size()) {
        sensorMotorWeights.resize(sensors.size());
        changed = true;
    }
    for (auto& row : sensorMotorWeights) {
        if (row.size() != joints.size()) {
            row.resize(joints.size(), SensorMotorWeight{});
            changed = true;
        }
    }
    return changed;
}

} // namespace Biomorph
