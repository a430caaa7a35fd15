#include "Mutation.h"

#include "core/Random.h"
#include "core/organisms/genetics/Genome.h"

#include <algorithm>
#include <cmath>
#include <type_traits>

namespace Biomorph {

namespace {

constexpr double kTwoPi = 2.0 * M_PI;

// Perturbation half-widths.
constexpr double kCircleRadiusDelta = 10.0;
constexpr double kRectLengthDelta = 15.0;
constexpr double kRectWidthDelta = 6.0;
constexpr double kMassDelta = 0.5;
constexpr double kColorDelta = 20.0;
constexpr double kBeautyColorBias = 50.0;
constexpr double kBeautyDelta = 0.1;
constexpr double kRestLengthDelta = 5.0;
constexpr double kStiffnessDelta = 0.1;
constexpr double kAmplitudeDelta = 2.0;
constexpr double kFrequencyDelta = 0.5;
constexpr double kPhaseDelta = M_PI / 4.0;
constexpr double kSensorAngleDelta = 0.25;
constexpr double kSensorRangeDelta = 15.0;
constexpr double kSensorFovDelta = 10.0;
constexpr double kAmplitudeModDelta = 0.4;
constexpr double kFrequencyModDelta = 0.2;
constexpr double kPhaseModDelta = 0.2;

// Trigger multipliers relative to the base rate.
constexpr double kColorRateScale = 0.5;
constexpr double kGripperRateScale = 0.1;
constexpr double kMotorRateScale = 1.5;
constexpr double kWeightRateScale = 2.0;
constexpr double kAddSensorRateScale = 0.05;
constexpr double kAddBranchRateScale = 0.08;

class Mutator {
public:
    Mutator(double rate, std::mt19937& rng, MutationStats* stats)
        : rate_(rate), rng_(rng), stats_(stats)
    {}

    // Perturb value by up to +-delta with probability rate * scale, then clamp.
    void perturb(double& value, double delta, double lo, double hi, double scale = 1.0)
    {
        if (!chance(rng_, rate_ * scale)) {
            return;
        }
        value = std::clamp(value + uniform(rng_, -delta, delta), lo, hi);
        countPoint();
    }

    bool trigger(double scale) { return chance(rng_, rate_ * scale); }

    std::mt19937& rng() { return rng_; }
    MutationStats* stats() { return stats_; }

    void countPoint()
    {
        if (stats_) {
            stats_->pointMutations++;
        }
    }

private:
    double rate_;
    std::mt19937& rng_;
    MutationStats* stats_;
};

double wrapAngle(double angle)
{
    angle = std::fmod(angle + M_PI, kTwoPi);
    if (angle < 0.0) {
        angle += kTwoPi;
    }
    return angle - M_PI;
}

double wrapPhase(double phase)
{
    phase = std::fmod(phase, kTwoPi);
    return phase < 0.0 ? phase + kTwoPi : phase;
}

void mutateSegment(Segment& segment, double beauty, Mutator& m)
{
    if (m.trigger(1.0)) {
        std::visit(
            [&m](auto&& shape) {
                using T = std::decay_t<decltype(shape)>;
                if constexpr (std::is_same_v<T, CircleSegment>) {
                    shape.radius = std::clamp(
                        shape.radius + uniform(m.rng(), -kCircleRadiusDelta, kCircleRadiusDelta),
                        5.0,
                        30.0);
                }
                else {
                    shape.length = std::clamp(
                        shape.length + uniform(m.rng(), -kRectLengthDelta, kRectLengthDelta),
                        15.0,
                        70.0);
                    shape.width = std::clamp(
                        shape.width + uniform(m.rng(), -kRectWidthDelta, kRectWidthDelta),
                        5.0,
                        25.0);
                }
            },
            segment.shape);
        m.countPoint();
    }

    m.perturb(segment.mass, kMassDelta, 0.3, 3.0);

    // Beautiful genomes drift toward lighter colors.
    if (m.trigger(kColorRateScale)) {
        const double bias = (beauty - 0.5) * kBeautyColorBias;
        for (int& channel : segment.color) {
            const double shifted = channel + uniform(m.rng(), -kColorDelta, kColorDelta) + bias;
            channel = std::clamp(static_cast<int>(std::floor(shifted)), 0, 255);
        }
        m.countPoint();
    }

    if (m.trigger(kGripperRateScale)) {
        segment.isGripper = !segment.isGripper;
        if (m.stats()) {
            m.stats()->grippersToggled++;
        }
    }
}

void mutateJoint(Joint& joint, Mutator& m)
{
    m.perturb(joint.restLength, kRestLengthDelta, 5.0, 60.0);
    m.perturb(joint.stiffness, kStiffnessDelta, 0.1, 0.9);

    MotorPattern& motor = joint.motorPattern;
    m.perturb(motor.amplitude, kAmplitudeDelta, 0.0, 15.0, kMotorRateScale);
    m.perturb(motor.frequency, kFrequencyDelta, 0.1, 4.0, kMotorRateScale);
    if (m.trigger(kMotorRateScale)) {
        motor.phase = wrapPhase(motor.phase + uniform(m.rng(), -kPhaseDelta, kPhaseDelta));
        m.countPoint();
    }
}

void mutateSensor(Sensor& sensor, Mutator& m)
{
    if (m.trigger(1.0)) {
        sensor.angle = wrapAngle(
            sensor.angle + uniform(m.rng(), -kSensorAngleDelta, kSensorAngleDelta));
        m.countPoint();
    }
    m.perturb(sensor.range, kSensorRangeDelta, 20.0, 300.0);
    if (sensor.type == SensorType::Eye) {
        m.perturb(sensor.fov, kSensorFovDelta, 10.0, 120.0);
    }
}

void mutateWeight(SensorMotorWeight& weight, Mutator& m)
{
    m.perturb(weight.amplitudeMod, kAmplitudeModDelta, -2.0, 2.0, kWeightRateScale);
    m.perturb(weight.frequencyMod, kFrequencyModDelta, -1.0, 1.0, kWeightRateScale);
    m.perturb(weight.phaseMod, kPhaseModDelta, -1.0, 1.0, kWeightRateScale);
}

void addSensor(Genome& genome, std::mt19937& rng)
{
    Sensor sensor;
    sensor.id = static_cast<int>(genome.sensors.size());
    sensor.type = chance(rng, 0.6) ? SensorType::Eye : SensorType::Feeler;
    sensor.segmentId = uniformInt(rng, 0, static_cast<int>(genome.segments.size()) - 1);
    sensor.angle = uniform(rng, -M_PI / 2.0, M_PI / 2.0);
    if (sensor.type == SensorType::Eye) {
        sensor.range = uniform(rng, 100.0, 200.0);
        sensor.fov = uniform(rng, 40.0, 80.0);
    }
    else {
        sensor.range = uniform(rng, 30.0, 60.0);
        sensor.fov = 0.0;
    }
    genome.sensors.push_back(sensor);

    std::vector<SensorMotorWeight> row;
    row.reserve(genome.joints.size());
    for (size_t j = 0; j < genome.joints.size(); j++) {
        row.push_back(randomSensorMotorWeight(rng));
    }
    genome.sensorMotorWeights.push_back(std::move(row));
}

void addBranch(Genome& genome, std::mt19937& rng)
{
    const int parentIndex = uniformInt(rng, 0, static_cast<int>(genome.segments.size()) - 1);
    const int newIndex = static_cast<int>(genome.segments.size());

    Segment segment;
    segment.id = newIndex;
    segment.parentId = parentIndex;
    segment.attachAngle = uniform(rng, -M_PI / 2.0, M_PI / 2.0);
    if (chance(rng, 0.3)) {
        segment.shape = CircleSegment{ .radius = uniform(rng, 8.0, 20.0) };
    }
    else {
        segment.shape = RectangleSegment{ .length = uniform(rng, 20.0, 45.0),
                                          .width = uniform(rng, 6.0, 16.0) };
    }
    segment.mass = uniform(rng, 0.5, 1.5);
    segment.color = randomFamilyColor(genome.baseHue, rng);
    segment.isHeart = false;
    segment.isMouth = chance(rng, 0.3);
    segment.isGripper = false;
    genome.segments.push_back(segment);

    Joint joint;
    joint.segA = parentIndex;
    joint.segB = newIndex;
    joint.attachPointA = Vector2d{ 0.0, 0.0 };
    joint.attachPointB = Vector2d{ 0.0, 10.0 };
    joint.restLength = uniform(rng, 15.0, 30.0);
    joint.minLength = 8.0;
    joint.maxLength = 40.0;
    joint.stiffness = uniform(rng, 0.3, 0.7);
    joint.motorPattern = MotorPattern{ .amplitude = uniform(rng, 2.0, 8.0),
                                       .frequency = uniform(rng, 0.5, 2.5),
                                       .phase = uniform(rng, 0.0, kTwoPi) };
    genome.joints.push_back(joint);

    for (auto& row : genome.sensorMotorWeights) {
        row.push_back(randomSensorMotorWeight(rng));
    }
}

} // namespace

Genome mutate(const Genome& parent, double rate, std::mt19937& rng, MutationStats* stats)
{
    if (stats) {
        *stats = MutationStats{};
    }

    Genome child = parent.clone();
    Mutator m(rate, rng, stats);

    for (Segment& segment : child.segments) {
        mutateSegment(segment, child.beauty, m);
    }

    m.perturb(child.beauty, kBeautyDelta, 0.0, 1.0);

    for (Joint& joint : child.joints) {
        mutateJoint(joint, m);
    }

    for (Sensor& sensor : child.sensors) {
        mutateSensor(sensor, m);
    }

    for (auto& row : child.sensorMotorWeights) {
        for (SensorMotorWeight& weight : row) {
            mutateWeight(weight, m);
        }
    }

    const int sensorCount = static_cast<int>(child.sensors.size());
    if (m.trigger(kAddSensorRateScale) && sensorCount < Genome::MaxSensors
        && !child.segments.empty()) {
        addSensor(child, rng);
        if (stats) {
            stats->sensorsAdded++;
        }
    }

    const int segmentCount = static_cast<int>(child.segments.size());
    if (m.trigger(kAddBranchRateScale) && segmentCount < Genome::MaxSegments && segmentCount > 0) {
        addBranch(child, rng);
        if (stats) {
            stats->branchesAdded++;
        }
    }

    return child;
}

} // namespace Biomorph
