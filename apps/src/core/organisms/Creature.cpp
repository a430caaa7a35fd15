#include "Creature.h"

#include "core/EventSink.h"
#include "core/LoggingChannels.h"
#include "core/physics/PhysicsWorld.h"

#include <algorithm>
#include <cmath>
#include <map>
#include <type_traits>

namespace Biomorph {

namespace {

constexpr double kTwoPi = 2.0 * M_PI;

constexpr double kChildSpacing = 20.0;
constexpr double kRootStacking = 40.0;
constexpr double kFrictionAir = 0.02;
constexpr double kRestitution = 0.2;
constexpr double kJointDamping = 0.1;
constexpr double kCorpseFriction = 0.5;
constexpr double kCorpseFrictionAir = 0.2;

constexpr double kBeautySignalBoost = 0.3;
constexpr double kAmplitudeModScale = 5.0;
constexpr double kMaxModulatedAmplitude = 20.0;
constexpr double kMinModulatedFrequency = 0.1;
constexpr double kMaxModulatedFrequency = 5.0;

constexpr double kMemoryRetention = 0.95;
constexpr double kMemoryGain = 0.05;

} // namespace

Creature::Creature(
    CreatureId id,
    std::shared_ptr<Genome> genome,
    PhysicsWorld& world,
    const Vector2d& spawnPosition,
    EventSink* events)
    : id_(id),
      genome_(std::move(genome)),
      world_(world),
      events_(events),
      spawnPosition_(spawnPosition)
{
    build();
}

Creature::~Creature()
{
    detachFromWorld();
}

void Creature::build()
{
    const auto& segments = genome_->segments;
    std::map<int, Vector2d> placed;

    for (size_t i = 0; i < segments.size(); i++) {
        const Segment& segment = segments[i];
        Vector2d position = spawnPosition_;

        const bool hasPlacedParent = segment.parentId.has_value()
            && *segment.parentId >= 0 && *segment.parentId < static_cast<int>(segments.size())
            && placed.count(*segment.parentId) > 0;

        if (hasPlacedParent) {
            const Segment& parent = segments[*segment.parentId];
            const double offset = segmentHalfLength(parent) + kChildSpacing;
            position = placed.at(*segment.parentId)
                + Vector2d{ std::sin(segment.attachAngle) * offset,
                            std::cos(segment.attachAngle) * offset };
        }
        else {
            position.y += static_cast<double>(i) * kRootStacking;
        }

        BodyOptions options;
        options.mass = segment.mass;
        options.friction = BaseFriction;
        options.frictionAir = kFrictionAir;
        options.restitution = kRestitution;
        options.collisionGroup = -(id_.get() + 1);
        options.tag = BodyTag{ .kind = BodyKind::CreatureSegment,
                               .ownerId = id_.get(),
                               .partIndex = static_cast<int>(i) };

        const BodyId bodyId = std::visit(
            [&](auto&& shape) {
                using T = std::decay_t<decltype(shape)>;
                if constexpr (std::is_same_v<T, CircleSegment>) {
                    return world_.addCircle(position, shape.radius, options);
                }
                else {
                    return world_.addRectangle(position, shape.width, shape.length, options);
                }
            },
            segment.shape);

        bodies_.push_back(SegmentBody{ .bodyId = bodyId, .segmentIndex = static_cast<int>(i) });
        placed[segment.id] = position;
    }

    const auto& joints = genome_->joints;
    for (size_t j = 0; j < joints.size(); j++) {
        const Joint& joint = joints[j];
        const int count = static_cast<int>(bodies_.size());
        if (joint.segA < 0 || joint.segA >= count || joint.segB < 0 || joint.segB >= count) {
            LOG_WARN(Creature, "Creature {} joint {} references a missing segment", id_, j);
            continue;
        }

        ConstraintOptions options;
        options.bodyA = bodies_[joint.segA].bodyId;
        options.bodyB = bodies_[joint.segB].bodyId;
        options.pointA = joint.attachPointA;
        options.pointB = joint.attachPointB;
        options.length = joint.restLength;
        options.stiffness = joint.stiffness;
        options.damping = kJointDamping;
        options.ownerId = id_.get();

        motors_.push_back(JointMotor{ .constraintId = world_.addConstraint(options),
                                      .jointIndex = static_cast<int>(j),
                                      .amplitude = joint.motorPattern.amplitude,
                                      .frequency = joint.motorPattern.frequency,
                                      .phase = joint.motorPattern.phase });
    }

    sensorActivations_.assign(genome_->sensors.size(), 0.0);
    memory_.assign(static_cast<size_t>(std::max(0, genome_->memorySize)), 0.0);

    LOG_DEBUG(
        Creature,
        "Built creature {} with {} bodies, {} joints, {} sensors",
        id_,
        bodies_.size(),
        motors_.size(),
        genome_->sensors.size());
}

void Creature::setVisibleCreatures(std::vector<const Creature*> others)
{
    visible_ = std::move(others);
    visible_.erase(
        std::remove(visible_.begin(), visible_.end(), this), visible_.end());
}

void Creature::setGenome(std::shared_ptr<Genome> genome)
{
    genome_ = std::move(genome);
    sensorActivations_.resize(genome_->sensors.size(), 0.0);
    memory_.resize(static_cast<size_t>(std::max(0, genome_->memorySize)), 0.0);
}

void Creature::update(double dt)
{
    if (state_ == CreatureState::Dead) {
        updateFade(dt);
        return;
    }

    simTime_ += dt;
    age_ += dt;

    // Metabolism runs regardless of activity; only power-ups and kills refill.
    food_ -= FoodBurnRate * dt;
    if (food_ <= 0.0) {
        food_ = 0.0;
        die(nullptr, DeathCause::Starvation);
        return;
    }

    pruneInvalidJoints();
    updateSensors();
    modulateMotors();
    updateMotors();
    updateStickyFeet();
    updateMemory();
}

void Creature::updateFade(double dt)
{
    deathTime_ += dt;
    if (deathTime_ <= DeathHoldSeconds) {
        return;
    }

    fadeAlpha_ -= dt * FadeRate;
    if (fadeAlpha_ <= 0.0) {
        fadeAlpha_ = 0.0;
        canDestroy_ = true;
    }
}

void Creature::pruneInvalidJoints()
{
    const size_t before = motors_.size();
    motors_.erase(
        std::remove_if(
            motors_.begin(),
            motors_.end(),
            [this](const JointMotor& motor) { return !world_.hasConstraint(motor.constraintId); }),
        motors_.end());

    if (motors_.size() != before) {
        LOG_DEBUG(Creature, "Creature {} lost {} joints", id_, before - motors_.size());
    }
}

void Creature::updateSensors()
{
    const auto& sensors = genome_->sensors;
    sensorActivations_.resize(sensors.size(), 0.0);
    for (size_t i = 0; i < sensors.size(); i++) {
        sensorActivations_[i] = readSensor(sensors[i]);
    }
}

double Creature::readSensor(const Sensor& sensor) const
{
    if (bodies_.empty() || sensor.range <= 0.0) {
        return 0.0;
    }

    BodyId mount = bodies_.front().bodyId;
    for (const SegmentBody& body : bodies_) {
        if (body.segmentIndex == sensor.segmentId) {
            mount = body.bodyId;
            break;
        }
    }

    const Body* body = world_.getBody(mount);
    if (!body) {
        return 0.0;
    }

    const double axis = body->angle + sensor.angle;
    const double halfFov = sensor.fov * M_PI / 180.0 / 2.0;

    double closest = sensor.range;
    double closestBeauty = 0.0;
    bool detected = false;

    for (const Creature* other : visible_) {
        if (!other->isAlive()) {
            continue;
        }

        const Vector2d toTarget = other->getCenterPosition() - body->position;
        const double distance = toTarget.magnitude();
        if (distance > sensor.range) {
            continue;
        }

        if (sensor.type == SensorType::Eye) {
            double diff = std::atan2(toTarget.y, toTarget.x) - axis;
            diff = std::remainder(diff, kTwoPi);
            if (std::abs(diff) > halfFov) {
                continue;
            }
        }

        if (distance < closest) {
            closest = distance;
            closestBeauty = other->getGenome()->beauty;
            detected = true;
        }
    }

    if (!detected) {
        return 0.0;
    }

    const double proximity = 1.0 - closest / sensor.range;
    return std::min(1.0, proximity * (1.0 + closestBeauty * kBeautySignalBoost));
}

void Creature::modulateMotors()
{
    const auto& weights = genome_->sensorMotorWeights;

    for (JointMotor& motor : motors_) {
        const MotorPattern& base = genome_->joints.at(motor.jointIndex).motorPattern;

        double amplitudeMod = 0.0;
        double frequencyMod = 0.0;
        double phaseMod = 0.0;
        for (size_t s = 0; s < sensorActivations_.size() && s < weights.size(); s++) {
            const double activation = sensorActivations_[s];
            if (activation <= 0.0 || motor.jointIndex >= static_cast<int>(weights[s].size())) {
                continue;
            }
            const SensorMotorWeight& w = weights[s][motor.jointIndex];
            amplitudeMod += activation * w.amplitudeMod;
            frequencyMod += activation * w.frequencyMod;
            phaseMod += activation * w.phaseMod;
        }

        motor.amplitude = std::clamp(
            base.amplitude + amplitudeMod * kAmplitudeModScale, 0.0, kMaxModulatedAmplitude);
        motor.frequency = std::clamp(
            base.frequency + frequencyMod, kMinModulatedFrequency, kMaxModulatedFrequency);
        motor.phase = base.phase + phaseMod * M_PI;
    }
}

void Creature::updateMotors()
{
    for (const JointMotor& motor : motors_) {
        DistanceConstraint* constraint = world_.getConstraint(motor.constraintId);
        if (!constraint) {
            continue;
        }

        const Joint& joint = genome_->joints.at(motor.jointIndex);
        const double oscillation =
            motor.amplitude * std::sin(kTwoPi * motor.frequency * simTime_ + motor.phase);
        constraint->length =
            std::clamp(joint.restLength + oscillation, joint.minLength, joint.maxLength);
    }
}

void Creature::updateStickyFeet()
{
    if (motors_.empty() || bodies_.empty()) {
        return;
    }

    // Front foot grips while the first joint contracts, back foot while it extends.
    const JointMotor& lead = motors_.front();
    const double phase = std::fmod(kTwoPi * lead.frequency * simTime_ + lead.phase, kTwoPi);
    const bool extending = std::cos(phase) > 0.0;

    if (Body* back = world_.getBody(bodies_.back().bodyId)) {
        back->friction = extending ? StickyFriction : SlipperyFriction;
    }
    if (Body* front = world_.getBody(bodies_.front().bodyId)) {
        front->friction = extending ? SlipperyFriction : StickyFriction;
    }
}

void Creature::updateMemory()
{
    double signal = 0.0;
    for (const double activation : sensorActivations_) {
        signal += activation;
    }

    for (size_t i = 0; i < memory_.size(); i++) {
        const double contribution = signal * static_cast<double>(i + 1) * 0.1;
        memory_[i] = memory_[i] * kMemoryRetention + contribution * kMemoryGain;
    }
}

void Creature::takeDamage(double amount, Creature* attacker)
{
    if (state_ == CreatureState::Dead) {
        return;
    }

    health_ -= amount;
    damageTaken_ += amount;

    if (attacker) {
        attacker->damageDealt_ += amount;
        if (events_) {
            events_->onDamage(attacker->getId(), id_, amount);
        }
    }

    if (health_ <= 0.0) {
        health_ = 0.0;
        die(attacker, DeathCause::Combat);
    }
}

void Creature::restoreHealth(double amount)
{
    if (state_ == CreatureState::Dead) {
        return;
    }

    food_ = std::min(MaxVitals, food_ + amount);
    health_ = std::min(MaxVitals, health_ + amount);
}

void Creature::die(Creature* killer, DeathCause cause)
{
    if (state_ == CreatureState::Dead) {
        return;
    }

    state_ = CreatureState::Dead;
    deathCause_ = cause;
    food_ = 0.0;
    health_ = 0.0;
    deathTime_ = 0.0;

    if (killer) {
        killer->kills_++;
        killer->health_ = MaxVitals;
        killer->food_ = MaxVitals;
    }

    for (const SegmentBody& segment : bodies_) {
        if (Body* body = world_.getBody(segment.bodyId)) {
            body->friction = kCorpseFriction;
            body->frictionAir = kCorpseFrictionAir;
        }
    }

    LOG_DEBUG(
        Creature,
        "Creature {} died ({}) at age {:.1f}s",
        id_,
        toString(cause),
        age_);

    if (events_) {
        events_->onDeath(
            id_, killer ? std::optional<CreatureId>(killer->getId()) : std::nullopt, cause);
    }
}

double Creature::calculateFitness() const
{
    const double distance = (getCenterPosition() - spawnPosition_).magnitude();
    const double fitness = distance * 1.0 + kills_ * 100.0 + damageDealt_ * 0.5
        - damageTaken_ * 0.3;
    return std::max(0.0, fitness);
}

Vector2d Creature::getCenterPosition() const
{
    Vector2d weighted{ 0.0, 0.0 };
    double totalMass = 0.0;

    for (const SegmentBody& segment : bodies_) {
        if (const Body* body = world_.getBody(segment.bodyId)) {
            weighted += body->position * body->mass;
            totalMass += body->mass;
        }
    }

    if (totalMass <= 0.0) {
        return spawnPosition_;
    }
    return weighted / totalMass;
}

std::optional<BodyId> Creature::getMouthBody() const
{
    if (bodies_.empty()) {
        return std::nullopt;
    }
    for (auto it = bodies_.rbegin(); it != bodies_.rend(); ++it) {
        if (genome_->segments.at(it->segmentIndex).isMouth) {
            return it->bodyId;
        }
    }
    return bodies_.back().bodyId;
}

std::optional<BodyId> Creature::getHeartBody() const
{
    if (bodies_.empty()) {
        return std::nullopt;
    }
    for (const SegmentBody& segment : bodies_) {
        if (genome_->segments.at(segment.segmentIndex).isHeart) {
            return segment.bodyId;
        }
    }
    return bodies_.front().bodyId;
}

std::vector<BodyId> Creature::getGripperBodies() const
{
    std::vector<BodyId> grippers;
    for (const SegmentBody& segment : bodies_) {
        if (genome_->segments.at(segment.segmentIndex).isGripper) {
            grippers.push_back(segment.bodyId);
        }
    }
    return grippers;
}

std::vector<Creature::SegmentState> Creature::getSegmentStates() const
{
    std::vector<SegmentState> states;
    states.reserve(bodies_.size());
    for (const SegmentBody& segment : bodies_) {
        const Body* body = world_.getBody(segment.bodyId);
        if (!body) {
            continue;
        }
        const Segment& gene = genome_->segments.at(segment.segmentIndex);
        states.push_back(SegmentState{ .position = body->position,
                                       .angle = body->angle,
                                       .shape = gene.shape,
                                       .color = gene.color,
                                       .isHeart = gene.isHeart,
                                       .isMouth = gene.isMouth,
                                       .isGripper = gene.isGripper });
    }
    return states;
}

bool Creature::isInWorld() const
{
    if (bodies_.empty()) {
        return false;
    }
    return std::all_of(bodies_.begin(), bodies_.end(), [this](const SegmentBody& segment) {
        return world_.hasBody(segment.bodyId);
    });
}

void Creature::detachFromWorld()
{
    for (const JointMotor& motor : motors_) {
        world_.removeConstraint(motor.constraintId);
    }
    // Also catch constraints pruned from motors_ but still present.
    world_.removeConstraintsIf(
        [this](const DistanceConstraint& c) { return c.ownerId == id_.get(); });
    for (const SegmentBody& segment : bodies_) {
        world_.removeBody(segment.bodyId);
    }
    motors_.clear();
    bodies_.clear();
}

} // namespace Biomorph
